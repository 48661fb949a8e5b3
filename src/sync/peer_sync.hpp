#pragma once

#include "sync/sync_context.hpp"
#include "network/sync_client.hpp"
#include "core/result.hpp"
#include <string>

namespace tally::sync {

/**
 * Requesting-side operations. Each one talks to the peer behind
 * `client` and records the outcome in the local pairing store.
 *
 * Conflicts are detected by the answering peer; a SYNC_CONFLICT error
 * here means the conflict is pending over there.
 */

/**
 * Exchange the peer's pairing code for a token and remember the peer
 * under its device id.
 */
[[nodiscard]] Result<network::PairResponse, Error> pair_with_peer(network::SyncClient& client,
                                                                  SyncContext& ctx,
                                                                  const std::string& code);

/**
 * Fetch the peer's archive and restore it over the local ledger.
 */
[[nodiscard]] Result<void, Error> pull_from_peer(network::SyncClient& client, SyncContext& ctx);

/**
 * Send the local archive to the peer.
 */
[[nodiscard]] Result<void, Error> push_to_peer(network::SyncClient& client, SyncContext& ctx);

} // namespace tally::sync
