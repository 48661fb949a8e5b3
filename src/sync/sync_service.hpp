#pragma once

#include "sync/sync_context.hpp"
#include "network/http_message.hpp"
#include "network/sync_protocol.hpp"
#include "core/result.hpp"
#include <optional>
#include <string>

namespace tally::sync {

/**
 * SyncService - the sync route set.
 *
 *   GET  /sync/status   unauthenticated identity + last change
 *   POST /sync/pair     exchange the pairing code for a device token
 *   GET  /sync/backup   peer pulls this device's archive
 *   POST /sync/restore  peer pushes its archive
 *
 * handle() is synchronous and blocks for the whole request. It is
 * called from the server thread; everything it touches is internally
 * locked.
 */
class SyncService {
public:
    explicit SyncService(SyncContext& ctx) : ctx_(ctx) {}

    [[nodiscard]] network::HttpResponse handle(const network::HttpRequest& request);

    [[nodiscard]] network::HttpResponse handle_status();
    [[nodiscard]] network::HttpResponse handle_pair(const network::HttpRequest& request);
    [[nodiscard]] network::HttpResponse handle_backup(const network::HttpRequest& request);
    [[nodiscard]] network::HttpResponse handle_restore(const network::HttpRequest& request);

private:
    struct AuthorizedPeer {
        std::string device_id;
        std::string device_name;
        std::optional<std::string> last_sync_at;
    };

    [[nodiscard]] Result<AuthorizedPeer, network::HttpResponse> authorize(const network::HttpRequest& request);
    [[nodiscard]] static Result<std::string, network::HttpResponse> read_remote_last_change(
        const network::HttpRequest& request);

    // Store the pending conflict. A failure is the caller's to report.
    [[nodiscard]] Result<void, Error> record_conflict(const AuthorizedPeer& peer,
                                                      const std::string& local_last,
                                                      const std::string& remote_last,
                                                      std::optional<std::string> archive_path,
                                                      std::optional<ConflictSummary> remote_summary);
    void note_remote_change(const AuthorizedPeer& peer, const std::string& remote_last);
    void mark_synced(const AuthorizedPeer& peer, const std::string& remote_last);

    SyncContext& ctx_;
};

} // namespace tally::sync
