#pragma once

#include "sync/sync_context.hpp"
#include "core/result.hpp"
#include <optional>
#include <string_view>

namespace tally::sync {

enum class ResolveAction {
    KeepLocal,
    UseRemote,
    Merge
};

/**
 * Parse "KEEP_LOCAL", "USE_REMOTE" or "MERGE" (case-insensitive).
 */
[[nodiscard]] std::optional<ResolveAction> parse_resolve_action(std::string_view label);
[[nodiscard]] std::string_view to_string(ResolveAction action);

/**
 * ConflictResolver - applies the operator's decision to the single
 * pending conflict and returns the store to the idle state.
 *
 * On failure the conflict stays pending so the operator can retry or
 * pick a different action.
 */
class ConflictResolver {
public:
    explicit ConflictResolver(SyncContext& ctx) : ctx_(ctx) {}

    [[nodiscard]] Result<void, Error> resolve(std::string_view action_label);
    [[nodiscard]] Result<void, Error> resolve(ResolveAction action);

private:
    [[nodiscard]] Result<void, Error> keep_local(const PendingConflict& conflict);
    [[nodiscard]] Result<void, Error> use_remote(const PendingConflict& conflict);
    [[nodiscard]] Result<void, Error> merge(const PendingConflict& conflict);

    [[nodiscard]] Result<void, Error> finish(const PendingConflict& conflict);
    void discard_archive(const PendingConflict& conflict);

    SyncContext& ctx_;
};

} // namespace tally::sync
