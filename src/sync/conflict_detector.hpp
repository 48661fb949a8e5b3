#pragma once

#include <optional>
#include <string_view>

namespace tally::sync {

/**
 * True when `a` is strictly later than `b`.
 *
 * Both values are compared as RFC 3339 instants when both parse; otherwise
 * the raw strings are compared lexically. The lexical path only orders
 * correctly for one fixed-width format, so callers should reject input
 * that fails is_timestamp_well_formed() before it gets here.
 */
[[nodiscard]] bool is_after(std::string_view a, std::string_view b);

/**
 * True iff both sides changed since the last agreed sync point.
 * A pair that never synced (`last_sync_at` empty) never conflicts.
 */
[[nodiscard]] bool has_conflict(const std::optional<std::string_view>& last_sync_at,
                                std::string_view local_last,
                                std::string_view remote_last);

[[nodiscard]] bool is_timestamp_well_formed(std::string_view value);

} // namespace tally::sync
