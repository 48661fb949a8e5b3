#include "sync/conflict_detector.hpp"
#include "core/types.hpp"

namespace tally::sync {

bool is_after(std::string_view a, std::string_view b) {
    const auto lhs = parse_rfc3339(a);
    const auto rhs = parse_rfc3339(b);
    if (lhs && rhs) {
        return *lhs > *rhs;
    }
    return a > b;
}

bool has_conflict(const std::optional<std::string_view>& last_sync_at,
                  std::string_view local_last,
                  std::string_view remote_last) {
    if (!last_sync_at) {
        return false;
    }
    return is_after(local_last, *last_sync_at) && is_after(remote_last, *last_sync_at);
}

bool is_timestamp_well_formed(std::string_view value) {
    return parse_rfc3339(value).has_value();
}

} // namespace tally::sync
