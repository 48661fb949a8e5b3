#pragma once

#include "storage/database.hpp"
#include "core/ledger.hpp"
#include "core/result.hpp"
#include <string>

namespace tally::storage {

/**
 * ChangeLog - the append-only `audit_log` table.
 *
 * Every committed mutation appends one entry. The timestamp written is
 * max(now, previous + 1ms) in fixed-width UTC form, so the maximum over
 * the table only ever grows and sorts correctly as text.
 */
class ChangeLog {
public:
    explicit ChangeLog(Database& db) : db_(db) {}

    /**
     * Append an entry and return the timestamp it was written with.
     */
    [[nodiscard]] Result<std::string, Error> append(const ChangeEntry& entry);

    /**
     * max(ts) over all entries, or EPOCH_SENTINEL for an empty log.
     */
    [[nodiscard]] Result<std::string, Error> last_change();

    [[nodiscard]] Result<int64_t, Error> count();

private:
    Database& db_;
};

} // namespace tally::storage
