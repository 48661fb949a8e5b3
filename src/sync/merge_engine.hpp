#pragma once

#include "sync/attachments.hpp"
#include "storage/database.hpp"
#include "core/result.hpp"
#include <QString>

namespace tally::sync {

struct MergeStats {
    int categories_added = 0;
    int bookings_inserted = 0;
    int bookings_updated = 0;
    int months_changed = 0;
};

/**
 * MergeEngine - folds a remote ledger snapshot into the local database.
 *
 * Categories match by name and are only ever added. Bookings match by
 * public_id; an existing row is replaced only when the remote updated_at
 * is strictly later. Month closings match by (year, month) and never
 * reopen a closed month.
 *
 * The remote database is only read. The engine does not open a
 * transaction; run() is expected to be called inside one.
 */
class MergeEngine {
public:
    MergeEngine(storage::Database& local, storage::Database& remote, const QString& receipt_base)
        : local_(local), remote_(remote), receipts_(receipt_base) {}

    [[nodiscard]] Result<MergeStats, Error> run();

    [[nodiscard]] Result<int, Error> merge_categories();
    [[nodiscard]] Result<MergeStats, Error> merge_bookings();
    [[nodiscard]] Result<int, Error> merge_month_closings();

private:
    storage::Database& local_;
    storage::Database& remote_;
    ReceiptIndex receipts_;
};

} // namespace tally::sync
