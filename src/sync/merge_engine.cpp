#include "sync/merge_engine.hpp"
#include "sync/conflict_detector.hpp"
#include "storage/ledger_repository.hpp"
#include "core/log.hpp"

#include <QDebug>

#include <unordered_map>

namespace tally::sync {

Result<int, Error> MergeEngine::merge_categories() {
    storage::LedgerRepository local(local_);
    storage::LedgerRepository remote(remote_);

    auto remote_categories = remote.get_categories();
    if (remote_categories.is_err()) {
        return Result<int, Error>::err(remote_categories.unwrap_err());
    }

    int added = 0;
    for (const auto& category : remote_categories.unwrap()) {
        auto existing = local.find_category_id(category.name);
        if (existing.is_err()) {
            return Result<int, Error>::err(existing.unwrap_err());
        }
        if (existing.unwrap()) {
            continue;
        }
        auto inserted = local.insert_category(category);
        if (inserted.is_err()) {
            return Result<int, Error>::err(inserted.unwrap_err());
        }
        ++added;
    }
    return Result<int, Error>::ok(added);
}

Result<MergeStats, Error> MergeEngine::merge_bookings() {
    storage::LedgerRepository local(local_);
    storage::LedgerRepository remote(remote_);

    auto local_categories = local.get_categories();
    if (local_categories.is_err()) {
        return Result<MergeStats, Error>::err(local_categories.unwrap_err());
    }
    std::unordered_map<std::string, int64_t> category_ids;
    for (const auto& category : local_categories.unwrap()) {
        category_ids.emplace(category.name, category.id);
    }

    auto remote_bookings = remote.get_bookings();
    if (remote_bookings.is_err()) {
        return Result<MergeStats, Error>::err(remote_bookings.unwrap_err());
    }

    MergeStats stats;
    for (auto booking : remote_bookings.unwrap()) {
        booking.category_id.reset();
        if (booking.category_name) {
            if (auto it = category_ids.find(*booking.category_name); it != category_ids.end()) {
                booking.category_id = it->second;
            }
        }

        std::optional<std::string> mapped_receipt;
        if (booking.receipt_path) {
            mapped_receipt = receipts_.map(*booking.receipt_path);
        }

        auto existing = local.get_booking(booking.public_id);
        if (existing.is_err()) {
            return Result<MergeStats, Error>::err(existing.unwrap_err());
        }

        if (const auto& current = existing.unwrap()) {
            if (!is_after(booking.updated_at, current->updated_at)) {
                continue;
            }
            booking.receipt_path = mapped_receipt ? mapped_receipt : current->receipt_path;
            TALLY_TRY(Result<MergeStats>, local.update_booking(booking));
            ++stats.bookings_updated;
        } else {
            booking.receipt_path = mapped_receipt;
            auto inserted = local.insert_booking(booking);
            if (inserted.is_err()) {
                return Result<MergeStats, Error>::err(inserted.unwrap_err());
            }
            ++stats.bookings_inserted;
        }
    }
    return Result<MergeStats, Error>::ok(stats);
}

Result<int, Error> MergeEngine::merge_month_closings() {
    storage::LedgerRepository local(local_);
    storage::LedgerRepository remote(remote_);

    auto remote_closings = remote.get_month_closings();
    if (remote_closings.is_err()) {
        return Result<int, Error>::err(remote_closings.unwrap_err());
    }

    int changed = 0;
    for (const auto& theirs : remote_closings.unwrap()) {
        auto existing = local.get_month_closing(theirs.year, theirs.month);
        if (existing.is_err()) {
            return Result<int, Error>::err(existing.unwrap_err());
        }

        const auto& ours = existing.unwrap();
        bool adopt = false;
        if (!ours) {
            adopt = true;
        } else if (theirs.is_closed && !ours->is_closed) {
            adopt = true;
        } else if (theirs.is_closed && ours->is_closed) {
            // Closed on both sides: keep the later closing.
            adopt = is_after(theirs.closed_at.value_or(""), ours->closed_at.value_or(""));
        }
        // Closed locally and open remotely: closing is sticky.

        if (!adopt) {
            continue;
        }
        TALLY_TRY(Result<int>, local.save_month_closing(theirs));
        ++changed;
    }
    return Result<int, Error>::ok(changed);
}

Result<MergeStats, Error> MergeEngine::run() {
    auto categories = merge_categories();
    if (categories.is_err()) {
        return Result<MergeStats, Error>::err(categories.unwrap_err());
    }

    auto bookings = merge_bookings();
    if (bookings.is_err()) {
        return bookings;
    }

    auto months = merge_month_closings();
    if (months.is_err()) {
        return Result<MergeStats, Error>::err(months.unwrap_err());
    }

    MergeStats stats = bookings.unwrap();
    stats.categories_added = categories.unwrap();
    stats.months_changed = months.unwrap();

    qCInfo(tallySyncLog) << "merge: categories+" << stats.categories_added
                         << "bookings+" << stats.bookings_inserted
                         << "bookings~" << stats.bookings_updated
                         << "months~" << stats.months_changed;
    return Result<MergeStats, Error>::ok(stats);
}

} // namespace tally::sync
