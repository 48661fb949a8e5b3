#include "sync/summary.hpp"
#include "storage/archive.hpp"
#include "storage/ledger_repository.hpp"

namespace tally::sync {

namespace {

std::string label_for(const Booking& booking) {
    for (const auto* candidate : {&booking.description, &booking.category_name, &booking.payment_method}) {
        if (*candidate && !(*candidate)->empty()) {
            return **candidate;
        }
    }
    return "Booking";
}

} // namespace

Result<ConflictSummary, Error> build_summary(storage::Database& db) {
    storage::LedgerRepository repo(db);

    auto totals = repo.get_totals();
    if (totals.is_err()) {
        return Result<ConflictSummary, Error>::err(totals.unwrap_err());
    }
    auto recent = repo.get_recent_bookings(SUMMARY_ITEM_COUNT);
    if (recent.is_err()) {
        return Result<ConflictSummary, Error>::err(recent.unwrap_err());
    }

    ConflictSummary summary{
        .tx_count = totals.unwrap().count,
        .income_total = totals.unwrap().income,
        .expense_total = totals.unwrap().expense,
        .last_items = {}
    };
    for (const auto& booking : recent.unwrap()) {
        summary.last_items.push_back(ConflictItem{
            .date = booking.date,
            .label = label_for(booking),
            .amount_chf = booking.amount_chf,
            .type = booking.type
        });
    }
    return Result<ConflictSummary, Error>::ok(std::move(summary));
}

Result<ConflictSummary, Error> build_archive_summary(const QString& archive_path,
                                                     const QString& scratch_dir) {
    auto extracted = storage::extract_archive(archive_path, scratch_dir);
    if (extracted.is_err()) {
        return Result<ConflictSummary, Error>::err(extracted.unwrap_err());
    }
    const auto& contents = extracted.unwrap();
    if (!contents.has_database()) {
        return Result<ConflictSummary, Error>::err(
            Error{"Archive contains no database", codes::SYNC_RESTORE});
    }

    auto db = storage::Database::open(contents.db_file.toStdString(),
                                      storage::Database::OpenMode::ReadOnly);
    if (db.is_err()) {
        return Result<ConflictSummary, Error>::err(db.unwrap_err());
    }
    return build_summary(db.unwrap());
}

} // namespace tally::sync
