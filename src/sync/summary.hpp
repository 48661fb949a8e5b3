#pragma once

#include "sync/models.hpp"
#include "storage/database.hpp"
#include "core/result.hpp"
#include <QString>

namespace tally::sync {

// Number of most recently updated bookings shown per side.
constexpr int SUMMARY_ITEM_COUNT = 5;

[[nodiscard]] Result<ConflictSummary, Error> build_summary(storage::Database& db);

/**
 * Summary of the database inside an archive. The archive is unpacked
 * into `scratch_dir` and the database opened read-only.
 */
[[nodiscard]] Result<ConflictSummary, Error> build_archive_summary(const QString& archive_path,
                                                                   const QString& scratch_dir);

} // namespace tally::sync
