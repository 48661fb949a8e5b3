#pragma once

#include "core/result.hpp"
#include <QString>

namespace tally::storage {

// Entry names inside a ledger archive.
inline constexpr const char* ARCHIVE_DB_ENTRY = "db.sqlite";
inline constexpr const char* ARCHIVE_RECEIPTS_DIR = "receipts";

/**
 * Files found after unpacking an archive into a scratch directory.
 */
struct ArchiveContents {
    QString root;
    QString db_file;       // empty when the archive had no database
    QString receipts_dir;  // empty when the archive had no attachments

    [[nodiscard]] bool has_database() const { return !db_file.isEmpty(); }
    [[nodiscard]] bool has_receipts() const { return !receipts_dir.isEmpty(); }
};

/**
 * Pack `db_path` as db.sqlite plus every file under `receipt_base` as
 * receipts/<relative path> into a zip at `output_path`.
 * A missing receipt directory is not an error.
 */
[[nodiscard]] Result<void, Error> create_archive(const QString& db_path,
                                                 const QString& receipt_base,
                                                 const QString& output_path);

/**
 * Unpack the zip at `archive_path` into `dest_dir` (created if needed).
 * Entries that would land outside `dest_dir` are rejected.
 */
[[nodiscard]] Result<ArchiveContents, Error> extract_archive(const QString& archive_path,
                                                             const QString& dest_dir);

/**
 * Copy every file under `from` to the same relative path under `to`.
 * With `overwrite` false, files already present in `to` are left alone.
 * Returns the number of files copied.
 */
[[nodiscard]] Result<int, Error> copy_tree(const QString& from, const QString& to, bool overwrite);

} // namespace tally::storage
