#include "sync/sync_context.hpp"
#include "sync/attachments.hpp"
#include "sync/summary.hpp"
#include "storage/archive.hpp"
#include "storage/change_log.hpp"
#include "crypto/random.hpp"
#include "core/error_codes.hpp"
#include "core/log.hpp"
#include "core/types.hpp"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QTimer>

namespace tally::sync {

namespace {

QString unique_suffix() {
    return QString::number(Timestamp::now().millis()) + QLatin1Char('_') +
           QString::fromStdString(crypto::generate_token(6));
}

ChangeEntry sync_entry(const std::string& action, const std::string& details) {
    ChangeEntry entry;
    entry.actor = "sync";
    entry.action = action;
    entry.entity_type = "SYNC";
    entry.details = details;
    return entry;
}

} // namespace

Result<std::string, Error> SyncContext::last_change() {
    return ledger_.last_change();
}

Result<ConflictSummary, Error> SyncContext::local_summary() {
    return ledger_.with_db([](storage::Database& db) {
        return build_summary(db);
    });
}

Result<QString, Error> SyncContext::make_scratch_dir(const QString& prefix) {
    const QString dir = paths_.scratch_dir() + QLatin1Char('/') + prefix + QLatin1Char('_') + unique_suffix();
    if (!QDir().mkpath(dir)) {
        return Result<QString, Error>::err(Error{"Cannot create " + dir.toStdString(), codes::IO});
    }
    return Result<QString, Error>::ok(dir);
}

void SyncContext::remove_dir(const QString& path) {
    if (!QDir(path).removeRecursively()) {
        qCWarning(tallySyncLog) << "cannot remove scratch directory" << path;
    }
}

Result<ConflictSummary, Error> SyncContext::archive_summary(const QString& archive_path) {
    auto scratch = make_scratch_dir(QStringLiteral("preview"));
    if (scratch.is_err()) {
        return Result<ConflictSummary, Error>::err(scratch.unwrap_err());
    }
    auto summary = build_archive_summary(archive_path, scratch.unwrap());
    remove_dir(scratch.unwrap());
    return summary;
}

Result<QString, Error> SyncContext::write_archive(const QString& dir, const QString& prefix,
                                                  const QByteArray& bytes) {
    if (!QDir().mkpath(dir)) {
        return Result<QString, Error>::err(Error{"Cannot create " + dir.toStdString(), codes::IO});
    }
    const QString path = dir + QLatin1Char('/') + prefix + QLatin1Char('_') + unique_suffix() +
                         QStringLiteral(".zip");
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly) || file.write(bytes) != bytes.size()) {
        return Result<QString, Error>::err(Error{
            "Cannot write " + path.toStdString() + ": " + file.errorString().toStdString(), codes::IO});
    }
    file.close();
    return Result<QString, Error>::ok(path);
}

Result<QByteArray, Error> SyncContext::read_archive(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return Result<QByteArray, Error>::err(Error{
            "Cannot read " + path.toStdString() + ": " + file.errorString().toStdString(), codes::IO});
    }
    return Result<QByteArray, Error>::ok(file.readAll());
}

Result<QString, Error> SyncContext::create_outgoing_archive() {
    if (!QDir().mkpath(paths_.temp_dir())) {
        return Result<QString, Error>::err(
            Error{"Cannot create " + paths_.temp_dir().toStdString(), codes::IO});
    }
    const QString suffix = unique_suffix();
    const QString snapshot = paths_.temp_dir() + QStringLiteral("/sync_snapshot_") + suffix +
                             QStringLiteral(".sqlite");
    const QString path = paths_.temp_dir() + QStringLiteral("/sync_backup_") + suffix +
                         QStringLiteral(".zip");

    // Snapshot and pack under one hold of the ledger lock. VACUUM INTO
    // reads one consistent view, WAL frames included.
    auto created = ledger_.with_db([&](storage::Database& db) -> Result<void, Error> {
        TALLY_TRY(Result<void>, db.vacuum_into(snapshot.toStdString()));
        return storage::create_archive(snapshot, paths_.receipt_base, path);
    });
    if (QFile::exists(snapshot) && !QFile::remove(snapshot)) {
        qCWarning(tallySyncLog) << "cannot remove snapshot" << snapshot;
    }
    if (created.is_err()) {
        return Result<QString, Error>::err(created.unwrap_err());
    }
    return Result<QString, Error>::ok(path);
}

Result<void, Error> SyncContext::apply_remote_restore(const QString& archive_path,
                                                      const std::string& action) {
    auto scratch = make_scratch_dir(QStringLiteral("restore"));
    if (scratch.is_err()) {
        return Result<void, Error>::err(scratch.unwrap_err());
    }
    const QString dir = scratch.unwrap();

    auto result = [&]() -> Result<void, Error> {
        auto extracted = storage::extract_archive(archive_path, dir);
        if (extracted.is_err()) {
            return Result<void, Error>::err(extracted.unwrap_err());
        }
        const auto contents = extracted.unwrap();
        if (!contents.has_database()) {
            return Result<void, Error>::err(Error{"Archive contains no database", codes::SYNC_RESTORE});
        }

        TALLY_TRY(Result<void>, ledger_.replace_with(contents.db_file.toStdString()));

        if (contents.has_receipts()) {
            auto copied = storage::copy_tree(contents.receipts_dir, paths_.receipt_base, true);
            if (copied.is_err()) {
                return Result<void, Error>::err(copied.unwrap_err());
            }
            qCDebug(tallySyncLog) << "restore copied" << copied.unwrap() << "attachment files";
        }

        return ledger_.with_db([&](storage::Database& db) {
            return db.transaction([&]() -> Result<void, Error> {
                auto fixed = fix_receipt_paths(db, paths_.receipt_base);
                if (fixed.is_err()) {
                    return Result<void, Error>::err(fixed.unwrap_err());
                }
                TALLY_TRY(Result<void>, ensure_receipt_setting(db, paths_.receipt_base));
                auto logged = storage::ChangeLog(db).append(
                    sync_entry(action, "Restore via local sync"));
                if (logged.is_err()) {
                    return Result<void, Error>::err(logged.unwrap_err());
                }
                return Result<void, Error>::ok();
            });
        });
    }();

    remove_dir(dir);
    if (result.is_ok()) {
        qCInfo(tallySyncLog) << "restore applied from" << archive_path
                             << "action=" << QString::fromStdString(action);
    }
    return result;
}

Result<MergeStats, Error> SyncContext::merge_archive(const QString& archive_path) {
    auto scratch = make_scratch_dir(QStringLiteral("merge"));
    if (scratch.is_err()) {
        return Result<MergeStats, Error>::err(scratch.unwrap_err());
    }
    const QString dir = scratch.unwrap();

    auto result = [&]() -> Result<MergeStats, Error> {
        auto extracted = storage::extract_archive(archive_path, dir);
        if (extracted.is_err()) {
            return Result<MergeStats, Error>::err(extracted.unwrap_err());
        }
        const auto contents = extracted.unwrap();
        if (!contents.has_database()) {
            return Result<MergeStats, Error>::err(
                Error{"Archive contains no database", codes::SYNC_RESTORE});
        }

        if (contents.has_receipts()) {
            auto copied = copy_missing_receipts(contents.receipts_dir, paths_.receipt_base);
            if (copied.is_err()) {
                return Result<MergeStats, Error>::err(copied.unwrap_err());
            }
        }

        auto remote_result = storage::Database::open(contents.db_file.toStdString(),
                                                     storage::Database::OpenMode::ReadOnly);
        if (remote_result.is_err()) {
            return Result<MergeStats, Error>::err(remote_result.unwrap_err());
        }
        auto remote = std::move(remote_result).unwrap();

        return ledger_.with_db([&](storage::Database& local) {
            return local.transaction([&]() -> Result<MergeStats, Error> {
                MergeEngine engine(local, remote, paths_.receipt_base);
                auto stats = engine.run();
                if (stats.is_err()) {
                    return stats;
                }
                TALLY_TRY(Result<MergeStats>, ensure_receipt_setting(local, paths_.receipt_base));
                auto logged = storage::ChangeLog(local).append(
                    sync_entry("SYNC_MERGE", "Merge via local sync"));
                if (logged.is_err()) {
                    return Result<MergeStats, Error>::err(logged.unwrap_err());
                }
                return stats;
            });
        });
    }();

    remove_dir(dir);
    return result;
}

void SyncContext::schedule_cleanup(const QString& path) {
    QTimer::singleShot(cleanup_delay_, [path]() {
        if (QFile::exists(path) && !QFile::remove(path)) {
            qCWarning(tallySyncLog) << "cannot remove temporary archive" << path;
        }
    });
}

void SyncContext::sweep_temp() {
    for (const auto& dir : {paths_.temp_dir(), paths_.scratch_dir()}) {
        if (QDir(dir).exists()) {
            remove_dir(dir);
        }
    }
}

} // namespace tally::sync
