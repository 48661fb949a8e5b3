#include "storage/ledger_store.hpp"
#include "storage/change_log.hpp"
#include "storage/migrations.hpp"
#include "core/log.hpp"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>

namespace tally::storage {

namespace {

Result<Database, Error> open_and_migrate(const std::string& path) {
    auto db_result = Database::open(path);
    if (db_result.is_err()) {
        return db_result;
    }
    auto db = std::move(db_result).unwrap();
    auto migrate_result = initialize_database(db);
    if (migrate_result.is_err()) {
        return Result<Database, Error>::err(migrate_result.unwrap_err());
    }
    return Result<Database, Error>::ok(std::move(db));
}

Result<void, Error> remove_stale(const QString& path) {
    for (const auto& suffix : {QString(), QStringLiteral("-wal"), QStringLiteral("-shm"),
                               QStringLiteral("-journal")}) {
        const QString file = path + suffix;
        if (QFile::exists(file) && !QFile::remove(file)) {
            return Result<void, Error>::err(Error{"Cannot remove " + file.toStdString(), codes::IO});
        }
    }
    return Result<void, Error>::ok();
}

} // namespace

Result<std::unique_ptr<LedgerStore>, Error> LedgerStore::open(const std::string& path) {
    const QFileInfo info(QString::fromStdString(path));
    if (!QDir().mkpath(info.absolutePath())) {
        return Result<std::unique_ptr<LedgerStore>, Error>::err(
            Error{"Cannot create " + info.absolutePath().toStdString(), codes::IO});
    }

    auto db_result = open_and_migrate(path);
    if (db_result.is_err()) {
        return Result<std::unique_ptr<LedgerStore>, Error>::err(db_result.unwrap_err());
    }
    qCInfo(tallyStorageLog) << "opened" << info.absoluteFilePath();
    return Result<std::unique_ptr<LedgerStore>, Error>::ok(
        std::unique_ptr<LedgerStore>(new LedgerStore(path, std::move(db_result).unwrap())));
}

Result<std::string, Error> LedgerStore::last_change() {
    return with_db([](Database& db) {
        return ChangeLog(db).last_change();
    });
}

Result<void, Error> LedgerStore::checkpoint() {
    return with_db([](Database& db) {
        return db.checkpoint();
    });
}

Result<void, Error> LedgerStore::replace_with(const std::string& source) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!QFile::exists(QString::fromStdString(source))) {
        return Result<void, Error>::err(Error{"Restored database missing: " + source, codes::IO});
    }

    auto incoming_result = Database::open(source, Database::OpenMode::ReadOnly);
    if (incoming_result.is_err()) {
        return Result<void, Error>::err(incoming_result.unwrap_err());
    }
    auto incoming = std::move(incoming_result).unwrap();
    auto checked = incoming.integrity_check();
    if (checked.is_err()) {
        qCWarning(tallyStorageLog) << "rejecting incoming database"
                                   << QString::fromStdString(source) << ":"
                                   << QString::fromStdString(checked.unwrap_err().to_string());
        return Result<void, Error>::err(Error{
            "Incoming database is not usable: " + checked.unwrap_err().message, codes::DB});
    }

    const std::string backup_path = path_ + ".bak";
    TALLY_TRY(Result<void>, remove_stale(QString::fromStdString(backup_path)));
    TALLY_TRY(Result<void>, db_.vacuum_into(backup_path));

    auto copied = db_.copy_from(incoming);
    if (copied.is_err()) {
        return copied;
    }

    auto migrated = initialize_database(db_);
    if (migrated.is_err()) {
        qCWarning(tallyStorageLog) << "restored database cannot be migrated, putting back"
                                   << QString::fromStdString(backup_path);
        auto rolled_back = restore_backup_locked(backup_path);
        if (rolled_back.is_err()) {
            qCCritical(tallyStorageLog) << "cannot put back previous database:"
                                        << QString::fromStdString(rolled_back.unwrap_err().to_string());
        }
        return migrated;
    }

    qCInfo(tallyStorageLog) << "database replaced from" << QString::fromStdString(source);
    return Result<void, Error>::ok();
}

Result<void, Error> LedgerStore::restore_backup_locked(const std::string& backup_path) {
    auto backup = Database::open(backup_path, Database::OpenMode::ReadOnly);
    if (backup.is_err()) {
        return Result<void, Error>::err(backup.unwrap_err());
    }
    return db_.copy_from(backup.unwrap());
}

} // namespace tally::storage
