#pragma once

#include "sync/pairing_store.hpp"
#include "sync/merge_engine.hpp"
#include "storage/ledger_store.hpp"
#include "core/result.hpp"
#include <QByteArray>
#include <QString>
#include <chrono>
#include <string>

namespace tally::sync {

/**
 * Directories the sync subsystem works in, all below the data directory.
 */
struct SyncPaths {
    QString data_dir;
    QString receipt_base;

    [[nodiscard]] QString temp_dir() const { return data_dir + QStringLiteral("/SyncTemp"); }
    [[nodiscard]] QString conflicts_dir() const { return data_dir + QStringLiteral("/SyncConflicts"); }
    [[nodiscard]] QString scratch_dir() const { return data_dir + QStringLiteral("/SyncScratch"); }
};

/**
 * SyncContext - everything a sync handler or the resolver touches: the
 * live ledger, the pairing store and the working directories.
 *
 * Constructed once by the application and passed by reference. It does
 * not own the ledger or the pairing store.
 */
class SyncContext {
public:
    // Grace period before a served archive is deleted.
    static constexpr std::chrono::milliseconds DEFAULT_CLEANUP_DELAY{90'000};

    SyncContext(storage::LedgerStore& ledger, PairingStore& pairing, SyncPaths paths,
                std::chrono::milliseconds cleanup_delay = DEFAULT_CLEANUP_DELAY)
        : ledger_(ledger), pairing_(pairing), paths_(std::move(paths)),
          cleanup_delay_(cleanup_delay) {}

    [[nodiscard]] storage::LedgerStore& ledger() { return ledger_; }
    [[nodiscard]] PairingStore& pairing() { return pairing_; }
    [[nodiscard]] const SyncPaths& paths() const { return paths_; }

    [[nodiscard]] Result<std::string, Error> last_change();
    [[nodiscard]] Result<ConflictSummary, Error> local_summary();

    /**
     * Summary of the ledger inside an archive, read from a scratch copy.
     */
    [[nodiscard]] Result<ConflictSummary, Error> archive_summary(const QString& archive_path);

    /**
     * Checkpoint and pack the live ledger into SyncTemp/. Returns the
     * archive path.
     */
    [[nodiscard]] Result<QString, Error> create_outgoing_archive();

    /**
     * Save `bytes` under `dir` as <prefix>_<timestamp>.zip.
     */
    [[nodiscard]] Result<QString, Error> write_archive(const QString& dir, const QString& prefix,
                                                       const QByteArray& bytes);

    [[nodiscard]] Result<QByteArray, Error> read_archive(const QString& path);

    /**
     * Replace the live ledger with the archive's contents: copy the
     * checked database in (keeping a .bak), copy attachments in,
     * repair attachment paths, re-point the receipt setting and log
     * `action` to the change log.
     */
    [[nodiscard]] Result<void, Error> apply_remote_restore(const QString& archive_path,
                                                           const std::string& action);

    /**
     * Merge the archive's ledger into the live one in a single
     * transaction. Missing attachment files are copied in first.
     */
    [[nodiscard]] Result<MergeStats, Error> merge_archive(const QString& archive_path);

    /**
     * Delete `path` once the cleanup delay has passed. Needs a running
     * event loop on the calling thread.
     */
    void schedule_cleanup(const QString& path);

    /**
     * Remove leftovers in SyncTemp/ and SyncScratch/ from earlier runs.
     */
    void sweep_temp();

private:
    [[nodiscard]] Result<QString, Error> make_scratch_dir(const QString& prefix);
    void remove_dir(const QString& path);

    storage::LedgerStore& ledger_;
    PairingStore& pairing_;
    SyncPaths paths_;
    std::chrono::milliseconds cleanup_delay_;
};

} // namespace tally::sync
