#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace tally::storage {

/**
 * LedgerStore - the single live connection to the ledger database.
 *
 * All access goes through with_db(), which holds the store mutex for the
 * duration of the callback. A restore rewrites the database in place, so
 * the connection (and those of other processes) stays valid.
 */
class LedgerStore {
public:
    /**
     * Open (creating if needed) and migrate the database at `path`.
     */
    [[nodiscard]] static Result<std::unique_ptr<LedgerStore>, Error> open(const std::string& path);

    LedgerStore(const LedgerStore&) = delete;
    LedgerStore& operator=(const LedgerStore&) = delete;

    template<typename F>
    auto with_db(F&& f) -> decltype(f(std::declval<Database&>())) {
        std::lock_guard<std::mutex> lock(mutex_);
        return f(db_);
    }

    [[nodiscard]] const std::string& path() const { return path_; }

    /**
     * Current logical change timestamp of the live database.
     */
    [[nodiscard]] Result<std::string, Error> last_change();

    /**
     * Flush the WAL so the database file can be copied on its own.
     */
    [[nodiscard]] Result<void, Error> checkpoint();

    /**
     * Replace the live database contents with the file at `source`.
     * The incoming file must pass an integrity check first. The previous
     * contents are kept as `<path>.bak` and put back when the copied
     * database cannot be migrated. The connection stays open throughout.
     */
    [[nodiscard]] Result<void, Error> replace_with(const std::string& source);

private:
    explicit LedgerStore(std::string path, Database db)
        : path_(std::move(path)), db_(std::move(db)) {}

    [[nodiscard]] Result<void, Error> restore_backup_locked(const std::string& backup_path);

    std::string path_;
    std::mutex mutex_;
    Database db_;
};

} // namespace tally::storage
