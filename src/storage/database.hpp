#pragma once

#include "core/result.hpp"
#include "core/error_codes.hpp"
#include <sqlite3.h>
#include <string>
#include <string_view>
#include <memory>
#include <optional>
#include <vector>
#include <cstdint>
#include <type_traits>

namespace tally::storage {

/**
 * SQLite statement wrapper with RAII.
 */
class Statement {
public:
    Statement() = default;
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt, sqlite3_finalize) {}

    [[nodiscard]] sqlite3_stmt* get() const { return stmt_.get(); }
    [[nodiscard]] explicit operator bool() const { return stmt_ != nullptr; }

    // Bind helpers (1-based indices, as in SQLite)
    Result<void, Error> bind_text(int index, std::string_view text);
    Result<void, Error> bind_int(int index, int value);
    Result<void, Error> bind_int64(int index, int64_t value);
    Result<void, Error> bind_double(int index, double value);
    Result<void, Error> bind_null(int index);

    /**
     * Bind every argument in order starting at index 1.
     * Accepts strings, integers, doubles and std::optional of those
     * (an empty optional binds NULL).
     */
    template<typename... Args>
    [[nodiscard]] Result<void, Error> bind_all(const Args&... args) {
        int index = 0;
        Result<void, Error> result = Result<void, Error>::ok();
        ((result = result.is_ok() ? bind_value(++index, args) : result), ...);
        return result;
    }

    // Column getters
    [[nodiscard]] std::string column_text(int index) const;
    [[nodiscard]] std::optional<std::string> column_optional_text(int index) const;
    [[nodiscard]] int column_int(int index) const;
    [[nodiscard]] int64_t column_int64(int index) const;
    [[nodiscard]] std::optional<int64_t> column_optional_int64(int index) const;
    [[nodiscard]] double column_double(int index) const;
    [[nodiscard]] bool column_is_null(int index) const;

    // Execute
    Result<bool, Error> step();  // Returns true if there's a row
    Result<void, Error> reset();

private:
    std::shared_ptr<sqlite3_stmt> stmt_;

    Result<void, Error> bind_value(int index, std::string_view v) { return bind_text(index, v); }
    Result<void, Error> bind_value(int index, const std::string& v) { return bind_text(index, v); }
    Result<void, Error> bind_value(int index, const char* v) { return bind_text(index, v); }
    Result<void, Error> bind_value(int index, double v) { return bind_double(index, v); }
    Result<void, Error> bind_value(int index, std::nullopt_t) { return bind_null(index); }

    template<typename T, std::enable_if_t<std::is_integral_v<T>, int> = 0>
    Result<void, Error> bind_value(int index, T v) { return bind_int64(index, static_cast<int64_t>(v)); }

    template<typename T>
    Result<void, Error> bind_value(int index, const std::optional<T>& v) {
        if (!v) return bind_null(index);
        return bind_value(index, *v);
    }
};

/**
 * Database - SQLite database wrapper.
 *
 * Provides RAII connection management, transactions and error
 * reporting through Result.
 */
class Database {
public:
    enum class OpenMode {
        ReadWrite,  // create if missing
        ReadOnly
    };

    Database() = default;
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;

    /**
     * Open a database connection.
     * Read-write connections run in WAL mode with foreign keys enforced.
     */
    [[nodiscard]] static Result<Database, Error> open(const std::string& path,
                                                      OpenMode mode = OpenMode::ReadWrite);

    /**
     * Open an in-memory database (for testing).
     */
    [[nodiscard]] static Result<Database, Error> open_memory();

    [[nodiscard]] bool is_open() const { return db_ != nullptr; }

    void close();

    /**
     * Get the raw SQLite handle (use with caution).
     */
    [[nodiscard]] sqlite3* handle() const { return db_; }

    [[nodiscard]] Result<Statement, Error> prepare(const std::string& sql);

    /**
     * Execute one or more SQL statements without results.
     */
    [[nodiscard]] Result<void, Error> execute(const std::string& sql);

    /**
     * Execute a SQL statement and process results with a callback.
     */
    template<typename F>
    [[nodiscard]] Result<void, Error> query(const std::string& sql, F&& callback) {
        auto stmt_result = prepare(sql);
        if (stmt_result.is_err()) {
            return Result<void, Error>::err(stmt_result.unwrap_err());
        }

        auto stmt = std::move(stmt_result).unwrap();
        while (true) {
            auto step_result = stmt.step();
            if (step_result.is_err()) {
                return Result<void, Error>::err(step_result.unwrap_err());
            }
            if (!step_result.unwrap()) break;
            callback(stmt);
        }

        return Result<void, Error>::ok();
    }

    [[nodiscard]] Result<void, Error> begin_transaction();
    [[nodiscard]] Result<void, Error> commit();
    [[nodiscard]] Result<void, Error> rollback();

    /**
     * Execute a function within a transaction.
     * Commits on success, rolls back on failure. When the rollback itself
     * fails, the error from `f` is still the one returned.
     */
    template<typename F>
    [[nodiscard]] auto transaction(F&& f) -> decltype(f()) {
        using ResultType = decltype(f());

        auto begin_result = begin_transaction();
        if (begin_result.is_err()) {
            return ResultType::err(begin_result.unwrap_err());
        }

        auto result = f();

        if (result.is_err()) {
            auto rollback_result = rollback();
            if (rollback_result.is_err()) {
                log_rollback_failure(rollback_result.unwrap_err());
            }
            return result;
        }

        auto commit_result = commit();
        if (commit_result.is_err()) {
            return ResultType::err(commit_result.unwrap_err());
        }

        return result;
    }

    /**
     * Flush the write-ahead log into the main database file so that the
     * file alone is a complete copy.
     */
    [[nodiscard]] Result<void, Error> checkpoint();

    /**
     * Run PRAGMA integrity_check. Fails when the file is not a database
     * or the check reports anything but "ok".
     */
    [[nodiscard]] Result<void, Error> integrity_check();

    /**
     * Overwrite this database with the contents of `source` through the
     * online backup API. The copy is one write transaction: on failure
     * this database is left as it was. Other connections to the same
     * file, in this process or another, see the new contents.
     */
    [[nodiscard]] Result<void, Error> copy_from(Database& source);

    /**
     * Write a compacted copy of this database to `path` (VACUUM INTO).
     * `path` must not exist.
     */
    [[nodiscard]] Result<void, Error> vacuum_into(const std::string& path);

    [[nodiscard]] int64_t last_insert_rowid() const;
    [[nodiscard]] int changes() const;
    [[nodiscard]] std::string last_error() const;

private:
    explicit Database(sqlite3* db) : db_(db) {}

    static void log_rollback_failure(const Error& error);

    sqlite3* db_ = nullptr;
};

/**
 * Transaction RAII guard.
 * Rolls back if not explicitly committed.
 */
class TransactionGuard {
public:
    explicit TransactionGuard(Database& db);
    ~TransactionGuard();

    TransactionGuard(const TransactionGuard&) = delete;
    TransactionGuard& operator=(const TransactionGuard&) = delete;

    [[nodiscard]] Result<void, Error> commit();
    void rollback();

    [[nodiscard]] bool is_active() const { return active_; }

private:
    Database& db_;
    bool active_ = false;
};

} // namespace tally::storage
