#include "storage/database.hpp"
#include "core/log.hpp"

#include <QDebug>

namespace tally::storage {

namespace {

constexpr int BUSY_TIMEOUT_MS = 5000;

Error sqlite_error(std::string what, int rc) {
    return Error{what + " (sqlite " + std::to_string(rc) + ")", codes::DB};
}

} // namespace

// ============================================================================
// Statement implementation
// ============================================================================

Result<void, Error> Statement::bind_text(int index, std::string_view text) {
    int rc = sqlite3_bind_text(stmt_.get(), index, text.data(),
                               static_cast<int>(text.size()), SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(sqlite_error("Failed to bind text", rc));
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Statement::bind_int(int index, int value) {
    int rc = sqlite3_bind_int(stmt_.get(), index, value);
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(sqlite_error("Failed to bind int", rc));
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Statement::bind_int64(int index, int64_t value) {
    int rc = sqlite3_bind_int64(stmt_.get(), index, value);
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(sqlite_error("Failed to bind int64", rc));
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Statement::bind_double(int index, double value) {
    int rc = sqlite3_bind_double(stmt_.get(), index, value);
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(sqlite_error("Failed to bind double", rc));
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Statement::bind_null(int index) {
    int rc = sqlite3_bind_null(stmt_.get(), index);
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(sqlite_error("Failed to bind null", rc));
    }
    return Result<void, Error>::ok();
}

std::string Statement::column_text(int index) const {
    const unsigned char* text = sqlite3_column_text(stmt_.get(), index);
    if (!text) return "";
    const int size = sqlite3_column_bytes(stmt_.get(), index);
    return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(size));
}

std::optional<std::string> Statement::column_optional_text(int index) const {
    if (column_is_null(index)) return std::nullopt;
    return column_text(index);
}

int Statement::column_int(int index) const {
    return sqlite3_column_int(stmt_.get(), index);
}

int64_t Statement::column_int64(int index) const {
    return sqlite3_column_int64(stmt_.get(), index);
}

std::optional<int64_t> Statement::column_optional_int64(int index) const {
    if (column_is_null(index)) return std::nullopt;
    return column_int64(index);
}

double Statement::column_double(int index) const {
    return sqlite3_column_double(stmt_.get(), index);
}

bool Statement::column_is_null(int index) const {
    return sqlite3_column_type(stmt_.get(), index) == SQLITE_NULL;
}

Result<bool, Error> Statement::step() {
    int rc = sqlite3_step(stmt_.get());
    if (rc == SQLITE_ROW) {
        return Result<bool, Error>::ok(true);
    }
    if (rc == SQLITE_DONE) {
        return Result<bool, Error>::ok(false);
    }
    sqlite3* db = sqlite3_db_handle(stmt_.get());
    std::string message = db ? sqlite3_errmsg(db) : "Step failed";
    return Result<bool, Error>::err(sqlite_error(message, rc));
}

Result<void, Error> Statement::reset() {
    int rc = sqlite3_reset(stmt_.get());
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(sqlite_error("Reset failed", rc));
    }
    return Result<void, Error>::ok();
}

// ============================================================================
// Database implementation
// ============================================================================

Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept : db_(other.db_) {
    other.db_ = nullptr;
}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = other.db_;
        other.db_ = nullptr;
    }
    return *this;
}

Result<Database, Error> Database::open(const std::string& path, OpenMode mode) {
    sqlite3* raw = nullptr;
    const int flags = mode == OpenMode::ReadOnly
        ? SQLITE_OPEN_READONLY
        : (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
    int rc = sqlite3_open_v2(path.c_str(), &raw, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = raw ? sqlite3_errmsg(raw) : "Unknown error";
        if (raw) sqlite3_close(raw);
        return Result<Database, Error>::err(sqlite_error("Cannot open " + path + ": " + error, rc));
    }

    Database db(raw);
    sqlite3_busy_timeout(raw, BUSY_TIMEOUT_MS);

    if (mode == OpenMode::ReadOnly) {
        return Result<Database, Error>::ok(std::move(db));
    }

    auto pragmas = db.execute(
        "PRAGMA foreign_keys = ON;"
        "PRAGMA journal_mode = WAL;"
        "PRAGMA synchronous = NORMAL;");
    if (pragmas.is_err()) {
        return Result<Database, Error>::err(pragmas.unwrap_err());
    }

    return Result<Database, Error>::ok(std::move(db));
}

Result<Database, Error> Database::open_memory() {
    return open(":memory:");
}

void Database::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

Result<Statement, Error> Database::prepare(const std::string& sql) {
    if (!db_) {
        return Result<Statement, Error>::err(Error{"Database not open", codes::DB});
    }
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(),
                                static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<Statement, Error>::err(sqlite_error(last_error(), rc));
    }
    return Result<Statement, Error>::ok(Statement(stmt));
}

Result<void, Error> Database::execute(const std::string& sql) {
    if (!db_) {
        return Result<void, Error>::err(Error{"Database not open", codes::DB});
    }
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        std::string error = error_msg ? error_msg : "Unknown error";
        sqlite3_free(error_msg);
        return Result<void, Error>::err(sqlite_error(error, rc));
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Database::begin_transaction() {
    return execute("BEGIN IMMEDIATE TRANSACTION;");
}

Result<void, Error> Database::commit() {
    return execute("COMMIT;");
}

Result<void, Error> Database::rollback() {
    return execute("ROLLBACK;");
}

Result<void, Error> Database::checkpoint() {
    return execute("PRAGMA wal_checkpoint(TRUNCATE);");
}

Result<void, Error> Database::integrity_check() {
    auto stmt_result = prepare("PRAGMA integrity_check;");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto row = stmt.step();
    if (row.is_err()) {
        return Result<void, Error>::err(row.unwrap_err());
    }
    if (!row.unwrap()) {
        return Result<void, Error>::err(Error{"Integrity check returned nothing", codes::DB});
    }
    const auto verdict = stmt.column_text(0);
    if (verdict != "ok") {
        return Result<void, Error>::err(Error{"Integrity check failed: " + verdict, codes::DB});
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Database::copy_from(Database& source) {
    if (!db_ || !source.db_) {
        return Result<void, Error>::err(Error{"Database not open", codes::DB});
    }
    sqlite3_backup* backup = sqlite3_backup_init(db_, "main", source.db_, "main");
    if (!backup) {
        return Result<void, Error>::err(sqlite_error("Backup init failed: " + last_error(),
                                                     sqlite3_errcode(db_)));
    }
    const int step_rc = sqlite3_backup_step(backup, -1);
    const int finish_rc = sqlite3_backup_finish(backup);
    if (step_rc != SQLITE_DONE) {
        return Result<void, Error>::err(sqlite_error("Backup copy failed: " + last_error(), step_rc));
    }
    if (finish_rc != SQLITE_OK) {
        return Result<void, Error>::err(sqlite_error("Backup finish failed: " + last_error(), finish_rc));
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Database::vacuum_into(const std::string& path) {
    auto stmt_result = prepare("VACUUM INTO ?");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    TALLY_TRY(Result<void>, stmt.bind_text(1, path));
    auto done = stmt.step();
    if (done.is_err()) {
        return Result<void, Error>::err(done.unwrap_err());
    }
    return Result<void, Error>::ok();
}

int64_t Database::last_insert_rowid() const {
    return sqlite3_last_insert_rowid(db_);
}

int Database::changes() const {
    return sqlite3_changes(db_);
}

std::string Database::last_error() const {
    return db_ ? sqlite3_errmsg(db_) : "Database not open";
}

void Database::log_rollback_failure(const Error& error) {
    qCWarning(tallyStorageLog) << "rollback failed:" << QString::fromStdString(error.to_string());
}

// ============================================================================
// TransactionGuard implementation
// ============================================================================

TransactionGuard::TransactionGuard(Database& db) : db_(db) {
    auto result = db_.begin_transaction();
    active_ = result.is_ok();
}

TransactionGuard::~TransactionGuard() {
    if (active_) {
        rollback();
    }
}

Result<void, Error> TransactionGuard::commit() {
    if (!active_) {
        return Result<void, Error>::err(Error{"No active transaction", codes::DB});
    }
    auto result = db_.commit();
    if (result.is_ok()) {
        active_ = false;
    }
    return result;
}

void TransactionGuard::rollback() {
    if (active_) {
        auto result = db_.rollback();
        if (result.is_err()) {
            qCWarning(tallyStorageLog) << "rollback failed:"
                                       << QString::fromStdString(result.unwrap_err().to_string());
        }
        active_ = false;
    }
}

} // namespace tally::storage
