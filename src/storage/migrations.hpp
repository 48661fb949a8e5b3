#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include <string>
#include <vector>

namespace tally::storage {

/**
 * Migration - A database schema migration.
 */
struct Migration {
    int version;
    std::string name;
    std::string up_sql;
};

/**
 * All migrations in order.
 */
inline const std::vector<Migration> ALL_MIGRATIONS = {
    {
        .version = 1,
        .name = "ledger_schema",
        .up_sql = R"SQL(
            CREATE TABLE IF NOT EXISTS settings (
                key TEXT PRIMARY KEY,
                value TEXT NOT NULL
            );

            CREATE TABLE IF NOT EXISTS categories (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                name TEXT NOT NULL UNIQUE,
                description TEXT,
                default_mwst_rate REAL NOT NULL DEFAULT 0.0,
                is_active INTEGER NOT NULL DEFAULT 1
            );

            CREATE TABLE IF NOT EXISTS transactions (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                public_id TEXT NOT NULL UNIQUE,
                date TEXT NOT NULL,
                year INTEGER NOT NULL,
                month INTEGER NOT NULL CHECK(month BETWEEN 1 AND 12),
                type TEXT NOT NULL CHECK(type IN ('INCOME', 'EXPENSE', 'CORRECTION')),
                payment_method TEXT CHECK(payment_method IN ('BAR', 'TWINT')),
                category_id INTEGER REFERENCES categories(id),
                description TEXT,
                amount_chf REAL NOT NULL CHECK(amount_chf <> 0),
                mwst_rate REAL NOT NULL CHECK(mwst_rate >= 0 AND mwst_rate < 100),
                receipt_path TEXT,
                note TEXT,
                ref_public_id TEXT,
                created_at TEXT NOT NULL,
                updated_at TEXT NOT NULL
            );
            CREATE INDEX IF NOT EXISTS idx_transactions_year_month_date
                ON transactions(year, month, date);
            CREATE INDEX IF NOT EXISTS idx_transactions_type ON transactions(type);
            CREATE INDEX IF NOT EXISTS idx_transactions_ref_public_id
                ON transactions(ref_public_id);

            CREATE TABLE IF NOT EXISTS month_closing (
                year INTEGER NOT NULL,
                month INTEGER NOT NULL CHECK(month BETWEEN 1 AND 12),
                is_closed INTEGER NOT NULL DEFAULT 0,
                closed_at TEXT,
                closed_by TEXT,
                PRIMARY KEY(year, month)
            );
        )SQL"
    },
    {
        .version = 2,
        .name = "change_log",
        .up_sql = R"SQL(
            -- Append-only; max(ts) is the dataset's logical change timestamp
            CREATE TABLE IF NOT EXISTS audit_log (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                ts TEXT NOT NULL,
                actor TEXT,
                action TEXT NOT NULL,
                entity_type TEXT NOT NULL,
                entity_id TEXT,
                ref_id TEXT,
                payload_json TEXT NOT NULL,
                details TEXT
            );
            CREATE INDEX IF NOT EXISTS idx_audit_ts ON audit_log(ts);
        )SQL"
    }
};

/**
 * MigrationRunner - Runs database migrations.
 */
class MigrationRunner {
public:
    explicit MigrationRunner(Database& db) : db_(db) {}

    /**
     * Run all pending migrations.
     */
    [[nodiscard]] Result<void, Error> migrate();

    /**
     * Migrate to a specific version.
     */
    [[nodiscard]] Result<void, Error> migrate_to(int target_version);

    /**
     * Get the current schema version.
     */
    [[nodiscard]] Result<int, Error> current_version();

    [[nodiscard]] static int latest_version() {
        return ALL_MIGRATIONS.empty() ? 0 : ALL_MIGRATIONS.back().version;
    }

private:
    Database& db_;

    [[nodiscard]] Result<void, Error> ensure_migrations_table();
    [[nodiscard]] Result<void, Error> run_migration(const Migration& m);
    [[nodiscard]] Result<void, Error> set_version(int version, const std::string& name);
};

/**
 * Initialize a database with all migrations.
 */
[[nodiscard]] inline Result<void, Error> initialize_database(Database& db) {
    MigrationRunner runner(db);
    return runner.migrate();
}

} // namespace tally::storage
