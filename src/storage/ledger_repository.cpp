#include "storage/ledger_repository.hpp"

namespace tally::storage {

namespace {

constexpr const char* BOOKING_COLUMNS = R"SQL(
    t.id, t.public_id, t.date, t.year, t.month, t.type, t.payment_method,
    t.category_id, c.name, t.description, t.amount_chf, t.mwst_rate,
    t.receipt_path, t.note, t.ref_public_id, t.created_at, t.updated_at
)SQL";

std::string booking_select(const std::string& tail) {
    return std::string("SELECT ") + BOOKING_COLUMNS +
           " FROM transactions t LEFT JOIN categories c ON c.id = t.category_id " + tail;
}

} // namespace

Booking LedgerRepository::row_to_booking(Statement& stmt) {
    return Booking{
        .id = stmt.column_int64(0),
        .public_id = stmt.column_text(1),
        .date = stmt.column_text(2),
        .year = stmt.column_int(3),
        .month = stmt.column_int(4),
        .type = stmt.column_text(5),
        .payment_method = stmt.column_optional_text(6),
        .category_id = stmt.column_optional_int64(7),
        .category_name = stmt.column_optional_text(8),
        .description = stmt.column_optional_text(9),
        .amount_chf = stmt.column_double(10),
        .mwst_rate = stmt.column_double(11),
        .receipt_path = stmt.column_optional_text(12),
        .note = stmt.column_optional_text(13),
        .ref_public_id = stmt.column_optional_text(14),
        .created_at = stmt.column_text(15),
        .updated_at = stmt.column_text(16)
    };
}

MonthClosing LedgerRepository::row_to_month_closing(Statement& stmt) {
    return MonthClosing{
        .year = stmt.column_int(0),
        .month = stmt.column_int(1),
        .is_closed = stmt.column_int(2) != 0,
        .closed_at = stmt.column_optional_text(3),
        .closed_by = stmt.column_optional_text(4)
    };
}

// ============================================================================
// Categories
// ============================================================================

Result<std::vector<Category>, Error> LedgerRepository::get_categories() {
    std::vector<Category> categories;
    auto result = db_.query(
        "SELECT id, name, description, default_mwst_rate, is_active FROM categories ORDER BY name;",
        [&](Statement& stmt) {
            categories.push_back(Category{
                .id = stmt.column_int64(0),
                .name = stmt.column_text(1),
                .description = stmt.column_optional_text(2),
                .default_mwst_rate = stmt.column_double(3),
                .is_active = stmt.column_int(4) != 0
            });
        });
    if (result.is_err()) {
        return Result<std::vector<Category>, Error>::err(result.unwrap_err());
    }
    return Result<std::vector<Category>, Error>::ok(std::move(categories));
}

Result<std::optional<int64_t>, Error> LedgerRepository::find_category_id(const std::string& name) {
    using R = Result<std::optional<int64_t>, Error>;

    auto stmt_result = db_.prepare("SELECT id FROM categories WHERE name = ?;");
    if (stmt_result.is_err()) {
        return R::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    TALLY_TRY(R, stmt.bind_all(name));

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return R::err(step_result.unwrap_err());
    }
    if (!step_result.unwrap()) {
        return R::ok(std::nullopt);
    }
    return R::ok(stmt.column_int64(0));
}

Result<int64_t, Error> LedgerRepository::insert_category(const Category& category) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO categories (name, description, default_mwst_rate, is_active)
        VALUES (?, ?, ?, ?);
    )SQL");
    if (stmt_result.is_err()) {
        return Result<int64_t, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    TALLY_TRY(Result<int64_t>, stmt.bind_all(category.name, category.description,
                                             category.default_mwst_rate,
                                             category.is_active ? 1 : 0));

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<int64_t, Error>::err(step_result.unwrap_err());
    }
    return Result<int64_t, Error>::ok(db_.last_insert_rowid());
}

// ============================================================================
// Bookings
// ============================================================================

Result<std::vector<Booking>, Error> LedgerRepository::query_bookings(const std::string& sql) {
    std::vector<Booking> bookings;
    auto result = db_.query(sql, [&](Statement& stmt) {
        bookings.push_back(row_to_booking(stmt));
    });
    if (result.is_err()) {
        return Result<std::vector<Booking>, Error>::err(result.unwrap_err());
    }
    return Result<std::vector<Booking>, Error>::ok(std::move(bookings));
}

Result<std::optional<Booking>, Error> LedgerRepository::get_booking(const std::string& public_id) {
    using R = Result<std::optional<Booking>, Error>;

    auto stmt_result = db_.prepare(booking_select("WHERE t.public_id = ?;"));
    if (stmt_result.is_err()) {
        return R::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    TALLY_TRY(R, stmt.bind_all(public_id));

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return R::err(step_result.unwrap_err());
    }
    if (!step_result.unwrap()) {
        return R::ok(std::nullopt);
    }
    return R::ok(row_to_booking(stmt));
}

Result<std::vector<Booking>, Error> LedgerRepository::get_bookings() {
    return query_bookings(booking_select("ORDER BY t.id;"));
}

Result<std::vector<Booking>, Error> LedgerRepository::get_recent_bookings(int limit) {
    return query_bookings(booking_select(
        "ORDER BY t.updated_at DESC, t.id DESC LIMIT " + std::to_string(limit) + ";"));
}

Result<BookingTotals, Error> LedgerRepository::get_totals() {
    auto stmt_result = db_.prepare(R"SQL(
        SELECT COUNT(*),
               COALESCE(SUM(CASE WHEN type = 'INCOME' THEN amount_chf END), 0),
               COALESCE(SUM(CASE WHEN type = 'EXPENSE' THEN amount_chf END), 0)
        FROM transactions;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<BookingTotals, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<BookingTotals, Error>::err(step_result.unwrap_err());
    }
    return Result<BookingTotals, Error>::ok(BookingTotals{
        .count = stmt.column_int64(0),
        .income = stmt.column_double(1),
        .expense = stmt.column_double(2)
    });
}

Result<int64_t, Error> LedgerRepository::insert_booking(const Booking& b) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO transactions (
            public_id, date, year, month, type, payment_method, category_id,
            description, amount_chf, mwst_rate, receipt_path, note, ref_public_id,
            created_at, updated_at
        ) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
    )SQL");
    if (stmt_result.is_err()) {
        return Result<int64_t, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    TALLY_TRY(Result<int64_t>, stmt.bind_all(
        b.public_id, b.date, b.year, b.month, b.type, b.payment_method, b.category_id,
        b.description, b.amount_chf, b.mwst_rate, b.receipt_path, b.note, b.ref_public_id,
        b.created_at, b.updated_at));

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<int64_t, Error>::err(step_result.unwrap_err());
    }
    return Result<int64_t, Error>::ok(db_.last_insert_rowid());
}

Result<void, Error> LedgerRepository::update_booking(const Booking& b) {
    auto stmt_result = db_.prepare(R"SQL(
        UPDATE transactions SET
            date = ?, year = ?, month = ?, type = ?, payment_method = ?,
            category_id = ?, description = ?, amount_chf = ?, mwst_rate = ?,
            receipt_path = ?, note = ?, ref_public_id = ?, created_at = ?, updated_at = ?
        WHERE public_id = ?;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    TALLY_TRY(Result<void>, stmt.bind_all(
        b.date, b.year, b.month, b.type, b.payment_method, b.category_id, b.description,
        b.amount_chf, b.mwst_rate, b.receipt_path, b.note, b.ref_public_id,
        b.created_at, b.updated_at, b.public_id));

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<void, Error>::err(step_result.unwrap_err());
    }
    return Result<void, Error>::ok();
}

Result<std::vector<std::pair<int64_t, std::string>>, Error> LedgerRepository::get_receipt_paths() {
    std::vector<std::pair<int64_t, std::string>> paths;
    auto result = db_.query(
        "SELECT id, receipt_path FROM transactions "
        "WHERE receipt_path IS NOT NULL AND receipt_path <> '';",
        [&](Statement& stmt) {
            paths.emplace_back(stmt.column_int64(0), stmt.column_text(1));
        });
    if (result.is_err()) {
        return Result<std::vector<std::pair<int64_t, std::string>>, Error>::err(result.unwrap_err());
    }
    return Result<std::vector<std::pair<int64_t, std::string>>, Error>::ok(std::move(paths));
}

Result<void, Error> LedgerRepository::set_receipt_path(int64_t id, const std::string& path) {
    auto stmt_result = db_.prepare("UPDATE transactions SET receipt_path = ? WHERE id = ?;");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    TALLY_TRY(Result<void>, stmt.bind_all(path, id));

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<void, Error>::err(step_result.unwrap_err());
    }
    return Result<void, Error>::ok();
}

// ============================================================================
// Month closing
// ============================================================================

Result<std::vector<MonthClosing>, Error> LedgerRepository::get_month_closings() {
    std::vector<MonthClosing> closings;
    auto result = db_.query(
        "SELECT year, month, is_closed, closed_at, closed_by FROM month_closing "
        "ORDER BY year, month;",
        [&](Statement& stmt) {
            closings.push_back(row_to_month_closing(stmt));
        });
    if (result.is_err()) {
        return Result<std::vector<MonthClosing>, Error>::err(result.unwrap_err());
    }
    return Result<std::vector<MonthClosing>, Error>::ok(std::move(closings));
}

Result<std::optional<MonthClosing>, Error> LedgerRepository::get_month_closing(int year, int month) {
    using R = Result<std::optional<MonthClosing>, Error>;

    auto stmt_result = db_.prepare(
        "SELECT year, month, is_closed, closed_at, closed_by FROM month_closing "
        "WHERE year = ? AND month = ?;");
    if (stmt_result.is_err()) {
        return R::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    TALLY_TRY(R, stmt.bind_all(year, month));

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return R::err(step_result.unwrap_err());
    }
    if (!step_result.unwrap()) {
        return R::ok(std::nullopt);
    }
    return R::ok(row_to_month_closing(stmt));
}

Result<void, Error> LedgerRepository::save_month_closing(const MonthClosing& closing) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO month_closing (year, month, is_closed, closed_at, closed_by)
        VALUES (?, ?, ?, ?, ?)
        ON CONFLICT(year, month) DO UPDATE SET
            is_closed = excluded.is_closed,
            closed_at = excluded.closed_at,
            closed_by = excluded.closed_by;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    TALLY_TRY(Result<void>, stmt.bind_all(closing.year, closing.month,
                                          closing.is_closed ? 1 : 0,
                                          closing.closed_at, closing.closed_by));

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<void, Error>::err(step_result.unwrap_err());
    }
    return Result<void, Error>::ok();
}

// ============================================================================
// Settings
// ============================================================================

Result<std::optional<std::string>, Error> LedgerRepository::get_setting(const std::string& key) {
    using R = Result<std::optional<std::string>, Error>;

    auto stmt_result = db_.prepare("SELECT value FROM settings WHERE key = ?;");
    if (stmt_result.is_err()) {
        return R::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    TALLY_TRY(R, stmt.bind_all(key));

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return R::err(step_result.unwrap_err());
    }
    if (!step_result.unwrap()) {
        return R::ok(std::nullopt);
    }
    return R::ok(stmt.column_text(0));
}

Result<void, Error> LedgerRepository::set_setting(const std::string& key, const std::string& value) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO settings (key, value) VALUES (?, ?)
        ON CONFLICT(key) DO UPDATE SET value = excluded.value;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    TALLY_TRY(Result<void>, stmt.bind_all(key, value));

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<void, Error>::err(step_result.unwrap_err());
    }
    return Result<void, Error>::ok();
}

} // namespace tally::storage
