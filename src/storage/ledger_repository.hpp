#pragma once

#include "storage/database.hpp"
#include "core/ledger.hpp"
#include "core/result.hpp"
#include <vector>
#include <optional>
#include <string>
#include <utility>

namespace tally::storage {

struct BookingTotals {
    int64_t count = 0;
    double income = 0.0;
    double expense = 0.0;
};

/**
 * LedgerRepository - Data access layer for categories, bookings,
 * month closings and settings.
 */
class LedgerRepository {
public:
    explicit LedgerRepository(Database& db) : db_(db) {}

    // Category operations

    [[nodiscard]] Result<std::vector<Category>, Error> get_categories();
    [[nodiscard]] Result<std::optional<int64_t>, Error> find_category_id(const std::string& name);
    [[nodiscard]] Result<int64_t, Error> insert_category(const Category& category);

    // Booking operations

    [[nodiscard]] Result<std::optional<Booking>, Error> get_booking(const std::string& public_id);
    [[nodiscard]] Result<std::vector<Booking>, Error> get_bookings();
    [[nodiscard]] Result<std::vector<Booking>, Error> get_recent_bookings(int limit);
    [[nodiscard]] Result<BookingTotals, Error> get_totals();
    [[nodiscard]] Result<int64_t, Error> insert_booking(const Booking& booking);

    /**
     * Overwrite every column of the booking identified by public_id.
     */
    [[nodiscard]] Result<void, Error> update_booking(const Booking& booking);

    [[nodiscard]] Result<std::vector<std::pair<int64_t, std::string>>, Error> get_receipt_paths();
    [[nodiscard]] Result<void, Error> set_receipt_path(int64_t id, const std::string& path);

    // Month closing operations

    [[nodiscard]] Result<std::vector<MonthClosing>, Error> get_month_closings();
    [[nodiscard]] Result<std::optional<MonthClosing>, Error> get_month_closing(int year, int month);
    [[nodiscard]] Result<void, Error> save_month_closing(const MonthClosing& closing);

    // Settings

    [[nodiscard]] Result<std::optional<std::string>, Error> get_setting(const std::string& key);
    [[nodiscard]] Result<void, Error> set_setting(const std::string& key, const std::string& value);

private:
    Database& db_;

    [[nodiscard]] Booking row_to_booking(Statement& stmt);
    [[nodiscard]] MonthClosing row_to_month_closing(Statement& stmt);
    [[nodiscard]] Result<std::vector<Booking>, Error> query_bookings(const std::string& sql);
};

} // namespace tally::storage
