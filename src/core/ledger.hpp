#pragma once

#include <string>
#include <optional>
#include <cstdint>

namespace tally {

/**
 * Category - a booking category. The name is unique per ledger.
 */
struct Category {
    int64_t id = 0;
    std::string name;
    std::optional<std::string> description;
    double default_mwst_rate = 0.0;
    bool is_active = true;
};

namespace booking_type {
inline constexpr const char* INCOME = "INCOME";
inline constexpr const char* EXPENSE = "EXPENSE";
inline constexpr const char* CORRECTION = "CORRECTION";
} // namespace booking_type

/**
 * Booking - one row of the `transactions` table.
 *
 * `public_id` is the natural key shared between devices; `id` is local.
 * `category_name` is filled by queries that join categories and is not
 * stored.
 */
struct Booking {
    int64_t id = 0;
    std::string public_id;
    std::string date;  // YYYY-MM-DD
    int year = 0;
    int month = 0;
    std::string type;
    std::optional<std::string> payment_method;
    std::optional<int64_t> category_id;
    std::optional<std::string> category_name;
    std::optional<std::string> description;
    double amount_chf = 0.0;
    double mwst_rate = 0.0;
    std::optional<std::string> receipt_path;
    std::optional<std::string> note;
    std::optional<std::string> ref_public_id;
    std::string created_at;
    std::string updated_at;
};

/**
 * MonthClosing - closing flag for one (year, month).
 */
struct MonthClosing {
    int year = 0;
    int month = 0;
    bool is_closed = false;
    std::optional<std::string> closed_at;
    std::optional<std::string> closed_by;
};

/**
 * ChangeEntry - one row of the change log (`audit_log`).
 */
struct ChangeEntry {
    std::optional<std::string> actor;
    std::string action;
    std::string entity_type;
    std::optional<std::string> entity_id;
    std::optional<std::string> ref_id;
    std::string payload_json = "{}";
    std::optional<std::string> details;
};

} // namespace tally
