#pragma once

#include "sync/pairing_store.hpp"
#include "sync/sync_context.hpp"
#include "storage/change_log.hpp"
#include "storage/ledger_repository.hpp"
#include "storage/ledger_store.hpp"
#include "core/ledger.hpp"
#include "core/types.hpp"

#include <QDir>
#include <QTemporaryDir>
#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <string>

namespace tally::test {

/**
 * One device's data directory: ledger, pairing store and sync context
 * under a temporary directory that is removed with the node.
 */
struct TestNode {
    QTemporaryDir dir;
    std::unique_ptr<storage::LedgerStore> ledger;
    std::unique_ptr<sync::PairingStore> pairing;
    std::unique_ptr<sync::SyncContext> ctx;

    explicit TestNode(const std::string& name) {
        REQUIRE(dir.isValid());
        auto ledger_result = storage::LedgerStore::open((dir.path() + "/tally.sqlite").toStdString());
        REQUIRE(ledger_result.is_ok());
        ledger = std::move(ledger_result).unwrap();

        auto pairing_result = sync::PairingStore::open(dir.path() + "/sync_state.json", name);
        REQUIRE(pairing_result.is_ok());
        pairing = std::move(pairing_result).unwrap();

        REQUIRE(QDir().mkpath(receipt_base()));
        ctx = std::make_unique<sync::SyncContext>(
            *ledger, *pairing, sync::SyncPaths{.data_dir = dir.path(), .receipt_base = receipt_base()});
    }

    [[nodiscard]] QString receipt_base() const { return dir.path() + "/Belege"; }
    [[nodiscard]] std::string device_id() const { return pairing->identity().device_id; }

    std::string touch(const std::string& action = "UPDATE") {
        auto ts = ledger->with_db([&](storage::Database& db) {
            return storage::ChangeLog(db).append(
                ChangeEntry{.actor = "test", .action = action, .entity_type = "TEST"});
        });
        REQUIRE(ts.is_ok());
        return ts.unwrap();
    }

    int64_t add_category(const std::string& name) {
        auto id = ledger->with_db([&](storage::Database& db) {
            return storage::LedgerRepository(db).insert_category(
                Category{.id = 0, .name = name, .description = std::nullopt,
                         .default_mwst_rate = 8.1, .is_active = true});
        });
        REQUIRE(id.is_ok());
        return id.unwrap();
    }

    void add_booking(const std::string& public_id, double amount, const std::string& updated_at,
                     std::optional<int64_t> category_id = std::nullopt) {
        Booking booking;
        booking.public_id = public_id;
        booking.date = "2024-03-15";
        booking.year = 2024;
        booking.month = 3;
        booking.type = amount > 0 ? booking_type::INCOME : booking_type::EXPENSE;
        booking.payment_method = "BAR";
        booking.category_id = category_id;
        booking.description = "Booking " + public_id;
        booking.amount_chf = amount;
        booking.mwst_rate = 8.1;
        booking.created_at = "2024-03-15T10:00:00.000Z";
        booking.updated_at = updated_at;
        auto id = ledger->with_db([&](storage::Database& db) {
            return storage::LedgerRepository(db).insert_booking(booking);
        });
        REQUIRE(id.is_ok());
    }

    void close_month(int year, int month, const std::string& closed_at) {
        auto saved = ledger->with_db([&](storage::Database& db) {
            return storage::LedgerRepository(db).save_month_closing(
                MonthClosing{.year = year, .month = month, .is_closed = true,
                             .closed_at = closed_at, .closed_by = "test"});
        });
        REQUIRE(saved.is_ok());
    }

    std::optional<Booking> booking(const std::string& public_id) {
        auto found = ledger->with_db([&](storage::Database& db) {
            return storage::LedgerRepository(db).get_booking(public_id);
        });
        REQUIRE(found.is_ok());
        return found.unwrap();
    }

    std::optional<MonthClosing> month(int year, int month) {
        auto found = ledger->with_db([&](storage::Database& db) {
            return storage::LedgerRepository(db).get_month_closing(year, month);
        });
        REQUIRE(found.is_ok());
        return found.unwrap();
    }

    std::string last_change() {
        auto last = ctx->last_change();
        REQUIRE(last.is_ok());
        return last.unwrap();
    }
};

} // namespace tally::test
