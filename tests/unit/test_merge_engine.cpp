#include <catch2/catch_test_macros.hpp>
#include "sync/merge_engine.hpp"
#include "storage/ledger_repository.hpp"
#include "storage/migrations.hpp"

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

using namespace tally;
using namespace tally::storage;
using namespace tally::sync;

namespace {

Database fresh_db() {
    auto db = Database::open_memory().unwrap();
    REQUIRE(initialize_database(db).is_ok());
    return db;
}

int64_t category(Database& db, const std::string& name) {
    auto id = LedgerRepository(db).insert_category(
        Category{.id = 0, .name = name, .description = std::nullopt,
                 .default_mwst_rate = 8.1, .is_active = true});
    REQUIRE(id.is_ok());
    return id.unwrap();
}

void booking(Database& db, const std::string& public_id, double amount, const std::string& updated_at,
             std::optional<int64_t> category_id = std::nullopt,
             std::optional<std::string> receipt = std::nullopt) {
    Booking b;
    b.public_id = public_id;
    b.date = "2024-03-15";
    b.year = 2024;
    b.month = 3;
    b.type = booking_type::INCOME;
    b.category_id = category_id;
    b.description = "Booking " + public_id;
    b.amount_chf = amount;
    b.mwst_rate = 8.1;
    b.receipt_path = std::move(receipt);
    b.created_at = "2024-03-01T00:00:00.000Z";
    b.updated_at = updated_at;
    REQUIRE(LedgerRepository(db).insert_booking(b).is_ok());
}

void month(Database& db, int m, bool closed, std::optional<std::string> closed_at = std::nullopt) {
    REQUIRE(LedgerRepository(db).save_month_closing(
        MonthClosing{.year = 2024, .month = m, .is_closed = closed,
                     .closed_at = std::move(closed_at), .closed_by = std::nullopt}).is_ok());
}

} // namespace

TEST_CASE("MergeEngine adds missing categories by name", "[merge]") {
    QTemporaryDir receipts;
    auto local = fresh_db();
    auto remote = fresh_db();
    category(local, "Material");
    category(remote, "Material");
    category(remote, "Miete");

    MergeEngine engine(local, remote, receipts.path());
    REQUIRE(engine.merge_categories().unwrap() == 1);
    REQUIRE(LedgerRepository(local).get_categories().unwrap().size() == 2);
    REQUIRE(engine.merge_categories().unwrap() == 0);
}

TEST_CASE("MergeEngine resolves bookings last-writer-wins", "[merge]") {
    QTemporaryDir receipts;
    auto local = fresh_db();
    auto remote = fresh_db();

    booking(local, "same", 10.0, "2024-03-15T10:00:00.000Z");
    booking(remote, "same", 10.0, "2024-03-15T10:00:00.000Z");
    booking(local, "newer-local", 20.0, "2024-03-16T10:00:00.000Z");
    booking(remote, "newer-local", 21.0, "2024-03-15T10:00:00.000Z");
    booking(local, "newer-remote", 30.0, "2024-03-15T10:00:00.000Z");
    booking(remote, "newer-remote", 31.0, "2024-03-15T10:00:00.001Z");
    booking(remote, "remote-only", 40.0, "2024-03-15T10:00:00.000Z");

    MergeEngine engine(local, remote, receipts.path());
    const auto stats = engine.merge_bookings().unwrap();
    REQUIRE(stats.bookings_inserted == 1);
    REQUIRE(stats.bookings_updated == 1);

    LedgerRepository repo(local);
    REQUIRE(repo.get_booking("newer-local").unwrap()->amount_chf == 20.0);
    REQUIRE(repo.get_booking("newer-remote").unwrap()->amount_chf == 31.0);
    REQUIRE(repo.get_booking("remote-only").unwrap().has_value());
    REQUIRE(repo.get_bookings().unwrap().size() == 4);

    SECTION("A second merge changes nothing") {
        const auto again = engine.merge_bookings().unwrap();
        REQUIRE(again.bookings_inserted == 0);
        REQUIRE(again.bookings_updated == 0);
    }
}

TEST_CASE("MergeEngine maps categories by name, not id", "[merge]") {
    QTemporaryDir receipts;
    auto local = fresh_db();
    auto remote = fresh_db();
    category(local, "Unrelated");
    const auto local_material = category(local, "Material");
    const auto remote_material = category(remote, "Material");
    REQUIRE(local_material != remote_material);

    booking(remote, "tx", 10.0, "2024-03-15T10:00:00.000Z", remote_material);

    MergeEngine engine(local, remote, receipts.path());
    REQUIRE(engine.run().is_ok());
    const auto merged = LedgerRepository(local).get_booking("tx").unwrap();
    REQUIRE(merged->category_id == std::optional<int64_t>(local_material));
    REQUIRE(merged->category_name == std::optional<std::string>("Material"));
}

TEST_CASE("MergeEngine rebases receipt paths onto local files", "[merge]") {
    QTemporaryDir receipts;
    REQUIRE(QDir().mkpath(receipts.path() + "/2024"));
    QFile file(receipts.path() + "/2024/r1.pdf");
    REQUIRE(file.open(QIODevice::WriteOnly));
    REQUIRE(file.write("pdf") == 3);
    file.close();

    auto local = fresh_db();
    auto remote = fresh_db();
    booking(remote, "with-receipt", 10.0, "2024-03-15T10:00:00.000Z", std::nullopt,
            std::string("C:\\Users\\kasse\\Belege\\2024\\r1.pdf"));
    booking(remote, "lost-receipt", 11.0, "2024-03-15T10:00:00.000Z", std::nullopt,
            std::string("/elsewhere/Belege/missing.pdf"));

    MergeEngine engine(local, remote, receipts.path());
    REQUIRE(engine.run().is_ok());

    LedgerRepository repo(local);
    const auto mapped = repo.get_booking("with-receipt").unwrap()->receipt_path;
    REQUIRE(mapped.has_value());
    REQUIRE(QFile::exists(QString::fromStdString(*mapped)));
    REQUIRE_FALSE(repo.get_booking("lost-receipt").unwrap()->receipt_path.has_value());
}

TEST_CASE("MergeEngine never reopens a closed month", "[merge]") {
    QTemporaryDir receipts;
    auto local = fresh_db();
    auto remote = fresh_db();

    month(local, 1, true, "2024-02-01T08:00:00.000Z");
    month(remote, 1, false);
    month(local, 2, false);
    month(remote, 2, true, "2024-03-01T08:00:00.000Z");
    month(local, 3, true, "2024-04-01T08:00:00.000Z");
    month(remote, 3, true, "2024-04-02T08:00:00.000Z");
    month(remote, 4, false);

    MergeEngine engine(local, remote, receipts.path());
    REQUIRE(engine.merge_month_closings().unwrap() == 3);

    LedgerRepository repo(local);
    REQUIRE(repo.get_month_closing(2024, 1).unwrap()->is_closed);
    REQUIRE(repo.get_month_closing(2024, 2).unwrap()->is_closed);
    REQUIRE(repo.get_month_closing(2024, 3).unwrap()->closed_at ==
            std::optional<std::string>("2024-04-02T08:00:00.000Z"));
    REQUIRE_FALSE(repo.get_month_closing(2024, 4).unwrap()->is_closed);

    REQUIRE(engine.merge_month_closings().unwrap() == 0);
}
