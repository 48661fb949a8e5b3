#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "sync/conflict_detector.hpp"
#include "sync/merge_engine.hpp"
#include "storage/ledger_repository.hpp"
#include "storage/migrations.hpp"
#include "core/types.hpp"

#include <QTemporaryDir>

#include <iterator>
#include <vector>

using namespace tally;
using namespace tally::storage;
using namespace tally::sync;

namespace {

struct BookingSpec {
    int key = 0;            // public_id is "tx-<key>"
    int amount = 1;         // never zero
    int64_t updated_millis = 0;
    int category = 0;       // index into CATEGORIES
};

const char* const CATEGORIES[] = {"Material", "Miete", "Verpflegung"};

rc::Gen<BookingSpec> gen_booking() {
    return rc::gen::build<BookingSpec>(
        rc::gen::set(&BookingSpec::key, rc::gen::inRange(0, 12)),
        rc::gen::set(&BookingSpec::amount, rc::gen::nonZero<int>()),
        rc::gen::set(&BookingSpec::updated_millis, rc::gen::inRange<int64_t>(1'700'000'000'000LL,
                                                                             1'700'000'100'000LL)),
        rc::gen::set(&BookingSpec::category, rc::gen::inRange(0, 3)));
}

Database ledger_with(const std::vector<BookingSpec>& specs) {
    auto db = Database::open_memory().unwrap();
    RC_ASSERT(initialize_database(db).is_ok());
    LedgerRepository repo(db);
    for (const auto& spec : specs) {
        const std::string name = CATEGORIES[spec.category];
        auto id = repo.find_category_id(name).unwrap();
        if (!id) {
            id = repo.insert_category(Category{.id = 0, .name = name, .description = std::nullopt,
                                               .default_mwst_rate = 0.0, .is_active = true}).unwrap();
        }
        const auto public_id = "tx-" + std::to_string(spec.key);
        if (repo.get_booking(public_id).unwrap()) {
            continue;
        }
        Booking b;
        b.public_id = public_id;
        b.date = "2024-03-15";
        b.year = 2024;
        b.month = 3;
        b.type = spec.amount > 0 ? booking_type::INCOME : booking_type::EXPENSE;
        b.category_id = id;
        b.amount_chf = spec.amount;
        b.created_at = Timestamp(spec.updated_millis).to_iso_string();
        b.updated_at = b.created_at;
        RC_ASSERT(repo.insert_booking(b).is_ok());
    }
    return db;
}

} // namespace

TEST_CASE("Property: merging twice is the same as merging once", "[property][merge]") {
    QTemporaryDir receipts;
    REQUIRE(receipts.isValid());

    rc::check("second merge changes nothing", [&] {
        const auto local_specs = *rc::gen::container<std::vector<BookingSpec>>(gen_booking());
        const auto remote_specs = *rc::gen::container<std::vector<BookingSpec>>(gen_booking());
        auto local = ledger_with(local_specs);
        auto remote = ledger_with(remote_specs);

        MergeEngine engine(local, remote, receipts.path());
        RC_ASSERT(engine.run().is_ok());
        const auto after_first = LedgerRepository(local).get_bookings().unwrap();

        const auto second = engine.run().unwrap();
        RC_ASSERT(second.categories_added == 0);
        RC_ASSERT(second.bookings_inserted == 0);
        RC_ASSERT(second.bookings_updated == 0);
        RC_ASSERT(second.months_changed == 0);

        const auto after_second = LedgerRepository(local).get_bookings().unwrap();
        RC_ASSERT(after_first.size() == after_second.size());
    });
}

TEST_CASE("Property: merge keeps the newest version of every booking", "[property][merge]") {
    QTemporaryDir receipts;
    REQUIRE(receipts.isValid());

    rc::check("each public_id ends with the later updated_at", [&] {
        const auto local_specs = *rc::gen::container<std::vector<BookingSpec>>(gen_booking());
        const auto remote_specs = *rc::gen::container<std::vector<BookingSpec>>(gen_booking());
        auto local = ledger_with(local_specs);
        auto remote = ledger_with(remote_specs);

        auto before_local = LedgerRepository(local).get_bookings().unwrap();
        auto before_remote = LedgerRepository(remote).get_bookings().unwrap();

        MergeEngine engine(local, remote, receipts.path());
        RC_ASSERT(engine.run().is_ok());

        LedgerRepository merged(local);
        for (const auto& theirs : before_remote) {
            const auto ours = merged.get_booking(theirs.public_id).unwrap();
            RC_ASSERT(ours.has_value());
            RC_ASSERT(!is_after(theirs.updated_at, ours->updated_at));
        }
        for (const auto& mine : before_local) {
            const auto ours = merged.get_booking(mine.public_id).unwrap();
            RC_ASSERT(ours.has_value());
            RC_ASSERT(!is_after(mine.updated_at, ours->updated_at));
        }
        RC_ASSERT(merged.get_categories().unwrap().size() <= std::size(CATEGORIES));
    });
}
