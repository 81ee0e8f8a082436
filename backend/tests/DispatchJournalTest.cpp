#include "FetchTestUtils.hpp"
#include "engine/Backlog.hpp"
#include "engine/DispatchConfirmer.hpp"
#include "engine/DispatchJournal.hpp"
#include "engine/EventBus.hpp"
#include "engine/Events.hpp"
#include "utils/StateStore.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include <doctest/doctest.h>

using namespace tf::engine;
using tf::tests::bytes_of;
using tf::tests::entry;

namespace
{

DispatchUnit make_unit(std::uint64_t id, std::vector<std::string> names)
{
    DispatchUnit unit;
    unit.id = id;
    for (auto const &name : names)
    {
        unit.items.push_back(DispatchItem{entry(name, 3), bytes_of("abc")});
    }
    unit.names = std::move(names);
    return unit;
}

} // namespace

TEST_CASE("Database stores dispatch records and confirmations")
{
    auto root = tf::tests::make_temp_root("journal-db");
    {
        tf::storage::Database db(root / "journal.db");
        REQUIRE(db.is_valid());

        tf::storage::DispatchRecord record;
        record.run_id = "run-1";
        record.unit_id = 5;
        record.names = {"a", "b \"quoted\""};
        record.bytes = 12;
        record.dispatched_at = 1000;
        REQUIRE(db.insert_dispatch(record));

        auto found = db.find_dispatch("run-1", 5);
        REQUIRE(found);
        CHECK(found->names == record.names);
        CHECK(found->bytes == 12);
        CHECK_FALSE(found->confirmed_at);

        CHECK(db.unconfirmed("").size() == 1);
        CHECK(db.unconfirmed("run-2").empty());

        CHECK(db.mark_confirmed("run-1", 5, 2000));
        CHECK_FALSE(db.mark_confirmed("run-1", 5, 3000));
        CHECK_FALSE(db.mark_confirmed("run-1", 6, 3000));
        found = db.find_dispatch("run-1", 5);
        REQUIRE(found);
        REQUIRE(found->confirmed_at);
        CHECK(*found->confirmed_at == 2000);
        CHECK(db.unconfirmed("run-1").empty());

        CHECK(db.delete_confirmed_before(2500));
        CHECK(db.count_dispatches() == std::optional<std::int64_t>(0));
    }
    std::error_code ec;
    std::filesystem::remove_all(root, ec);
}

TEST_CASE("Database keeps names that are not valid UTF-8")
{
    auto root = tf::tests::make_temp_root("journal-bytes");
    {
        tf::storage::Database db(root / "journal.db");
        REQUIRE(db.is_valid());

        tf::storage::DispatchRecord record;
        record.run_id = "run-1";
        record.unit_id = 1;
        record.names = {"latin1-caf\xe9.txt", "plain.txt"};
        record.bytes = 4;
        record.dispatched_at = 1000;
        REQUIRE(db.insert_dispatch(record));

        auto found = db.find_dispatch("run-1", 1);
        REQUIRE(found);
        CHECK(found->names == record.names);
    }
    std::error_code ec;
    std::filesystem::remove_all(root, ec);
}

TEST_CASE("DispatchJournal follows units through the event bus")
{
    auto root = tf::tests::make_temp_root("journal-bus");
    {
        EventBus bus;
        DispatchJournal journal(root / "journal.db", "test-run");
        REQUIRE(journal.is_valid());
        CHECK(journal.run_id() == "test-run");
        journal.attach(bus);
        journal.start();

        bus.publish(DispatchReadyEvent{make_unit(1, {"a", "b"})});
        bus.publish(DispatchReadyEvent{make_unit(2, {"c"})});
        bus.publish(DispatchConfirmedEvent{1, {"a", "b"}});
        // Bare-name confirmations are not attributable to a unit.
        bus.publish(DispatchConfirmedEvent{0, {"c"}});
        journal.flush();

        auto open = journal.unconfirmed();
        REQUIRE(open.size() == 1);
        CHECK(open[0].unit_id == 2);
        CHECK(open[0].names == std::vector<std::string>{"c"});
        CHECK(open[0].bytes == 3);
        journal.stop();
    }
    {
        tf::storage::Database reader(root / "journal.db");
        REQUIRE(reader.is_valid());
        auto first = reader.find_dispatch("test-run", 1);
        REQUIRE(first);
        CHECK(first->confirmed_at.has_value());
        CHECK(reader.count_dispatches() == std::optional<std::int64_t>(2));
    }
    std::error_code ec;
    std::filesystem::remove_all(root, ec);
}

TEST_CASE("DispatchJournal records confirmations from the confirmer")
{
    auto root = tf::tests::make_temp_root("journal-confirmer");
    {
        EventBus bus;
        Backlog backlog;
        backlog.reconcile(tf::tests::snapshot_of({entry("x", 3)}));
        auto unit = make_unit(9, backlog.select_batch(Backlog::kUnbounded));

        DispatchJournal journal(root / "journal.db");
        journal.attach(bus);
        journal.start();
        DispatchConfirmer confirmer(&backlog, &bus);

        bus.publish(DispatchReadyEvent{unit});
        confirmer.confirm(unit);
        journal.flush();
        CHECK(journal.unconfirmed().empty());
        CHECK(backlog.in_flight_count() == 0);
    }
    std::error_code ec;
    std::filesystem::remove_all(root, ec);
}
