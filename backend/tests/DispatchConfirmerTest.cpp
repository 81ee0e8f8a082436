#include "FetchTestUtils.hpp"
#include "engine/Backlog.hpp"
#include "engine/DispatchConfirmer.hpp"
#include "engine/EventBus.hpp"
#include "engine/Events.hpp"

#include <string>
#include <vector>

#include <doctest/doctest.h>

using namespace tf::engine;
using tf::tests::entry;
using tf::tests::snapshot_of;

TEST_CASE("DispatchConfirmer releases names from in-flight")
{
    Backlog backlog;
    backlog.reconcile(snapshot_of({entry("a", 1), entry("b", 1)}));
    auto batch = backlog.select_batch(Backlog::kUnbounded);
    REQUIRE(backlog.in_flight_count() == 2);

    DispatchConfirmer confirmer(&backlog);
    confirmer.confirm(batch);
    CHECK(backlog.in_flight_count() == 0);
    CHECK(backlog.pending_count() == 0);
    CHECK(confirmer.confirmations() == 1);

    // A repeated confirmation changes nothing.
    auto state = backlog.snapshot_state();
    confirmer.confirm(batch);
    CHECK(backlog.snapshot_state() == state);
}

TEST_CASE("DispatchConfirmer ignores an empty confirmation")
{
    Backlog backlog;
    DispatchConfirmer confirmer(&backlog);
    confirmer.confirm(std::vector<std::string>{});
    CHECK(confirmer.confirmations() == 0);
}

TEST_CASE("DispatchConfirmer publishes confirmed units")
{
    Backlog backlog;
    backlog.reconcile(snapshot_of({entry("x", 4)}));

    DispatchUnit unit;
    unit.id = 42;
    unit.names = backlog.select_batch(Backlog::kUnbounded);

    EventBus bus;
    std::vector<DispatchConfirmedEvent> seen;
    bus.subscribe<DispatchConfirmedEvent>(
        [&seen](DispatchConfirmedEvent const &event) { seen.push_back(event); });

    DispatchConfirmer confirmer(&backlog, &bus);
    confirmer.confirm(unit);
    REQUIRE(seen.size() == 1);
    CHECK(seen[0].unit_id == 42);
    CHECK(seen[0].names == std::vector<std::string>{"x"});
    CHECK(backlog.in_flight_count() == 0);

    // Bare names carry no unit id.
    confirmer.confirm(std::vector<std::string>{"x"});
    REQUIRE(seen.size() == 2);
    CHECK(seen[1].unit_id == 0);
}
