#include "FetchTestUtils.hpp"
#include "engine/Backlog.hpp"
#include "engine/DispatchConfirmer.hpp"
#include "engine/PollingSource.hpp"

#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <doctest/doctest.h>

using namespace tf::engine;
using tf::tests::entry;
using tf::tests::FakeProvider;
using tf::tests::FakeRetriever;

namespace
{

struct Harness
{
    explicit Harness(int max_batch_size = Backlog::kUnbounded)
    {
        PollingConfig config;
        config.max_batch_size = max_batch_size;
        config.source_label = "test";
        source = PollingSource::create(config, &provider, &retriever,
                                       [this](DispatchUnit unit)
                                       {
                                           if (sink_throws)
                                           {
                                               throw std::runtime_error(
                                                   "queue full");
                                           }
                                           units.push_back(std::move(unit));
                                       });
    }

    FakeProvider provider;
    FakeRetriever retriever;
    std::vector<DispatchUnit> units;
    bool sink_throws = false;
    std::unique_ptr<PollingSource> source;
};

} // namespace

TEST_CASE("PollingSource::create validates maxBatchSize")
{
    FakeProvider provider;
    FakeRetriever retriever;
    auto sink = [](DispatchUnit) {};

    auto make = [&](int size)
    {
        PollingConfig config;
        config.max_batch_size = size;
        return PollingSource::create(config, &provider, &retriever, sink);
    };
    CHECK(make(0) == nullptr);
    CHECK(make(-5) == nullptr);
    CHECK(make(Backlog::kUnbounded) != nullptr);
    CHECK(make(3) != nullptr);

    PollingConfig config;
    CHECK(PollingSource::create(config, nullptr, &retriever, sink) == nullptr);
    CHECK(PollingSource::create(config, &provider, nullptr, sink) == nullptr);
    CHECK(PollingSource::create(config, &provider, &retriever, nullptr) ==
          nullptr);
}

TEST_CASE("PollingSource dispatches a bounded batch and requeues a failed "
          "entry")
{
    Harness h(2);
    REQUIRE(h.source);
    h.provider.set({entry("a", 1), entry("b", 2), entry("c", 3)});
    h.retriever.entry_failures = {"b"};

    auto outcome = h.source->poll();
    CHECK(outcome.status == PollStatus::Dispatched);
    CHECK(outcome.reconcile.added == 3);
    CHECK(outcome.dispatched == std::vector<std::string>{"a"});
    REQUIRE(outcome.entry_failures.size() == 1);
    CHECK(outcome.entry_failures[0].name == "b");
    CHECK(outcome.entry_failures[0].error.scope == RetrieveError::Scope::Entry);
    CHECK(h.retriever.requested == std::vector<std::string>{"a", "b"});

    REQUIRE(h.units.size() == 1);
    auto const &unit = h.units[0];
    CHECK(unit.id == outcome.unit_id);
    CHECK(unit.names == std::vector<std::string>{"a"});
    REQUIRE(unit.items.size() == 1);
    CHECK(unit.items[0].info.size == 1);
    CHECK(unit.items[0].content == tf::tests::bytes_of("a-payload"));
    CHECK(outcome.dispatched_bytes == unit.payload_bytes());

    auto state = h.source->backlog().snapshot_state();
    CHECK(state.in_flight == std::set<std::string>{"a"});
    CHECK(state.pending == std::set<std::string>{"b", "c"});

    DispatchConfirmer confirmer(&h.source->backlog());
    confirmer.confirm(unit.names);
    state = h.source->backlog().snapshot_state();
    CHECK(state.in_flight.empty());
    CHECK(state.pending == std::set<std::string>{"b", "c"});

    // b is retried on the next cycle.
    h.retriever.entry_failures.clear();
    auto next = h.source->poll();
    CHECK(next.status == PollStatus::Dispatched);
    CHECK(next.dispatched == std::vector<std::string>{"b", "c"});
    CHECK(next.unit_id > outcome.unit_id);
}

TEST_CASE("PollingSource leaves the backlog untouched when listing fails")
{
    Harness h;
    h.provider.set({entry("a", 1)});
    REQUIRE(h.source->poll().status == PollStatus::Dispatched);
    h.provider.set({entry("a", 1), entry("b", 1)});

    auto before = h.source->backlog().snapshot_state();
    h.provider.fail_next_lists = 1;
    auto outcome = h.source->poll();
    CHECK(outcome.status == PollStatus::ListFailed);
    REQUIRE(outcome.list_error);
    CHECK(outcome.list_error->message == "connection refused");
    CHECK_FALSE(outcome.ok());
    CHECK(h.source->backlog().snapshot_state() == before);
    CHECK(h.units.size() == 1);

    // Recovery picks up where the failed cycle would have.
    auto recovered = h.source->poll();
    CHECK(recovered.status == PollStatus::Dispatched);
    CHECK(recovered.dispatched == std::vector<std::string>{"b"});
}

TEST_CASE("PollingSource turns a throwing provider into a list failure")
{
    Harness h;
    h.provider.set({entry("a", 1)});
    REQUIRE(h.source->poll().status == PollStatus::Dispatched);
    h.provider.set({entry("a", 1), entry("b", 1)});

    auto before = h.source->backlog().snapshot_state();
    h.provider.throw_next_lists = 1;
    PollOutcome outcome;
    CHECK_NOTHROW(outcome = h.source->poll());
    CHECK(outcome.status == PollStatus::ListFailed);
    REQUIRE(outcome.list_error);
    CHECK(outcome.list_error->message == "listing socket closed");
    CHECK(h.source->backlog().snapshot_state() == before);

    auto recovered = h.source->poll();
    CHECK(recovered.status == PollStatus::Dispatched);
    CHECK(recovered.dispatched == std::vector<std::string>{"b"});
}

TEST_CASE("PollingSource rolls the whole batch back on a channel failure")
{
    Harness h;
    h.provider.set({entry("a", 1), entry("b", 1), entry("c", 1)});
    h.retriever.channel_failures = {"b"};

    auto outcome = h.source->poll();
    CHECK(outcome.status == PollStatus::RetrieveChannelFailed);
    REQUIRE(outcome.channel_error);
    CHECK(outcome.channel_error->scope == RetrieveError::Scope::Channel);
    CHECK(outcome.rolled_back == 3);
    CHECK(h.units.empty());
    // Retrieval stops at the broken channel.
    CHECK(h.retriever.requested == std::vector<std::string>{"a", "b"});

    auto state = h.source->backlog().snapshot_state();
    CHECK(state.in_flight.empty());
    CHECK(state.pending == std::set<std::string>{"a", "b", "c"});
}

TEST_CASE("PollingSource treats a throwing retriever as a lost channel")
{
    Harness h;
    h.provider.set({entry("a", 1), entry("b", 1)});
    h.retriever.throwing = {"a"};

    auto outcome = h.source->poll();
    CHECK(outcome.status == PollStatus::RetrieveChannelFailed);
    REQUIRE(outcome.channel_error);
    CHECK(outcome.channel_error->message == "socket closed");
    CHECK(h.source->backlog().in_flight_count() == 0);
    CHECK(h.source->backlog().pending_count() == 2);
}

TEST_CASE("PollingSource is idle when nothing is new")
{
    Harness h;
    auto empty = h.source->poll();
    CHECK(empty.status == PollStatus::Idle);
    CHECK(empty.ok());
    CHECK(empty.unit_id == 0);
    CHECK(h.units.empty());

    h.provider.set({entry("a", 1)});
    REQUIRE(h.source->poll().status == PollStatus::Dispatched);
    auto quiet = h.source->poll();
    CHECK(quiet.status == PollStatus::Idle);
    CHECK(quiet.reconcile.unchanged == 1);
    CHECK(h.units.size() == 1);
}

TEST_CASE("PollingSource is idle when every selected entry fails")
{
    Harness h;
    h.provider.set({entry("a", 1), entry("b", 1)});
    h.retriever.entry_failures = {"a", "b"};

    auto outcome = h.source->poll();
    CHECK(outcome.status == PollStatus::Idle);
    CHECK(outcome.entry_failures.size() == 2);
    CHECK(h.units.empty());
    CHECK(h.source->backlog().pending_count() == 2);
    CHECK(h.source->backlog().in_flight_count() == 0);
}

TEST_CASE("PollingSource rolls back when the sink throws")
{
    Harness h;
    h.provider.set({entry("a", 1), entry("b", 1)});
    h.sink_throws = true;

    auto outcome = h.source->poll();
    CHECK(outcome.status == PollStatus::DispatchFailed);
    CHECK(outcome.rolled_back == 2);
    CHECK(h.source->backlog().pending_count() == 2);
    CHECK(h.source->backlog().in_flight_count() == 0);

    h.sink_throws = false;
    auto retry = h.source->poll();
    CHECK(retry.status == PollStatus::Dispatched);
    CHECK(retry.dispatched == std::vector<std::string>{"a", "b"});
}

TEST_CASE("PollingSource stop cancels further cycles")
{
    Harness h;
    h.provider.set({entry("a", 1)});
    h.source->stop();
    CHECK(h.source->is_stopped());

    auto outcome = h.source->poll();
    CHECK(outcome.status == PollStatus::Cancelled);
    CHECK(h.provider.calls == 0);
    CHECK(h.source->backlog().snapshot_state().known.empty());
}

TEST_CASE("PollingSource stopped mid-retrieval rolls the batch back")
{
    Harness h;
    h.provider.set({entry("a", 1), entry("b", 2), entry("c", 3)});
    h.retriever.on_retrieve = [&](std::string const &name)
    {
        if (name == "a")
        {
            h.source->stop();
        }
    };

    auto outcome = h.source->poll();
    CHECK(outcome.status == PollStatus::Cancelled);
    CHECK(outcome.rolled_back == 3);
    CHECK(outcome.dispatched.empty());
    CHECK(h.units.empty());
    CHECK(h.retriever.requested == std::vector<std::string>{"a"});

    auto state = h.source->backlog().snapshot_state();
    CHECK(state.pending == std::set<std::string>{"a", "b", "c"});
    CHECK(state.in_flight.empty());
    CHECK(state.known.size() == 3);
}

TEST_CASE("PollingSource never dispatches an entry twice across cycles")
{
    Harness h(1);
    h.provider.set({entry("a", 1), entry("b", 1), entry("c", 1)});

    std::set<std::string> seen;
    for (int i = 0; i < 6; ++i)
    {
        auto outcome = h.source->poll();
        for (auto const &name : outcome.dispatched)
        {
            CHECK(seen.insert(name).second);
        }
    }
    CHECK(seen == std::set<std::string>{"a", "b", "c"});
    CHECK(h.units.size() == 3);
}

TEST_CASE("PollingSource concurrent cycles dispatch disjoint units")
{
    FakeProvider provider;
    FakeRetriever retriever;
    std::vector<tf::engine::FileInfo> entries;
    for (int i = 0; i < 60; ++i)
    {
        entries.push_back(entry("n" + std::to_string(100 + i), 1));
    }
    provider.set(entries);

    std::mutex units_mutex;
    std::vector<std::string> dispatched;
    PollingConfig config;
    config.max_batch_size = 4;
    SUBCASE("serialized cycles") { config.allow_overlapping_cycles = false; }
    SUBCASE("overlapping cycles") { config.allow_overlapping_cycles = true; }
    auto source = PollingSource::create(
        config, &provider, &retriever,
        [&](DispatchUnit unit)
        {
            std::lock_guard<std::mutex> lock(units_mutex);
            dispatched.insert(dispatched.end(), unit.names.begin(),
                              unit.names.end());
        });
    REQUIRE(source);

    std::vector<std::thread> pollers;
    for (int t = 0; t < 3; ++t)
    {
        pollers.emplace_back(
            [&]
            {
                for (int i = 0; i < 10; ++i)
                {
                    source->poll();
                }
            });
    }
    for (auto &poller : pollers)
    {
        poller.join();
    }

    std::set<std::string> unique(dispatched.begin(), dispatched.end());
    CHECK(unique.size() == dispatched.size());
    CHECK(dispatched.size() == 60);
}
