#include "engine/DispatchJournal.hpp"

#include "engine/EventBus.hpp"
#include "engine/Events.hpp"
#include "utils/Log.hpp"
#include "utils/StateStore.hpp"

#include <chrono>
#include <format>
#include <future>
#include <utility>

#include <unistd.h>

namespace tf::engine
{

namespace
{

std::int64_t unix_now()
{
    return static_cast<std::int64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count());
}

} // namespace

DispatchJournal::DispatchJournal(std::filesystem::path db_path,
                                 std::string run_id)
    : database_(std::make_shared<storage::Database>(std::move(db_path))),
      run_id_(run_id.empty() ? make_run_id() : std::move(run_id))
{
}

DispatchJournal::~DispatchJournal()
{
    stop();
}

std::string DispatchJournal::make_run_id()
{
    return std::format("{}-{}", unix_now(), static_cast<long>(::getpid()));
}

bool DispatchJournal::is_valid() const noexcept
{
    return database_ && database_->is_valid();
}

void DispatchJournal::start()
{
    if (!is_valid())
    {
        return;
    }
    writer_.start();
}

void DispatchJournal::stop()
{
    writer_.stop();
}

void DispatchJournal::attach(EventBus &bus)
{
    bus.subscribe<DispatchReadyEvent>(
        [this](DispatchReadyEvent const &event)
        { record_dispatch(event.unit); });
    bus.subscribe<DispatchConfirmedEvent>(
        [this](DispatchConfirmedEvent const &event)
        {
            // Bare name confirmations carry no unit id.
            if (event.unit_id != 0)
            {
                record_confirmation(event.unit_id);
            }
        });
}

void DispatchJournal::record_dispatch(DispatchUnit const &unit)
{
    if (!is_valid() || unit.empty())
    {
        return;
    }
    storage::DispatchRecord record;
    record.run_id = run_id_;
    record.unit_id = unit.id;
    record.names = unit.names;
    record.bytes = unit.payload_bytes();
    record.dispatched_at = unix_now();
    writer_.submit(
        [db = database_, record = std::move(record)]
        {
            if (!db->insert_dispatch(record))
            {
                TF_LOG_WARN("journal: failed to record unit {}", record.unit_id);
            }
        });
}

void DispatchJournal::record_confirmation(std::uint64_t unit_id)
{
    if (!is_valid())
    {
        return;
    }
    writer_.submit(
        [db = database_, run_id = run_id_, unit_id, at = unix_now()]
        {
            if (!db->mark_confirmed(run_id, unit_id, at))
            {
                TF_LOG_DEBUG("journal: unit {} not open for confirmation",
                             unit_id);
            }
        });
}

std::vector<storage::DispatchRecord> DispatchJournal::unconfirmed()
{
    if (!is_valid())
    {
        return {};
    }
    auto promise =
        std::make_shared<std::promise<std::vector<storage::DispatchRecord>>>();
    auto future = promise->get_future();
    bool queued = writer_.submit(
        [db = database_, run_id = run_id_, promise]
        { promise->set_value(db->unconfirmed(run_id)); });
    if (!queued || !writer_.is_running())
    {
        // No worker to order against; the database is safe to read directly.
        return database_->unconfirmed(run_id_);
    }
    return future.get();
}

void DispatchJournal::prune_confirmed_older_than(std::chrono::hours age)
{
    if (!is_valid())
    {
        return;
    }
    auto cutoff =
        unix_now() -
        std::chrono::duration_cast<std::chrono::seconds>(age).count();
    writer_.submit(
        [db = database_, cutoff]
        {
            if (!db->delete_confirmed_before(cutoff))
            {
                TF_LOG_WARN("journal: retention delete failed");
            }
        });
}

void DispatchJournal::flush()
{
    if (writer_.is_running())
    {
        writer_.wait_idle();
    }
}

} // namespace tf::engine
