#pragma once

#include "engine/AsyncTaskService.hpp"
#include "engine/Dispatch.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace tf::storage
{
class Database;
struct DispatchRecord;
} // namespace tf::storage

namespace tf::engine
{

class EventBus;

// Diagnostic record of dispatched units and their confirmations, kept in a
// sqlite file. Writes run on the journal's own worker so the polling and
// consumer threads never wait on disk. Nothing here feeds back into the
// Backlog.
class DispatchJournal
{
  public:
    DispatchJournal(std::filesystem::path db_path, std::string run_id = {});
    DispatchJournal(DispatchJournal const &) = delete;
    DispatchJournal &operator=(DispatchJournal const &) = delete;
    ~DispatchJournal();

    bool is_valid() const noexcept;
    std::string const &run_id() const noexcept { return run_id_; }

    void start();
    void stop();

    // Subscribes to DispatchReadyEvent and DispatchConfirmedEvent.
    void attach(EventBus &bus);

    void record_dispatch(DispatchUnit const &unit);
    void record_confirmation(std::uint64_t unit_id);

    // Units of this run still awaiting confirmation, oldest first.
    std::vector<storage::DispatchRecord> unconfirmed();
    void prune_confirmed_older_than(std::chrono::hours age);

    // Blocks until queued writes have reached the database.
    void flush();

  private:
    static std::string make_run_id();

    std::shared_ptr<storage::Database> database_;
    std::string run_id_;
    AsyncTaskService writer_{"journal"};
};

} // namespace tf::engine
