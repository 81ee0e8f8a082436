#pragma once

#include "engine/Backlog.hpp"
#include "engine/Collaborators.hpp"
#include "engine/Dispatch.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tf::engine
{

struct PollingConfig
{
    // Backlog::kUnbounded or a positive bound on names per dispatch unit.
    int max_batch_size = Backlog::kUnbounded;
    // Lets a cycle start listing while another is still selecting. The
    // backlog lock alone keeps batches disjoint either way.
    bool allow_overlapping_cycles = false;
    std::string source_label{"source"};

    static bool is_valid_batch_size(int value) noexcept
    {
        return value == Backlog::kUnbounded || value > 0;
    }
};

enum class PollStatus
{
    // Nothing new, or every selected entry failed and was requeued.
    Idle,
    Dispatched,
    ListFailed,
    RetrieveChannelFailed,
    // The sink threw; the batch went back to pending.
    DispatchFailed,
    // stop() was requested before or during the cycle.
    Cancelled,
};

char const *to_string(PollStatus status) noexcept;

struct EntryFailure
{
    std::string name;
    RetrieveError error;
};

struct PollOutcome
{
    PollStatus status = PollStatus::Idle;
    std::uint64_t unit_id = 0;
    std::vector<std::string> dispatched;
    std::size_t dispatched_bytes = 0;
    Backlog::ReconcileResult reconcile{};
    std::optional<ListError> list_error;
    std::optional<RetrieveError> channel_error;
    std::vector<EntryFailure> entry_failures;
    // Names returned to pending because the whole batch was abandoned.
    std::size_t rolled_back = 0;

    bool ok() const noexcept
    {
        return status == PollStatus::Idle || status == PollStatus::Dispatched;
    }
};

// PollingSource runs polling cycles against one source:
//   list -> reconcile+select (backlog lock) -> retrieve (no lock) -> sink.
// Selected names stay in flight until DispatchConfirmer releases them.
// Failed retrievals are requeued; a lost channel rolls the whole batch back.
class PollingSource
{
  public:
    using Sink = std::function<void(DispatchUnit)>;

    // Returns nullptr if the configuration is rejected (batch size 0 or a
    // negative other than Backlog::kUnbounded, missing sink).
    static std::unique_ptr<PollingSource>
    create(PollingConfig config, SnapshotProvider *provider,
           ContentRetriever *retriever, Sink sink);

    PollingSource(PollingSource const &) = delete;
    PollingSource &operator=(PollingSource const &) = delete;

    PollOutcome poll();

    // Makes in-progress and future cycles stop early. A cycle interrupted
    // mid-retrieval rolls its batch back to pending.
    void stop() noexcept;
    bool is_stopped() const noexcept;

    Backlog &backlog() noexcept { return backlog_; }
    Backlog const &backlog() const noexcept { return backlog_; }
    PollingConfig const &config() const noexcept { return config_; }

  private:
    // Only create() can make one.
    struct ConstructionKey
    {
        explicit ConstructionKey() = default;
    };

  public:
    PollingSource(ConstructionKey, PollingConfig config,
                  SnapshotProvider *provider, ContentRetriever *retriever,
                  Sink sink);

  private:
    std::optional<Backlog::Selection> list_and_select(PollOutcome &outcome);
    void retrieve_and_dispatch(Backlog::Selection selection,
                               PollOutcome &outcome);

    PollingConfig config_;
    SnapshotProvider *provider_ = nullptr;
    ContentRetriever *retriever_ = nullptr;
    Sink sink_;
    Backlog backlog_;
    std::mutex cycle_mutex_;
    std::atomic<std::uint64_t> next_unit_id_{1};
    std::atomic<bool> stop_requested_{false};
};

} // namespace tf::engine
