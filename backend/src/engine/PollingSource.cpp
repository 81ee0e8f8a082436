#include "engine/PollingSource.hpp"

#include "utils/Log.hpp"

#include <exception>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tf::engine
{

namespace
{

// Names selected by a cycle that have not yet been handed off. Whatever is
// still held when the guard dies goes back to pending, so an exception or an
// early return can't strand names in flight.
class BatchGuard
{
  public:
    BatchGuard(Backlog &backlog, std::vector<std::string> names)
        : backlog_(backlog), names_(std::move(names))
    {
    }
    BatchGuard(BatchGuard const &) = delete;
    BatchGuard &operator=(BatchGuard const &) = delete;
    ~BatchGuard()
    {
        if (!names_.empty())
        {
            backlog_.restore_pending(names_);
        }
    }

    // Requeues a single name now.
    void requeue(std::string const &name)
    {
        std::erase(names_, name);
        backlog_.restore_pending({name});
    }

    std::size_t roll_back()
    {
        auto restored = backlog_.restore_pending(names_);
        names_.clear();
        return restored;
    }

    void commit() noexcept { names_.clear(); }

  private:
    Backlog &backlog_;
    std::vector<std::string> names_;
};

} // namespace

char const *to_string(PollStatus status) noexcept
{
    switch (status)
    {
    case PollStatus::Idle:
        return "idle";
    case PollStatus::Dispatched:
        return "dispatched";
    case PollStatus::ListFailed:
        return "list-failed";
    case PollStatus::RetrieveChannelFailed:
        return "retrieve-channel-failed";
    case PollStatus::DispatchFailed:
        return "dispatch-failed";
    case PollStatus::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

std::unique_ptr<PollingSource>
PollingSource::create(PollingConfig config, SnapshotProvider *provider,
                      ContentRetriever *retriever, Sink sink)
{
    if (!PollingConfig::is_valid_batch_size(config.max_batch_size))
    {
        TF_LOG_ERROR("{}: rejecting maxBatchSize {} (use {} for unbounded or "
                     "a positive value)",
                     config.source_label, config.max_batch_size,
                     Backlog::kUnbounded);
        return nullptr;
    }
    if (provider == nullptr || retriever == nullptr || !sink)
    {
        TF_LOG_ERROR("{}: polling source needs a provider, a retriever and a "
                     "sink",
                     config.source_label);
        return nullptr;
    }
    return std::make_unique<PollingSource>(ConstructionKey{}, std::move(config),
                                           provider, retriever, std::move(sink));
}

PollingSource::PollingSource(ConstructionKey, PollingConfig config,
                             SnapshotProvider *provider,
                             ContentRetriever *retriever, Sink sink)
    : config_(std::move(config)), provider_(provider), retriever_(retriever),
      sink_(std::move(sink))
{
}

void PollingSource::stop() noexcept
{
    stop_requested_.store(true, std::memory_order_release);
}

bool PollingSource::is_stopped() const noexcept
{
    return stop_requested_.load(std::memory_order_acquire);
}

PollOutcome PollingSource::poll()
{
    PollOutcome outcome;
    if (is_stopped())
    {
        outcome.status = PollStatus::Cancelled;
        return outcome;
    }

    std::optional<Backlog::Selection> selection;
    if (config_.allow_overlapping_cycles)
    {
        selection = list_and_select(outcome);
    }
    else
    {
        std::lock_guard<std::mutex> cycle_lock(cycle_mutex_);
        selection = list_and_select(outcome);
    }
    if (!selection)
    {
        return outcome;
    }
    if (selection->names.empty())
    {
        outcome.status = PollStatus::Idle;
        return outcome;
    }

    retrieve_and_dispatch(std::move(*selection), outcome);
    return outcome;
}

std::optional<Backlog::Selection>
PollingSource::list_and_select(PollOutcome &outcome)
{
    ListResult listed;
    try
    {
        listed = provider_->list();
    }
    catch (std::exception const &ex)
    {
        listed = ListResult::failure(ex.what());
    }
    if (!listed.ok())
    {
        TF_LOG_WARN("{}: listing failed, will retry next cycle: {}",
                    config_.source_label, listed.error->message);
        outcome.status = PollStatus::ListFailed;
        outcome.list_error = std::move(listed.error);
        return std::nullopt;
    }
    auto selection =
        backlog_.reconcile_and_select(listed.snapshot, config_.max_batch_size);
    outcome.reconcile = selection.reconciled;
    if (selection.reconciled.added > 0 || selection.reconciled.changed > 0)
    {
        TF_LOG_DEBUG("{}: {} new, {} changed, {} selected", config_.source_label,
                     selection.reconciled.added, selection.reconciled.changed,
                     selection.names.size());
    }
    return selection;
}

void PollingSource::retrieve_and_dispatch(Backlog::Selection selection,
                                          PollOutcome &outcome)
{
    auto const &selected = selection.names;
    auto &versions = selection.versions;
    BatchGuard guard(backlog_, selected);

    DispatchUnit unit;
    unit.items.reserve(selected.size());
    for (std::size_t i = 0; i < selected.size(); ++i)
    {
        auto const &name = selected[i];
        if (is_stopped())
        {
            outcome.rolled_back = guard.roll_back();
            outcome.status = PollStatus::Cancelled;
            TF_LOG_INFO("{}: cycle cancelled, {} names back to pending",
                        config_.source_label, outcome.rolled_back);
            return;
        }

        std::optional<RetrieveResult> fetched;
        try
        {
            fetched = retriever_->retrieve(name);
        }
        catch (std::exception const &ex)
        {
            fetched = RetrieveResult::channel_failure(ex.what());
        }

        if (fetched->ok())
        {
            unit.names.push_back(name);
            unit.items.push_back(
                DispatchItem{versions[i], std::move(fetched->content)});
            continue;
        }

        auto &error = *fetched->error;
        if (error.scope == RetrieveError::Scope::Channel)
        {
            outcome.rolled_back = guard.roll_back();
            outcome.status = PollStatus::RetrieveChannelFailed;
            TF_LOG_WARN("{}: retrieval channel failed on '{}', {} names back "
                        "to pending: {}",
                        config_.source_label, name, outcome.rolled_back,
                        error.message);
            outcome.channel_error = std::move(error);
            return;
        }

        TF_LOG_WARN("{}: retrieving '{}' failed, requeued: {}",
                    config_.source_label, name, error.message);
        guard.requeue(name);
        outcome.entry_failures.push_back(EntryFailure{name, std::move(error)});
    }

    if (unit.empty())
    {
        outcome.status = PollStatus::Idle;
        return;
    }

    unit.id = next_unit_id_.fetch_add(1, std::memory_order_relaxed);
    auto const unit_id = unit.id;
    auto const bytes = unit.payload_bytes();
    auto names = unit.names;
    try
    {
        sink_(std::move(unit));
    }
    catch (std::exception const &ex)
    {
        outcome.rolled_back = guard.roll_back();
        outcome.status = PollStatus::DispatchFailed;
        TF_LOG_ERROR("{}: dispatch of unit {} failed, {} names back to "
                     "pending: {}",
                     config_.source_label, unit_id, outcome.rolled_back,
                     ex.what());
        return;
    }
    guard.commit();

    TF_LOG_INFO("{}: dispatched unit {} ({} entries, {} bytes)",
                config_.source_label, unit_id, names.size(), bytes);
    outcome.status = PollStatus::Dispatched;
    outcome.unit_id = unit_id;
    outcome.dispatched_bytes = bytes;
    outcome.dispatched = std::move(names);
}

} // namespace tf::engine
