#include "engine/Backlog.hpp"

#include "utils/Log.hpp"

#include <algorithm>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

namespace tf::engine
{

namespace
{

struct SkippedRow
{
    std::string name;
    std::string reason;
};

// Rows that pass validation, first occurrence of each name only.
struct ScreenedSnapshot
{
    std::vector<FileInfo const *> entries;
    std::vector<SkippedRow> skipped;
};

ScreenedSnapshot screen(Snapshot const &snapshot)
{
    ScreenedSnapshot screened;
    screened.entries.reserve(snapshot.entries.size());
    for (auto const &row : snapshot.malformed)
    {
        screened.skipped.push_back({row.name, row.reason});
    }
    std::unordered_set<std::string_view> seen;
    seen.reserve(snapshot.entries.size());
    for (auto const &entry : snapshot.entries)
    {
        if (entry.name.empty())
        {
            screened.skipped.push_back({entry.name, "empty name"});
            continue;
        }
        if (entry.size < 0)
        {
            screened.skipped.push_back({entry.name, "negative size"});
            continue;
        }
        if (!seen.insert(entry.name).second)
        {
            screened.skipped.push_back({entry.name, "duplicate name"});
            continue;
        }
        screened.entries.push_back(&entry);
    }
    return screened;
}

void report_skipped(std::vector<SkippedRow> const &skipped)
{
    for (auto const &row : skipped)
    {
        TF_LOG_WARN("skipping listing entry '{}': {}", row.name, row.reason);
    }
}

} // namespace

auto Backlog::reconcile(Snapshot const &snapshot) -> ReconcileResult
{
    auto screened = screen(snapshot);
    ReconcileResult result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result = apply_locked(screened.entries);
    }
    result.skipped = screened.skipped.size();
    report_skipped(screened.skipped);
    return result;
}

auto Backlog::apply_locked(std::vector<FileInfo const *> const &entries)
    -> ReconcileResult
{
    ReconcileResult result;
    for (auto const *entry : entries)
    {
        auto it = known_.find(entry->name);
        if (it != known_.end() && it->second.same_version(*entry))
        {
            ++result.unchanged;
            continue;
        }
        if (it == known_.end())
        {
            known_.emplace(entry->name, *entry);
            ++result.added;
        }
        else
        {
            it->second = *entry;
            ++result.changed;
        }

        if (in_flight_.contains(entry->name))
        {
            changed_in_flight_.insert(entry->name);
            ++result.deferred;
            continue;
        }
        pending_.insert(entry->name);
    }
    return result;
}

std::vector<std::string> Backlog::select_batch(int limit)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return select_locked(limit);
}

std::vector<std::string> Backlog::select_locked(int limit)
{
    std::vector<std::string> batch;
    auto const wanted = limit <= 0 ? pending_.size()
                                   : std::min<std::size_t>(
                                         static_cast<std::size_t>(limit),
                                         pending_.size());
    batch.reserve(wanted);
    auto it = pending_.begin();
    while (it != pending_.end() && batch.size() < wanted)
    {
        in_flight_.insert(*it);
        batch.push_back(*it);
        it = pending_.erase(it);
    }
    return batch;
}

auto Backlog::reconcile_and_select(Snapshot const &snapshot, int limit)
    -> Selection
{
    auto screened = screen(snapshot);
    Selection selection;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        selection.reconciled = apply_locked(screened.entries);
        selection.names = select_locked(limit);
        selection.versions.reserve(selection.names.size());
        for (auto const &name : selection.names)
        {
            selection.versions.push_back(known_.at(name));
        }
    }
    selection.reconciled.skipped = screened.skipped.size();
    report_skipped(screened.skipped);
    return selection;
}

void Backlog::mark_done(std::vector<std::string> const &names)
{
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto const &name : names)
    {
        if (in_flight_.erase(name) == 0)
        {
            continue;
        }
        if (changed_in_flight_.erase(name) > 0)
        {
            pending_.insert(name);
        }
    }
}

std::size_t Backlog::restore_pending(std::vector<std::string> const &names)
{
    std::size_t restored = 0;
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto const &name : names)
    {
        if (in_flight_.erase(name) == 0)
        {
            continue;
        }
        changed_in_flight_.erase(name);
        pending_.insert(name);
        ++restored;
    }
    return restored;
}

auto Backlog::snapshot_state() const -> State
{
    std::lock_guard<std::mutex> lock(mutex_);
    return State{known_, pending_, in_flight_};
}

std::size_t Backlog::pending_count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

std::size_t Backlog::in_flight_count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_.size();
}

} // namespace tf::engine
