#pragma once

#include "engine/FileInfo.hpp"

#include <cstddef>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace tf::engine
{

// Backlog is the entry ledger of one polled source.
//  - known: last observed version of every entry ever seen. Never shrinks.
//  - pending: new or changed entries waiting to be selected.
//  - in_flight: selected entries awaiting downstream confirmation.
// pending and in_flight are disjoint. A name leaves in_flight through
// mark_done(), or through restore_pending() when its retrieval was rolled
// back. All transitions happen under one mutex; callers do their I/O outside.
class Backlog
{
  public:
    struct State
    {
        std::map<std::string, FileInfo> known;
        std::set<std::string> pending;
        std::set<std::string> in_flight;

        bool operator==(State const &other) const = default;
    };

    struct ReconcileResult
    {
        std::size_t added = 0;
        std::size_t changed = 0;
        std::size_t unchanged = 0;
        std::size_t skipped = 0;
        // Changed while in flight; queued again once confirmed.
        std::size_t deferred = 0;
    };

    static constexpr int kUnbounded = -1;

    Backlog() = default;
    Backlog(Backlog const &) = delete;
    Backlog &operator=(Backlog const &) = delete;

    ReconcileResult reconcile(Snapshot const &snapshot);

    // Returns up to `limit` pending names in lexicographic order and moves
    // them to in_flight. limit <= 0 selects everything pending.
    std::vector<std::string> select_batch(int limit);

    struct Selection
    {
        ReconcileResult reconciled;
        std::vector<std::string> names;
        // Version recorded in known for each selected name, same order.
        std::vector<FileInfo> versions;
    };

    // reconcile() followed by select_batch() without releasing the lock in
    // between, so concurrent pollers never select overlapping batches.
    Selection reconcile_and_select(Snapshot const &snapshot, int limit);

    // Unknown or already released names are ignored.
    void mark_done(std::vector<std::string> const &names);

    // Moves in-flight names back to pending after a failed retrieval.
    // Returns how many names were actually restored.
    std::size_t restore_pending(std::vector<std::string> const &names);

    State snapshot_state() const;

    std::size_t pending_count() const;
    std::size_t in_flight_count() const;

  private:
    ReconcileResult apply_locked(std::vector<FileInfo const *> const &entries);
    std::vector<std::string> select_locked(int limit);

    mutable std::mutex mutex_;
    std::map<std::string, FileInfo> known_;
    std::set<std::string> pending_;
    std::set<std::string> in_flight_;
    // Subset of in_flight_ whose source version moved on after selection.
    std::set<std::string> changed_in_flight_;
};

} // namespace tf::engine
