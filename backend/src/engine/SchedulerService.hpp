#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <queue>
#include <unordered_set>
#include <vector>

namespace tf::engine
{

// Fixed-interval timer wheel driven from the caller's loop. Not thread-safe;
// owned and ticked by one thread.
class SchedulerService
{
  public:
    using Clock = std::chrono::steady_clock;
    using TaskId = std::size_t;
    using Callback = std::function<void()>;

    // First run is `interval` from now, or at the next tick when
    // run_immediately is set.
    TaskId schedule(std::chrono::milliseconds interval, Callback callback,
                    bool run_immediately = false);
    void cancel(TaskId id);

    // Run due tasks. Returns how many were executed.
    std::size_t tick(Clock::time_point now);

    std::chrono::milliseconds time_until_next_task(Clock::time_point now) const;

    std::size_t active_tasks() const noexcept;

  private:
    struct Task
    {
        TaskId id;
        std::chrono::milliseconds interval;
        Clock::time_point next_run;
        Callback callback;

        bool operator>(const Task &other) const
        {
            return next_run > other.next_run;
        }
    };

    void drop_cancelled_head();

    std::priority_queue<Task, std::vector<Task>, std::greater<Task>> tasks_;
    std::unordered_set<TaskId> cancelled_;
    TaskId next_id_ = 1;
};

} // namespace tf::engine
