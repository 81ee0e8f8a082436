#include "engine/SchedulerService.hpp"

namespace tf::engine
{

auto SchedulerService::schedule(std::chrono::milliseconds interval,
                                Callback callback, bool run_immediately)
    -> TaskId
{
    TaskId id = next_id_++;
    auto now = Clock::now();
    auto next = run_immediately ? now : now + interval;
    tasks_.push({id, interval, next, std::move(callback)});
    return id;
}

void SchedulerService::cancel(TaskId id)
{
    if (id == 0 || id >= next_id_)
    {
        return;
    }
    cancelled_.insert(id);
    drop_cancelled_head();
}

std::size_t SchedulerService::tick(Clock::time_point now)
{
    std::size_t executed = 0;
    // Tasks rescheduled during this tick wait for the next one, even with a
    // zero interval.
    std::vector<Task> due;
    drop_cancelled_head();
    while (!tasks_.empty() && tasks_.top().next_run <= now)
    {
        due.push_back(tasks_.top());
        tasks_.pop();
        drop_cancelled_head();
    }

    for (auto &task : due)
    {
        if (cancelled_.contains(task.id))
        {
            cancelled_.erase(task.id);
            continue;
        }
        if (task.callback)
        {
            task.callback();
            ++executed;
        }
        // A callback may cancel its own task.
        if (cancelled_.erase(task.id) > 0)
        {
            continue;
        }
        task.next_run = now + task.interval;
        tasks_.push(std::move(task));
    }
    return executed;
}

std::chrono::milliseconds
SchedulerService::time_until_next_task(Clock::time_point now) const
{
    if (tasks_.empty())
    {
        return std::chrono::hours(24);
    }
    auto next = tasks_.top().next_run;
    if (now >= next)
        return std::chrono::milliseconds(0);
    return std::chrono::duration_cast<std::chrono::milliseconds>(next - now);
}

std::size_t SchedulerService::active_tasks() const noexcept
{
    return tasks_.size() > cancelled_.size() ? tasks_.size() - cancelled_.size()
                                             : 0;
}

void SchedulerService::drop_cancelled_head()
{
    while (!tasks_.empty() && cancelled_.contains(tasks_.top().id))
    {
        cancelled_.erase(tasks_.top().id);
        tasks_.pop();
    }
}

} // namespace tf::engine
