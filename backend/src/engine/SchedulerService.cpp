#include "engine/SchedulerService.hpp"

#include "utils/Log.hpp"

#include <exception>

namespace kc::engine
{

auto SchedulerService::schedule(std::chrono::milliseconds interval,
                                Callback callback, Clock::time_point now)
    -> TaskId
{
    std::lock_guard<std::mutex> guard(mutex_);
    TaskId id = next_id_++;
    tasks_.push({id, interval, now + interval, std::move(callback)});
    return id;
}

void SchedulerService::cancel(TaskId id)
{
    std::lock_guard<std::mutex> guard(mutex_);
    cancelled_.insert(id);
}

size_t SchedulerService::tick(Clock::time_point now)
{
    size_t executed = 0;
    std::vector<Task> due;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        while (!tasks_.empty() && tasks_.top().next_run <= now)
        {
            Task task = tasks_.top();
            tasks_.pop();
            if (cancelled_.erase(task.id) > 0)
            {
                continue;
            }
            due.push_back(std::move(task));
        }
    }

    // Callbacks run unlocked so they may schedule or cancel tasks.
    for (auto &task : due)
    {
        if (task.callback)
        {
            try
            {
                task.callback();
            }
            catch (std::exception const &ex)
            {
                KC_LOG_ERROR("scheduler: task {} threw: {}", task.id,
                             ex.what());
            }
            executed++;
        }
        task.next_run = now + task.interval;
    }

    std::lock_guard<std::mutex> guard(mutex_);
    for (auto &task : due)
    {
        if (cancelled_.erase(task.id) > 0)
        {
            continue;
        }
        tasks_.push(std::move(task));
    }
    return executed;
}

std::chrono::milliseconds
SchedulerService::time_until_next_task(Clock::time_point now) const
{
    std::lock_guard<std::mutex> guard(mutex_);
    if (tasks_.empty())
    {
        return std::chrono::hours(24);
    }
    auto next = tasks_.top().next_run;
    if (now >= next)
        return std::chrono::milliseconds(0);
    return std::chrono::duration_cast<std::chrono::milliseconds>(next - now);
}

} // namespace kc::engine
