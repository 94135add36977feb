#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <queue>
#include <unordered_set>
#include <vector>

namespace kc::engine
{

class SchedulerService
{
  public:
    using Clock = std::chrono::steady_clock;
    using TaskId = size_t;
    using Callback = std::function<void()>;

    // First run happens one interval after `now`.
    TaskId schedule(std::chrono::milliseconds interval, Callback callback,
                    Clock::time_point now = Clock::now());

    // The task is dropped the next time it reaches the top of the heap.
    void cancel(TaskId id);

    // Run pending tasks. Returns how many were executed.
    size_t tick(Clock::time_point now);

    // Helper for the main loop: "How long can I sleep before work is due?"
    std::chrono::milliseconds time_until_next_task(Clock::time_point now) const;

  private:
    struct Task
    {
        TaskId id;
        std::chrono::milliseconds interval;
        Clock::time_point next_run;
        Callback callback;

        // Min-heap priority queue needs > operator for smallest-first
        bool operator>(const Task &other) const
        {
            return next_run > other.next_run;
        }
    };

    mutable std::mutex mutex_;
    std::priority_queue<Task, std::vector<Task>, std::greater<Task>> tasks_;
    std::unordered_set<TaskId> cancelled_;
    TaskId next_id_ = 1;
};

} // namespace kc::engine
