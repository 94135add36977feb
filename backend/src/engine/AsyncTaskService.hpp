#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace kc::engine {

class AsyncTaskService {
public:
  explicit AsyncTaskService(std::string name = "worker");
  AsyncTaskService(AsyncTaskService const &) = delete;
  AsyncTaskService &operator=(AsyncTaskService const &) = delete;
  ~AsyncTaskService();

  void start();
  // Drains queued tasks, then joins the worker.
  void stop();
  bool is_running() const noexcept;
  // Returns false when the service is stopping and the task was dropped.
  bool submit(std::function<void()> task);
  // Blocks until the queue is empty and no task is executing.
  void wait_idle();
  std::size_t pending() const;
  std::string const &name() const noexcept { return name_; }

private:
  void loop();

  std::string name_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  std::deque<std::function<void()>> tasks_;
  std::thread worker_;
  bool busy_ = false;
  std::atomic<bool> running_{false};
  std::atomic<bool> exit_requested_{false};
};

} // namespace kc::engine
