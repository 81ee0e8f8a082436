#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace tf::engine {

// Single worker thread consuming a FIFO of tasks. stop() drains what was
// already queued before joining.
class AsyncTaskService {
public:
  explicit AsyncTaskService(std::string name = "worker");
  AsyncTaskService(AsyncTaskService const &) = delete;
  AsyncTaskService &operator=(AsyncTaskService const &) = delete;
  ~AsyncTaskService();

  void start();
  void stop();
  bool is_running() const noexcept;

  // Returns false if the task was refused (service stopping).
  bool submit(std::function<void()> task);

  std::size_t pending() const;

  // Blocks until the queue is empty and no task is executing.
  void wait_idle();

private:
  void loop();

  std::string name_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  std::deque<std::function<void()>> tasks_;
  bool busy_ = false;
  std::thread worker_;
  std::atomic<bool> running_{false};
  std::atomic<bool> exit_requested_{false};
};

} // namespace tf::engine
