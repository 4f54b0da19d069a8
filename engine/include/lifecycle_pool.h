#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace drinkd {

/**
 * LifecyclePool - workers for blocking per-resource lifecycle jobs.
 *
 * Closing a database client or a connection pool can block for a network
 * round trip, so ResourceContainer hands each resource's job to this pool
 * and waits on the futures instead of closing clients one after another.
 *
 * A job's exception is delivered through its future; the worker itself
 * never dies. Jobs are tagged with the resource they belong to so slow
 * ones show up in the "lifecycle" log.
 *
 * The destructor finishes every queued job before joining.
 */
class LifecyclePool {
 public:
  explicit LifecyclePool(size_t workers = 4);
  ~LifecyclePool();

  LifecyclePool(const LifecyclePool&) = delete;
  LifecyclePool& operator=(const LifecyclePool&) = delete;

  // Queue `job` for `resource`.
  // Throws std::runtime_error once shutdown has begun.
  std::future<void> run(std::string resource, std::function<void()> job);

  // Block until no job is queued or running, or `timeout` passes.
  // Returns true when idle.
  bool wait_idle(std::chrono::milliseconds timeout =
                     std::chrono::milliseconds::max());

  size_t workers() const { return workers_.size(); }
  size_t pending() const;

 private:
  struct Job {
    std::string resource;
    std::packaged_task<void()> task;
  };

  void work();

  std::vector<std::thread> workers_;
  std::deque<Job> queue_;
  mutable std::mutex mutex_;
  std::condition_variable has_job_;
  std::condition_variable idle_;
  size_t running_ = 0;
  bool stopping_ = false;
};

// Process-wide pool used by ResourceContainer::cleanup_all
LifecyclePool& GetLifecyclePool();

}  // namespace drinkd
