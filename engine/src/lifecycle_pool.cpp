#include "lifecycle_pool.h"

#include "logging.h"

#include <stdexcept>

namespace drinkd {

namespace {

constexpr auto kSlowJob = std::chrono::seconds(1);

}  // namespace

LifecyclePool::LifecyclePool(size_t workers) {
  if (workers == 0) {
    workers = 1;
  }
  workers_.reserve(workers);
  for (size_t i = 0; i < workers; ++i) {
    workers_.emplace_back([this] { work(); });
  }
}

LifecyclePool::~LifecyclePool() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  has_job_.notify_all();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

std::future<void> LifecyclePool::run(std::string resource,
                                     std::function<void()> job) {
  std::packaged_task<void()> task(std::move(job));
  auto done = task.get_future();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) {
      throw std::runtime_error("lifecycle pool is shutting down; cannot run '" +
                               resource + "'");
    }
    queue_.push_back(Job{std::move(resource), std::move(task)});
  }
  has_job_.notify_one();
  return done;
}

void LifecyclePool::work() {
  auto log = get_logger("lifecycle");
  while (true) {
    Job job;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      has_job_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
      if (queue_.empty()) {
        return;  // stopping and drained
      }
      job = std::move(queue_.front());
      queue_.pop_front();
      ++running_;
    }

    auto start = std::chrono::steady_clock::now();
    job.task();  // exceptions land in the job's future
    auto elapsed = std::chrono::steady_clock::now() - start;
    if (elapsed >= kSlowJob) {
      log->warn("Lifecycle job for '{}' took {}ms", job.resource,
                std::chrono::duration_cast<std::chrono::milliseconds>(elapsed)
                    .count());
    }

    {
      std::lock_guard<std::mutex> lock(mutex_);
      --running_;
      if (running_ == 0 && queue_.empty()) {
        idle_.notify_all();
      }
    }
  }
}

bool LifecyclePool::wait_idle(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  auto is_idle = [this] { return running_ == 0 && queue_.empty(); };
  if (timeout == std::chrono::milliseconds::max()) {
    idle_.wait(lock, is_idle);
    return true;
  }
  return idle_.wait_for(lock, timeout, is_idle);
}

size_t LifecyclePool::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size() + running_;
}

LifecyclePool& GetLifecyclePool() {
  static LifecyclePool pool(4);
  return pool;
}

}  // namespace drinkd
