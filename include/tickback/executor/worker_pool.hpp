#pragma once

#include "tickback/config/system_config.hpp"
#include "tickback/core/error.hpp"
#include "tickback/task/task.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace tickback {

class CallbackExecutor;

struct WorkerPoolConfig {
  std::size_t workers{16};
  std::size_t queue_capacity{1024};
  SaturationPolicy saturation{SaturationPolicy::Reject};
  std::chrono::milliseconds submit_timeout{1000};
};

// Fixed set of worker threads fed by a bounded FIFO. stop() lets the workers
// drain what is already queued before joining them.
class WorkerPool {
public:
  using Job = std::move_only_function<void()>;

  explicit WorkerPool(WorkerPoolConfig config);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  auto operator=(const WorkerPool&) -> WorkerPool& = delete;

  auto start() -> void;
  auto stop() -> void;

  // QueueFull when saturated (after submit_timeout under Block), Cancelled
  // when the pool is not running.
  [[nodiscard]] auto submit(Job job) -> Result<void>;

  // Waits until the queue is empty and no job is running.
  [[nodiscard]] auto wait_idle(std::chrono::milliseconds timeout) -> bool;

  [[nodiscard]] auto queued() const -> std::size_t;
  [[nodiscard]] auto active() const noexcept -> std::size_t {
    return active_.load(std::memory_order_acquire);
  }
  [[nodiscard]] auto is_running() const noexcept -> bool {
    return running_.load(std::memory_order_acquire);
  }
  [[nodiscard]] auto config() const noexcept -> const WorkerPoolConfig& {
    return config_;
  }

private:
  auto worker_loop() -> void;

  WorkerPoolConfig config_;
  std::atomic<bool> running_{false};
  std::atomic<std::size_t> active_{0};

  mutable std::mutex mu_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::condition_variable idle_;
  std::deque<Job> queue_;
  std::vector<std::thread> workers_;
};

// Hands a task to whoever executes it; false means it was not accepted and
// stays pending for the next catchup pass.
using DispatchFn = std::function<bool(Task)>;

[[nodiscard]] auto make_pool_dispatcher(WorkerPool& pool,
                                        CallbackExecutor& executor)
    -> DispatchFn;

}  // namespace tickback
