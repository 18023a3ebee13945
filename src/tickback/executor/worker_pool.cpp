#include "tickback/executor/worker_pool.hpp"

#include "tickback/executor/callback_executor.hpp"
#include "tickback/util/log.hpp"

#include <algorithm>
#include <stdexcept>

namespace tickback {

WorkerPool::WorkerPool(WorkerPoolConfig config) : config_(config) {
  config_.workers = std::max<std::size_t>(config_.workers, 1);
  config_.queue_capacity = std::max<std::size_t>(config_.queue_capacity, 1);
}

WorkerPool::~WorkerPool() {
  stop();
}

auto WorkerPool::start() -> void {
  std::lock_guard lock(mu_);
  if (running_.exchange(true)) {
    return;
  }
  workers_.reserve(config_.workers);
  for (std::size_t i = 0; i < config_.workers; ++i) {
    workers_.emplace_back([this] { worker_loop(); });
  }
  log::info("Worker pool started: {} workers, queue capacity {}, {} when full",
            config_.workers, config_.queue_capacity,
            saturation_policy_name(config_.saturation));
}

auto WorkerPool::stop() -> void {
  {
    std::lock_guard lock(mu_);
    if (!running_.exchange(false)) {
      return;
    }
  }
  not_empty_.notify_all();
  not_full_.notify_all();
  for (auto& w : workers_) {
    if (w.joinable()) {
      w.join();
    }
  }
  workers_.clear();
  log::info("Worker pool stopped");
}

auto WorkerPool::submit(Job job) -> Result<void> {
  std::unique_lock lock(mu_);
  if (!running_.load(std::memory_order_acquire)) {
    return fail(Error::Cancelled);
  }

  if (queue_.size() >= config_.queue_capacity) {
    if (config_.saturation == SaturationPolicy::Reject) {
      return fail(Error::QueueFull);
    }
    bool has_room = not_full_.wait_for(lock, config_.submit_timeout, [this] {
      return queue_.size() < config_.queue_capacity ||
             !running_.load(std::memory_order_acquire);
    });
    if (!running_.load(std::memory_order_acquire)) {
      return fail(Error::Cancelled);
    }
    if (!has_room) {
      return fail(Error::QueueFull);
    }
  }

  queue_.push_back(std::move(job));
  lock.unlock();
  not_empty_.notify_one();
  return ok();
}

auto WorkerPool::wait_idle(std::chrono::milliseconds timeout) -> bool {
  std::unique_lock lock(mu_);
  return idle_.wait_for(lock, timeout, [this] {
    return queue_.empty() && active_.load(std::memory_order_acquire) == 0;
  });
}

auto WorkerPool::queued() const -> std::size_t {
  std::lock_guard lock(mu_);
  return queue_.size();
}

auto WorkerPool::worker_loop() -> void {
  std::unique_lock lock(mu_);
  while (true) {
    not_empty_.wait(lock, [this] {
      return !queue_.empty() || !running_.load(std::memory_order_acquire);
    });
    if (queue_.empty()) {
      break;
    }

    auto job = std::move(queue_.front());
    queue_.pop_front();
    active_.fetch_add(1, std::memory_order_acq_rel);
    lock.unlock();
    not_full_.notify_one();

    try {
      job();
    } catch (const std::exception& e) {
      log::error("Worker job failed: {}", e.what());
    }

    lock.lock();
    active_.fetch_sub(1, std::memory_order_acq_rel);
    if (queue_.empty() && active_.load(std::memory_order_acquire) == 0) {
      idle_.notify_all();
    }
  }
}

auto make_pool_dispatcher(WorkerPool& pool, CallbackExecutor& executor)
    -> DispatchFn {
  return [&pool, &executor](Task task) {
    auto id = task.id();
    auto r = pool.submit(
        [&executor, task = std::move(task)]() mutable {
          executor.execute(std::move(task));
        });
    if (!r) {
      log::warn("Task {} not dispatched: {}", id, r.error().message());
      return false;
    }
    return true;
  };
}

}  // namespace tickback
