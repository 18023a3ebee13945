#pragma once

#include "tickback/core/error.hpp"
#include "tickback/executor/worker_pool.hpp"
#include "tickback/storage/task_store.hpp"
#include "tickback/util/time.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <thread>

namespace tickback {

struct TickReport {
  std::int64_t minute{0};
  std::size_t minutes{0};  // minutes queried, > 1 after a late wakeup
  std::size_t found{0};
  std::size_t dispatched{0};
  std::size_t rejected{0};
  std::size_t undecodable{0};
};

// Wakes every `interval` and dispatches the tasks due at the current minute.
// Minutes passed over by a late wakeup are swept on the next tick.
class TickScheduler {
public:
  TickScheduler(ITaskStore& store, DispatchFn dispatch, Clock clock,
                std::chrono::seconds interval);
  ~TickScheduler();

  TickScheduler(const TickScheduler&) = delete;
  auto operator=(const TickScheduler&) -> TickScheduler& = delete;

  auto start() -> void;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool {
    return running_.load();
  }

  // One cycle at `now` (Unix seconds).
  [[nodiscard]] auto tick(std::int64_t now) -> Result<TickReport>;

private:
  auto run_loop() -> void;
  [[nodiscard]] auto fire_minute(std::int64_t minute, TickReport& report)
      -> Result<void>;

  ITaskStore& store_;
  DispatchFn dispatch_;
  Clock clock_;
  std::chrono::seconds interval_;

  std::atomic<bool> running_{false};
  std::mutex mu_;
  std::condition_variable cv_;
  std::thread thread_;

  std::mutex tick_mu_;
  std::optional<std::int64_t> last_minute_;
};

}  // namespace tickback
