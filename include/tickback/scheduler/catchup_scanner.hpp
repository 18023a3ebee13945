#pragma once

#include "tickback/core/error.hpp"
#include "tickback/executor/worker_pool.hpp"
#include "tickback/storage/task_store.hpp"
#include "tickback/util/time.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <thread>

namespace tickback {

struct CatchupReport {
  std::int64_t up_to{0};
  std::size_t pages{0};
  std::size_t scanned{0};
  std::size_t dispatched{0};
  std::size_t rejected{0};
  std::size_t undecodable{0};
};

// Replays pending tasks whose minute has already passed, e.g. after the
// process was down. Only one pass runs at a time.
class CatchupScanner {
public:
  CatchupScanner(ITaskStore& store, DispatchFn dispatch, Clock clock,
                 std::size_t page_size);
  ~CatchupScanner();

  CatchupScanner(const CatchupScanner&) = delete;
  auto operator=(const CatchupScanner&) -> CatchupScanner& = delete;

  // Busy if another pass is in progress; LookupFailed if a page read fails.
  [[nodiscard]] auto run() -> Result<CatchupReport>;

  // Runs one pass on a background thread.
  auto run_async() -> void;
  auto join() -> void;

  [[nodiscard]] auto is_running() const noexcept -> bool {
    return running_.load();
  }

private:
  auto scan_pages(std::int64_t up_to) -> Result<CatchupReport>;

  ITaskStore& store_;
  DispatchFn dispatch_;
  Clock clock_;
  std::size_t page_size_;

  std::atomic<bool> running_{false};
  std::mutex thread_mu_;
  std::thread thread_;
};

}  // namespace tickback
