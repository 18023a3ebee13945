#include "tickback/scheduler/catchup_scanner.hpp"

#include "tickback/util/log.hpp"

#include <optional>

namespace tickback {

CatchupScanner::CatchupScanner(ITaskStore& store, DispatchFn dispatch,
                               Clock clock, std::size_t page_size)
    : store_(store), dispatch_(std::move(dispatch)), clock_(std::move(clock)),
      page_size_(page_size) {
}

CatchupScanner::~CatchupScanner() {
  join();
}

auto CatchupScanner::run() -> Result<CatchupReport> {
  if (running_.exchange(true)) {
    return fail(Error::Busy);
  }
  struct Guard {
    std::atomic<bool>& flag;
    ~Guard() { flag.store(false); }
  } guard{running_};

  auto up_to = floor_to_minute(clock_());
  log::info("Catchup started for pending tasks up to {}", up_to);

  auto report = scan_pages(up_to);
  if (!report) {
    log::error("Catchup aborted: {}", report.error().message());
    return report;
  }

  log::info("Catchup finished: {} pages, {} pending, {} dispatched, {} "
            "rejected, {} undecodable",
            report->pages, report->scanned, report->dispatched,
            report->rejected, report->undecodable);
  return report;
}

auto CatchupScanner::scan_pages(std::int64_t up_to) -> Result<CatchupReport> {
  CatchupReport report;
  report.up_to = up_to;

  ScanFilter filter;
  filter.max_trigger = up_to;
  filter.state = TaskState::Pending;

  std::optional<TaskKey> cursor;
  do {
    auto page = store_.scan(filter, cursor, page_size_);
    if (!page) {
      log::error("Catchup scan failed after {} pages: {}", report.pages,
                 page.error().message());
      return fail(Error::LookupFailed);
    }
    ++report.pages;

    for (const auto& row : page->rows) {
      ++report.scanned;
      auto task = from_row(row);
      if (!task) {
        log::error("Skipping undecodable task {}: {}", row.key,
                   task.error().message());
        ++report.undecodable;
        continue;
      }
      if (dispatch_(std::move(*task))) {
        ++report.dispatched;
      } else {
        ++report.rejected;
      }
    }
    cursor = std::move(page->next);
  } while (cursor);

  return report;
}

auto CatchupScanner::run_async() -> void {
  std::lock_guard lock(thread_mu_);
  if (thread_.joinable()) {
    thread_.join();
  }
  thread_ = std::thread([this] {
    if (auto r = run(); !r && r.error() == Error::Busy) {
      log::warn("Catchup already in progress");
    }
  });
}

auto CatchupScanner::join() -> void {
  std::lock_guard lock(thread_mu_);
  if (thread_.joinable()) {
    thread_.join();
  }
}

}  // namespace tickback
