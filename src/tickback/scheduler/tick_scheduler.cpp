#include "tickback/scheduler/tick_scheduler.hpp"

#include "tickback/util/log.hpp"

#include <algorithm>

namespace tickback {

TickScheduler::TickScheduler(ITaskStore& store, DispatchFn dispatch,
                             Clock clock, std::chrono::seconds interval)
    : store_(store), dispatch_(std::move(dispatch)), clock_(std::move(clock)),
      interval_(interval) {
}

TickScheduler::~TickScheduler() {
  stop();
}

auto TickScheduler::start() -> void {
  if (running_.exchange(true)) {
    return;
  }
  thread_ = std::thread([this] { run_loop(); });
  log::info("Tick scheduler started (interval {}s)", interval_.count());
}

auto TickScheduler::stop() -> void {
  {
    std::lock_guard lock(mu_);
    if (!running_.exchange(false)) {
      return;
    }
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
  log::info("Tick scheduler stopped");
}

auto TickScheduler::run_loop() -> void {
  while (running_.load()) {
    if (auto r = tick(clock_()); !r) {
      log::error("Tick skipped: {}", r.error().message());
    }

    std::unique_lock lock(mu_);
    cv_.wait_for(lock, interval_, [this] { return !running_.load(); });
  }
}

auto TickScheduler::tick(std::int64_t now) -> Result<TickReport> {
  std::lock_guard lock(tick_mu_);
  TickReport report;
  report.minute = floor_to_minute(now);

  if (last_minute_ && *last_minute_ >= report.minute) {
    log::debug("Tick {}: minute already handled", report.minute);
    return report;
  }

  auto first = report.minute;
  if (last_minute_) {
    first = std::max(*last_minute_ + timing::kSecondsPerMinute,
                     report.minute - (limits::kMaxTickSweepMinutes - 1) *
                                         timing::kSecondsPerMinute);
    if (first < report.minute) {
      log::warn("Late tick: sweeping {} minutes up to {}",
                (report.minute - first) / timing::kSecondsPerMinute + 1,
                report.minute);
    }
  }

  for (auto minute = first; minute <= report.minute;
       minute += timing::kSecondsPerMinute) {
    if (auto r = fire_minute(minute, report); !r) {
      return std::unexpected(r.error());
    }
    last_minute_ = minute;
  }

  if (report.found > 0) {
    log::info("Tick {}: {} due, {} dispatched, {} rejected", report.minute,
              report.found, report.dispatched, report.rejected);
  } else {
    log::debug("Tick {}: nothing due", report.minute);
  }
  return report;
}

auto TickScheduler::fire_minute(std::int64_t minute, TickReport& report)
    -> Result<void> {
  auto rows = store_.query_by_trigger(minute);
  if (!rows) {
    log::error("Failed to query tasks due at {}: {}", minute,
               rows.error().message());
    return fail(Error::LookupFailed);
  }
  ++report.minutes;

  for (const auto& row : *rows) {
    ++report.found;
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
  return ok();
}

}  // namespace tickback
