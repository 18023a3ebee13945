#include "tickback/executor/callback_executor.hpp"

#include "tickback/util/log.hpp"

#include <array>
#include <utility>

namespace tickback {

namespace {

constexpr std::array<std::string_view, 4> kOutcomeNames = {
    "succeeded", "failed", "skipped", "claim_lost"};

}  // namespace

auto outcome_name(ExecutionOutcome outcome) noexcept -> std::string_view {
  return kOutcomeNames[std::to_underlying(outcome)];
}

CallbackExecutor::CallbackExecutor(ITaskStore& store,
                                   http::IHttpTransport& transport, Clock clock,
                                   http::Sleeper sleeper)
    : store_(store), transport_(transport), clock_(std::move(clock)),
      sleeper_(std::move(sleeper)) {
}

auto CallbackExecutor::execute(Task task) -> ExecutionOutcome {
  log::debug("Starting callback for {}", task.id());

  auto now = clock_();
  if (task.past_max_delay(floor_to_minute(now))) {
    log::warn("Skipping {}: past max_delay (trigger_at={}, now={}, "
              "max_delay={}m)",
              task.id(), task.trigger_at, now, task.max_delay);
    skip(task, now);
    return ExecutionOutcome::Skipped;
  }

  if (!claim(task)) {
    log::debug("Claim lost for {}", task.id());
    return ExecutionOutcome::ClaimLost;
  }
  task.state = TaskState::Running;

  auto result = http::send_with_retry(transport_, build_request(task),
                                      task.expected_http_status, task.retry,
                                      sleeper_);
  task.record_response(result.status, result.body, clock_());

  log::info("Callback {} finished: state={} status={} attempts={}", task.id(),
            task.state, result.status, result.attempts);

  if (auto r = store_.put(to_row(task)); !r) {
    log::error("Failed to update task {}: {}", task.id(), r.error().message());
  }

  return task.state == TaskState::Successful ? ExecutionOutcome::Succeeded
                                             : ExecutionOutcome::Failed;
}

auto CallbackExecutor::skip(Task& task, std::int64_t now) -> void {
  auto expected = task.state;
  task.state = TaskState::Skipped;
  task.executed_at = now;

  auto r = store_.put_if_state(to_row(task), expected);
  if (!r) {
    log::error("Failed to mark {} skipped: {}", task.id(), r.error().message());
  } else if (!*r) {
    log::debug("{} changed state before it could be skipped", task.id());
  }
}

// A task already running elsewhere is never executed twice. A store error on
// the claim itself is not fatal.
auto CallbackExecutor::claim(const Task& task) -> bool {
  if (task.state == TaskState::Running) {
    return false;
  }

  Task running = task;
  running.state = TaskState::Running;
  auto r = store_.put_if_state(to_row(running), task.state);
  if (!r) {
    log::error("Failed to claim task {}: {}", task.id(), r.error().message());
    return true;
  }
  return *r;
}

auto CallbackExecutor::build_request(const Task& task) const
    -> http::HttpRequest {
  http::HttpRequest req;
  req.method = task.callback_method;
  req.url = task.callback;
  req.body = task.payload;
  if (task.callback_method == http::HttpMethod::POST) {
    req.headers["Content-Type"] = "application/x-www-form-urlencoded";
  }
  return req;
}

}  // namespace tickback
