#include "tickback/task/task.hpp"

#include "tickback/client/http/url.hpp"
#include "tickback/core/constants.hpp"
#include "tickback/util/id.hpp"
#include "tickback/util/time.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>

namespace tickback {

namespace {

auto parse_int64(std::string_view s) -> std::optional<std::int64_t> {
  std::int64_t value = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
  if (ec != std::errc{} || ptr != s.data() + s.size()) {
    return std::nullopt;
  }
  return value;
}

auto unit_seconds(char unit) -> std::int64_t {
  switch (unit) {
    case 'm': return timing::kSecondsPerMinute;
    case 'h': return timing::kSecondsPerHour;
    case 'd': return timing::kSecondsPerDay;
    default: return 0;
  }
}

}  // namespace

auto normalize_trigger_at(std::string_view spec, std::int64_t now)
    -> Result<std::int64_t> {
  // Neither form can be shorter than "+1m".
  if (spec.size() < 3) {
    return fail(Error::InvalidTimeSpec);
  }

  auto current_minute = floor_to_minute(now);

  if (spec.front() == '+') {
    auto digits = spec.substr(1, spec.size() - 2);
    auto unit = unit_seconds(spec.back());
    if (unit == 0 || !std::ranges::all_of(digits, [](char c) {
          return std::isdigit(static_cast<unsigned char>(c));
        })) {
      return fail(Error::InvalidTimeSpec);
    }
    auto amount = parse_int64(digits);
    if (!amount ||
        *amount > (std::numeric_limits<std::int64_t>::max() - current_minute) /
                      unit) {
      return fail(Error::InvalidTimeSpec);
    }
    return current_minute + *amount * unit;
  }

  auto ts = parse_int64(spec);
  if (!ts || *ts % timing::kSecondsPerMinute != 0 || *ts <= current_minute) {
    return fail(Error::InvalidTimeSpec);
  }
  return *ts;
}

auto is_valid_tag(std::string_view tag) noexcept -> bool {
  return std::ranges::all_of(tag, [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
  });
}

auto validate(const CreateTaskRequest& req) -> Result<void> {
  if (req.tag.empty() || req.trigger_at.empty() || req.callback.empty()) {
    return fail(Error::IncompleteTask);
  }
  if (!req.callback_method.empty()) {
    auto method = http::parse_method(req.callback_method);
    if (!method) {
      return fail(Error::UnsupportedMethod);
    }
  }
  if (!is_valid_tag(req.tag)) {
    return fail(Error::InvalidTag);
  }
  if (!http::Url::parse(req.callback)) {
    return fail(Error::InvalidCallbackURL);
  }
  if (req.retry < 0 || req.max_delay < 0) {
    return fail(Error::NegativeField);
  }
  return ok();
}

auto truncate_response(std::string_view body) -> std::string {
  return std::string(body.substr(0, limits::kStoredResponseBytes));
}

auto Task::set_defaults() -> void {
  state = TaskState::Pending;
  if (retry == 0) {
    retry = kDefaultRetry;
  }
  if (expected_http_status == 0) {
    expected_http_status = kDefaultExpectedHttpStatus;
  }
  if (max_delay == 0) {
    max_delay = kDefaultMaxDelayMinutes;
  }
}

auto Task::assign_unique_id() -> void {
  unique_id = generate_unique_id();
}

auto Task::past_max_delay(std::int64_t current_minute) const noexcept -> bool {
  return current_minute >
         trigger_at + static_cast<std::int64_t>(max_delay) *
                          timing::kSecondsPerMinute;
}

auto Task::record_response(int status, std::string_view body,
                           std::int64_t executed) -> void {
  state = status == expected_http_status ? TaskState::Successful
                                         : TaskState::Failed;
  response_status = status;
  response_body = truncate_response(body);
  executed_at = executed;
}

auto Task::from_request(const CreateTaskRequest& req, std::int64_t now)
    -> Result<Task> {
  if (auto r = validate(req); !r) {
    return std::unexpected(r.error());
  }
  auto trigger_at = normalize_trigger_at(req.trigger_at, now);
  if (!trigger_at) {
    return std::unexpected(trigger_at.error());
  }

  Task task;
  task.trigger_at = *trigger_at;
  task.tag = req.tag;
  task.callback = req.callback;
  task.callback_method = http::parse_method(req.callback_method)
                             .value_or(http::HttpMethod::GET);
  task.payload = req.payload;
  task.retry = req.retry;
  task.expected_http_status = req.expected_http_status;
  task.max_delay = req.max_delay;
  task.set_defaults();
  task.assign_unique_id();
  return task;
}

}  // namespace tickback
