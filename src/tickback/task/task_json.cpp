#include "tickback/task/task_json.hpp"

#include "tickback/util/log.hpp"

#include <cstdint>
#include <limits>

namespace tickback {

using json = nlohmann::json;

namespace {

// Absent fields read as 0. Anything but a JSON integer that fits in an int is
// rejected rather than converted.
auto int_field(const json& j, const char* key) -> Result<int> {
  auto it = j.find(key);
  if (it == j.end()) {
    return 0;
  }
  if (!it->is_number_integer()) {
    return fail(Error::ParseError);
  }
  constexpr auto kMin = std::numeric_limits<int>::min();
  constexpr auto kMax = std::numeric_limits<int>::max();
  if (it->is_number_unsigned()) {
    auto v = it->get<std::uint64_t>();
    if (v > static_cast<std::uint64_t>(kMax)) {
      return fail(Error::ParseError);
    }
    return static_cast<int>(v);
  }
  auto v = it->get<std::int64_t>();
  if (v < kMin || v > kMax) {
    return fail(Error::ParseError);
  }
  return static_cast<int>(v);
}

}  // namespace

void to_json(json& j, const Task& task) {
  j = json{
      {"task_id", task.id()},
      {"trigger_at", task.trigger_at},
      {"tag", task.tag},
      {"unique_id", task.unique_id},
      {"payload", task.payload},
      {"callback", task.callback},
      {"callback_method", std::string(http::method_name(task.callback_method))},
      {"retry", task.retry},
      {"expected_http_status", task.expected_http_status},
      {"max_delay", task.max_delay},
      {"task_state", std::string(task_state_name(task.state))},
      {"response_status", task.response_status},
      {"response_body", task.response_body},
      {"executed_at", task.executed_at},
  };
}

auto encode_task(const Task& task) -> std::string {
  json j = task;
  j.erase("task_id");
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

auto decode_task(std::string_view document) -> Result<Task> {
  try {
    auto j = json::parse(document);
    if (!j.is_object()) {
      return fail(Error::CorruptRecord);
    }

    Task task;
    task.trigger_at = j.at("trigger_at").get<std::int64_t>();
    task.tag = j.at("tag").get<std::string>();
    task.unique_id = j.at("unique_id").get<std::string>();
    task.callback = j.at("callback").get<std::string>();
    task.payload = j.value("payload", "");
    task.retry = j.value("retry", kDefaultRetry);
    task.expected_http_status =
        j.value("expected_http_status", kDefaultExpectedHttpStatus);
    task.max_delay = j.value("max_delay", kDefaultMaxDelayMinutes);
    task.response_status = j.value("response_status", 0);
    task.response_body = j.value("response_body", "");
    task.executed_at = j.value("executed_at", std::int64_t{0});

    auto method = http::parse_method(j.value("callback_method", "GET"));
    auto state = parse_task_state(j.at("task_state").get<std::string>());
    if (!method || !state) {
      return fail(Error::CorruptRecord);
    }
    task.callback_method = *method;
    task.state = *state;
    return task;
  } catch (const json::exception& e) {
    log::debug("Failed to decode task document: {}", e.what());
    return fail(Error::CorruptRecord);
  }
}

auto parse_create_request(std::string_view body) -> Result<CreateTaskRequest> {
  try {
    auto j = json::parse(body);
    if (!j.is_object()) {
      return fail(Error::ParseError);
    }

    CreateTaskRequest req;
    if (auto it = j.find("trigger_at"); it != j.end()) {
      req.trigger_at = it->is_number_integer()
                           ? std::to_string(it->get<std::int64_t>())
                           : it->get<std::string>();
    }
    req.tag = j.value("tag", "");
    req.payload = j.value("payload", "");
    req.callback = j.value("callback", "");
    req.callback_method = j.value("callback_method", "");

    auto retry = int_field(j, "retry");
    auto expected = int_field(j, "expected_http_status");
    auto max_delay = int_field(j, "max_delay");
    if (!retry || !expected || !max_delay) {
      log::debug("Invalid create request: integer field out of range");
      return fail(Error::ParseError);
    }
    req.retry = *retry;
    req.expected_http_status = *expected;
    req.max_delay = *max_delay;
    return req;
  } catch (const json::exception& e) {
    log::debug("Invalid create request: {}", e.what());
    return fail(Error::ParseError);
  }
}

}  // namespace tickback
