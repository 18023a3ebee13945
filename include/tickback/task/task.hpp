#pragma once

#include "tickback/client/http/http_types.hpp"
#include "tickback/core/error.hpp"
#include "tickback/task/task_key.hpp"
#include "tickback/task/task_state.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace tickback {

inline constexpr int kDefaultRetry = 1;
inline constexpr int kDefaultExpectedHttpStatus = 200;
inline constexpr int kDefaultMaxDelayMinutes = 10;

// Body of a create call. Zero/empty optional fields mean "use the default".
struct CreateTaskRequest {
  std::string trigger_at;
  std::string tag;
  std::string payload;
  std::string callback;
  std::string callback_method;
  int retry{0};
  int expected_http_status{0};
  int max_delay{0};
};

struct Task {
  std::int64_t trigger_at{0};
  std::string tag;
  std::string unique_id;
  std::string callback;
  http::HttpMethod callback_method{http::HttpMethod::GET};
  std::string payload;
  int retry{0};
  int expected_http_status{0};
  int max_delay{0};  // minutes

  TaskState state{TaskState::Pending};
  int response_status{0};
  std::string response_body;
  std::int64_t executed_at{0};

  [[nodiscard]] auto key() const -> TaskKey {
    return TaskKey{trigger_at, tag, unique_id};
  }
  [[nodiscard]] auto id() const -> std::string {
    return format_task_id(key());
  }

  auto set_defaults() -> void;
  auto assign_unique_id() -> void;

  // True when the abandonment window has passed at `current_minute`.
  [[nodiscard]] auto past_max_delay(std::int64_t current_minute) const noexcept
      -> bool;

  // Final state after the callback returned `status`.
  auto record_response(int status, std::string_view body,
                       std::int64_t executed) -> void;

  // Validate, normalize the trigger time, apply defaults and generate the
  // unique id. `now` is Unix seconds.
  [[nodiscard]] static auto from_request(const CreateTaskRequest& req,
                                         std::int64_t now) -> Result<Task>;
};

// Resolves an absolute ("1700000040") or relative ("+5m", "+2h", "+1d")
// trigger specification to a minute-aligned Unix timestamp strictly after
// the current minute.
[[nodiscard]] auto normalize_trigger_at(std::string_view spec, std::int64_t now)
    -> Result<std::int64_t>;

[[nodiscard]] auto is_valid_tag(std::string_view tag) noexcept -> bool;

[[nodiscard]] auto validate(const CreateTaskRequest& req) -> Result<void>;

[[nodiscard]] auto truncate_response(std::string_view body) -> std::string;

}  // namespace tickback
