#pragma once

#include "tickback/client/http/http_client.hpp"
#include "tickback/client/http/retry.hpp"
#include "tickback/storage/task_store.hpp"
#include "tickback/task/task.hpp"
#include "tickback/util/time.hpp"

#include <cstdint>
#include <format>
#include <string_view>

namespace tickback {

enum class ExecutionOutcome : std::uint8_t {
  Succeeded,
  Failed,
  Skipped,
  ClaimLost,
};

[[nodiscard]] auto outcome_name(ExecutionOutcome outcome) noexcept
    -> std::string_view;

// Runs one task's callback: abandons it past max_delay, claims it, calls the
// endpoint with retries and writes the result back to the store.
class CallbackExecutor {
public:
  CallbackExecutor(ITaskStore& store, http::IHttpTransport& transport,
                   Clock clock, http::Sleeper sleeper);

  CallbackExecutor(const CallbackExecutor&) = delete;
  auto operator=(const CallbackExecutor&) -> CallbackExecutor& = delete;

  auto execute(Task task) -> ExecutionOutcome;

private:
  auto skip(Task& task, std::int64_t now) -> void;
  [[nodiscard]] auto claim(const Task& task) -> bool;
  [[nodiscard]] auto build_request(const Task& task) const -> http::HttpRequest;

  ITaskStore& store_;
  http::IHttpTransport& transport_;
  Clock clock_;
  http::Sleeper sleeper_;
};

}  // namespace tickback

template <>
struct std::formatter<tickback::ExecutionOutcome>
    : std::formatter<std::string_view> {
  auto format(tickback::ExecutionOutcome outcome, auto& ctx) const {
    return std::formatter<std::string_view>::format(
        tickback::outcome_name(outcome), ctx);
  }
};
