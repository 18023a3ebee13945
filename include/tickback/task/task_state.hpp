#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <format>
#include <optional>
#include <ranges>
#include <string_view>
#include <utility>

namespace tickback {

enum class TaskState : std::uint8_t {
  Pending,
  Running,
  Successful,
  Failed,
  Skipped,
};

namespace detail {

constexpr std::array<std::string_view, 5> kTaskStateNames = {
    "pending",
    "running",
    "successful",
    "failed",
    "skipped",
};

}  // namespace detail

[[nodiscard]] inline auto task_state_name(TaskState state) noexcept
    -> std::string_view {
  auto idx = std::to_underlying(state);
  return idx < detail::kTaskStateNames.size() ? detail::kTaskStateNames[idx]
                                              : "unknown";
}

[[nodiscard]] inline auto parse_task_state(std::string_view name) noexcept
    -> std::optional<TaskState> {
  auto it = std::ranges::find(detail::kTaskStateNames, name);
  if (it == detail::kTaskStateNames.end()) {
    return std::nullopt;
  }
  return static_cast<TaskState>(
      std::ranges::distance(detail::kTaskStateNames.begin(), it));
}

[[nodiscard]] constexpr auto is_terminal(TaskState state) noexcept -> bool {
  return state == TaskState::Successful || state == TaskState::Failed ||
         state == TaskState::Skipped;
}

}  // namespace tickback

template <>
struct std::formatter<tickback::TaskState> : std::formatter<std::string_view> {
  auto format(tickback::TaskState state, auto& ctx) const {
    return std::formatter<std::string_view>::format(
        tickback::task_state_name(state), ctx);
  }
};
