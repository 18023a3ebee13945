#pragma once

#include "tickback/core/constants.hpp"

#include <chrono>
#include <cstdint>
#include <functional>

namespace tickback {

// Source of "now" in Unix seconds; injectable so schedulers can be driven by
// a manual clock in tests.
using Clock = std::function<std::int64_t()>;

[[nodiscard]] inline auto unix_now() -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

[[nodiscard]] constexpr auto floor_to_minute(std::int64_t ts) noexcept
    -> std::int64_t {
  return ts - ts % timing::kSecondsPerMinute;
}

[[nodiscard]] inline auto unix_minute() -> std::int64_t {
  return floor_to_minute(unix_now());
}

[[nodiscard]] inline auto system_clock() -> Clock {
  return [] { return unix_now(); };
}

}  // namespace tickback
