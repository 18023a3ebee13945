#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace tickback {

namespace timing {
inline constexpr std::int64_t kSecondsPerMinute = 60;
inline constexpr std::int64_t kSecondsPerHour = 3600;
inline constexpr std::int64_t kSecondsPerDay = 86400;
inline constexpr auto kShutdownPollInterval = std::chrono::milliseconds(100);
inline constexpr auto kBackoffBase = std::chrono::milliseconds(100);
}  // namespace timing

namespace limits {
inline constexpr std::size_t kStoredResponseBytes = 256;
inline constexpr std::size_t kDefaultPageSize = 100;
inline constexpr std::size_t kReadBufferSize = 8192;
inline constexpr int kMaxBackoffExponent = 16;
inline constexpr std::int64_t kMaxTickSweepMinutes = 60;
}  // namespace limits

}  // namespace tickback
