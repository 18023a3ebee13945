#pragma once

#include "tickback/core/error.hpp"

#include <compare>
#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>

namespace tickback {

inline constexpr char kUniqueIdDelimiter = '+';
inline constexpr char kTriggerDelimiter = '@';

// Stored identity of a task. The natural ordering (trigger_at, tag,
// unique_id) is the primary key order used by scans.
struct TaskKey {
  std::int64_t trigger_at{0};
  std::string tag;
  std::string unique_id;

  [[nodiscard]] friend auto operator<=>(const TaskKey&, const TaskKey&) =
      default;
  [[nodiscard]] friend auto operator==(const TaskKey&, const TaskKey&)
      -> bool = default;
};

// Secondary index order: (tag, trigger_at, unique_id).
struct TagIndexOrder {
  [[nodiscard]] auto operator()(const TaskKey& a, const TaskKey& b) const
      -> bool {
    if (auto c = a.tag <=> b.tag; c != 0) return c < 0;
    if (a.trigger_at != b.trigger_at) return a.trigger_at < b.trigger_at;
    return a.unique_id < b.unique_id;
  }
};

// Partial identity supplied by a caller: a tag alone, a tag at one trigger
// time, or the full key.
struct TaskRef {
  std::string tag;
  std::optional<std::string> unique_id;
  std::optional<std::int64_t> trigger_at;

  [[nodiscard]] auto empty() const noexcept -> bool {
    return tag.empty() && !unique_id && !trigger_at;
  }
  [[nodiscard]] auto is_exact() const noexcept -> bool {
    return !tag.empty() && unique_id.has_value() && trigger_at.has_value();
  }
  // Only meaningful when is_exact().
  [[nodiscard]] auto key() const -> TaskKey {
    return TaskKey{trigger_at.value_or(0), tag, unique_id.value_or("")};
  }
  [[nodiscard]] auto matches(const TaskKey& key) const -> bool;
};

// "<tag>+<unique_id>@<trigger_at>"
[[nodiscard]] auto format_task_id(const TaskKey& key) -> std::string;

// Accepts "", "<tag>", "<tag>+<unique_id>", "<tag>@<trigger_at>" and
// "<tag>+<unique_id>@<trigger_at>". Every component is validated; a tag can
// never carry either delimiter.
[[nodiscard]] auto parse_task_ref(std::string_view text) -> Result<TaskRef>;

// Like parse_task_ref but requires the full key.
[[nodiscard]] auto parse_task_key(std::string_view text) -> Result<TaskKey>;

}  // namespace tickback

template <>
struct std::formatter<tickback::TaskKey> : std::formatter<std::string> {
  auto format(const tickback::TaskKey& key, auto& ctx) const {
    return std::formatter<std::string>::format(tickback::format_task_id(key),
                                               ctx);
  }
};
