#include "tickback/task/task_key.hpp"

#include "tickback/task/task.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace tickback {

namespace {

auto is_unique_id(std::string_view s) -> bool {
  return !s.empty() && std::ranges::all_of(s, [](char c) {
    return std::isdigit(static_cast<unsigned char>(c)) || (c >= 'a' && c <= 'f');
  });
}

auto parse_trigger(std::string_view s) -> std::optional<std::int64_t> {
  if (s.empty() || !std::ranges::all_of(s, [](char c) {
        return std::isdigit(static_cast<unsigned char>(c));
      })) {
    return std::nullopt;
  }
  std::int64_t value = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
  if (ec != std::errc{} || ptr != s.data() + s.size()) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

auto TaskRef::matches(const TaskKey& key) const -> bool {
  if (!tag.empty() && key.tag != tag) return false;
  if (unique_id && key.unique_id != *unique_id) return false;
  if (trigger_at && key.trigger_at != *trigger_at) return false;
  return true;
}

auto format_task_id(const TaskKey& key) -> std::string {
  return std::format("{}{}{}{}{}", key.tag, kUniqueIdDelimiter, key.unique_id,
                     kTriggerDelimiter, key.trigger_at);
}

auto parse_task_ref(std::string_view text) -> Result<TaskRef> {
  TaskRef ref;
  if (text.empty()) {
    return ref;
  }

  auto head = text;
  if (auto at = text.find(kTriggerDelimiter); at != std::string_view::npos) {
    auto trigger = parse_trigger(text.substr(at + 1));
    if (!trigger) {
      return fail(Error::InvalidTaskRef);
    }
    ref.trigger_at = *trigger;
    head = text.substr(0, at);
  }

  if (auto plus = head.find(kUniqueIdDelimiter); plus != std::string_view::npos) {
    auto uid = head.substr(plus + 1);
    if (!is_unique_id(uid)) {
      return fail(Error::InvalidTaskRef);
    }
    ref.unique_id = std::string(uid);
    head = head.substr(0, plus);
  }

  if (head.empty() || !is_valid_tag(head)) {
    return fail(Error::InvalidTaskRef);
  }
  ref.tag = std::string(head);
  return ref;
}

auto parse_task_key(std::string_view text) -> Result<TaskKey> {
  auto ref = parse_task_ref(text);
  if (!ref) {
    return std::unexpected(ref.error());
  }
  if (!ref->is_exact()) {
    return fail(Error::InvalidTaskRef);
  }
  return ref->key();
}

}  // namespace tickback
