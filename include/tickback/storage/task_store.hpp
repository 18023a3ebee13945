#pragma once

#include "tickback/core/error.hpp"
#include "tickback/task/task.hpp"
#include "tickback/task/task_key.hpp"
#include "tickback/task/task_state.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tickback {

// Stored form of a task: the key and state are indexed columns, the rest of
// the task lives in an opaque JSON document.
struct TaskRow {
  TaskKey key;
  TaskState state{TaskState::Pending};
  std::string document;
};

[[nodiscard]] auto to_row(const Task& task) -> TaskRow;
[[nodiscard]] auto from_row(const TaskRow& row) -> Result<Task>;

// Secondary-index query bounds for one tag.
struct TagRange {
  std::optional<std::int64_t> exact_trigger;
  std::optional<std::int64_t> min_trigger;  // inclusive
};

struct ScanFilter {
  std::optional<std::int64_t> max_trigger;    // inclusive
  std::optional<std::int64_t> after_trigger;  // exclusive
  std::optional<TaskState> state;
};

// `next` is set when the page was filled, so more rows may follow it.
struct RowPage {
  std::vector<TaskRow> rows;
  std::optional<TaskKey> next;
};

class ITaskStore {
public:
  virtual ~ITaskStore() = default;

  [[nodiscard]] virtual auto get(const TaskKey& key) -> Result<TaskRow> = 0;
  [[nodiscard]] virtual auto put(const TaskRow& row) -> Result<void> = 0;

  // Replaces the row only if it exists with `expected` state. Returns false
  // when the row is absent or its state moved on.
  [[nodiscard]] virtual auto put_if_state(const TaskRow& row,
                                          TaskState expected)
      -> Result<bool> = 0;

  [[nodiscard]] virtual auto query_by_trigger(std::int64_t trigger_at)
      -> Result<std::vector<TaskRow>> = 0;

  // Ordered by (trigger_at, unique_id) within the tag.
  [[nodiscard]] virtual auto query_by_tag(std::string_view tag,
                                          const TagRange& range,
                                          const std::optional<TaskKey>& start_after,
                                          std::size_t limit)
      -> Result<RowPage> = 0;

  // Ordered by primary key (trigger_at, tag, unique_id).
  [[nodiscard]] virtual auto scan(const ScanFilter& filter,
                                  const std::optional<TaskKey>& start_after,
                                  std::size_t limit) -> Result<RowPage> = 0;
};

}  // namespace tickback
