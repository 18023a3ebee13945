#pragma once

#include "tickback/storage/task_store.hpp"

#include <map>
#include <mutex>
#include <set>

namespace tickback {

// Non-durable store with the same ordering and pagination semantics as the
// SQLite store.
class MemoryTaskStore : public ITaskStore {
public:
  MemoryTaskStore() = default;

  MemoryTaskStore(const MemoryTaskStore&) = delete;
  MemoryTaskStore& operator=(const MemoryTaskStore&) = delete;

  [[nodiscard]] auto get(const TaskKey& key) -> Result<TaskRow> override;
  [[nodiscard]] auto put(const TaskRow& row) -> Result<void> override;
  [[nodiscard]] auto put_if_state(const TaskRow& row, TaskState expected)
      -> Result<bool> override;
  [[nodiscard]] auto query_by_trigger(std::int64_t trigger_at)
      -> Result<std::vector<TaskRow>> override;
  [[nodiscard]] auto query_by_tag(std::string_view tag, const TagRange& range,
                                  const std::optional<TaskKey>& start_after,
                                  std::size_t limit)
      -> Result<RowPage> override;
  [[nodiscard]] auto scan(const ScanFilter& filter,
                          const std::optional<TaskKey>& start_after,
                          std::size_t limit) -> Result<RowPage> override;

  [[nodiscard]] auto size() const -> std::size_t;

private:
  struct Entry {
    TaskState state{TaskState::Pending};
    std::string document;
  };

  [[nodiscard]] static auto make_row(const TaskKey& key, const Entry& entry)
      -> TaskRow {
    return TaskRow{key, entry.state, entry.document};
  }

  mutable std::mutex mu_;
  std::map<TaskKey, Entry> rows_;
  std::set<TaskKey, TagIndexOrder> by_tag_;
};

}  // namespace tickback
