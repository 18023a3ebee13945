#include "tickback/storage/task_store.hpp"

#include "tickback/task/task_json.hpp"

namespace tickback {

auto to_row(const Task& task) -> TaskRow {
  return TaskRow{task.key(), task.state, encode_task(task)};
}

auto from_row(const TaskRow& row) -> Result<Task> {
  auto task = decode_task(row.document);
  if (!task) {
    return task;
  }
  // Indexed columns are authoritative.
  task->trigger_at = row.key.trigger_at;
  task->tag = row.key.tag;
  task->unique_id = row.key.unique_id;
  task->state = row.state;
  return task;
}

}  // namespace tickback
