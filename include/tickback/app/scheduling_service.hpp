#pragma once

#include "tickback/core/error.hpp"
#include "tickback/storage/task_store.hpp"
#include "tickback/task/task.hpp"
#include "tickback/task/task_key.hpp"
#include "tickback/util/time.hpp"

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace tickback {

struct StatusPage {
  std::vector<Task> tasks;
  std::optional<TaskKey> next;
};

// Create, reschedule and status operations over the task store.
class SchedulingService {
public:
  SchedulingService(ITaskStore& store, Clock clock, std::size_t page_size);

  SchedulingService(const SchedulingService&) = delete;
  auto operator=(const SchedulingService&) -> SchedulingService& = delete;

  [[nodiscard]] auto create(const CreateTaskRequest& req) -> Result<Task>;

  // Moves the failed occurrences matched by `ref` (every occurrence when
  // `include_all`) to `trigger_spec`, or to the next minute when absent.
  [[nodiscard]] auto reschedule(const TaskRef& ref,
                                std::optional<std::string_view> trigger_spec,
                                bool include_all) -> Result<std::vector<Task>>;

  // One page of tasks matched by `ref`. Pass the returned `next` back as
  // `start_from` to continue.
  [[nodiscard]] auto status(const TaskRef& ref,
                            const std::optional<TaskKey>& start_from,
                            bool future_only) -> Result<StatusPage>;

  [[nodiscard]] auto page_size() const noexcept -> std::size_t {
    return page_size_;
  }

private:
  [[nodiscard]] auto collect(const TaskRef& ref) -> Result<std::vector<Task>>;
  [[nodiscard]] auto decode_page(RowPage page) -> StatusPage;

  ITaskStore& store_;
  Clock clock_;
  std::size_t page_size_;
};

}  // namespace tickback
