#include "tickback/app/scheduling_service.hpp"

#include "tickback/util/log.hpp"

namespace tickback {

SchedulingService::SchedulingService(ITaskStore& store, Clock clock,
                                     std::size_t page_size)
    : store_(store), clock_(std::move(clock)), page_size_(page_size) {
}

auto SchedulingService::create(const CreateTaskRequest& req) -> Result<Task> {
  auto task = Task::from_request(req, clock_());
  if (!task) {
    log::debug("Rejected task '{}': {}", req.tag, task.error().message());
    return task;
  }

  if (auto r = store_.put(to_row(*task)); !r) {
    log::error("Failed to save task {}: {}", task->id(), r.error().message());
    return fail(Error::StorageError);
  }

  log::info("Task {} scheduled, callback {} {}", task->id(),
            task->callback_method, task->callback);
  return task;
}

auto SchedulingService::collect(const TaskRef& ref)
    -> Result<std::vector<Task>> {
  std::vector<Task> tasks;

  if (ref.is_exact()) {
    auto row = store_.get(ref.key());
    if (!row) {
      if (row.error() == Error::NotFound) {
        return std::unexpected(row.error());
      }
      return fail(Error::LookupFailed);
    }
    auto task = from_row(*row);
    if (!task) {
      log::error("Task {} is undecodable: {}", row->key,
                 task.error().message());
      return fail(Error::LookupFailed);
    }
    tasks.push_back(std::move(*task));
    return tasks;
  }

  TagRange range;
  range.exact_trigger = ref.trigger_at;

  std::optional<TaskKey> cursor;
  do {
    auto page = store_.query_by_tag(ref.tag, range, cursor, page_size_);
    if (!page) {
      log::error("Failed to look up tasks for tag {}: {}", ref.tag,
                 page.error().message());
      return fail(Error::LookupFailed);
    }
    for (const auto& row : page->rows) {
      if (!ref.matches(row.key)) {
        continue;
      }
      auto task = from_row(row);
      if (!task) {
        log::error("Skipping undecodable task {}: {}", row.key,
                   task.error().message());
        continue;
      }
      tasks.push_back(std::move(*task));
    }
    cursor = std::move(page->next);
  } while (cursor);

  return tasks;
}

auto SchedulingService::reschedule(const TaskRef& ref,
                                   std::optional<std::string_view> trigger_spec,
                                   bool include_all)
    -> Result<std::vector<Task>> {
  if (ref.tag.empty()) {
    return fail(Error::InvalidTaskRef);
  }

  auto now = clock_();
  std::int64_t new_trigger = floor_to_minute(now) + timing::kSecondsPerMinute;
  if (trigger_spec) {
    auto normalized = normalize_trigger_at(*trigger_spec, now);
    if (!normalized) {
      return std::unexpected(normalized.error());
    }
    new_trigger = *normalized;
  }

  auto found = collect(ref);
  if (!found) {
    return std::unexpected(found.error());
  }

  std::vector<Task> rescheduled;
  for (auto& task : *found) {
    if (!include_all && task.state != TaskState::Failed) {
      continue;
    }
    auto old_id = task.id();
    task.trigger_at = new_trigger;
    // Running rows here were abandoned mid-callback; the copy restarts.
    if (task.state == TaskState::Running) {
      task.state = TaskState::Pending;
    }
    if (auto r = store_.put(to_row(task)); !r) {
      log::error("Failed to reschedule {} to {}: {}", old_id, new_trigger,
                 r.error().message());
      return fail(Error::StorageError);
    }
    log::info("Task {} rescheduled as {}", old_id, task.id());
    rescheduled.push_back(std::move(task));
  }
  return rescheduled;
}

auto SchedulingService::decode_page(RowPage page) -> StatusPage {
  StatusPage out;
  out.tasks.reserve(page.rows.size());
  for (const auto& row : page.rows) {
    auto task = from_row(row);
    if (!task) {
      log::error("Skipping undecodable task {}: {}", row.key,
                 task.error().message());
      continue;
    }
    out.tasks.push_back(std::move(*task));
  }
  out.next = std::move(page.next);
  return out;
}

auto SchedulingService::status(const TaskRef& ref,
                               const std::optional<TaskKey>& start_from,
                               bool future_only) -> Result<StatusPage> {
  auto now = clock_();

  if (ref.is_exact()) {
    auto row = store_.get(ref.key());
    if (!row) {
      if (row.error() == Error::NotFound) {
        return std::unexpected(row.error());
      }
      return fail(Error::StatusUnavailable);
    }
    auto task = from_row(*row);
    if (!task) {
      log::error("Task {} is undecodable: {}", row->key,
                 task.error().message());
      return fail(Error::StatusUnavailable);
    }
    StatusPage page;
    page.tasks.push_back(std::move(*task));
    return page;
  }

  if (!ref.tag.empty()) {
    TagRange range;
    range.exact_trigger = ref.trigger_at;
    if (future_only) {
      range.min_trigger = now;
    }
    auto rows = store_.query_by_tag(ref.tag, range, start_from, page_size_);
    if (!rows) {
      log::error("Failed to read status for tag {}: {}", ref.tag,
                 rows.error().message());
      return fail(Error::StatusUnavailable);
    }
    if (ref.unique_id) {
      std::erase_if(rows->rows,
                    [&ref](const TaskRow& row) { return !ref.matches(row.key); });
    }
    auto page = decode_page(std::move(*rows));
    if (ref.trigger_at && page.tasks.empty() && !page.next && !start_from) {
      return fail(Error::NotFound);
    }
    return page;
  }

  ScanFilter filter;
  if (future_only) {
    filter.after_trigger = floor_to_minute(now);
  }
  auto rows = store_.scan(filter, start_from, page_size_);
  if (!rows) {
    log::error("Failed to read status: {}", rows.error().message());
    return fail(Error::StatusUnavailable);
  }
  return decode_page(std::move(*rows));
}

}  // namespace tickback
