#include "tickback/storage/memory_task_store.hpp"

#include <algorithm>
#include <limits>

namespace tickback {

auto MemoryTaskStore::get(const TaskKey& key) -> Result<TaskRow> {
  std::lock_guard lock(mu_);
  auto it = rows_.find(key);
  if (it == rows_.end()) {
    return fail(Error::NotFound);
  }
  return make_row(it->first, it->second);
}

auto MemoryTaskStore::put(const TaskRow& row) -> Result<void> {
  std::lock_guard lock(mu_);
  rows_.insert_or_assign(row.key, Entry{row.state, row.document});
  by_tag_.insert(row.key);
  return ok();
}

auto MemoryTaskStore::put_if_state(const TaskRow& row, TaskState expected)
    -> Result<bool> {
  std::lock_guard lock(mu_);
  auto it = rows_.find(row.key);
  if (it == rows_.end() || it->second.state != expected) {
    return false;
  }
  it->second = Entry{row.state, row.document};
  return true;
}

auto MemoryTaskStore::query_by_trigger(std::int64_t trigger_at)
    -> Result<std::vector<TaskRow>> {
  std::lock_guard lock(mu_);
  std::vector<TaskRow> out;
  for (auto it = rows_.lower_bound(TaskKey{trigger_at, {}, {}});
       it != rows_.end() && it->first.trigger_at == trigger_at; ++it) {
    out.push_back(make_row(it->first, it->second));
  }
  return out;
}

auto MemoryTaskStore::query_by_tag(std::string_view tag, const TagRange& range,
                                   const std::optional<TaskKey>& start_after,
                                   std::size_t limit) -> Result<RowPage> {
  std::lock_guard lock(mu_);
  RowPage page;

  std::int64_t from = std::numeric_limits<std::int64_t>::min();
  if (range.exact_trigger) from = *range.exact_trigger;
  if (range.min_trigger) from = std::max(from, *range.min_trigger);

  TaskKey lower{from, std::string(tag), {}};
  auto it = by_tag_.lower_bound(lower);
  if (start_after) {
    TaskKey cursor{start_after->trigger_at, std::string(tag),
                   start_after->unique_id};
    if (!TagIndexOrder{}(cursor, lower)) {
      it = by_tag_.upper_bound(cursor);
    }
  }

  for (; it != by_tag_.end() && it->tag == tag; ++it) {
    if (range.exact_trigger && it->trigger_at != *range.exact_trigger) break;
    page.rows.push_back(make_row(*it, rows_.at(*it)));
    if (page.rows.size() == limit) {
      page.next = *it;
      break;
    }
  }
  return page;
}

auto MemoryTaskStore::scan(const ScanFilter& filter,
                           const std::optional<TaskKey>& start_after,
                           std::size_t limit) -> Result<RowPage> {
  std::lock_guard lock(mu_);
  RowPage page;

  auto it = start_after ? rows_.upper_bound(*start_after) : rows_.begin();
  for (; it != rows_.end(); ++it) {
    const auto& [key, entry] = *it;
    if (filter.max_trigger && key.trigger_at > *filter.max_trigger) break;
    if (filter.after_trigger && key.trigger_at <= *filter.after_trigger)
      continue;
    if (filter.state && entry.state != *filter.state) continue;
    page.rows.push_back(make_row(key, entry));
    if (page.rows.size() == limit) {
      page.next = key;
      break;
    }
  }
  return page;
}

auto MemoryTaskStore::size() const -> std::size_t {
  std::lock_guard lock(mu_);
  return rows_.size();
}

}  // namespace tickback
