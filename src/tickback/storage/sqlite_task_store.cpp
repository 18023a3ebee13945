#include "tickback/storage/sqlite_task_store.hpp"

#include "tickback/util/log.hpp"

#include <sqlite3.h>

#include <format>
#include <utility>

namespace tickback {

namespace {

auto col_text(sqlite3_stmt* stmt, int col) -> std::string {
  auto* p = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
  return p ? p : "";
}

// Binds positional parameters in order.
class Binder {
public:
  explicit Binder(sqlite3_stmt* stmt) noexcept : stmt_(stmt) {
  }

  auto bind(std::int64_t value) -> Binder& {
    sqlite3_bind_int64(stmt_, ++index_, value);
    return *this;
  }

  auto bind(std::string_view value) -> Binder& {
    sqlite3_bind_text(stmt_, ++index_, value.data(),
                      static_cast<int>(value.size()), SQLITE_TRANSIENT);
    return *this;
  }

private:
  sqlite3_stmt* stmt_;
  int index_{0};
};

auto sql_limit(std::size_t limit) -> std::int64_t {
  return limit == 0 ? -1 : static_cast<std::int64_t>(limit);
}

// The cursor is the last key the query returned, including rows that were
// dropped while reading, so a filled page always continues.
auto make_page(SqliteTaskStore::Rows rows, std::size_t limit) -> RowPage {
  RowPage page;
  if (limit != 0 && rows.scanned == limit) {
    page.next = std::move(rows.last_key);
  }
  page.rows = std::move(rows.rows);
  return page;
}

constexpr auto kSelectColumns =
    "SELECT trigger_at, tag, unique_id, task_state, document FROM tasks";

}  // namespace

auto SqliteTaskStore::DbDeleter::operator()(sqlite3* db) const -> void {
  if (db)
    sqlite3_close(db);
}

SqliteTaskStore::Statement::~Statement() {
  reset();
}

auto SqliteTaskStore::Statement::reset() -> void {
  if (stmt_) {
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
  }
}

SqliteTaskStore::SqliteTaskStore(std::string_view db_path) : db_path_(db_path) {
}

SqliteTaskStore::~SqliteTaskStore() {
  close();
}

auto SqliteTaskStore::prepare(const char* sql) -> Result<sqlite3_stmt*> {
  if (!db_) {
    return fail(Error::DatabaseError);
  }
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_.get(), sql, -1, &stmt, nullptr) != SQLITE_OK) {
    log::error("Failed to prepare statement: {}", sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return stmt;
}

auto SqliteTaskStore::open() -> Result<void> {
  std::lock_guard lock(mu_);
  if (db_) {
    return ok();
  }

  sqlite3* raw_db = nullptr;
  int rc = sqlite3_open(db_path_.c_str(), &raw_db);
  if (rc != SQLITE_OK) {
    log::error("Failed to open database {}: {}", db_path_,
               raw_db ? sqlite3_errmsg(raw_db) : "out of memory");
    if (raw_db) {
      sqlite3_close(raw_db);
    }
    return fail(Error::DatabaseOpenFailed);
  }
  db_.reset(raw_db);
  sqlite3_busy_timeout(db_.get(), 5000);

  // PRAGMA statements may fail on some filesystems; keep going.
  if (auto r = execute("PRAGMA journal_mode=WAL;"); !r) {
    log::warn("Failed to set WAL mode: {}", r.error().message());
  }
  if (auto r = execute("PRAGMA synchronous=NORMAL;"); !r) {
    log::warn("Failed to set synchronous mode: {}", r.error().message());
  }

  if (auto r = create_tables(); !r) {
    db_.reset();
    return r;
  }

  log::info("Database opened: {}", db_path_);
  return ok();
}

auto SqliteTaskStore::close() -> void {
  std::lock_guard lock(mu_);
  db_.reset();
}

auto SqliteTaskStore::create_tables() -> Result<void> {
  const char* sql = R"(
    CREATE TABLE IF NOT EXISTS tasks (
      trigger_at INTEGER NOT NULL,
      tag TEXT NOT NULL,
      unique_id TEXT NOT NULL,
      task_state TEXT NOT NULL DEFAULT 'pending',
      document TEXT NOT NULL,
      PRIMARY KEY (trigger_at, tag, unique_id)
    ) WITHOUT ROWID;

    CREATE INDEX IF NOT EXISTS idx_tasks_tag
      ON tasks(tag, trigger_at, unique_id);
    CREATE INDEX IF NOT EXISTS idx_tasks_state
      ON tasks(task_state, trigger_at);
  )";

  return execute(sql);
}

auto SqliteTaskStore::execute(std::string_view sql) -> Result<void> {
  char* err_msg = nullptr;
  std::string sql_str{sql};
  int rc = sqlite3_exec(db_.get(), sql_str.c_str(), nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    log::error("SQL error: {}", err_msg ? err_msg : sqlite3_errstr(rc));
    sqlite3_free(err_msg);
    return fail(Error::DatabaseQueryFailed);
  }
  return ok();
}

auto SqliteTaskStore::read_rows(sqlite3_stmt* stmt) -> Result<Rows> {
  Rows rows;
  int rc = SQLITE_OK;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    TaskRow row;
    row.key.trigger_at = sqlite3_column_int64(stmt, 0);
    row.key.tag = col_text(stmt, 1);
    row.key.unique_id = col_text(stmt, 2);
    ++rows.scanned;
    rows.last_key = row.key;

    auto state_name = col_text(stmt, 3);
    auto state = parse_task_state(state_name);
    if (!state) {
      log::warn("Skipping task {} with unknown state '{}'", row.key,
                state_name);
      continue;
    }
    row.state = *state;
    row.document = col_text(stmt, 4);
    rows.rows.push_back(std::move(row));
  }
  if (rc != SQLITE_DONE) {
    log::error("Failed to read tasks: {}", sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return rows;
}

auto SqliteTaskStore::get(const TaskKey& key) -> Result<TaskRow> {
  std::lock_guard lock(mu_);
  auto sql = std::format(
      "{} WHERE trigger_at = ? AND tag = ? AND unique_id = ?;", kSelectColumns);

  auto result = prepare(sql.c_str());
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  Binder(stmt.get()).bind(key.trigger_at).bind(key.tag).bind(key.unique_id);

  auto rows = read_rows(stmt.get());
  if (!rows)
    return std::unexpected(rows.error());
  if (rows->rows.empty())
    return fail(Error::NotFound);
  return std::move(rows->rows.front());
}

auto SqliteTaskStore::put(const TaskRow& row) -> Result<void> {
  std::lock_guard lock(mu_);
  constexpr auto sql = R"(
    INSERT INTO tasks (trigger_at, tag, unique_id, task_state, document)
    VALUES (?, ?, ?, ?, ?)
    ON CONFLICT(trigger_at, tag, unique_id) DO UPDATE SET
      task_state = excluded.task_state,
      document = excluded.document;
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  Binder(stmt.get())
      .bind(row.key.trigger_at)
      .bind(row.key.tag)
      .bind(row.key.unique_id)
      .bind(task_state_name(row.state))
      .bind(row.document);

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    log::error("Failed to save task {}: {}", row.key,
               sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return ok();
}

auto SqliteTaskStore::put_if_state(const TaskRow& row, TaskState expected)
    -> Result<bool> {
  std::lock_guard lock(mu_);
  constexpr auto sql = R"(
    UPDATE tasks SET task_state = ?, document = ?
    WHERE trigger_at = ? AND tag = ? AND unique_id = ? AND task_state = ?;
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  Binder(stmt.get())
      .bind(task_state_name(row.state))
      .bind(row.document)
      .bind(row.key.trigger_at)
      .bind(row.key.tag)
      .bind(row.key.unique_id)
      .bind(task_state_name(expected));

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    log::error("Failed to update task {}: {}", row.key,
               sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }

  return sqlite3_changes(db_.get()) > 0;
}

auto SqliteTaskStore::query_by_trigger(std::int64_t trigger_at)
    -> Result<std::vector<TaskRow>> {
  std::lock_guard lock(mu_);
  auto sql = std::format("{} WHERE trigger_at = ? ORDER BY tag, unique_id;",
                         kSelectColumns);

  auto result = prepare(sql.c_str());
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  Binder(stmt.get()).bind(trigger_at);
  auto rows = read_rows(stmt.get());
  if (!rows)
    return std::unexpected(rows.error());
  return std::move(rows->rows);
}

auto SqliteTaskStore::query_by_tag(std::string_view tag, const TagRange& range,
                                   const std::optional<TaskKey>& start_after,
                                   std::size_t limit) -> Result<RowPage> {
  std::lock_guard lock(mu_);
  std::string sql = std::format("{} WHERE tag = ?", kSelectColumns);
  if (range.exact_trigger)
    sql += " AND trigger_at = ?";
  if (range.min_trigger)
    sql += " AND trigger_at >= ?";
  if (start_after)
    sql += " AND (trigger_at, unique_id) > (?, ?)";
  sql += " ORDER BY trigger_at, unique_id LIMIT ?;";

  auto result = prepare(sql.c_str());
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  Binder binder(stmt.get());
  binder.bind(tag);
  if (range.exact_trigger)
    binder.bind(*range.exact_trigger);
  if (range.min_trigger)
    binder.bind(*range.min_trigger);
  if (start_after)
    binder.bind(start_after->trigger_at).bind(start_after->unique_id);
  binder.bind(sql_limit(limit));

  auto rows = read_rows(stmt.get());
  if (!rows)
    return std::unexpected(rows.error());
  return make_page(std::move(*rows), limit);
}

auto SqliteTaskStore::scan(const ScanFilter& filter,
                           const std::optional<TaskKey>& start_after,
                           std::size_t limit) -> Result<RowPage> {
  std::lock_guard lock(mu_);
  std::string sql = std::format("{} WHERE 1 = 1", kSelectColumns);
  if (filter.max_trigger)
    sql += " AND trigger_at <= ?";
  if (filter.after_trigger)
    sql += " AND trigger_at > ?";
  if (filter.state)
    sql += " AND task_state = ?";
  if (start_after)
    sql += " AND (trigger_at, tag, unique_id) > (?, ?, ?)";
  sql += " ORDER BY trigger_at, tag, unique_id LIMIT ?;";

  auto result = prepare(sql.c_str());
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  Binder binder(stmt.get());
  if (filter.max_trigger)
    binder.bind(*filter.max_trigger);
  if (filter.after_trigger)
    binder.bind(*filter.after_trigger);
  if (filter.state)
    binder.bind(task_state_name(*filter.state));
  if (start_after)
    binder.bind(start_after->trigger_at)
        .bind(start_after->tag)
        .bind(start_after->unique_id);
  binder.bind(sql_limit(limit));

  auto rows = read_rows(stmt.get());
  if (!rows)
    return std::unexpected(rows.error());
  return make_page(std::move(*rows), limit);
}

}  // namespace tickback
