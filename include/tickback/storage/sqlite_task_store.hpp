#pragma once

#include "tickback/core/error.hpp"
#include "tickback/storage/task_store.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace tickback {

class SqliteTaskStore : public ITaskStore {
public:
  explicit SqliteTaskStore(std::string_view db_path);
  ~SqliteTaskStore() override;

  SqliteTaskStore(const SqliteTaskStore&) = delete;
  SqliteTaskStore& operator=(const SqliteTaskStore&) = delete;

  [[nodiscard]] auto open() -> Result<void>;
  auto close() -> void;
  [[nodiscard]] auto is_open() const noexcept -> bool {
    return db_ != nullptr;
  }

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

  struct Rows {
    std::vector<TaskRow> rows;
    std::size_t scanned{0};
    std::optional<TaskKey> last_key;
  };

private:
  [[nodiscard]] auto create_tables() -> Result<void>;
  [[nodiscard]] auto execute(std::string_view sql) -> Result<void>;
  [[nodiscard]] auto prepare(const char* sql) -> Result<sqlite3_stmt*>;
  [[nodiscard]] auto read_rows(sqlite3_stmt* stmt) -> Result<Rows>;

  struct DbDeleter {
    void operator()(sqlite3* db) const;
  };

  class Statement {
  public:
    explicit Statement(sqlite3_stmt* stmt = nullptr) noexcept : stmt_(stmt) {
    }
    ~Statement();
    Statement(Statement&& other) noexcept
        : stmt_(std::exchange(other.stmt_, nullptr)) {
    }
    Statement& operator=(Statement&& other) noexcept {
      if (this != &other) {
        reset();
        stmt_ = std::exchange(other.stmt_, nullptr);
      }
      return *this;
    }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    [[nodiscard]] auto get() const noexcept -> sqlite3_stmt* {
      return stmt_;
    }
    auto reset() -> void;

  private:
    sqlite3_stmt* stmt_ = nullptr;
  };

  std::string db_path_;
  std::unique_ptr<sqlite3, DbDeleter> db_{nullptr};
  std::mutex mu_;
};

}  // namespace tickback
