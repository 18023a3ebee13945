#pragma once

#include "tickback/client/http/http_client.hpp"
#include "tickback/client/http/retry.hpp"
#include "tickback/config/config.hpp"
#include "tickback/core/error.hpp"
#include "tickback/util/time.hpp"

#include <atomic>
#include <chrono>
#include <memory>

namespace tickback {

class ApiServer;
class CallbackExecutor;
class CatchupScanner;
class ITaskStore;
class SchedulingService;
class SqliteTaskStore;
class TickScheduler;
class WorkerPool;

// Owns the store, worker pool, schedulers and API server and runs them in
// dependency order.
class Application {
public:
  explicit Application(SystemConfig config, Clock clock = system_clock());
  // Test seam: replaces the network client and the backoff sleeper.
  Application(SystemConfig config, Clock clock,
              std::unique_ptr<http::IHttpTransport> transport,
              http::Sleeper sleeper);
  ~Application();

  Application(const Application&) = delete;
  auto operator=(const Application&) -> Application& = delete;

  // Opens the store and builds every service; nothing runs yet.
  [[nodiscard]] auto init() -> Result<void>;

  [[nodiscard]] auto start() -> Result<void>;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;

  // True once queued and running callbacks have all finished.
  [[nodiscard]] auto wait_idle(std::chrono::milliseconds timeout) -> bool;

  [[nodiscard]] auto config() const noexcept -> const SystemConfig&;
  [[nodiscard]] auto store() -> ITaskStore&;
  [[nodiscard]] auto scheduling() -> SchedulingService&;
  [[nodiscard]] auto scheduler() -> TickScheduler&;
  [[nodiscard]] auto catchup() -> CatchupScanner&;
  [[nodiscard]] auto pool() -> WorkerPool&;
  [[nodiscard]] auto api_server() -> ApiServer*;

private:
  [[nodiscard]] auto open_store() -> Result<void>;

  SystemConfig config_;
  Clock clock_;
  std::atomic<bool> running_{false};
  bool initialized_{false};

  std::unique_ptr<ITaskStore> store_;
  SqliteTaskStore* sqlite_{nullptr};

  std::unique_ptr<http::IHttpTransport> transport_;
  http::Sleeper sleeper_;

  std::unique_ptr<WorkerPool> pool_;
  std::unique_ptr<CallbackExecutor> executor_;
  std::unique_ptr<SchedulingService> scheduling_;
  std::unique_ptr<TickScheduler> scheduler_;
  std::unique_ptr<CatchupScanner> catchup_;
  std::unique_ptr<ApiServer> api_;
};

}  // namespace tickback
