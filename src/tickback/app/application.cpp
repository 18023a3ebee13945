#include "tickback/app/application.hpp"

#include "tickback/app/api/api_server.hpp"
#include "tickback/app/scheduling_service.hpp"
#include "tickback/executor/callback_executor.hpp"
#include "tickback/executor/worker_pool.hpp"
#include "tickback/scheduler/catchup_scanner.hpp"
#include "tickback/scheduler/tick_scheduler.hpp"
#include "tickback/storage/memory_task_store.hpp"
#include "tickback/storage/sqlite_task_store.hpp"
#include "tickback/util/log.hpp"

namespace tickback {

namespace {

auto make_client_config(const HttpClientSettings& s) -> http::HttpClientConfig {
  http::HttpClientConfig cfg;
  cfg.connect_timeout = std::chrono::milliseconds(s.connect_timeout_ms);
  cfg.request_timeout = std::chrono::milliseconds(s.request_timeout_ms);
  cfg.max_response_size = s.max_response_bytes;
  return cfg;
}

auto make_pool_config(const SchedulerConfig& s) -> WorkerPoolConfig {
  WorkerPoolConfig cfg;
  cfg.workers = static_cast<std::size_t>(s.workers);
  cfg.queue_capacity = static_cast<std::size_t>(s.queue_capacity);
  cfg.saturation = s.saturation;
  cfg.submit_timeout = std::chrono::milliseconds(s.submit_timeout_ms);
  return cfg;
}

}  // namespace

Application::Application(SystemConfig config, Clock clock)
    : Application(config, std::move(clock),
                  std::make_unique<http::HttpClient>(
                      make_client_config(config.http_client)),
                  http::default_sleeper()) {
}

Application::Application(SystemConfig config, Clock clock,
                         std::unique_ptr<http::IHttpTransport> transport,
                         http::Sleeper sleeper)
    : config_(std::move(config)), clock_(std::move(clock)),
      transport_(std::move(transport)), sleeper_(std::move(sleeper)) {
}

Application::~Application() {
  stop();
}

auto Application::open_store() -> Result<void> {
  if (config_.storage.backend == StorageBackend::Memory) {
    log::warn("Using in-memory storage; tasks are lost on exit");
    store_ = std::make_unique<MemoryTaskStore>();
    return ok();
  }

  auto sqlite = std::make_unique<SqliteTaskStore>(config_.storage.db_file);
  if (auto r = sqlite->open(); !r) {
    return r;
  }
  sqlite_ = sqlite.get();
  store_ = std::move(sqlite);
  return ok();
}

auto Application::init() -> Result<void> {
  if (initialized_) {
    return ok();
  }
  if (auto r = open_store(); !r) {
    log::error("Failed to open storage: {}", r.error().message());
    return r;
  }

  pool_ = std::make_unique<WorkerPool>(make_pool_config(config_.scheduler));
  executor_ = std::make_unique<CallbackExecutor>(*store_, *transport_, clock_,
                                                 sleeper_);
  auto dispatch = make_pool_dispatcher(*pool_, *executor_);

  scheduling_ = std::make_unique<SchedulingService>(
      *store_, clock_, config_.storage.page_size);
  scheduler_ = std::make_unique<TickScheduler>(
      *store_, dispatch, clock_,
      std::chrono::seconds(config_.scheduler.tick_interval_sec));
  catchup_ = std::make_unique<CatchupScanner>(*store_, dispatch, clock_,
                                              config_.storage.page_size);

  if (config_.server.enabled) {
    api_ = std::make_unique<ApiServer>(*this, config_.server.port,
                                       config_.server.host,
                                       config_.server.threads);
  }

  initialized_ = true;
  return ok();
}

auto Application::start() -> Result<void> {
  if (auto r = init(); !r) {
    return r;
  }
  if (running_.exchange(true)) {
    return ok();
  }

  if (sqlite_ && !sqlite_->is_open()) {
    if (auto r = sqlite_->open(); !r) {
      running_.store(false);
      return r;
    }
  }

  pool_->start();
  if (config_.scheduler.catchup_on_startup) {
    catchup_->run_async();
  }
  scheduler_->start();
  if (api_) {
    api_->start();
  }

  log::info("tickback started ({} storage)",
            storage_backend_name(config_.storage.backend));
  return ok();
}

auto Application::stop() -> void {
  if (!running_.exchange(false)) {
    return;
  }

  log::info("Stopping tickback...");

  if (api_) {
    api_->stop();
  }
  scheduler_->stop();
  catchup_->join();
  pool_->stop();

  if (sqlite_) {
    sqlite_->close();
  }

  log::info("tickback stopped");
}

auto Application::is_running() const noexcept -> bool {
  return running_.load();
}

auto Application::wait_idle(std::chrono::milliseconds timeout) -> bool {
  return pool_ ? pool_->wait_idle(timeout) : true;
}

auto Application::config() const noexcept -> const SystemConfig& {
  return config_;
}

auto Application::store() -> ITaskStore& {
  return *store_;
}

auto Application::scheduling() -> SchedulingService& {
  return *scheduling_;
}

auto Application::scheduler() -> TickScheduler& {
  return *scheduler_;
}

auto Application::catchup() -> CatchupScanner& {
  return *catchup_;
}

auto Application::pool() -> WorkerPool& {
  return *pool_;
}

auto Application::api_server() -> ApiServer* {
  return api_.get();
}

}  // namespace tickback
