#include "tickback/app/api/api_server.hpp"

#include "tickback/app/application.hpp"
#include "tickback/app/scheduling_service.hpp"
#include "tickback/scheduler/catchup_scanner.hpp"
#include "tickback/task/task_json.hpp"
#include "tickback/util/log.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <optional>
#include <thread>

#include <crow.h>

namespace tickback {

using json = nlohmann::json;

namespace {

auto wants_pretty(const crow::request& req) -> bool {
  return req.url_params.get("pretty") != nullptr;
}

auto json_response(const crow::request& req, const json& j, int status = 200)
    -> crow::response {
  crow::response resp(status, j.dump(wants_pretty(req) ? 4 : -1, ' ', false,
                                     json::error_handler_t::replace));
  resp.set_header("Content-Type", "application/json");
  return resp;
}

auto status_for(std::error_code ec) -> int {
  if (is_validation_error(ec)) {
    return 400;
  }
  if (ec == Error::NotFound) {
    return 404;
  }
  if (ec == Error::Busy) {
    return 409;
  }
  return 500;
}

auto error_response(const crow::request& req, std::error_code ec)
    -> crow::response {
  return json_response(req, {{"error", ec.message()}}, status_for(ec));
}

auto tasks_to_json(const std::vector<Task>& tasks) -> json {
  json result = json::array();
  for (const auto& task : tasks) {
    result.push_back(task);
  }
  return result;
}

auto optional_param(const crow::request& req, const char* name)
    -> std::optional<std::string_view> {
  const char* value = req.url_params.get(name);
  if (value == nullptr || *value == '\0') {
    return std::nullopt;
  }
  return std::string_view(value);
}

}  // namespace

struct ApiServer::Impl {
  Application& app;
  std::uint16_t port;
  std::string host;
  int threads;

  std::unique_ptr<crow::SimpleApp> crow_app;
  std::thread server_thread;
  std::atomic<bool> running{false};

  Impl(Application& a, std::uint16_t p, const std::string& h, int t)
      : app(a), port(p), host(h), threads(t) {
  }

  auto setup_routes() -> void;
  auto handle_status(const crow::request& req, std::string_view ref_text)
      -> crow::response;
};

ApiServer::ApiServer(Application& app, std::uint16_t port,
                     const std::string& host, int threads)
    : impl_(std::make_unique<Impl>(app, port, host, threads)) {
}

ApiServer::~ApiServer() {
  stop();
}

auto ApiServer::start() -> void {
  if (impl_->running.exchange(true)) {
    return;
  }

  impl_->crow_app = std::make_unique<crow::SimpleApp>();
  impl_->crow_app->loglevel(crow::LogLevel::Warning);
  impl_->setup_routes();

  impl_->crow_app->signal_clear();

  impl_->server_thread = std::thread([this]() {
    log::info("API server starting on {}:{}", impl_->host, impl_->port);
    impl_->crow_app->bindaddr(impl_->host)
        .port(impl_->port)
        .concurrency(static_cast<std::uint16_t>(impl_->threads))
        .run();
  });
  impl_->crow_app->wait_for_server_start();
}

auto ApiServer::stop() -> void {
  if (!impl_->running.exchange(false)) {
    return;
  }

  log::info("Stopping API server...");

  if (impl_->crow_app) {
    impl_->crow_app->stop();
  }

  if (impl_->server_thread.joinable()) {
    impl_->server_thread.join();
  }

  impl_->crow_app.reset();

  log::info("API server stopped");
}

auto ApiServer::is_running() const noexcept -> bool {
  return impl_->running.load();
}

auto ApiServer::port() const noexcept -> std::uint16_t {
  return impl_->port;
}

auto ApiServer::Impl::handle_status(const crow::request& req,
                                    std::string_view ref_text)
    -> crow::response {
  auto ref = parse_task_ref(ref_text);
  if (!ref) {
    return error_response(req, ref.error());
  }

  std::optional<TaskKey> start_from;
  if (auto cursor = optional_param(req, "start_from")) {
    auto key = parse_task_key(*cursor);
    if (!key) {
      return error_response(req, key.error());
    }
    start_from = std::move(*key);
  }
  bool future_only = req.url_params.get("future_only") != nullptr;

  auto page = app.scheduling().status(*ref, start_from, future_only);
  if (!page) {
    return error_response(req, page.error());
  }

  json next = nullptr;
  if (page->next) {
    next = format_task_id(*page->next);
  }
  return json_response(req,
                       {{"tasks", tasks_to_json(page->tasks)}, {"next", next}});
}

auto ApiServer::Impl::setup_routes() -> void {
  CROW_ROUTE((*crow_app), "/health")
  ([](const crow::request& req) {
    return json_response(req, {{"status", "ok"}});
  });

  CROW_ROUTE((*crow_app), "/task/")
      .methods(crow::HTTPMethod::PUT)([this](const crow::request& req) {
        auto create = parse_create_request(req.body);
        if (!create) {
          return error_response(req, create.error());
        }
        auto task = app.scheduling().create(*create);
        if (!task) {
          return error_response(req, task.error());
        }
        return json_response(req, {{"task_id", task->id()}});
      });

  CROW_ROUTE((*crow_app), "/reschedule/<string>")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request& req, const std::string& ref_text) {
            auto ref = parse_task_ref(ref_text);
            if (!ref) {
              return error_response(req, ref.error());
            }
            bool all = req.url_params.get("all") != nullptr;
            auto tasks = app.scheduling().reschedule(
                *ref, optional_param(req, "trigger_at"), all);
            if (!tasks) {
              return error_response(req, tasks.error());
            }
            return json_response(req, {{"tasks", tasks_to_json(*tasks)}});
          });

  CROW_ROUTE((*crow_app), "/status/")
  ([this](const crow::request& req) { return handle_status(req, ""); });

  CROW_ROUTE((*crow_app), "/status/<string>")
  ([this](const crow::request& req, const std::string& ref_text) {
    return handle_status(req, ref_text);
  });

  CROW_ROUTE((*crow_app), "/catchup")
      .methods(crow::HTTPMethod::POST)([this](const crow::request& req) {
        auto report = app.catchup().run();
        if (!report) {
          return error_response(req, report.error());
        }
        return json_response(req, {{"up_to", report->up_to},
                                   {"pages", report->pages},
                                   {"scanned", report->scanned},
                                   {"dispatched", report->dispatched},
                                   {"rejected", report->rejected},
                                   {"undecodable", report->undecodable}});
      });
}

}  // namespace tickback
