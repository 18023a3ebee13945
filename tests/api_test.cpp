#include "tickback/app/api/api_server.hpp"
#include "tickback/app/application.hpp"
#include "tickback/storage/task_store.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <memory>

using namespace tickback;
using json = nlohmann::json;
using tickback::test::kBaseTime;
using tickback::test::ManualClock;
using tickback::test::RecordingSleeper;
using tickback::test::ScriptedTransport;

namespace {

// Percent-encodes the characters a query value cannot carry verbatim.
auto encode_query(std::string_view value) -> std::string {
  std::string out;
  for (char c : value) {
    switch (c) {
      case '+': out += "%2B"; break;
      case '@': out += "%40"; break;
      case '&': out += "%26"; break;
      default: out += c;
    }
  }
  return out;
}

}  // namespace

class ApiServerTest : public ::testing::Test {
protected:
  void SetUp() override {
    port_ = tickback::test::find_free_port();
    ASSERT_NE(port_, 0);

    SystemConfig config;
    config.server.host = "127.0.0.1";
    config.server.port = port_;
    config.server.threads = 2;
    config.storage.backend = StorageBackend::Memory;
    config.storage.page_size = 2;
    config.scheduler.tick_interval_sec = 3600;
    config.scheduler.workers = 2;
    config.scheduler.catchup_on_startup = false;

    auto transport = std::make_unique<ScriptedTransport>();
    transport_ = transport.get();
    app_ = std::make_unique<Application>(config, clock_.clock(),
                                         std::move(transport),
                                         sleeper_.sleeper());
    ASSERT_TRUE(app_->start().has_value());
  }

  void TearDown() override {
    if (app_) {
      app_->stop();
    }
  }

  auto request(http::HttpMethod method, std::string_view target,
               std::string body = {}) -> http::HttpResponse {
    http::HttpRequest req;
    req.method = method;
    req.url = "http://127.0.0.1:" + std::to_string(port_) + std::string(target);
    req.body = std::move(body);
    if (!req.body.empty()) {
      req.headers["Content-Type"] = "application/json";
    }
    auto resp = client_.send(req);
    EXPECT_TRUE(resp.has_value()) << target;
    return resp.value_or(http::HttpResponse{});
  }

  auto get(std::string_view target) -> http::HttpResponse {
    return request(http::HttpMethod::GET, target);
  }

  auto create(std::string_view trigger_at, std::string_view tag = "billing")
      -> std::string {
    json body = {{"trigger_at", std::string(trigger_at)},
                 {"tag", std::string(tag)},
                 {"callback", "http://127.0.0.1:9/hook"}};
    auto resp = request(http::HttpMethod::PUT, "/task/", body.dump());
    EXPECT_EQ(resp.status, 200) << resp.body;
    return json::parse(resp.body).value("task_id", "");
  }

  auto body_of(const http::HttpResponse& resp) -> json {
    return json::parse(resp.body);
  }

  ManualClock clock_{kBaseTime + 10};
  RecordingSleeper sleeper_;
  ScriptedTransport* transport_{nullptr};
  std::unique_ptr<Application> app_;
  std::uint16_t port_{0};
  http::HttpClient client_;
};

TEST_F(ApiServerTest, Health) {
  auto resp = get("/health");

  EXPECT_EQ(resp.status, 200);
  EXPECT_EQ(body_of(resp)["status"], "ok");
  EXPECT_EQ(resp.header("Content-Type"), "application/json");
}

TEST_F(ApiServerTest, ServerReportsPort) {
  ASSERT_NE(app_->api_server(), nullptr);
  EXPECT_TRUE(app_->api_server()->is_running());
  EXPECT_EQ(app_->api_server()->port(), port_);
}

TEST_F(ApiServerTest, CreateThenStatus) {
  auto id = create("+1m");
  ASSERT_FALSE(id.empty());

  auto resp = get("/status/" + id);

  ASSERT_EQ(resp.status, 200) << resp.body;
  auto body = body_of(resp);
  ASSERT_EQ(body["tasks"].size(), 1u);
  EXPECT_EQ(body["tasks"][0]["task_id"], id);
  EXPECT_EQ(body["tasks"][0]["task_state"], "pending");
  EXPECT_EQ(body["tasks"][0]["trigger_at"], kBaseTime + 60);
  EXPECT_TRUE(body["next"].is_null());
}

TEST_F(ApiServerTest, CreateValidationErrors) {
  auto bad_tag = request(http::HttpMethod::PUT, "/task/",
                         R"({"trigger_at":"+1m","tag":"a-b","callback":"http://h/"})");
  EXPECT_EQ(bad_tag.status, 400);
  EXPECT_EQ(body_of(bad_tag)["error"], make_error_code(Error::InvalidTag).message());

  auto missing = request(http::HttpMethod::PUT, "/task/", R"({"tag":"a"})");
  EXPECT_EQ(missing.status, 400);

  auto malformed = request(http::HttpMethod::PUT, "/task/", "{not json");
  EXPECT_EQ(malformed.status, 400);

  auto bad_time = request(http::HttpMethod::PUT, "/task/",
                          R"({"trigger_at":"soon","tag":"a","callback":"http://h/"})");
  EXPECT_EQ(bad_time.status, 400);
}

TEST_F(ApiServerTest, StatusErrors) {
  auto missing = get("/status/billing+abc@" + std::to_string(kBaseTime + 60));
  EXPECT_EQ(missing.status, 404);
  EXPECT_TRUE(body_of(missing).contains("error"));

  auto bad_ref = get("/status/bad-tag");
  EXPECT_EQ(bad_ref.status, 400);

  auto bad_cursor = get("/status/billing?start_from=nope");
  EXPECT_EQ(bad_cursor.status, 400);
}

TEST_F(ApiServerTest, StatusPagination) {
  for (int i = 1; i <= 3; ++i) {
    create("+" + std::to_string(i) + "m");
  }
  create("+1m", "other");

  auto first = get("/status/billing");
  ASSERT_EQ(first.status, 200);
  auto page1 = body_of(first);
  ASSERT_EQ(page1["tasks"].size(), 2u);
  ASSERT_TRUE(page1["next"].is_string());

  auto second = get("/status/billing?start_from=" +
                    encode_query(page1["next"].get<std::string>()));
  ASSERT_EQ(second.status, 200) << second.body;
  auto page2 = body_of(second);
  ASSERT_EQ(page2["tasks"].size(), 1u);
  EXPECT_TRUE(page2["next"].is_null());
  EXPECT_EQ(page2["tasks"][0]["trigger_at"], kBaseTime + 180);

  auto everything = get("/status/");
  ASSERT_EQ(everything.status, 200);
  EXPECT_EQ(body_of(everything)["tasks"].size(), 2u);
}

TEST_F(ApiServerTest, StatusFutureOnly) {
  create("+1m");
  create("+5m");
  clock_.set(kBaseTime + 3 * 60);

  auto resp = get("/status/billing?future_only");

  ASSERT_EQ(resp.status, 200);
  auto body = body_of(resp);
  ASSERT_EQ(body["tasks"].size(), 1u);
  EXPECT_EQ(body["tasks"][0]["trigger_at"], kBaseTime + 300);
}

TEST_F(ApiServerTest, RescheduleFailedTasks) {
  auto id = create("+1m");
  auto key = parse_task_key(id).value();
  auto row = app_->store().get(key).value();
  row.state = TaskState::Failed;
  ASSERT_TRUE(app_->store().put(row).has_value());
  create("+2m");

  auto target = std::to_string(kBaseTime + 600);
  auto resp = request(http::HttpMethod::POST,
                      "/reschedule/billing?trigger_at=" + target);

  ASSERT_EQ(resp.status, 200) << resp.body;
  auto body = body_of(resp);
  ASSERT_EQ(body["tasks"].size(), 1u);
  EXPECT_EQ(body["tasks"][0]["unique_id"], key.unique_id);
  EXPECT_EQ(body["tasks"][0]["trigger_at"], kBaseTime + 600);

  auto all = request(http::HttpMethod::POST,
                     "/reschedule/billing?all&trigger_at=" + target);
  ASSERT_EQ(all.status, 200);
  EXPECT_EQ(body_of(all)["tasks"].size(), 3u);
}

TEST_F(ApiServerTest, RescheduleErrors) {
  auto bad_time = request(http::HttpMethod::POST,
                          "/reschedule/billing?trigger_at=later");
  EXPECT_EQ(bad_time.status, 400);

  auto missing = request(
      http::HttpMethod::POST,
      "/reschedule/billing+abc@" + std::to_string(kBaseTime + 60));
  EXPECT_EQ(missing.status, 404);
}

TEST_F(ApiServerTest, CatchupDispatchesOverdueTasks) {
  auto id = create("+1m");
  clock_.set(kBaseTime + 2 * 60);

  auto resp = request(http::HttpMethod::POST, "/catchup");

  ASSERT_EQ(resp.status, 200) << resp.body;
  auto body = body_of(resp);
  EXPECT_EQ(body["dispatched"], 1);
  EXPECT_EQ(body["up_to"], kBaseTime + 120);

  ASSERT_TRUE(app_->wait_idle(std::chrono::seconds(5)));
  EXPECT_EQ(transport_->calls(), 1u);
  auto row = app_->store().get(parse_task_key(id).value());
  ASSERT_TRUE(row.has_value());
  EXPECT_EQ(row->state, TaskState::Successful);
}

TEST_F(ApiServerTest, PrettyOutput) {
  auto compact = get("/health");
  auto pretty = get("/health?pretty");

  EXPECT_EQ(compact.body.find('\n'), std::string::npos);
  EXPECT_NE(pretty.body.find("\n    \"status\""), std::string::npos);
}

TEST_F(ApiServerTest, WrongMethodIsRejected) {
  auto resp = request(http::HttpMethod::GET, "/task/");

  EXPECT_EQ(resp.status, 405);
}
