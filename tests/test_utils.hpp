#pragma once

#include "tickback/client/http/http_client.hpp"
#include "tickback/client/http/retry.hpp"
#include "tickback/storage/task_store.hpp"
#include "tickback/util/time.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstdlib>
#include <deque>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace tickback::test {

template <typename T>
class BlockingQueue {
public:
  void push(T value) {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push(std::move(value));
    cv_.notify_one();
  }

  template <typename Rep, typename Period>
  [[nodiscard]] auto try_pop_for(const std::chrono::duration<Rep, Period>& timeout)
      -> std::optional<T> {
    std::unique_lock<std::mutex> lock(mutex_);
    if (cv_.wait_for(lock, timeout, [this] { return !queue_.empty(); })) {
      T value = std::move(queue_.front());
      queue_.pop();
      return value;
    }
    return std::nullopt;
  }

private:
  std::queue<T> queue_;
  std::mutex mutex_;
  std::condition_variable cv_;
};

inline void sleep_ms(std::chrono::milliseconds ms) {
  std::this_thread::sleep_for(ms);
}

// Polls `pred` until it holds or `timeout` passes.
inline auto wait_until(const std::function<bool()>& pred,
                       std::chrono::milliseconds timeout =
                           std::chrono::milliseconds(5000)) -> bool {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!pred()) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return true;
}

// A minute boundary used as "now" throughout the tests.
inline constexpr std::int64_t kBaseTime = 1'700'000'040;

class ManualClock {
public:
  explicit ManualClock(std::int64_t now = kBaseTime) : now_(now) {
  }

  [[nodiscard]] auto now() const -> std::int64_t {
    return now_.load();
  }
  auto set(std::int64_t now) -> void {
    now_.store(now);
  }
  auto advance(std::int64_t seconds) -> void {
    now_.fetch_add(seconds);
  }

  [[nodiscard]] auto clock() -> Clock {
    return [this] { return now_.load(); };
  }

private:
  std::atomic<std::int64_t> now_;
};

// Transport that replays a script of responses and records every request.
// Once the script runs out the fallback response is returned.
class ScriptedTransport : public http::IHttpTransport {
public:
  explicit ScriptedTransport(int fallback_status = 200)
      : fallback_status_(fallback_status) {
  }

  auto push_status(int status, std::string body = {}) -> void {
    http::HttpResponse resp;
    resp.status = status;
    resp.body = std::move(body);
    std::lock_guard lock(mu_);
    script_.emplace_back(std::move(resp));
  }

  auto push_error(Error e) -> void {
    std::lock_guard lock(mu_);
    script_.emplace_back(fail(e));
  }

  // Each send blocks for `delay` before answering.
  auto set_delay(std::chrono::milliseconds delay) -> void {
    delay_ = delay;
  }

  [[nodiscard]] auto send(const http::HttpRequest& req)
      -> Result<http::HttpResponse> override {
    if (delay_.count() > 0) {
      std::this_thread::sleep_for(delay_);
    }
    std::lock_guard lock(mu_);
    requests_.push_back(req);
    if (script_.empty()) {
      http::HttpResponse resp;
      resp.status = fallback_status_;
      return resp;
    }
    auto next = std::move(script_.front());
    script_.pop_front();
    return next;
  }

  [[nodiscard]] auto calls() const -> std::size_t {
    std::lock_guard lock(mu_);
    return requests_.size();
  }

  [[nodiscard]] auto requests() const -> std::vector<http::HttpRequest> {
    std::lock_guard lock(mu_);
    return requests_;
  }

private:
  int fallback_status_;
  std::chrono::milliseconds delay_{0};
  mutable std::mutex mu_;
  std::deque<Result<http::HttpResponse>> script_;
  std::vector<http::HttpRequest> requests_;
};

// Records backoff delays instead of sleeping.
class RecordingSleeper {
public:
  [[nodiscard]] auto sleeper() -> http::Sleeper {
    return [this](std::chrono::milliseconds delay) {
      std::lock_guard lock(mu_);
      delays_.push_back(delay);
    };
  }

  [[nodiscard]] auto delays() const -> std::vector<std::chrono::milliseconds> {
    std::lock_guard lock(mu_);
    return delays_;
  }

private:
  mutable std::mutex mu_;
  std::vector<std::chrono::milliseconds> delays_;
};

// Wraps a store and fails selected operations on demand.
class FailingStore : public ITaskStore {
public:
  explicit FailingStore(ITaskStore& inner) : inner_(inner) {
  }

  std::atomic<bool> fail_get{false};
  std::atomic<bool> fail_put{false};
  std::atomic<bool> fail_put_if_state{false};
  std::atomic<bool> fail_query_by_trigger{false};
  std::atomic<bool> fail_query_by_tag{false};
  std::atomic<bool> fail_scan{false};

  [[nodiscard]] auto get(const TaskKey& key) -> Result<TaskRow> override {
    if (fail_get) return fail(Error::DatabaseQueryFailed);
    return inner_.get(key);
  }
  [[nodiscard]] auto put(const TaskRow& row) -> Result<void> override {
    if (fail_put) return fail(Error::DatabaseQueryFailed);
    return inner_.put(row);
  }
  [[nodiscard]] auto put_if_state(const TaskRow& row, TaskState expected)
      -> Result<bool> override {
    if (fail_put_if_state) return fail(Error::DatabaseQueryFailed);
    return inner_.put_if_state(row, expected);
  }
  [[nodiscard]] auto query_by_trigger(std::int64_t trigger_at)
      -> Result<std::vector<TaskRow>> override {
    if (fail_query_by_trigger) return fail(Error::DatabaseQueryFailed);
    return inner_.query_by_trigger(trigger_at);
  }
  [[nodiscard]] auto query_by_tag(std::string_view tag, const TagRange& range,
                                  const std::optional<TaskKey>& start_after,
                                  std::size_t limit)
      -> Result<RowPage> override {
    if (fail_query_by_tag) return fail(Error::DatabaseQueryFailed);
    return inner_.query_by_tag(tag, range, start_after, limit);
  }
  [[nodiscard]] auto scan(const ScanFilter& filter,
                          const std::optional<TaskKey>& start_after,
                          std::size_t limit) -> Result<RowPage> override {
    if (fail_scan) return fail(Error::DatabaseQueryFailed);
    return inner_.scan(filter, start_after, limit);
  }

private:
  ITaskStore& inner_;
};

// Asks the kernel for an unused loopback port.
inline auto find_free_port() -> std::uint16_t {
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    return 0;
  }
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr.sin_port = 0;
  std::uint16_t port = 0;
  socklen_t len = sizeof(addr);
  if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0 &&
      ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
    port = ntohs(addr.sin_port);
  }
  ::close(fd);
  return port;
}

// Minimal HTTP/1.1 endpoint on 127.0.0.1: answers every request with a fixed
// status and body and closes the connection.
class StubHttpServer {
public:
  StubHttpServer(int status, std::string body)
      : status_(status), body_(std::move(body)) {
  }

  ~StubHttpServer() {
    stop();
  }

  StubHttpServer(const StubHttpServer&) = delete;
  auto operator=(const StubHttpServer&) -> StubHttpServer& = delete;

  [[nodiscard]] auto start() -> bool {
    listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (listen_fd_ < 0) {
      return false;
    }
    int one = 1;
    ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    socklen_t len = sizeof(addr);
    if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) !=
            0 ||
        ::listen(listen_fd_, 16) != 0 ||
        ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len) !=
            0) {
      ::close(listen_fd_);
      listen_fd_ = -1;
      return false;
    }
    port_ = ntohs(addr.sin_port);
    running_ = true;
    thread_ = std::thread([this] { accept_loop(); });
    return true;
  }

  auto stop() -> void {
    if (!running_.exchange(false)) {
      return;
    }
    ::shutdown(listen_fd_, SHUT_RDWR);
    ::close(listen_fd_);
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  [[nodiscard]] auto port() const noexcept -> std::uint16_t {
    return port_;
  }
  [[nodiscard]] auto url(std::string_view path = "/") const -> std::string {
    return "http://127.0.0.1:" + std::to_string(port_) + std::string(path);
  }
  [[nodiscard]] auto requests() const noexcept -> int {
    return requests_.load();
  }
  [[nodiscard]] auto last_request() const -> std::string {
    std::lock_guard lock(mu_);
    return last_request_;
  }

private:
  auto accept_loop() -> void {
    while (running_) {
      int client = ::accept(listen_fd_, nullptr, nullptr);
      if (client < 0) {
        continue;
      }
      handle(client);
      ::close(client);
    }
  }

  auto handle(int fd) -> void {
    std::string request;
    char buf[4096];
    std::size_t body_needed = 0;
    std::size_t header_end = std::string::npos;
    while (true) {
      auto n = ::recv(fd, buf, sizeof(buf), 0);
      if (n <= 0) {
        break;
      }
      request.append(buf, static_cast<std::size_t>(n));
      if (header_end == std::string::npos) {
        header_end = request.find("\r\n\r\n");
        if (header_end != std::string::npos) {
          auto cl = request.find("Content-Length: ");
          if (cl != std::string::npos && cl < header_end) {
            body_needed = std::strtoul(request.c_str() + cl + 16, nullptr, 10);
          }
        }
      }
      if (header_end != std::string::npos &&
          request.size() >= header_end + 4 + body_needed) {
        break;
      }
    }

    {
      std::lock_guard lock(mu_);
      last_request_ = request;
    }
    ++requests_;

    auto response = "HTTP/1.1 " + std::to_string(status_) +
                    " Stub\r\nContent-Length: " + std::to_string(body_.size()) +
                    "\r\nConnection: close\r\n\r\n" + body_;
    std::size_t sent = 0;
    while (sent < response.size()) {
      auto n = ::send(fd, response.data() + sent, response.size() - sent,
                      MSG_NOSIGNAL);
      if (n <= 0) {
        break;
      }
      sent += static_cast<std::size_t>(n);
    }
  }

  int status_;
  std::string body_;
  int listen_fd_{-1};
  std::uint16_t port_{0};
  std::atomic<bool> running_{false};
  std::atomic<int> requests_{0};
  mutable std::mutex mu_;
  std::string last_request_;
  std::thread thread_;
};

// Unique path for a throwaway SQLite file.
inline auto temp_db_path() -> std::string {
  std::string pattern = "/tmp/tickback_test_XXXXXX";
  int fd = ::mkstemp(pattern.data());
  if (fd >= 0) {
    ::close(fd);
    std::filesystem::remove(pattern);
  }
  return pattern + ".db";
}

}  // namespace tickback::test
