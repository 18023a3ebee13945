#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace tickback {

class Application;

class ApiServer {
public:
  ApiServer(Application& app, std::uint16_t port = 6777,
            const std::string& host = "0.0.0.0", int threads = 4);
  ~ApiServer();

  ApiServer(const ApiServer&) = delete;
  auto operator=(const ApiServer&) -> ApiServer& = delete;

  // Returns once the listener is accepting connections.
  auto start() -> void;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;
  [[nodiscard]] auto port() const noexcept -> std::uint16_t;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace tickback
