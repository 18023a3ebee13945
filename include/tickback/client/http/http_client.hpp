#pragma once

#include "tickback/client/http/http_types.hpp"
#include "tickback/core/error.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace tickback::http {

// One request, one response. Implementations must be safe to call from
// several worker threads at once.
class IHttpTransport {
public:
  virtual ~IHttpTransport() = default;

  [[nodiscard]] virtual auto send(const HttpRequest& req)
      -> Result<HttpResponse> = 0;
};

struct HttpClientConfig {
  std::chrono::milliseconds connect_timeout{1000};
  std::chrono::milliseconds request_timeout{3000};
  std::size_t max_response_size{1024 * 1024};  // 1MB
  std::string user_agent{"tickback/0.1"};
};

// Blocking HTTP/1.1 client: a fresh connection per request
// (Connection: close), TLS through OpenSSL for https URLs.
class HttpClient : public IHttpTransport {
public:
  explicit HttpClient(HttpClientConfig config = {});
  ~HttpClient() override;

  HttpClient(const HttpClient&) = delete;
  auto operator=(const HttpClient&) -> HttpClient& = delete;

  [[nodiscard]] auto send(const HttpRequest& req)
      -> Result<HttpResponse> override;

  [[nodiscard]] auto config() const noexcept -> const HttpClientConfig&;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace tickback::http
