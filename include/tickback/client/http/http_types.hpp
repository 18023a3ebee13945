#pragma once

#include "tickback/core/error.hpp"

#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace tickback::http {

enum class HttpMethod : std::uint8_t {
  GET,
  POST,
  PUT,
  DELETE,
};

[[nodiscard]] auto method_name(HttpMethod method) noexcept -> std::string_view;
[[nodiscard]] auto parse_method(std::string_view name) noexcept
    -> std::optional<HttpMethod>;

using HttpHeaders = std::unordered_map<std::string, std::string,
                                       tickback::StringHash,
                                       tickback::StringEqual>;

struct HttpRequest {
  HttpMethod method{HttpMethod::GET};
  std::string url;
  HttpHeaders headers;
  std::string body;

  [[nodiscard]] auto header(std::string_view key) const
      -> std::optional<std::string>;
};

struct HttpResponse {
  int status{0};
  HttpHeaders headers;
  std::string body;

  [[nodiscard]] auto header(std::string_view key) const
      -> std::optional<std::string>;
  [[nodiscard]] auto is_client_error() const noexcept -> bool {
    return status >= 400 && status <= 499;
  }
  [[nodiscard]] auto is_server_error() const noexcept -> bool {
    return status >= 500 && status <= 599;
  }
};

}  // namespace tickback::http

template <>
struct std::formatter<tickback::http::HttpMethod>
    : std::formatter<std::string_view> {
  auto format(tickback::http::HttpMethod method, auto& ctx) const {
    return std::formatter<std::string_view>::format(
        tickback::http::method_name(method), ctx);
  }
};
