#include "tickback/client/http/http_types.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <ranges>
#include <utility>

namespace tickback::http {

namespace {

constexpr std::array<std::string_view, 4> kMethodNames = {
    "GET", "POST", "PUT", "DELETE",
};

auto iequals(std::string_view a, std::string_view b) -> bool {
  return std::ranges::equal(a, b, [](char x, char y) {
    return std::tolower(static_cast<unsigned char>(x)) ==
           std::tolower(static_cast<unsigned char>(y));
  });
}

// Header names are case-insensitive; exact match first, then a linear scan.
auto find_header(const HttpHeaders& headers, std::string_view key)
    -> std::optional<std::string> {
  if (auto it = headers.find(key); it != headers.end()) {
    return it->second;
  }
  for (const auto& [name, value] : headers) {
    if (iequals(name, key)) {
      return value;
    }
  }
  return std::nullopt;
}

}  // namespace

auto method_name(HttpMethod method) noexcept -> std::string_view {
  auto idx = std::to_underlying(method);
  return idx < kMethodNames.size() ? kMethodNames[idx] : "UNKNOWN";
}

auto parse_method(std::string_view name) noexcept -> std::optional<HttpMethod> {
  auto it = std::ranges::find(kMethodNames, name);
  if (it == kMethodNames.end()) {
    return std::nullopt;
  }
  return static_cast<HttpMethod>(
      std::ranges::distance(kMethodNames.begin(), it));
}

auto HttpRequest::header(std::string_view key) const
    -> std::optional<std::string> {
  return find_header(headers, key);
}

auto HttpResponse::header(std::string_view key) const
    -> std::optional<std::string> {
  return find_header(headers, key);
}

}  // namespace tickback::http
