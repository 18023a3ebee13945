#pragma once

#include "tickback/core/error.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace tickback::http {

// Absolute http/https URL split into the parts a client needs to connect and
// build a request line.
struct Url {
  std::string scheme;
  std::string host;
  std::uint16_t port{0};
  std::string target{"/"};

  [[nodiscard]] auto is_tls() const noexcept -> bool {
    return scheme == "https";
  }
  [[nodiscard]] auto default_port() const noexcept -> bool {
    return port == (is_tls() ? 443 : 80);
  }
  // Value for the Host header (port omitted when it is the scheme default).
  [[nodiscard]] auto authority() const -> std::string;

  [[nodiscard]] static auto parse(std::string_view text) -> Result<Url>;
};

}  // namespace tickback::http
