#pragma once

#include "tickback/client/http/http_types.hpp"
#include "tickback/core/error.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string_view>

namespace tickback::http {

// Incremental HTTP/1.x response parser. Feed bytes as they arrive; a value is
// returned once the message is complete.
class HttpResponseParser {
public:
  explicit HttpResponseParser(std::size_t max_body_size);
  ~HttpResponseParser();

  HttpResponseParser(const HttpResponseParser&) = delete;
  auto operator=(const HttpResponseParser&) -> HttpResponseParser& = delete;

  [[nodiscard]] auto parse(std::string_view data)
      -> Result<std::optional<HttpResponse>>;

  // Signals EOF. Completes responses whose body is delimited by connection
  // close.
  [[nodiscard]] auto finish() -> Result<std::optional<HttpResponse>>;

  auto reset() -> void;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace tickback::http
