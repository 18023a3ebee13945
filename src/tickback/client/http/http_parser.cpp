#include "tickback/client/http/http_parser.hpp"

#include "tickback/util/log.hpp"

#include <llhttp.h>

#include <utility>

namespace tickback::http {

struct HttpResponseParser::Impl {
  llhttp_t parser;
  llhttp_settings_t settings;
  std::size_t max_body_size;
  HttpResponse current_response;
  bool response_complete = false;
  bool body_too_large = false;
  std::string current_header_field;
  std::string current_header_value;
  bool in_header_field = false;

  explicit Impl(std::size_t max_body) : max_body_size(max_body) {
  }

  auto flush_header() -> void {
    if (!current_header_field.empty()) {
      current_response.headers[current_header_field] = current_header_value;
      current_header_field.clear();
      current_header_value.clear();
    }
  }

  static auto on_header_field(llhttp_t *parser, const char *at, size_t length)
      -> int {
    auto *impl = static_cast<Impl *>(parser->data);
    if (!impl->in_header_field) {
      impl->flush_header();
    }
    impl->current_header_field.append(at, length);
    impl->in_header_field = true;
    return 0;
  }

  static auto on_header_value(llhttp_t *parser, const char *at, size_t length)
      -> int {
    auto *impl = static_cast<Impl *>(parser->data);
    impl->current_header_value.append(at, length);
    impl->in_header_field = false;
    return 0;
  }

  static auto on_headers_complete(llhttp_t *parser) -> int {
    auto *impl = static_cast<Impl *>(parser->data);
    impl->flush_header();
    impl->current_response.status = llhttp_get_status_code(&impl->parser);
    return 0;
  }

  static auto on_body(llhttp_t *parser, const char *at, size_t length) -> int {
    auto *impl = static_cast<Impl *>(parser->data);
    if (impl->current_response.body.size() + length > impl->max_body_size) {
      impl->body_too_large = true;
      return -1;
    }
    impl->current_response.body.append(at, length);
    return 0;
  }

  static auto on_message_complete(llhttp_t *parser) -> int {
    auto *impl = static_cast<Impl *>(parser->data);
    impl->response_complete = true;
    return HPE_PAUSED;
  }

  auto init() -> void {
    llhttp_init(&parser, HTTP_RESPONSE, &settings);
    parser.data = this;
  }

  auto take() -> std::optional<HttpResponse> {
    if (!response_complete) {
      return std::nullopt;
    }
    response_complete = false;
    return std::exchange(current_response, HttpResponse{});
  }

  auto check(llhttp_errno err) -> Result<std::optional<HttpResponse>> {
    if (err == HPE_OK || err == HPE_PAUSED) {
      return take();
    }
    if (body_too_large) {
      log::warn("HTTP response body exceeds {} bytes", max_body_size);
      return fail(Error::ResponseTooLarge);
    }
    const char *reason = llhttp_get_error_reason(&parser);
    log::warn("HTTP response parse error: {} (reason: {})",
              llhttp_errno_name(err), reason ? reason : "");
    return fail(Error::ParseError);
  }
};

HttpResponseParser::HttpResponseParser(std::size_t max_body_size)
    : impl_(std::make_unique<Impl>(max_body_size)) {
  llhttp_settings_init(&impl_->settings);
  impl_->settings.on_header_field = Impl::on_header_field;
  impl_->settings.on_header_value = Impl::on_header_value;
  impl_->settings.on_headers_complete = Impl::on_headers_complete;
  impl_->settings.on_body = Impl::on_body;
  impl_->settings.on_message_complete = Impl::on_message_complete;
  impl_->init();
}

HttpResponseParser::~HttpResponseParser() = default;

auto HttpResponseParser::parse(std::string_view data)
    -> Result<std::optional<HttpResponse>> {
  return impl_->check(llhttp_execute(&impl_->parser, data.data(), data.size()));
}

auto HttpResponseParser::finish() -> Result<std::optional<HttpResponse>> {
  auto err = llhttp_finish(&impl_->parser);
  if (err == HPE_INVALID_EOF_STATE) {
    log::warn("HTTP response truncated before completion");
    return fail(Error::TransportError);
  }
  auto result = impl_->check(err);
  if (result && !*result) {
    log::warn("HTTP response truncated before completion");
    return fail(Error::TransportError);
  }
  return result;
}

auto HttpResponseParser::reset() -> void {
  impl_->current_response = HttpResponse{};
  impl_->response_complete = false;
  impl_->body_too_large = false;
  impl_->current_header_field.clear();
  impl_->current_header_value.clear();
  impl_->in_header_field = false;
  impl_->init();
}

}  // namespace tickback::http
