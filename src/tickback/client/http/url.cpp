#include "tickback/client/http/url.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>

namespace tickback::http {

namespace {

auto is_forbidden(char c) -> bool {
  auto uc = static_cast<unsigned char>(c);
  return uc <= 0x20 || uc == 0x7F;
}

auto to_lower(std::string_view s) -> std::string {
  std::string out(s);
  std::ranges::transform(out, out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

auto is_host_char(char c) -> bool {
  auto uc = static_cast<unsigned char>(c);
  return std::isalnum(uc) || c == '-' || c == '.' || c == '_' || c == '~' ||
         c == '%';
}

}  // namespace

auto Url::authority() const -> std::string {
  auto h = host.find(':') != std::string::npos ? std::format("[{}]", host)
                                               : host;
  if (default_port()) {
    return h;
  }
  return std::format("{}:{}", h, port);
}

auto Url::parse(std::string_view text) -> Result<Url> {
  if (text.empty() || std::ranges::any_of(text, is_forbidden)) {
    return fail(Error::InvalidCallbackURL);
  }

  auto scheme_end = text.find("://");
  if (scheme_end == std::string_view::npos || scheme_end == 0) {
    return fail(Error::InvalidCallbackURL);
  }

  Url url;
  url.scheme = to_lower(text.substr(0, scheme_end));
  if (url.scheme != "http" && url.scheme != "https") {
    return fail(Error::InvalidCallbackURL);
  }

  auto rest = text.substr(scheme_end + 3);
  auto authority_end = rest.find_first_of("/?#");
  auto authority = rest.substr(0, authority_end);
  auto target = authority_end == std::string_view::npos
                    ? std::string_view{}
                    : rest.substr(authority_end);

  if (auto at = authority.rfind('@'); at != std::string_view::npos) {
    authority.remove_prefix(at + 1);
  }

  std::string_view host;
  std::string_view port;
  if (authority.starts_with('[')) {
    auto close = authority.find(']');
    if (close == std::string_view::npos) {
      return fail(Error::InvalidCallbackURL);
    }
    host = authority.substr(1, close - 1);
    auto after = authority.substr(close + 1);
    if (!after.empty()) {
      if (after.front() != ':') {
        return fail(Error::InvalidCallbackURL);
      }
      port = after.substr(1);
    }
    if (host.empty() || !std::ranges::all_of(host, [](char c) {
          return std::isxdigit(static_cast<unsigned char>(c)) || c == ':' ||
                 c == '.';
        })) {
      return fail(Error::InvalidCallbackURL);
    }
  } else {
    auto colon = authority.rfind(':');
    host = authority.substr(0, colon);
    if (colon != std::string_view::npos) {
      port = authority.substr(colon + 1);
    }
    if (host.empty() || !std::ranges::all_of(host, is_host_char)) {
      return fail(Error::InvalidCallbackURL);
    }
  }
  url.host = to_lower(host);

  url.port = url.is_tls() ? 443 : 80;
  if (!port.empty()) {
    unsigned value = 0;
    auto [ptr, ec] =
        std::from_chars(port.data(), port.data() + port.size(), value);
    if (ec != std::errc{} || ptr != port.data() + port.size() || value == 0 ||
        value > 65535) {
      return fail(Error::InvalidCallbackURL);
    }
    url.port = static_cast<std::uint16_t>(value);
  }

  if (auto hash = target.find('#'); hash != std::string_view::npos) {
    target = target.substr(0, hash);
  }
  if (target.empty()) {
    url.target = "/";
  } else if (target.front() == '?') {
    url.target = std::format("/{}", target);
  } else {
    url.target = std::string(target);
  }

  return url;
}

}  // namespace tickback::http
