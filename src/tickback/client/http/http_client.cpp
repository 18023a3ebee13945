#include "tickback/client/http/http_client.hpp"

#include "tickback/client/http/http_parser.hpp"
#include "tickback/client/http/url.hpp"
#include "tickback/core/constants.hpp"
#include "tickback/util/log.hpp"

#include <netdb.h>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <format>
#include <span>
#include <utility>

namespace tickback::http {

namespace {

using SteadyClock = std::chrono::steady_clock;
using Deadline = SteadyClock::time_point;

class Socket {
public:
  explicit Socket(int fd = -1) noexcept : fd_(fd) {
  }
  ~Socket() {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }
  Socket(Socket&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {
  }
  auto operator=(Socket&& other) noexcept -> Socket& {
    if (this != &other) {
      if (fd_ >= 0) {
        ::close(fd_);
      }
      fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
  }
  Socket(const Socket&) = delete;
  auto operator=(const Socket&) -> Socket& = delete;

  [[nodiscard]] auto fd() const noexcept -> int {
    return fd_;
  }

private:
  int fd_;
};

struct SslDeleter {
  void operator()(SSL* ssl) const {
    SSL_free(ssl);
  }
};

struct SslCtxDeleter {
  void operator()(SSL_CTX* ctx) const {
    SSL_CTX_free(ctx);
  }
};

auto ssl_error_text() -> std::string {
  auto code = ERR_get_error();
  if (code == 0) {
    return "unknown";
  }
  std::array<char, 256> buf{};
  ERR_error_string_n(code, buf.data(), buf.size());
  return buf.data();
}

auto wait_fd(int fd, short events, Deadline deadline) -> Result<void> {
  while (true) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - SteadyClock::now());
    if (remaining.count() <= 0) {
      return fail(Error::Timeout);
    }
    pollfd pfd{fd, events, 0};
    int rc = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
    if (rc > 0) {
      return ok();
    }
    if (rc == 0) {
      return fail(Error::Timeout);
    }
    if (errno != EINTR) {
      return fail(Error::TransportError);
    }
  }
}

auto connect_addr(const addrinfo* ai, Deadline deadline) -> Result<Socket> {
  Socket sock(::socket(ai->ai_family,
                       ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC,
                       ai->ai_protocol));
  if (sock.fd() < 0) {
    return fail(Error::ConnectFailed);
  }

  if (::connect(sock.fd(), ai->ai_addr, ai->ai_addrlen) == 0) {
    return sock;
  }
  if (errno != EINPROGRESS) {
    return fail(Error::ConnectFailed);
  }

  if (auto r = wait_fd(sock.fd(), POLLOUT, deadline); !r) {
    return std::unexpected(r.error());
  }

  int so_error = 0;
  socklen_t len = sizeof(so_error);
  if (::getsockopt(sock.fd(), SOL_SOCKET, SO_ERROR, &so_error, &len) != 0 ||
      so_error != 0) {
    return fail(Error::ConnectFailed);
  }
  return sock;
}

auto connect_tcp(const Url& url, std::chrono::milliseconds timeout)
    -> Result<Socket> {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo* result = nullptr;
  auto port_str = std::to_string(url.port);
  int ret = ::getaddrinfo(url.host.c_str(), port_str.c_str(), &hints, &result);
  if (ret != 0 || result == nullptr) {
    log::warn("Failed to resolve {}:{} - {}", url.host, url.port,
              gai_strerror(ret));
    return fail(Error::ConnectFailed);
  }
  auto addr_guard = std::unique_ptr<addrinfo, decltype(&freeaddrinfo)>(
      result, freeaddrinfo);

  auto deadline = SteadyClock::now() + timeout;
  std::error_code last = make_error_code(Error::ConnectFailed);
  for (auto* ai = result; ai != nullptr; ai = ai->ai_next) {
    auto sock = connect_addr(ai, deadline);
    if (sock) {
      return sock;
    }
    last = sock.error();
    if (last == Error::Timeout) {
      break;
    }
  }
  log::warn("Failed to connect to {}:{} - {}", url.host, url.port,
            last.message());
  return fail(last);
}

auto serialize_request(const HttpRequest& req, const Url& url,
                       const HttpClientConfig& config) -> std::string {
  auto out = std::format("{} {} HTTP/1.1\r\n", req.method, url.target);
  if (!req.header("Host")) {
    out += std::format("Host: {}\r\n", url.authority());
  }
  if (!req.header("User-Agent")) {
    out += std::format("User-Agent: {}\r\n", config.user_agent);
  }
  for (const auto& [name, value] : req.headers) {
    out += std::format("{}: {}\r\n", name, value);
  }
  if (!req.body.empty() || req.method == HttpMethod::POST ||
      req.method == HttpMethod::PUT) {
    out += std::format("Content-Length: {}\r\n", req.body.size());
  }
  out += "Connection: close\r\n\r\n";
  out += req.body;
  return out;
}

// A connected socket with an optional TLS session on top. Every operation is
// bounded by the request deadline.
class Connection {
public:
  explicit Connection(Socket sock) noexcept : sock_(std::move(sock)) {
  }

  auto start_tls(SSL_CTX* ctx, const std::string& host, Deadline deadline)
      -> Result<void> {
    ssl_.reset(SSL_new(ctx));
    if (!ssl_ || SSL_set_fd(ssl_.get(), sock_.fd()) != 1) {
      log::warn("TLS setup failed: {}", ssl_error_text());
      return fail(Error::TlsError);
    }
    SSL_set_tlsext_host_name(ssl_.get(), host.c_str());
    if (SSL_set1_host(ssl_.get(), host.c_str()) != 1) {
      log::warn("TLS host verification setup failed for {}", host);
      return fail(Error::TlsError);
    }

    while (true) {
      int rc = SSL_connect(ssl_.get());
      if (rc == 1) {
        return ok();
      }
      if (auto r = wait_ssl(SSL_get_error(ssl_.get(), rc), deadline); !r) {
        if (r.error() == Error::TlsError) {
          log::warn("TLS handshake with {} failed: {}", host,
                    ssl_error_text());
        }
        return r;
      }
    }
  }

  auto write_all(std::string_view data, Deadline deadline) -> Result<void> {
    while (!data.empty()) {
      auto written = write_some(data, deadline);
      if (!written) {
        return std::unexpected(written.error());
      }
      data.remove_prefix(*written);
    }
    return ok();
  }

  // Returns 0 at end of stream.
  auto read_some(std::span<char> buf, Deadline deadline)
      -> Result<std::size_t> {
    while (true) {
      if (ssl_) {
        int n = SSL_read(ssl_.get(), buf.data(), static_cast<int>(buf.size()));
        if (n > 0) {
          return static_cast<std::size_t>(n);
        }
        int err = SSL_get_error(ssl_.get(), n);
        // Peers often close without close_notify.
        if (err == SSL_ERROR_ZERO_RETURN ||
            (err == SSL_ERROR_SYSCALL && ERR_peek_error() == 0)) {
          return std::size_t{0};
        }
        if (auto r = wait_ssl(err, deadline); !r) {
          return std::unexpected(r.error());
        }
        continue;
      }

      auto n = ::recv(sock_.fd(), buf.data(), buf.size(), 0);
      if (n >= 0) {
        return static_cast<std::size_t>(n);
      }
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        if (auto r = wait_fd(sock_.fd(), POLLIN, deadline); !r) {
          return std::unexpected(r.error());
        }
        continue;
      }
      if (errno != EINTR) {
        return fail(Error::TransportError);
      }
    }
  }

private:
  auto write_some(std::string_view data, Deadline deadline)
      -> Result<std::size_t> {
    while (true) {
      if (ssl_) {
        int n = SSL_write(ssl_.get(), data.data(), static_cast<int>(data.size()));
        if (n > 0) {
          return static_cast<std::size_t>(n);
        }
        if (auto r = wait_ssl(SSL_get_error(ssl_.get(), n), deadline); !r) {
          return std::unexpected(r.error());
        }
        continue;
      }

      auto n = ::send(sock_.fd(), data.data(), data.size(), MSG_NOSIGNAL);
      if (n >= 0) {
        return static_cast<std::size_t>(n);
      }
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        if (auto r = wait_fd(sock_.fd(), POLLOUT, deadline); !r) {
          return std::unexpected(r.error());
        }
        continue;
      }
      if (errno != EINTR) {
        return fail(Error::TransportError);
      }
    }
  }

  auto wait_ssl(int err, Deadline deadline) -> Result<void> {
    switch (err) {
      case SSL_ERROR_WANT_READ:
        return wait_fd(sock_.fd(), POLLIN, deadline);
      case SSL_ERROR_WANT_WRITE:
        return wait_fd(sock_.fd(), POLLOUT, deadline);
      default:
        return fail(Error::TlsError);
    }
  }

  Socket sock_;
  std::unique_ptr<SSL, SslDeleter> ssl_;
};

}  // namespace

struct HttpClient::Impl {
  HttpClientConfig config;
  std::unique_ptr<SSL_CTX, SslCtxDeleter> tls_ctx;

  explicit Impl(HttpClientConfig cfg) : config(std::move(cfg)) {
    tls_ctx.reset(SSL_CTX_new(TLS_client_method()));
    if (!tls_ctx) {
      log::error("Failed to create TLS context: {}", ssl_error_text());
      return;
    }
    SSL_CTX_set_min_proto_version(tls_ctx.get(), TLS1_2_VERSION);
    SSL_CTX_set_verify(tls_ctx.get(), SSL_VERIFY_PEER, nullptr);
    if (SSL_CTX_set_default_verify_paths(tls_ctx.get()) != 1) {
      log::warn("Failed to load default CA paths: {}", ssl_error_text());
    }
  }

  auto read_response(Connection& conn, Deadline deadline)
      -> Result<HttpResponse> {
    HttpResponseParser parser(config.max_response_size);
    std::array<char, limits::kReadBufferSize> buffer{};

    while (true) {
      auto n = conn.read_some(buffer, deadline);
      if (!n) {
        return std::unexpected(n.error());
      }
      auto parsed = *n == 0 ? parser.finish()
                            : parser.parse({buffer.data(), *n});
      if (!parsed) {
        return std::unexpected(parsed.error());
      }
      if (*parsed) {
        return std::move(**parsed);
      }
    }
  }
};

HttpClient::HttpClient(HttpClientConfig config)
    : impl_(std::make_unique<Impl>(std::move(config))) {
}

HttpClient::~HttpClient() = default;

auto HttpClient::config() const noexcept -> const HttpClientConfig& {
  return impl_->config;
}

auto HttpClient::send(const HttpRequest& req) -> Result<HttpResponse> {
  auto url = Url::parse(req.url);
  if (!url) {
    return std::unexpected(url.error());
  }

  auto sock = connect_tcp(*url, impl_->config.connect_timeout);
  if (!sock) {
    return std::unexpected(sock.error());
  }

  auto deadline = SteadyClock::now() + impl_->config.request_timeout;
  Connection conn(std::move(*sock));

  if (url->is_tls()) {
    if (!impl_->tls_ctx) {
      return fail(Error::TlsError);
    }
    if (auto r = conn.start_tls(impl_->tls_ctx.get(), url->host, deadline);
        !r) {
      return std::unexpected(r.error());
    }
  }

  if (auto r = conn.write_all(serialize_request(req, *url, impl_->config),
                              deadline);
      !r) {
    log::debug("Failed to send {} {}: {}", req.method, req.url,
               r.error().message());
    return std::unexpected(r.error());
  }

  auto resp = impl_->read_response(conn, deadline);
  if (!resp) {
    log::debug("Failed to read response from {}: {}", req.url,
               resp.error().message());
  }
  return resp;
}

}  // namespace tickback::http
