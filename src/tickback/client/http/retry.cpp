#include "tickback/client/http/retry.hpp"

#include "tickback/core/constants.hpp"
#include "tickback/util/log.hpp"

#include <algorithm>
#include <thread>

namespace tickback::http {

namespace {

auto thread_rng() -> std::mt19937_64& {
  thread_local std::mt19937_64 rng{std::random_device{}()};
  return rng;
}

}  // namespace

auto backoff_delay(int attempt, std::mt19937_64& rng)
    -> std::chrono::milliseconds {
  auto exponent = std::clamp(attempt, 0, limits::kMaxBackoffExponent);
  auto base = timing::kBackoffBase.count() << exponent;
  std::uniform_int_distribution<std::int64_t> dist(base / 2, base - 1);
  return std::chrono::milliseconds(dist(rng));
}

auto send_with_retry(IHttpTransport& transport, const HttpRequest& req,
                     int expected_status, int max_attempts,
                     const Sleeper& sleeper) -> CallResult {
  CallResult result;

  for (int i = 0; i < max_attempts; ++i) {
    result.attempts = i + 1;
    auto resp = transport.send(req);
    if (!resp) {
      log::debug("{} {} attempt {} failed: {}", req.method, req.url, i + 1,
                 resp.error().message());
      result.body = resp.error().message();
      sleeper(backoff_delay(i, thread_rng()));
      continue;
    }

    result.status = resp->status;
    result.body = std::move(resp->body);

    if (resp->status == expected_status || resp->is_client_error()) {
      return result;
    }
    log::debug("{} {} attempt {} returned {}", req.method, req.url, i + 1,
               resp->status);
    if (resp->is_server_error()) {
      sleeper(backoff_delay(i, thread_rng()));
    }
  }

  return result;
}

auto default_sleeper() -> Sleeper {
  return [](std::chrono::milliseconds delay) {
    std::this_thread::sleep_for(delay);
  };
}

}  // namespace tickback::http
