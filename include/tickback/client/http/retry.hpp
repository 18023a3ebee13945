#pragma once

#include "tickback/client/http/http_client.hpp"
#include "tickback/client/http/http_types.hpp"

#include <chrono>
#include <functional>
#include <random>
#include <string>

namespace tickback::http {

using Sleeper = std::function<void(std::chrono::milliseconds)>;

struct CallResult {
  int status{0};  // 0 when no response was ever received
  std::string body;
  int attempts{0};
};

// Uniform in [base/2, base) where base = 100ms * 2^attempt.
[[nodiscard]] auto backoff_delay(int attempt, std::mt19937_64& rng)
    -> std::chrono::milliseconds;

// Sends `req` up to `max_attempts` times. Stops early on the expected status
// or any 4xx; 5xx and transport failures back off before the next attempt,
// other statuses retry immediately.
[[nodiscard]] auto send_with_retry(IHttpTransport& transport,
                                   const HttpRequest& req, int expected_status,
                                   int max_attempts, const Sleeper& sleeper)
    -> CallResult;

[[nodiscard]] auto default_sleeper() -> Sleeper;

}  // namespace tickback::http
