#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tickback {

struct ServerConfig {
  bool enabled{true};
  std::string host{"0.0.0.0"};
  std::uint16_t port{6777};
  int threads{4};
};

enum class StorageBackend : std::uint8_t { Sqlite, Memory };

[[nodiscard]] constexpr auto storage_backend_name(StorageBackend backend) noexcept
    -> std::string_view {
  switch (backend) {
    case StorageBackend::Sqlite: return "sqlite";
    case StorageBackend::Memory: return "memory";
  }
  return "sqlite";
}

[[nodiscard]] constexpr auto parse_storage_backend(std::string_view str) noexcept
    -> std::optional<StorageBackend> {
  if (str == "sqlite") return StorageBackend::Sqlite;
  if (str == "memory") return StorageBackend::Memory;
  return std::nullopt;
}

struct StorageConfig {
  StorageBackend backend{StorageBackend::Sqlite};
  std::string db_file{"tickback.db"};
  std::size_t page_size{100};
};

struct HttpClientSettings {
  int connect_timeout_ms{1000};
  int request_timeout_ms{3000};
  std::size_t max_response_bytes{1024 * 1024};
};

enum class SaturationPolicy : std::uint8_t { Reject, Block };

[[nodiscard]] constexpr auto saturation_policy_name(SaturationPolicy policy) noexcept
    -> std::string_view {
  switch (policy) {
    case SaturationPolicy::Reject: return "reject";
    case SaturationPolicy::Block: return "block";
  }
  return "reject";
}

[[nodiscard]] constexpr auto parse_saturation_policy(std::string_view str) noexcept
    -> std::optional<SaturationPolicy> {
  if (str == "reject") return SaturationPolicy::Reject;
  if (str == "block") return SaturationPolicy::Block;
  return std::nullopt;
}

struct SchedulerConfig {
  int tick_interval_sec{60};
  int workers{16};
  int queue_capacity{1024};
  SaturationPolicy saturation{SaturationPolicy::Reject};
  int submit_timeout_ms{1000};
  bool catchup_on_startup{true};
};

struct LoggingConfig {
  std::string level{"info"};
  std::string format{"text"};
  std::string file;
};

struct SystemConfig {
  ServerConfig server;
  StorageConfig storage;
  HttpClientSettings http_client;
  SchedulerConfig scheduler;
  LoggingConfig logging;
};

}  // namespace tickback
