#include "tickback/config/config.hpp"

#include "tickback/config/yaml_utils.hpp"
#include "tickback/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace YAML {

template <>
struct convert<tickback::ServerConfig> {
  static bool decode(const Node& node, tickback::ServerConfig& s) {
    if (!node.IsMap()) {
      return false;
    }
    s.enabled = tickback::yaml_get_or(node, "enabled", true);
    s.host = tickback::yaml_get_or<std::string>(node, "host", "0.0.0.0");
    s.port = tickback::yaml_get_or<std::uint16_t>(node, "port", 6777);
    s.threads = tickback::yaml_get_or(node, "threads", 4);
    return true;
  }
};

template <>
struct convert<tickback::StorageConfig> {
  static bool decode(const Node& node, tickback::StorageConfig& s) {
    if (!node.IsMap()) {
      return false;
    }
    auto backend = tickback::parse_storage_backend(
        tickback::yaml_get_or<std::string>(node, "backend", "sqlite"));
    if (!backend) {
      return false;
    }
    s.backend = *backend;
    s.db_file = tickback::yaml_get_or<std::string>(node, "db_file", "tickback.db");
    s.page_size = tickback::yaml_get_or<std::size_t>(node, "page_size", 100);
    return true;
  }
};

template <>
struct convert<tickback::HttpClientSettings> {
  static bool decode(const Node& node, tickback::HttpClientSettings& h) {
    if (!node.IsMap()) {
      return false;
    }
    h.connect_timeout_ms = tickback::yaml_get_or(node, "connect_timeout_ms", 1000);
    h.request_timeout_ms = tickback::yaml_get_or(node, "request_timeout_ms", 3000);
    h.max_response_bytes = tickback::yaml_get_or<std::size_t>(
        node, "max_response_bytes", 1024 * 1024);
    return true;
  }
};

template <>
struct convert<tickback::SchedulerConfig> {
  static bool decode(const Node& node, tickback::SchedulerConfig& s) {
    if (!node.IsMap()) {
      return false;
    }
    auto saturation = tickback::parse_saturation_policy(
        tickback::yaml_get_or<std::string>(node, "saturation", "reject"));
    if (!saturation) {
      return false;
    }
    s.saturation = *saturation;
    s.tick_interval_sec = tickback::yaml_get_or(node, "tick_interval_sec", 60);
    s.workers = tickback::yaml_get_or(node, "workers", 16);
    s.queue_capacity = tickback::yaml_get_or(node, "queue_capacity", 1024);
    s.submit_timeout_ms = tickback::yaml_get_or(node, "submit_timeout_ms", 1000);
    s.catchup_on_startup = tickback::yaml_get_or(node, "catchup_on_startup", true);
    return true;
  }
};

template <>
struct convert<tickback::LoggingConfig> {
  static bool decode(const Node& node, tickback::LoggingConfig& l) {
    if (!node.IsMap()) {
      return false;
    }
    l.level = tickback::yaml_get_or<std::string>(node, "level", "info");
    l.format = tickback::yaml_get_or<std::string>(node, "format", "text");
    l.file = tickback::yaml_get_or<std::string>(node, "file", "");
    return true;
  }
};

template <>
struct convert<tickback::SystemConfig> {
  static bool decode(const Node& node, tickback::SystemConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    if (auto server = node["server"]) {
      c.server = server.as<tickback::ServerConfig>();
    }
    if (auto storage = node["storage"]) {
      c.storage = storage.as<tickback::StorageConfig>();
    }
    if (auto http_client = node["http_client"]) {
      c.http_client = http_client.as<tickback::HttpClientSettings>();
    }
    if (auto scheduler = node["scheduler"]) {
      c.scheduler = scheduler.as<tickback::SchedulerConfig>();
    }
    if (auto logging = node["logging"]) {
      c.logging = logging.as<tickback::LoggingConfig>();
    }
    return true;
  }
};

}  // namespace YAML

namespace tickback {

namespace {

template <typename T>
auto parse_number(std::string_view s) -> std::optional<T> {
  T value{};
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
  if (ec != std::errc{} || ptr != s.data() + s.size()) {
    return std::nullopt;
  }
  return value;
}

auto iequals(std::string_view a, std::string_view b) -> bool {
  return std::ranges::equal(a, b, [](char x, char y) {
    return std::tolower(static_cast<unsigned char>(x)) ==
           std::tolower(static_cast<unsigned char>(y));
  });
}

template <typename T>
auto env_number(const EnvLookup& lookup, std::string_view name, T& out)
    -> void {
  auto value = lookup(name);
  if (!value || value->empty()) {
    return;
  }
  auto n = parse_number<T>(*value);
  if (!n) {
    log::error("Ignoring {}={}: not a valid number", name, *value);
    return;
  }
  log::info("Configuration override {}={}", name, *value);
  out = *n;
}

auto env_string(const EnvLookup& lookup, std::string_view name,
                std::string& out) -> void {
  auto value = lookup(name);
  if (!value || value->empty()) {
    return;
  }
  log::info("Configuration override {}={}", name, *value);
  out = std::move(*value);
}

}  // namespace

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<SystemConfig> {
  std::string path_str{path};
  std::ifstream file(path_str);
  if (!file.is_open()) {
    log::error("Failed to open config file: {}", path);
    return fail(Error::FileNotFound);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str());
}

auto ConfigLoader::load_from_string(std::string_view yaml_str)
    -> Result<SystemConfig> {
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    if (!root.IsDefined() || root.IsNull()) {
      // An empty file keeps every default.
      return SystemConfig{};
    }
    SystemConfig config = root.as<SystemConfig>();
    return ok(std::move(config));
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }
}

auto ConfigLoader::apply_env(SystemConfig& config, const EnvLookup& lookup)
    -> void {
  env_string(lookup, "TICKBACK_LISTEN_IP", config.server.host);
  env_number(lookup, "TICKBACK_LISTEN_PORT", config.server.port);
  env_string(lookup, "TICKBACK_DB_FILE", config.storage.db_file);
  env_number(lookup, "TICKBACK_CONNECT_TIMEOUT",
             config.http_client.connect_timeout_ms);
  env_number(lookup, "TICKBACK_CLIENT_TIMEOUT",
             config.http_client.request_timeout_ms);
  env_number(lookup, "TICKBACK_WORKERS", config.scheduler.workers);
  env_string(lookup, "TICKBACK_LOG_LEVEL", config.logging.level);
  env_string(lookup, "TICKBACK_LOG_FORMAT", config.logging.format);

  if (auto backend = lookup("TICKBACK_STORAGE_BACKEND");
      backend && !backend->empty()) {
    if (auto parsed = parse_storage_backend(*backend)) {
      log::info("Configuration override TICKBACK_STORAGE_BACKEND={}",
                *backend);
      config.storage.backend = *parsed;
    } else {
      log::error("Ignoring TICKBACK_STORAGE_BACKEND={}: unknown backend",
                 *backend);
    }
  }

  if (auto debug = lookup("TICKBACK_DEBUG"); debug && iequals(*debug, "true")) {
    log::info("Configuration override TICKBACK_DEBUG=true");
    config.logging.level = "debug";
  }
}

auto ConfigLoader::validate(const SystemConfig& config) -> Result<void> {
  auto invalid = [](std::string_view what) {
    log::error("Invalid configuration: {}", what);
    return fail(Error::InvalidConfig);
  };

  if (config.server.enabled && config.server.port == 0) {
    return invalid("server.port must be non-zero");
  }
  if (config.server.threads <= 0) {
    return invalid("server.threads must be positive");
  }
  if (config.storage.backend == StorageBackend::Sqlite &&
      config.storage.db_file.empty()) {
    return invalid("storage.db_file is required for the sqlite backend");
  }
  if (config.storage.page_size == 0) {
    return invalid("storage.page_size must be positive");
  }
  if (config.http_client.connect_timeout_ms <= 0 ||
      config.http_client.request_timeout_ms <= 0) {
    return invalid("http_client timeouts must be positive");
  }
  if (config.http_client.max_response_bytes == 0) {
    return invalid("http_client.max_response_bytes must be positive");
  }
  if (config.scheduler.tick_interval_sec <= 0) {
    return invalid("scheduler.tick_interval_sec must be positive");
  }
  if (config.scheduler.workers <= 0 || config.scheduler.queue_capacity <= 0) {
    return invalid("scheduler.workers and queue_capacity must be positive");
  }
  if (config.scheduler.submit_timeout_ms < 0) {
    return invalid("scheduler.submit_timeout_ms must be non-negative");
  }
  if (!log::parse_level(config.logging.level)) {
    return invalid("logging.level must be trace, debug, info, warn or error");
  }
  if (!log::parse_format(config.logging.format)) {
    return invalid("logging.format must be text or json");
  }
  return ok();
}

auto process_env() -> EnvLookup {
  return [](std::string_view name) -> std::optional<std::string> {
    const char* value = std::getenv(std::string(name).c_str());
    if (value == nullptr) {
      return std::nullopt;
    }
    return std::string(value);
  };
}

}  // namespace tickback
