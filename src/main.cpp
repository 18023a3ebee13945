#include "tickback/app/application.hpp"
#include "tickback/config/config.hpp"
#include "tickback/core/constants.hpp"
#include "tickback/util/daemon.hpp"
#include "tickback/util/log.hpp"

#include <charconv>
#include <cstdlib>
#include <optional>
#include <print>
#include <string>
#include <string_view>
#include <thread>

namespace {

void print_usage(const char* prog) {
  std::println("tickback - minute-resolution deferred HTTP callbacks");
  std::println("Usage: {} [OPTIONS]", prog);
  std::println("");
  std::println("Options:");
  std::println("  -c, --config <file>   YAML config file");
  std::println("  --host <host>         API listen address (default: 0.0.0.0)");
  std::println("  --port <port>         API listen port (default: 6777)");
  std::println("  --db <file>           SQLite database file (default: tickback.db)");
  std::println("  --memory              Keep tasks in memory only");
  std::println("  --debug               Log at debug level");
  std::println("  -d, --daemon          Run as daemon");
  std::println("  -v, --version         Show version and exit");
  std::println("  -h, --help            Show this help message");
  std::println("");
  std::println("Environment: TICKBACK_LISTEN_IP, TICKBACK_LISTEN_PORT, "
               "TICKBACK_DEBUG, TICKBACK_DB_FILE,");
  std::println("  TICKBACK_STORAGE_BACKEND, TICKBACK_CONNECT_TIMEOUT, "
               "TICKBACK_CLIENT_TIMEOUT,");
  std::println("  TICKBACK_WORKERS, TICKBACK_LOG_LEVEL, TICKBACK_LOG_FORMAT");
}

void print_version() {
  std::println("tickback v0.1.0");
}

struct Options {
  std::string config_file;
  std::optional<std::string> db_file;
  std::optional<std::string> host;
  std::optional<std::uint16_t> port;
  bool memory = false;
  bool debug = false;
  bool daemon = false;
};

auto require_value(int& i, int argc, char* argv[], std::string_view flag)
    -> std::string_view {
  if (++i >= argc) {
    std::println(stderr, "Error: {} requires an argument", flag);
    std::exit(1);
  }
  return argv[i];
}

auto parse_args(int argc, char* argv[]) -> Options {
  Options opts;

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (arg == "-v" || arg == "--version") {
      print_version();
      std::exit(0);
    } else if (arg == "-c" || arg == "--config") {
      opts.config_file = require_value(i, argc, argv, arg);
    } else if (arg == "--host") {
      opts.host = std::string(require_value(i, argc, argv, arg));
    } else if (arg == "--port") {
      auto value = require_value(i, argc, argv, arg);
      std::uint16_t port = 0;
      auto [ptr, ec] =
          std::from_chars(value.data(), value.data() + value.size(), port);
      if (ec != std::errc{} || ptr != value.data() + value.size() ||
          port == 0) {
        std::println(stderr, "Error: invalid port: {}", value);
        std::exit(1);
      }
      opts.port = port;
    } else if (arg == "--db") {
      opts.db_file = std::string(require_value(i, argc, argv, arg));
    } else if (arg == "--memory") {
      opts.memory = true;
    } else if (arg == "--debug") {
      opts.debug = true;
    } else if (arg == "-d" || arg == "--daemon") {
      opts.daemon = true;
    } else {
      std::println(stderr, "Unknown option: {}", arg);
      print_usage(argv[0]);
      std::exit(1);
    }
  }

  return opts;
}

auto load_config(const Options& opts) -> std::optional<tickback::SystemConfig> {
  tickback::SystemConfig config;
  if (!opts.config_file.empty()) {
    auto loaded = tickback::ConfigLoader::load_from_file(opts.config_file);
    if (!loaded) {
      std::println(stderr, "Error: Failed to load config {}: {}",
                   opts.config_file, loaded.error().message());
      return std::nullopt;
    }
    config = std::move(*loaded);
  }

  tickback::ConfigLoader::apply_env(config, tickback::process_env());

  if (opts.host) config.server.host = *opts.host;
  if (opts.port) config.server.port = *opts.port;
  if (opts.db_file) config.storage.db_file = *opts.db_file;
  if (opts.memory) config.storage.backend = tickback::StorageBackend::Memory;
  if (opts.debug) config.logging.level = "debug";

  if (auto r = tickback::ConfigLoader::validate(config); !r) {
    std::println(stderr, "Error: {}", r.error().message());
    return std::nullopt;
  }
  return config;
}

auto setup_logging(const tickback::LoggingConfig& cfg) -> bool {
  tickback::log::set_level(cfg.level);
  tickback::log::set_format(cfg.format);
  if (!cfg.file.empty() && !tickback::log::open_file(cfg.file)) {
    std::println(stderr, "Error: cannot open log file {}", cfg.file);
    return false;
  }
  tickback::log::start();
  return true;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto opts = parse_args(argc, argv);

  auto config = load_config(opts);
  if (!config) {
    return 1;
  }

  if (opts.daemon && !tickback::daemonize()) {
    std::println(stderr, "Error: Failed to daemonize");
    return 1;
  }

  if (!setup_logging(config->logging)) {
    return 1;
  }
  tickback::setup_signal_handlers();

  tickback::Application app(*config);
  if (auto r = app.start(); !r) {
    tickback::log::error("Failed to start: {}", r.error().message());
    tickback::log::stop();
    return 1;
  }

  while (app.is_running() &&
         !tickback::g_shutdown_requested.load(std::memory_order_acquire)) {
    std::this_thread::sleep_for(tickback::timing::kShutdownPollInterval);
  }

  if (tickback::g_shutdown_requested.load(std::memory_order_acquire)) {
    tickback::log::info("Received shutdown signal, stopping...");
  }

  app.stop();
  tickback::log::stop();
  return 0;
}
