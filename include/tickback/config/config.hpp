#pragma once

#include "tickback/config/system_config.hpp"
#include "tickback/core/error.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace tickback {

using Config = SystemConfig;

// Returns the value of an environment variable, nullopt when unset.
using EnvLookup =
    std::function<std::optional<std::string>(std::string_view name)>;

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<SystemConfig>;

  // Overrides fields from TICKBACK_* variables. Malformed values are logged
  // and ignored.
  static auto apply_env(SystemConfig& config, const EnvLookup& lookup) -> void;

  [[nodiscard]] static auto validate(const SystemConfig& config)
      -> Result<void>;
};

[[nodiscard]] auto process_env() -> EnvLookup;

}  // namespace tickback
