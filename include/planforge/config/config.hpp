#pragma once

#include "planforge/config/engine_config.hpp"
#include "planforge/core/error.hpp"

#include <string_view>

namespace planforge {

/// Loads EngineConfig from TOML, then applies PLANFORGE_* environment
/// overrides.
class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<EngineConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view toml_str)
      -> Result<EngineConfig>;
  // Defaults plus environment overrides, for runs without a config file.
  [[nodiscard]] static auto load_defaults() -> Result<EngineConfig>;
};

} // namespace planforge
