#pragma once

#include "planforge/engine/engine.hpp"
#include "planforge/util/log.hpp"

#include <string>

namespace planforge {

struct LoggingConfig {
  log::Level level{log::Level::Info};
  // Empty: stdout.
  std::string file;
};

struct EngineConfig {
  EngineOptions engine{};
  LoggingConfig logging{};
};

} // namespace planforge
