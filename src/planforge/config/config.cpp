#include "planforge/config/config.hpp"
#include "planforge/config/toml_util.hpp"

#include "planforge/core/error.hpp"
#include "planforge/util/log.hpp"

#include <boost/lexical_cast.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>

namespace planforge {
namespace detail {

struct EngineToml {
  std::int64_t default_task_timeout_ms{task_defaults::kTimeout.count()};
  std::int64_t max_active_runs{0};
};

struct LoggingToml {
  std::string level{"info"};
  std::string file;
};

struct EngineConfigToml {
  EngineToml engine{};
  LoggingToml logging{};
};

} // namespace detail
} // namespace planforge

namespace glz {
template <> struct meta<planforge::detail::EngineToml> {
  using T = planforge::detail::EngineToml;
  static constexpr auto value =
      object("default_task_timeout_ms", &T::default_task_timeout_ms,
             "max_active_runs", &T::max_active_runs);
};

template <> struct meta<planforge::detail::LoggingToml> {
  using T = planforge::detail::LoggingToml;
  static constexpr auto value = object("level", &T::level, "file", &T::file);
};

template <> struct meta<planforge::detail::EngineConfigToml> {
  using T = planforge::detail::EngineConfigToml;
  static constexpr auto value =
      object("engine", &T::engine, "logging", &T::logging);
};
} // namespace glz

namespace planforge {
namespace {

auto apply_env_overrides(detail::EngineConfigToml &raw) -> void {
  if (const char *v = std::getenv("PLANFORGE_LOG_LEVEL"); v != nullptr) {
    raw.logging.level = v;
  }
  if (const char *v = std::getenv("PLANFORGE_LOG_FILE"); v != nullptr) {
    raw.logging.file = v;
  }
  if (const char *v = std::getenv("PLANFORGE_DEFAULT_TASK_TIMEOUT_MS");
      v != nullptr) {
    raw.engine.default_task_timeout_ms = boost::lexical_cast<std::int64_t>(v);
  }
  if (const char *v = std::getenv("PLANFORGE_MAX_ACTIVE_RUNS"); v != nullptr) {
    raw.engine.max_active_runs = boost::lexical_cast<std::int64_t>(v);
  }
}

[[nodiscard]] auto convert(detail::EngineConfigToml &raw)
    -> Result<EngineConfig> {
  apply_env_overrides(raw);

  auto level = log::parse_level(raw.logging.level);
  if (!level || raw.engine.default_task_timeout_ms <= 0 ||
      raw.engine.max_active_runs < 0) {
    log::error("Invalid engine configuration");
    return fail(Error::ParseError);
  }

  EngineConfig cfg{};
  cfg.engine.default_task_timeout =
      std::chrono::milliseconds(raw.engine.default_task_timeout_ms);
  cfg.engine.max_active_runs =
      static_cast<std::size_t>(raw.engine.max_active_runs);
  cfg.logging.level = *level;
  cfg.logging.file = std::move(raw.logging.file);
  return ok(std::move(cfg));
}

[[nodiscard]] auto convert_toml(std::string_view toml_text)
    -> Result<EngineConfig> {
  auto raw_result = toml_util::parse_toml<detail::EngineConfigToml>(toml_text);
  if (!raw_result) {
    return fail(raw_result.error());
  }
  return convert(*raw_result);
}

} // namespace

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<EngineConfig> {
  auto text = toml_util::read_file(path);
  if (!text) {
    return fail(text.error());
  }
  return load_from_string(*text);
}

auto ConfigLoader::load_from_string(std::string_view toml_str)
    -> Result<EngineConfig> {
  try {
    return convert_toml(toml_str);
  } catch (const std::exception &e) {
    log::error("Failed to parse TOML engine configuration: {}", e.what());
    return fail(Error::ParseError);
  }
}

auto ConfigLoader::load_defaults() -> Result<EngineConfig> {
  try {
    detail::EngineConfigToml raw{};
    return convert(raw);
  } catch (const std::exception &e) {
    log::error("Invalid engine configuration override: {}", e.what());
    return fail(Error::ParseError);
  }
}

} // namespace planforge
