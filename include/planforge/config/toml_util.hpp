#pragma once

#include "planforge/core/error.hpp"
#include "planforge/util/log.hpp"

#include <glaze/toml.hpp>

#include <format>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>

namespace planforge::toml_util {

// Slurps a plan or config file. The diagnostic names the path on failure.
[[nodiscard]] inline auto read_file(std::string_view path,
                                    std::string *diagnostic = nullptr)
    -> Result<std::string> {
  std::ifstream in(std::string(path), std::ios::binary);
  if (!in) {
    if (diagnostic) {
      *diagnostic = std::format("cannot open '{}'", path);
    }
    return fail(Error::FileNotFound);
  }
  return ok(std::string((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>()));
}

/// Decode TOML into the raw mirror struct T; keys T does not declare are
/// skipped so plan files may carry annotations for other tools.
template <typename T>
[[nodiscard]] auto parse_toml(std::string_view text,
                              std::string *diagnostic = nullptr) -> Result<T> {
  T raw{};
  constexpr auto kOpts =
      glz::opts{.format = glz::TOML, .error_on_unknown_keys = false};
  if (auto ec = glz::read<kOpts>(raw, text); ec) {
    auto where = glz::format_error(ec, text);
    if (diagnostic) {
      *diagnostic = std::format("TOML syntax error: {}", where);
    } else {
      log::warn("TOML syntax error: {}", where);
    }
    return fail(Error::ParseError);
  }
  return ok(std::move(raw));
}

} // namespace planforge::toml_util
