#pragma once

#include "planforge/core/error.hpp"

#include <glaze/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace planforge {

using JsonValue = glz::generic_json<glz::num_mode::i64>;
using JsonArray = std::vector<JsonValue>;

[[nodiscard]] inline auto dump_json(const JsonValue &value) -> std::string {
  auto out = glz::write_json(value);
  return out ? *out : "null";
}

// Integral view of a JSON number; doubles are truncated.
[[nodiscard]] inline auto json_to_int(const JsonValue &value)
    -> std::optional<std::int64_t> {
  if (const auto *i = std::get_if<std::int64_t>(&value.data)) {
    return *i;
  }
  if (const auto *d = std::get_if<double>(&value.data)) {
    return static_cast<std::int64_t>(*d);
  }
  return std::nullopt;
}

[[nodiscard]] inline auto parse_json(std::string_view input)
    -> Result<JsonValue> {
  JsonValue value{};
  constexpr auto kOpts = glz::opts{.null_terminated = false};
  if (auto ec = glz::read<kOpts>(value, input); ec) {
    return fail(Error::ParseError);
  }
  return ok(std::move(value));
}

} // namespace planforge
