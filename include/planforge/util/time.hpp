#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <string>

namespace planforge::util {

// Formats time point to ISO 8601 with millisecond precision
// (YYYY-MM-DDTHH:MM:SS.mmmZ); the epoch formats as an empty string.
[[nodiscard]] inline auto
format_iso8601(std::chrono::system_clock::time_point tp) -> std::string {
  if (tp == std::chrono::system_clock::time_point{}) {
    return {};
  }
  return std::format("{:%Y-%m-%dT%H:%M:%S}Z",
                     std::chrono::floor<std::chrono::milliseconds>(tp));
}

[[nodiscard]] inline auto
to_epoch_ms(std::chrono::system_clock::time_point tp) noexcept
    -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

} // namespace planforge::util
