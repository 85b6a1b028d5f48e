#pragma once

#include <optional>
#include <string>
#include <vector>

namespace planforge::cli {

struct ValidateOptions {
  std::vector<std::string> files;
  bool json{false};
};

struct RunOptions {
  std::string plan_file;
  std::string config_file;
  std::string input; // JSON text; empty means null
  std::optional<std::string> log_level;
  bool stream{false};
  bool json{false};
};

auto cmd_validate(const ValidateOptions &opts) -> int;
auto cmd_run(const RunOptions &opts) -> int;

} // namespace planforge::cli
