#include "planforge/cli/commands.hpp"
#include "planforge/util/log.hpp"

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <string>

namespace {
auto default_config() -> std::string {
  if (const char *env = std::getenv("PLANFORGE_CONFIG"); env && *env) {
    return env;
  }
  return {};
}
} // namespace

int main(int argc, char *argv[]) {
  // Keep CLI output clean by default; `run` raises this from its config.
  planforge::log::set_output_stderr();
  planforge::log::set_level(planforge::log::Level::Warn);

  CLI::App app{"PlanForge", "A task-orchestration engine"};
  app.require_subcommand(1);
  app.footer("\nExamples:\n"
             "  planforge validate plans/etl.toml\n"
             "  planforge run plans/etl.toml --input '{\"n\": 1}' --stream\n"
             "\nTip: Set PLANFORGE_CONFIG=engine.toml to skip -c on every "
             "run.");

  planforge::cli::ValidateOptions validate_opts;
  auto *validate =
      app.add_subcommand("validate", "Validate plan files or directories");
  validate->footer("\nExamples:\n"
                   "  planforge validate plans/etl.toml\n"
                   "  planforge validate plans/ --json");
  validate->add_option("files", validate_opts.files, "Plan TOML files")
      ->required()
      ->check(CLI::ExistingPath);
  validate->add_flag("--json", validate_opts.json, "Output JSON");
  validate->callback([&validate_opts]() {
    std::exit(planforge::cli::cmd_validate(validate_opts));
  });

  planforge::cli::RunOptions run_opts;
  auto *run = app.add_subcommand("run", "Execute a plan file");
  run->footer("\nExamples:\n"
              "  planforge run plans/etl.toml\n"
              "  planforge run plans/etl.toml -c engine.toml --stream\n"
              "  planforge run plans/etl.toml --input 0 --json");
  run_opts.config_file = default_config();
  run->add_option("plan", run_opts.plan_file, "Plan TOML file")
      ->required()
      ->check(CLI::ExistingFile);
  run->add_option("-c,--config", run_opts.config_file, "Engine config file")
      ->check(CLI::ExistingFile);
  run->add_option("--input", run_opts.input, "Plan input as JSON text");
  run->add_option("--log-level", run_opts.log_level,
                  "Log level override: trace|debug|info|warn|error");
  run->add_flag("--stream", run_opts.stream,
                "Print task results as they settle");
  run->add_flag("--json", run_opts.json, "Output JSON");
  run->callback(
      [&run_opts]() { std::exit(planforge::cli::cmd_run(run_opts)); });

  CLI11_PARSE(app, argc, argv);
  return 0;
}
