#include "goalflow/cli/commands.hpp"
#include "goalflow/util/log.hpp"

#include <CLI/CLI.hpp>

#include <cstdio>
#include <cstdlib>
#include <string>

namespace {
auto default_config() -> std::string {
  if (const char *env = std::getenv("GOALFLOW_CONFIG"); env && *env) {
    return env;
  }
  return {};
}
} // namespace

int main(int argc, char *argv[]) {
  // Keep CLI output clean by default.
  goalflow::log::set_output_stderr();
  goalflow::log::set_level(goalflow::log::Level::Warn);

  CLI::App app{"GoalFlow", "Goal-driven plan execution engine"};
  app.require_subcommand(1);
  app.footer("\nExamples:\n"
             "  goalflow validate plan.json\n"
             "  goalflow simulate plan.json -c engine.toml --trust balanced\n"
             "\nTip: Set GOALFLOW_CONFIG=engine.toml to skip -c on "
             "every command.");

  goalflow::cli::ValidateOptions validate_opts;
  auto *validate = app.add_subcommand(
      "validate", "Check a plan file for structural errors and list waves");
  validate->add_option("plan", validate_opts.plan_file, "Plan JSON file")
      ->required();
  validate->add_flag("--json", validate_opts.json, "Output JSON");
  validate->callback([&validate_opts]() {
    std::exit(goalflow::cli::cmd_validate(validate_opts));
  });

  goalflow::cli::SimulateOptions simulate_opts;
  auto *simulate = app.add_subcommand(
      "simulate", "Run a plan file against simulated capabilities");
  simulate->footer(
      "\nTask params understood by the simulated capabilities:\n"
      "  simulate_delay_ms   sleep before answering\n"
      "  simulate_error      fail with this message\n"
      "\nExamples:\n"
      "  goalflow simulate plan.json\n"
      "  goalflow simulate plan.json --revision fixed.json --json\n"
      "  goalflow simulate plan.json --trust paranoid");
  simulate_opts.config_file = default_config();
  simulate->add_option("plan", simulate_opts.plan_file, "Plan JSON file")
      ->required()
      ->check(CLI::ExistingFile);
  simulate
      ->add_option("-c,--config", simulate_opts.config_file,
                   "Engine config file (TOML)")
      ->check(CLI::ExistingFile);
  simulate
      ->add_option("--revision", simulate_opts.revision_file,
                   "Task list returned on the first replanning request")
      ->check(CLI::ExistingFile);
  simulate
      ->add_option("--trust", simulate_opts.trust_level,
                   "Trust level: paranoid|balanced|autonomous")
      ->check(CLI::IsMember({"paranoid", "balanced", "autonomous"},
                            CLI::ignore_case));
  simulate->add_option("--log-level", simulate_opts.log_level,
                       "Log level override: trace|debug|info|warn|error");
  simulate->add_flag("--json", simulate_opts.json, "Output JSON report");
  simulate->callback([&simulate_opts]() {
    std::exit(goalflow::cli::cmd_simulate(simulate_opts));
  });

  CLI11_PARSE(app, argc, argv);
  return 0;
}
