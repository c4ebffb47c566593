#include "batchforge/cli/commands.hpp"
#include "batchforge/util/log.hpp"

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <string>

namespace {
auto default_config() -> std::string {
  if (const char *env = std::getenv("BATCHFORGE_CONFIG"); env && *env) {
    return env;
  }
  return {};
}
} // namespace

int main(int argc, char *argv[]) {
  // Keep CLI output clean by default.
  batchforge::log::set_output_stderr();
  batchforge::log::set_level(batchforge::log::Level::Warn);

  CLI::App app{"BatchForge", "A multi-tenant batch job scheduler"};
  app.require_subcommand(1);
  app.footer("\nExamples:\n"
             "  batchforge validate -c batchforge.toml\n"
             "  batchforge simulate --workers 4 --jobs 20 --tasks 5\n"
             "\nTip: Set BATCHFORGE_CONFIG=batchforge.toml to skip -c on "
             "every command.");

  const std::string env_config = default_config();

  batchforge::cli::ValidateOptions validate_opts;
  auto *validate =
      app.add_subcommand("validate", "Validate a scheduler config file");
  validate_opts.config_file = env_config;
  auto *validate_cfg =
      validate
          ->add_option("-c,--config", validate_opts.config_file,
                       "System config file")
          ->check(CLI::ExistingFile);
  if (env_config.empty())
    validate_cfg->required();
  validate->add_flag("--json", validate_opts.json, "Output JSON");
  validate->callback([&validate_opts]() {
    std::exit(batchforge::cli::cmd_validate(validate_opts));
  });

  batchforge::cli::SimulateOptions simulate_opts;
  auto *simulate = app.add_subcommand(
      "simulate", "Run a synthetic workload against in-process workers");
  simulate->footer(
      "\nExamples:\n"
      "  batchforge simulate --workers 3 --jobs 10 --tasks 4 --capacity 2\n"
      "  batchforge simulate --fail-rate 0.2 --reject-rate 0.05 --json\n"
      "  batchforge simulate -c batchforge.toml --log-level debug");
  simulate_opts.config_file = env_config;
  simulate
      ->add_option("-c,--config", simulate_opts.config_file,
                   "System config file")
      ->check(CLI::ExistingFile);
  simulate->add_option("-w,--workers", simulate_opts.workers,
                       "Number of workers to register")
      ->check(CLI::PositiveNumber);
  simulate->add_option("-j,--jobs", simulate_opts.jobs,
                       "Number of jobs to submit")
      ->check(CLI::PositiveNumber);
  simulate->add_option("-t,--tasks", simulate_opts.tasks, "Tasks per job")
      ->check(CLI::NonNegativeNumber);
  simulate->add_option("--capacity", simulate_opts.capacity,
                       "Concurrent tasks per worker")
      ->check(CLI::PositiveNumber);
  simulate->add_option("--fail-rate", simulate_opts.fail_rate,
                       "Probability that a task fails")
      ->check(CLI::Range(0.0, 1.0));
  simulate->add_option("--reject-rate", simulate_opts.reject_rate,
                       "Probability that a dispatch is rejected")
      ->check(CLI::Range(0.0, 1.0));
  simulate->add_option("--seed", simulate_opts.seed,
                       "Seed for task durations and outcomes");
  simulate->add_option("--timeout", simulate_opts.timeout_sec,
                       "Seconds to wait for every job to settle")
      ->check(CLI::PositiveNumber);
  simulate->add_option("--log-level", simulate_opts.log_level,
                       "Log level override: trace|debug|info|warn|error");
  simulate->add_flag("--json", simulate_opts.json, "Output JSON");
  simulate->callback([&simulate_opts]() {
    std::exit(batchforge::cli::cmd_simulate(simulate_opts));
  });

  CLI11_PARSE(app, argc, argv);
  return 0;
}
