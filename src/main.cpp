#include "agentgraph/cli/commands.hpp"
#include "agentgraph/util/log.hpp"

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <string>

namespace {
auto default_config() -> std::string {
  if (const char *env = std::getenv("AGENTGRAPH_CONFIG"); env && *env) {
    return env;
  }
  return {};
}
} // namespace

int main(int argc, char *argv[]) {
  // Results go to stdout; diagnostics stay on stderr.
  agentgraph::log::set_output_stderr();
  agentgraph::log::set_level(agentgraph::log::Level::Warn);

  CLI::App app{"agentgraph", "Dependency-aware concurrent task runner"};
  app.require_subcommand(1);
  app.footer("\nExamples:\n"
             "  agentgraph describe\n"
             "  agentgraph run --max-concurrent 2\n"
             "  agentgraph run --fail-task draft --fail-kind timeout\n"
             "\nTip: Set AGENTGRAPH_CONFIG=agentgraph.toml to skip -c on "
             "every command.");

  const std::string env_config = default_config();

  agentgraph::cli::DescribeOptions describe_opts;
  describe_opts.config_file = env_config;
  auto *describe =
      app.add_subcommand("describe", "Print the sample pipeline's graph");
  describe
      ->add_option("-c,--config", describe_opts.config_file, "Config file")
      ->check(CLI::ExistingFile);
  describe->callback([&describe_opts]() {
    std::exit(agentgraph::cli::cmd_describe(describe_opts));
  });

  agentgraph::cli::RunOptions run_opts;
  run_opts.config_file = env_config;
  auto *run = app.add_subcommand("run", "Run the sample pipeline");
  run->footer("\nExit status: 0 on success, 1 when a task fails, 2 on a "
              "configuration or dependency error.");
  run->add_option("-c,--config", run_opts.config_file, "Config file")
      ->check(CLI::ExistingFile);
  run->add_option("--max-concurrent", run_opts.max_concurrent,
                  "Tasks launched per round (overrides config)");
  run->add_option("--log-level", run_opts.log_level,
                  "Log level override: trace|debug|info|warn|error")
      ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error"}));
  run->add_option("--fail-task", run_opts.fail_task,
                  "Inject a failure into this task");
  run->add_option("--fail-kind", run_opts.fail_kind,
                  "Kind of the injected failure (default: invalid_output)")
      ->check(CLI::IsMember({"generic", "token_limit", "timeout",
                             "invalid_output", "user_interrupt",
                             "configuration", "dependency"}));
  run->add_flag("--json", run_opts.json, "Output JSON");
  run->callback(
      [&run_opts]() { std::exit(agentgraph::cli::cmd_run(run_opts)); });

  CLI11_PARSE(app, argc, argv);
  return 0;
}
