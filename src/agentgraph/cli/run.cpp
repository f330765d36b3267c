#include "agentgraph/cli/commands.hpp"
#include "agentgraph/cli/sample_pipeline.hpp"
#include "agentgraph/config/config.hpp"
#include "agentgraph/graph/graph_executor.hpp"
#include "agentgraph/recovery/error_handler.hpp"
#include "agentgraph/recovery/retry_policy.hpp"
#include "agentgraph/recovery/usage_tracker.hpp"
#include "agentgraph/util/json.hpp"
#include "agentgraph/util/log.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/use_future.hpp>

#include <csignal>
#include <cstdint>
#include <format>
#include <print>
#include <string>
#include <variant>

namespace agentgraph::cli {

namespace {

auto load_config(const std::string &path) -> Result<SystemConfig> {
  return path.empty() ? ConfigLoader::load_defaults()
                      : ConfigLoader::load_from_file(path);
}

auto exit_code_for(const TaskError &error) -> int {
  return is_fatal(error.kind()) ? kExitFatal : kExitTaskFailed;
}

auto print_results(const TaskGraph &graph, const ResultStore &store,
                   const UsageTracker &usage, const RunStats &stats) -> void {
  for (const auto &t : graph.tasks()) {
    const auto &value = store.at(t.id);
    const auto *fields = std::get_if<JsonValue::object_t>(&value.data);
    std::string shown = stringify(value);
    if (fields != nullptr) {
      if (auto it = fields->find("text"); it != fields->end()) {
        shown = stringify(it->second);
      }
    }
    std::println("{}: {} ({} ms)", t.id, shown, t.elapsed().count());
  }
  const auto snap = usage.snapshot();
  std::println("\n{} task(s) in {} round(s), {} ms; {} request(s), {} "
               "token(s), {} failed attempt(s)",
               stats.launched, stats.rounds, stats.elapsed.count(),
               snap.requests, snap.total_tokens, snap.total_failures());
}

auto print_results_json(const TaskGraph &graph, const ResultStore &store,
                        const UsageTracker &usage, const RunStats &stats)
    -> void {
  JsonValue results = JsonValue::object_t{};
  JsonValue timings = JsonValue::object_t{};
  for (const auto &t : graph.tasks()) {
    results[t.id.str()] = store.at(t.id);
    timings[t.id.str()] = static_cast<std::int64_t>(t.elapsed().count());
  }
  JsonValue out{
      {"status", "completed"},
      {"results", std::move(results)},
      {"elapsed_ms", std::move(timings)},
      {"usage", usage.to_json()},
      {"stats",
       JsonValue{
           {"rounds", static_cast<std::int64_t>(stats.rounds)},
           {"launched", static_cast<std::int64_t>(stats.launched)},
           {"peak_batch", static_cast<std::int64_t>(stats.peak_batch)},
           {"elapsed_ms", static_cast<std::int64_t>(stats.elapsed.count())},
       }},
  };
  std::println("{}", dump_json(out));
}

auto report_failure(const TaskError &error, ErrorHandler &handler,
                    const UsageTracker &usage, bool json) -> void {
  handler.handle(error);
  const auto action = handler.fallback(error);

  if (json) {
    JsonValue out{
        {"status", "failed"},
        {"error",
         JsonValue{{"kind", std::string(to_string_view(error.kind()))},
                   {"severity", std::string(to_string_view(error.severity()))},
                   {"message", error.message()}}},
        {"fallback", action.to_json()},
        {"usage", usage.to_json()},
    };
    std::println("{}", dump_json(out));
    return;
  }

  if (is_fatal(error.kind())) {
    std::println(stderr, "Error: pipeline is misconfigured: {}", error);
  } else {
    std::println(stderr, "Error: task failed: {}", error);
  }
  std::println(stderr, "Suggested recovery: {}", dump_json(action.to_json()));
}

} // namespace

auto cmd_run(const RunOptions &opts) -> int {
  auto config = load_config(opts.config_file);
  if (!config) {
    std::println(stderr, "Error: {}", config.error());
    return kExitFatal;
  }
  auto &cfg = *config;
  if (opts.max_concurrent) {
    cfg.executor.max_concurrent = *opts.max_concurrent;
  }
  if (opts.log_level) {
    cfg.log.level = *opts.log_level;
  }

  log::set_level(cfg.log.level);
  if (!cfg.log.file.empty() && !log::set_output_file(cfg.log.file)) {
    std::println(stderr, "Error: cannot open log file '{}'", cfg.log.file);
    return kExitFatal;
  }
  log::start();

  ErrorKind fail_kind{};
  if (!util::try_parse_enum(opts.fail_kind, fail_kind)) {
    std::println(stderr, "Error: unknown error kind '{}'", opts.fail_kind);
    log::stop();
    return kExitFatal;
  }

  auto policy = RetryPolicy::create(cfg.retry);
  if (!policy) {
    std::println(stderr, "Error: {}", policy.error());
    log::stop();
    return kExitFatal;
  }

  ErrorHandler handler(cfg.log.verbose);
  UsageTracker usage;
  TaskGraph graph;
  PipelineOptions pipeline_opts;
  if (opts.fail_task) {
    pipeline_opts.fail_task = TaskId{*opts.fail_task};
  }
  pipeline_opts.fail_kind = fail_kind;

  if (auto built = build_sample_pipeline(graph, *policy, usage, pipeline_opts);
      !built) {
    report_failure(built.error(), handler, usage, opts.json);
    log::stop();
    return exit_code_for(built.error());
  }

  boost::asio::io_context io;
  boost::asio::signal_set signals(io, SIGINT, SIGTERM);
  signals.async_wait([&handler](boost::system::error_code ec, int signo) {
    if (!ec) {
      handler.handle(TaskError{ErrorKind::UserInterrupt,
                               std::format("received signal {}", signo)});
    }
  });

  GraphExecutor executor;
  const int max_concurrent = cfg.executor.max_concurrent;
  auto fut = boost::asio::co_spawn(
      io,
      [&]() -> task<Result<ResultStore>> {
        auto result = co_await executor.run(graph, max_concurrent);
        signals.cancel();
        co_return result;
      },
      boost::asio::use_future);
  io.run();
  auto result = fut.get();

  int code = kExitOk;
  if (!result) {
    report_failure(result.error(), handler, usage, opts.json);
    code = exit_code_for(result.error());
  } else if (opts.json) {
    print_results_json(graph, *result, usage, executor.last_stats());
  } else {
    print_results(graph, *result, usage, executor.last_stats());
  }

  log::stop();
  return code;
}

} // namespace agentgraph::cli
