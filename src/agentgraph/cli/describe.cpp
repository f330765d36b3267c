#include "agentgraph/cli/commands.hpp"
#include "agentgraph/cli/sample_pipeline.hpp"
#include "agentgraph/config/config.hpp"
#include "agentgraph/graph/graph_executor.hpp"

#include <print>

namespace agentgraph::cli {

auto cmd_describe(const DescribeOptions &opts) -> int {
  auto config = opts.config_file.empty()
                    ? ConfigLoader::load_defaults()
                    : ConfigLoader::load_from_file(opts.config_file);
  if (!config) {
    std::println(stderr, "Error: {}", config.error());
    return kExitFatal;
  }
  auto policy = RetryPolicy::create(config->retry);
  if (!policy) {
    std::println(stderr, "Error: {}", policy.error());
    return kExitFatal;
  }

  UsageTracker usage;
  TaskGraph graph;
  if (auto built = build_sample_pipeline(graph, *policy, usage, {}); !built) {
    std::println(stderr, "Error: {}", built.error());
    return kExitFatal;
  }
  if (auto valid = graph.validate(); !valid) {
    std::println(stderr, "Warning: {}", valid.error());
  }

  std::println("{}", GraphExecutor::describe(graph));
  return kExitOk;
}

} // namespace agentgraph::cli
