#pragma once

#include "agentgraph/core/error.hpp"
#include "agentgraph/graph/task_graph.hpp"
#include "agentgraph/recovery/retry_policy.hpp"
#include "agentgraph/recovery/usage_tracker.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace agentgraph::cli {

struct PipelineOptions {
  std::string topic{"dependency-aware task scheduling"};
  std::chrono::milliseconds latency{25};
  // Injected failure. Retryable kinds fail only the first attempt so the
  // retry path can recover; other kinds fail every attempt.
  std::optional<TaskId> fail_task;
  ErrorKind fail_kind{ErrorKind::InvalidOutput};
};

// research -> outline; research, outline -> draft; style;
// draft, style -> review. `policy` and `usage` must outlive every run of
// the graph.
[[nodiscard]] auto build_sample_pipeline(TaskGraph &graph,
                                         const RetryPolicy &policy,
                                         UsageTracker &usage,
                                         const PipelineOptions &opts)
    -> Result<void>;

} // namespace agentgraph::cli
