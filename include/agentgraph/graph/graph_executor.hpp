#pragma once

#include "agentgraph/core/coroutine.hpp"
#include "agentgraph/core/error.hpp"
#include "agentgraph/graph/task_graph.hpp"

#include <boost/asio/any_io_executor.hpp>

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace agentgraph {

using ResultStore = std::map<TaskId, Value>;

struct RunStats {
  std::size_t rounds{0};
  std::size_t launched{0};
  std::size_t peak_batch{0};
  std::chrono::milliseconds elapsed{0};
};

// Drives a TaskGraph round by round: every round launches up to
// `max_concurrent` ready tasks concurrently and joins them before the next
// readiness computation. The first failed task (in launch order) aborts the
// run once its round has joined.
class GraphExecutor {
public:
  GraphExecutor() = default;
  explicit GraphExecutor(boost::asio::any_io_executor executor)
      : executor_(std::move(executor)) {}

  [[nodiscard]] auto run(TaskGraph &graph, int max_concurrent)
      -> task<Result<ResultStore>>;

  [[nodiscard]] static auto describe(const TaskGraph &graph) -> std::string {
    return graph.describe();
  }

  [[nodiscard]] auto last_stats() const noexcept -> const RunStats & {
    return stats_;
  }

private:
  [[nodiscard]] auto execute_rounds(TaskGraph &graph,
                                    std::size_t max_concurrent)
      -> task<Result<ResultStore>>;

  std::optional<boost::asio::any_io_executor> executor_;
  RunStats stats_;
};

} // namespace agentgraph
