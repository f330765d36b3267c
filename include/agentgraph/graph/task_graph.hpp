#pragma once

#include "agentgraph/core/error.hpp"
#include "agentgraph/graph/task.hpp"
#include "agentgraph/util/id.hpp"

#include <ankerl/unordered_dense.h>

#include <atomic>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace agentgraph {

using TaskIndex = std::uint32_t;
constexpr TaskIndex kInvalidTask = UINT32_MAX;

class GraphExecutor;

// Declared tasks in insertion order. Dependencies are kept by id and may name
// tasks that are added later; they are resolved when the graph runs.
class TaskGraph {
public:
  [[nodiscard]] auto add_task(TaskSpec spec) -> Result<TaskIndex>;
  [[nodiscard]] auto add_task(std::string_view id, Operation operation,
                              std::vector<TaskId> depends_on = {},
                              Args args = {}, NamedInputs named_inputs = {})
      -> Result<TaskIndex>;

  // `task` waits for `dependency`; the dependency need not exist yet.
  [[nodiscard]] auto add_dependency(const TaskId &task,
                                    const TaskId &dependency) -> Result<void>;

  [[nodiscard]] auto has_task(const TaskId &id) const -> bool;
  [[nodiscard]] auto get_index(const TaskId &id) const -> TaskIndex;
  [[nodiscard]] auto find(const TaskId &id) const -> const Task *;
  [[nodiscard]] auto tasks() const noexcept -> std::span<const Task> {
    return tasks_;
  }
  [[nodiscard]] auto ids() const -> std::vector<TaskId>;

  [[nodiscard]] auto roots() const -> std::vector<TaskId>;
  [[nodiscard]] auto consumers(const TaskId &id) const -> std::vector<TaskId>;

  // Reports unknown dependency ids (Configuration) and cycles (Dependency)
  // without running anything.
  [[nodiscard]] auto validate() const -> Result<void>;

  // Forward (consumer) tree rooted at tasks without dependencies.
  [[nodiscard]] auto describe() const -> std::string;

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return tasks_.size();
  }
  [[nodiscard]] auto empty() const noexcept -> bool { return tasks_.empty(); }
  [[nodiscard]] auto is_running() const noexcept -> bool {
    return running_.load(std::memory_order_acquire);
  }
  auto clear() -> Result<void>;

private:
  friend class GraphExecutor;

  class RunGuard {
  public:
    explicit RunGuard(TaskGraph &graph) noexcept : graph_(&graph) {}
    RunGuard(RunGuard &&other) noexcept
        : graph_(std::exchange(other.graph_, nullptr)) {}
    RunGuard(const RunGuard &) = delete;
    RunGuard &operator=(const RunGuard &) = delete;
    RunGuard &operator=(RunGuard &&) = delete;
    ~RunGuard() {
      if (graph_ != nullptr) {
        graph_->running_.store(false, std::memory_order_release);
      }
    }

  private:
    TaskGraph *graph_;
  };

  [[nodiscard]] auto begin_run() -> Result<RunGuard>;
  auto reset_run_state() -> void;
  [[nodiscard]] auto mark_running(TaskIndex idx) -> Result<void>;
  [[nodiscard]] auto mark_completed(TaskIndex idx, Value value) -> Result<void>;
  [[nodiscard]] auto mark_failed(TaskIndex idx, TaskError error)
      -> Result<void>;
  [[nodiscard]] auto task_at(TaskIndex idx) -> Task & { return tasks_[idx]; }

  [[nodiscard]] auto consumer_index() const
      -> std::vector<std::vector<TaskIndex>>;

  std::vector<Task> tasks_;
  ankerl::unordered_dense::map<TaskId, TaskIndex> id_to_idx_;
  std::atomic<bool> running_{false};
};

} // namespace agentgraph
