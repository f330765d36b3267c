#include "agentgraph/graph/task_graph.hpp"

#include <algorithm>
#include <format>
#include <ranges>
#include <utility>
#include <vector>

namespace agentgraph {

namespace {

auto collapse_duplicates(std::vector<TaskId> &deps) -> void {
  std::vector<TaskId> unique;
  unique.reserve(deps.size());
  for (auto &dep : deps) {
    if (std::ranges::find(unique, dep) == unique.end()) {
      unique.push_back(std::move(dep));
    }
  }
  deps = std::move(unique);
}

} // namespace

auto TaskGraph::add_task(TaskSpec spec) -> Result<TaskIndex> {
  if (is_running()) [[unlikely]] {
    return fail(ErrorKind::Configuration,
                "cannot add tasks while the graph is running");
  }
  if (!is_valid_id_text(spec.id.value())) {
    return fail(ErrorKind::Configuration,
                "task id must be non-empty without control characters");
  }
  if (id_to_idx_.contains(spec.id)) {
    return fail(ErrorKind::Configuration,
                std::format("duplicate task id '{}'", spec.id));
  }
  if (!spec.operation) {
    return fail(ErrorKind::Configuration,
                std::format("task '{}' has no operation", spec.id));
  }
  collapse_duplicates(spec.depends_on);
  for (const auto &dep : spec.depends_on) {
    if (dep == spec.id) {
      return fail(ErrorKind::Dependency,
                  std::format("task '{}' depends on itself", spec.id));
    }
    if (!is_valid_id_text(dep.value())) {
      return fail(ErrorKind::Configuration,
                  std::format("task '{}' has an invalid dependency id",
                              spec.id));
    }
  }
  if (tasks_.size() >= kInvalidTask) [[unlikely]] {
    return fail(ErrorKind::Configuration, "too many tasks");
  }

  auto idx = static_cast<TaskIndex>(tasks_.size());
  id_to_idx_.emplace(spec.id, idx);
  tasks_.push_back(Task{.id = std::move(spec.id),
                        .depends_on = std::move(spec.depends_on),
                        .operation = std::move(spec.operation),
                        .args = std::move(spec.args),
                        .named_inputs = std::move(spec.named_inputs)});
  return ok(idx);
}

auto TaskGraph::add_task(std::string_view id, Operation operation,
                         std::vector<TaskId> depends_on, Args args,
                         NamedInputs named_inputs) -> Result<TaskIndex> {
  return add_task(TaskSpec{.id = TaskId{id},
                           .depends_on = std::move(depends_on),
                           .operation = std::move(operation),
                           .args = std::move(args),
                           .named_inputs = std::move(named_inputs)});
}

auto TaskGraph::add_dependency(const TaskId &task, const TaskId &dependency)
    -> Result<void> {
  if (is_running()) [[unlikely]] {
    return fail(ErrorKind::Configuration,
                "cannot add dependencies while the graph is running");
  }
  auto idx = get_index(task);
  if (idx == kInvalidTask) {
    return fail(ErrorKind::Configuration,
                std::format("unknown task '{}'", task));
  }
  if (task == dependency) {
    return fail(ErrorKind::Dependency,
                std::format("task '{}' depends on itself", task));
  }
  if (!is_valid_id_text(dependency.value())) {
    return fail(ErrorKind::Configuration,
                std::format("task '{}' has an invalid dependency id", task));
  }
  auto &deps = tasks_[idx].depends_on;
  if (std::ranges::find(deps, dependency) == deps.end()) {
    deps.push_back(dependency);
  }
  return ok();
}

auto TaskGraph::has_task(const TaskId &id) const -> bool {
  return id_to_idx_.contains(id);
}

auto TaskGraph::get_index(const TaskId &id) const -> TaskIndex {
  auto it = id_to_idx_.find(id);
  return it != id_to_idx_.end() ? it->second : kInvalidTask;
}

auto TaskGraph::find(const TaskId &id) const -> const Task * {
  auto idx = get_index(id);
  return idx == kInvalidTask ? nullptr : &tasks_[idx];
}

auto TaskGraph::ids() const -> std::vector<TaskId> {
  std::vector<TaskId> out;
  out.reserve(tasks_.size());
  for (const auto &t : tasks_) {
    out.push_back(t.id);
  }
  return out;
}

auto TaskGraph::roots() const -> std::vector<TaskId> {
  std::vector<TaskId> out;
  for (const auto &t : tasks_) {
    if (t.depends_on.empty()) {
      out.push_back(t.id);
    }
  }
  return out;
}

auto TaskGraph::consumers(const TaskId &id) const -> std::vector<TaskId> {
  std::vector<TaskId> out;
  for (const auto &t : tasks_) {
    if (t.depends_on_task(id)) {
      out.push_back(t.id);
    }
  }
  return out;
}

auto TaskGraph::consumer_index() const -> std::vector<std::vector<TaskIndex>> {
  std::vector<std::vector<TaskIndex>> out(tasks_.size());
  for (auto [i, t] : std::views::enumerate(tasks_)) {
    for (const auto &dep : t.depends_on) {
      if (auto dep_idx = get_index(dep); dep_idx != kInvalidTask) {
        out[dep_idx].push_back(static_cast<TaskIndex>(i));
      }
    }
  }
  return out;
}

auto TaskGraph::validate() const -> Result<void> {
  for (const auto &t : tasks_) {
    for (const auto &dep : t.depends_on) {
      if (!has_task(dep)) {
        return fail(ErrorKind::Configuration,
                    std::format("task '{}' depends on unknown task '{}'", t.id,
                                dep));
      }
    }
  }

  // 0 = unvisited, 1 = on the DFS path, 2 = done.
  std::vector<std::uint8_t> state(tasks_.size(), 0);
  std::vector<std::pair<TaskIndex, std::size_t>> stack;
  stack.reserve(tasks_.size());

  for (TaskIndex start :
       std::views::iota(TaskIndex{0}, static_cast<TaskIndex>(tasks_.size()))) {
    if (state[start] != 0) {
      continue;
    }
    stack.emplace_back(start, 0);
    state[start] = 1;

    while (!stack.empty()) {
      auto &[node, dep_pos] = stack.back();
      const auto &deps = tasks_[node].depends_on;

      if (dep_pos < deps.size()) {
        TaskIndex next = get_index(deps[dep_pos++]);
        if (state[next] == 1) {
          return fail(ErrorKind::Dependency,
                      std::format("dependency cycle through '{}'",
                                  tasks_[next].id));
        }
        if (state[next] == 0) {
          state[next] = 1;
          stack.emplace_back(next, 0);
        }
      } else {
        state[node] = 2;
        stack.pop_back();
      }
    }
  }
  return ok();
}

auto TaskGraph::describe() const -> std::string {
  std::string out = "Dependency Graph:";
  const auto consumers_of = consumer_index();
  std::vector<bool> visited(tasks_.size(), false);
  std::vector<std::pair<TaskIndex, std::size_t>> stack;

  for (TaskIndex root = 0; root < tasks_.size(); ++root) {
    if (!tasks_[root].depends_on.empty()) {
      continue;
    }
    stack.emplace_back(root, 0);
    while (!stack.empty()) {
      auto [node, depth] = stack.back();
      stack.pop_back();
      if (visited[node]) {
        continue;
      }
      visited[node] = true;

      out.push_back('\n');
      out.append(depth * 2, ' ');
      out.append("└─ ");
      out.append(tasks_[node].id.value());

      // Reverse push keeps consumers in declaration order.
      for (auto child : consumers_of[node] | std::views::reverse) {
        stack.emplace_back(child, depth + 1);
      }
    }
  }
  return out;
}

auto TaskGraph::clear() -> Result<void> {
  if (is_running()) [[unlikely]] {
    return fail(ErrorKind::Configuration,
                "cannot clear the graph while it is running");
  }
  tasks_.clear();
  id_to_idx_.clear();
  return ok();
}

auto TaskGraph::begin_run() -> Result<RunGuard> {
  if (running_.exchange(true, std::memory_order_acq_rel)) {
    return fail(ErrorKind::Configuration, "graph is already running");
  }
  return Result<RunGuard>{std::in_place, *this};
}

auto TaskGraph::reset_run_state() -> void {
  for (auto &t : tasks_) {
    t.state = TaskState::Pending;
    t.result.reset();
    t.error.reset();
    t.started_at = {};
    t.finished_at = {};
  }
}

auto TaskGraph::mark_running(TaskIndex idx) -> Result<void> {
  auto &t = tasks_[idx];
  if (t.state != TaskState::Pending) {
    return fail(ErrorKind::Generic,
                std::format("task '{}' cannot start from state {}", t.id,
                            to_string_view(t.state)));
  }
  t.state = TaskState::Running;
  t.started_at = Task::Clock::now();
  return ok();
}

auto TaskGraph::mark_completed(TaskIndex idx, Value value) -> Result<void> {
  auto &t = tasks_[idx];
  if (t.state != TaskState::Running) {
    return fail(ErrorKind::Generic,
                std::format("task '{}' cannot complete from state {}", t.id,
                            to_string_view(t.state)));
  }
  t.state = TaskState::Completed;
  t.result = std::move(value);
  t.finished_at = Task::Clock::now();
  return ok();
}

auto TaskGraph::mark_failed(TaskIndex idx, TaskError error) -> Result<void> {
  auto &t = tasks_[idx];
  if (t.state != TaskState::Running) {
    return fail(ErrorKind::Generic,
                std::format("task '{}' cannot fail from state {}", t.id,
                            to_string_view(t.state)));
  }
  t.state = TaskState::Failed;
  t.error = std::move(error);
  t.finished_at = Task::Clock::now();
  return ok();
}

} // namespace agentgraph
