#pragma once

#include "agentgraph/core/coroutine.hpp"
#include "agentgraph/core/error.hpp"
#include "agentgraph/util/enum.hpp"
#include "agentgraph/util/id.hpp"
#include "agentgraph/util/json.hpp"

#include <boost/describe/enum.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <format>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace agentgraph {

enum class TaskState : std::uint8_t { Pending, Running, Completed, Failed };
BOOST_DESCRIBE_ENUM(TaskState, Pending, Running, Completed, Failed)
AGENTGRAPH_DEFINE_ENUM_SERDE(TaskState, TaskState::Pending)

[[nodiscard]] constexpr auto is_terminal(TaskState state) noexcept -> bool {
  return state == TaskState::Completed || state == TaskState::Failed;
}

using Value = JsonValue;
using Args = std::vector<Value>;
using NamedInputs = std::map<std::string, Value, std::less<>>;

// The arguments are borrowed for the lifetime of the returned coroutine.
using Operation = std::move_only_function<task<Result<Value>>(
    const Args &, const NamedInputs &)>;

// Accepts either a coroutine returning task<Result<Value>> or a plain
// callable returning Result<Value> (or anything convertible to it).
template <typename F> [[nodiscard]] auto make_operation(F fn) -> Operation {
  using R = std::invoke_result_t<F &, const Args &, const NamedInputs &>;
  if constexpr (is_task_v<R>) {
    return Operation{std::move(fn)};
  } else {
    return Operation{
        [fn = std::move(fn)](const Args &args, const NamedInputs &named) mutable
            -> task<Result<Value>> { co_return Result<Value>{fn(args, named)}; }};
  }
}

[[nodiscard]] inline auto result_key(const TaskId &dep) -> std::string {
  return std::format("{}_result", dep.value());
}

struct TaskSpec {
  struct Builder;
  static auto builder() -> Builder;

  TaskId id;
  std::vector<TaskId> depends_on;
  Operation operation;
  Args args;
  NamedInputs named_inputs;
};

struct TaskSpec::Builder {
  TaskSpec spec_;

  auto id(std::string id_str) -> Builder && {
    spec_.id = TaskId{std::move(id_str)};
    return std::move(*this);
  }

  auto depends_on(std::string dep_id) -> Builder && {
    spec_.depends_on.emplace_back(std::move(dep_id));
    return std::move(*this);
  }

  template <typename F> auto operation(F fn) -> Builder && {
    spec_.operation = make_operation(std::move(fn));
    return std::move(*this);
  }

  auto arg(Value value) -> Builder && {
    spec_.args.push_back(std::move(value));
    return std::move(*this);
  }

  auto named_input(std::string key, Value value) -> Builder && {
    spec_.named_inputs.insert_or_assign(std::move(key), std::move(value));
    return std::move(*this);
  }

  [[nodiscard]] auto build() && -> Result<TaskSpec> {
    if (!is_valid_id_text(spec_.id.value())) {
      return fail(ErrorKind::Configuration,
                  "task id must be non-empty without control characters");
    }
    if (!spec_.operation) {
      return fail(ErrorKind::Configuration,
                  std::format("task '{}' has no operation", spec_.id));
    }
    return ok(std::move(spec_));
  }
};

inline auto TaskSpec::builder() -> Builder { return Builder{}; }

struct Task {
  using Clock = std::chrono::steady_clock;

  TaskId id;
  std::vector<TaskId> depends_on;
  Operation operation;
  Args args;
  NamedInputs named_inputs;

  TaskState state{TaskState::Pending};
  std::optional<Value> result;
  std::optional<TaskError> error;
  Clock::time_point started_at{};
  Clock::time_point finished_at{};

  [[nodiscard]] auto depends_on_task(const TaskId &other) const -> bool {
    return std::ranges::find(depends_on, other) != depends_on.end();
  }

  [[nodiscard]] auto elapsed() const -> std::chrono::milliseconds {
    if (!is_terminal(state)) {
      return std::chrono::milliseconds{0};
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(finished_at -
                                                                 started_at);
  }
};

} // namespace agentgraph
