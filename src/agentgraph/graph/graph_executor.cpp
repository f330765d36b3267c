#include "agentgraph/graph/graph_executor.hpp"

#include "agentgraph/util/log.hpp"

#include <boost/asio/experimental/parallel_group.hpp>
#include <boost/asio/this_coro.hpp>

#include <algorithm>
#include <format>
#include <ranges>
#include <string>
#include <utility>
#include <vector>

namespace agentgraph {

namespace {

// Exceptions escaping the operation surface through co_spawn's
// exception_ptr and are converted after the join.
auto invoke_task(Task &t, NamedInputs inputs) -> task<Result<Value>> {
  co_return co_await t.operation(t.args, inputs);
}

auto join_ids(const TaskGraph &graph, const std::vector<bool> &done)
    -> std::string {
  std::string out;
  for (auto [i, t] : std::views::enumerate(graph.tasks())) {
    if (done[static_cast<std::size_t>(i)]) {
      continue;
    }
    if (!out.empty()) {
      out.append(", ");
    }
    out.append(t.id.value());
  }
  return out;
}

} // namespace

auto GraphExecutor::run(TaskGraph &graph, int max_concurrent)
    -> task<Result<ResultStore>> {
  stats_ = {};
  if (max_concurrent < 1) {
    co_return fail(ErrorKind::Configuration,
                   std::format("max_concurrent must be at least 1, got {}",
                               max_concurrent));
  }

  auto guard = graph.begin_run();
  if (!guard) {
    co_return fail(std::move(guard.error()));
  }
  graph.reset_run_state();

  const auto started = std::chrono::steady_clock::now();
  auto result =
      co_await execute_rounds(graph, static_cast<std::size_t>(max_concurrent));
  stats_.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);

  log::debug("Run finished: {} round(s), {} task(s) launched, peak batch {}",
             stats_.rounds, stats_.launched, stats_.peak_batch);
  co_return result;
}

auto GraphExecutor::execute_rounds(TaskGraph &graph,
                                   std::size_t max_concurrent)
    -> task<Result<ResultStore>> {
  namespace exp = boost::asio::experimental;

  for (const auto &t : graph.tasks()) {
    for (const auto &dep : t.depends_on) {
      if (!graph.has_task(dep)) {
        log::error("Task {} depends on undeclared task {}", t.id, dep);
        co_return fail(ErrorKind::Configuration,
                       std::format("task '{}' depends on unknown task '{}'",
                                   t.id, dep));
      }
    }
  }

  boost::asio::any_io_executor ex;
  if (executor_) {
    ex = *executor_;
  } else {
    ex = co_await boost::asio::this_coro::executor;
  }

  const auto total = graph.size();
  ResultStore store;
  std::vector<bool> done(total, false);
  std::size_t completed = 0;

  while (completed < total) {
    std::vector<TaskIndex> batch;
    for (TaskIndex idx = 0; idx < total && batch.size() < max_concurrent;
         ++idx) {
      if (done[idx]) {
        continue;
      }
      const auto &deps = graph.tasks()[idx].depends_on;
      if (std::ranges::all_of(deps, [&](const TaskId &dep) {
            return done[graph.get_index(dep)];
          })) {
        batch.push_back(idx);
      }
    }

    if (batch.empty()) {
      auto stuck = join_ids(graph, done);
      log::error("Deadlock detected in dependency graph: {}", stuck);
      co_return fail(TaskError{
          ErrorKind::Dependency, Severity::Critical,
          std::format("Deadlock detected in dependency graph; {} task(s) "
                      "cannot run: {}",
                      total - completed, stuck)});
    }

    ++stats_.rounds;
    stats_.launched += batch.size();
    stats_.peak_batch = std::max(stats_.peak_batch, batch.size());

    using SpawnOp = decltype(co_spawn(ex, std::declval<task<Result<Value>>>(),
                                      deferred));
    std::vector<SpawnOp> ops;
    ops.reserve(batch.size());

    for (auto idx : batch) {
      auto &t = graph.task_at(idx);
      if (auto started = graph.mark_running(idx); !started) {
        co_return fail(std::move(started.error()));
      }

      NamedInputs inputs = t.named_inputs;
      for (const auto &dep : t.depends_on) {
        inputs.try_emplace(result_key(dep), store.at(dep));
      }

      log::info("Executing task: {}", t.id);
      ops.push_back(co_spawn(ex, invoke_task(t, std::move(inputs)), deferred));
    }

    auto [order, exceptions, outcomes] =
        co_await exp::make_parallel_group(std::move(ops))
            .async_wait(exp::wait_for_all(), use_awaitable);

    std::optional<TaskError> first_failure;
    for (auto [pos, idx] : std::views::enumerate(batch)) {
      const auto i = static_cast<std::size_t>(pos);
      auto &t = graph.task_at(idx);

      Result<Value> outcome = std::move(outcomes[i]);
      if (exceptions[i]) {
        outcome = fail(error_from_exception(exceptions[i]));
      }

      if (outcome) {
        store.emplace(t.id, *outcome);
        if (auto r = graph.mark_completed(idx, std::move(*outcome)); !r) {
          co_return fail(std::move(r.error()));
        }
        done[idx] = true;
        ++completed;
        log::info("Task completed: {}", t.id);
        continue;
      }

      log::error("Error executing task {}: {}", t.id, outcome.error());
      if (!first_failure) {
        first_failure = outcome.error();
      }
      if (auto r = graph.mark_failed(idx, std::move(outcome.error())); !r) {
        co_return fail(std::move(r.error()));
      }
    }

    if (first_failure) {
      co_return fail(std::move(*first_failure));
    }
  }

  co_return ok(std::move(store));
}

} // namespace agentgraph
