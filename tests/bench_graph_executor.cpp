// bench_graph_executor.cpp

#include "agentgraph/graph/graph_executor.hpp"
#include "agentgraph/util/log.hpp"

#include <benchmark/benchmark.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

#include <cstdint>
#include <format>
#include <string>
#include <utility>
#include <vector>

namespace agentgraph {
namespace {

template <typename T>
[[nodiscard]] auto run_on_io(boost::asio::io_context &io, task<T> t) -> T {
  auto fut = boost::asio::co_spawn(io, std::move(t), boost::asio::use_future);
  io.run();
  io.restart();
  return fut.get();
}

[[nodiscard]] auto noop() -> Operation {
  return make_operation([](const Args &, const NamedInputs &) -> Result<Value> {
    return Value(std::int64_t{1});
  });
}

auto make_flat_graph(TaskGraph &graph, std::size_t nodes) -> Result<void> {
  for (std::size_t i = 0; i < nodes; ++i) {
    if (auto added = graph.add_task(std::format("t_{}", i), noop()); !added) {
      return fail(std::move(added.error()));
    }
  }
  return ok();
}

auto make_linear_graph(TaskGraph &graph, std::size_t nodes) -> Result<void> {
  for (std::size_t i = 0; i < nodes; ++i) {
    std::vector<TaskId> deps;
    if (i > 0) {
      deps.emplace_back(std::format("t_{}", i - 1));
    }
    if (auto added =
            graph.add_task(std::format("t_{}", i), noop(), std::move(deps));
        !added) {
      return fail(std::move(added.error()));
    }
  }
  return ok();
}

// Every node in layer k depends on every node in layer k-1.
auto make_layered_graph(TaskGraph &graph, std::size_t width,
                        std::size_t depth) -> Result<void> {
  for (std::size_t layer = 0; layer < depth; ++layer) {
    for (std::size_t i = 0; i < width; ++i) {
      std::vector<TaskId> deps;
      if (layer > 0) {
        for (std::size_t j = 0; j < width; ++j) {
          deps.emplace_back(std::format("l{}_{}", layer - 1, j));
        }
      }
      if (auto added = graph.add_task(std::format("l{}_{}", layer, i), noop(),
                                      std::move(deps));
          !added) {
        return fail(std::move(added.error()));
      }
    }
  }
  return ok();
}

auto skip_on_error(benchmark::State &state, const Result<void> &built)
    -> bool {
  if (!built) {
    state.SkipWithError(built.error().describe().c_str());
    return true;
  }
  return false;
}

void BM_RunFlat(benchmark::State &state) {
  log::set_level(log::Level::Error);
  TaskGraph graph;
  if (skip_on_error(state, make_flat_graph(
                              graph, static_cast<std::size_t>(state.range(0))))) {
    return;
  }
  GraphExecutor executor;
  boost::asio::io_context io;
  for (auto _ : state) {
    auto result = run_on_io(io, executor.run(graph, 16));
    if (!result) {
      state.SkipWithError(result.error().describe().c_str());
      break;
    }
    benchmark::DoNotOptimize(result);
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_RunFlat)->Arg(10)->Arg(100)->Arg(1000);

void BM_RunLinear(benchmark::State &state) {
  log::set_level(log::Level::Error);
  TaskGraph graph;
  if (skip_on_error(state, make_linear_graph(
                              graph, static_cast<std::size_t>(state.range(0))))) {
    return;
  }
  GraphExecutor executor;
  boost::asio::io_context io;
  for (auto _ : state) {
    auto result = run_on_io(io, executor.run(graph, 4));
    if (!result) {
      state.SkipWithError(result.error().describe().c_str());
      break;
    }
    benchmark::DoNotOptimize(result);
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_RunLinear)->Arg(10)->Arg(100)->Arg(500);

void BM_RunLayered(benchmark::State &state) {
  log::set_level(log::Level::Error);
  const auto width = static_cast<std::size_t>(state.range(0));
  TaskGraph graph;
  if (skip_on_error(state, make_layered_graph(graph, width, 10))) {
    return;
  }
  GraphExecutor executor;
  boost::asio::io_context io;
  for (auto _ : state) {
    auto result = run_on_io(io, executor.run(graph, 8));
    if (!result) {
      state.SkipWithError(result.error().describe().c_str());
      break;
    }
    benchmark::DoNotOptimize(result);
  }
  state.SetItemsProcessed(state.iterations() *
                          static_cast<std::int64_t>(width * 10));
}
BENCHMARK(BM_RunLayered)->Arg(4)->Arg(16)->Arg(64);

void BM_Validate(benchmark::State &state) {
  TaskGraph graph;
  if (skip_on_error(state,
                    make_layered_graph(
                        graph, static_cast<std::size_t>(state.range(0)), 20))) {
    return;
  }
  for (auto _ : state) {
    auto valid = graph.validate();
    benchmark::DoNotOptimize(valid);
  }
}
BENCHMARK(BM_Validate)->Arg(8)->Arg(32);

void BM_Describe(benchmark::State &state) {
  TaskGraph graph;
  if (skip_on_error(state, make_linear_graph(
                              graph, static_cast<std::size_t>(state.range(0))))) {
    return;
  }
  for (auto _ : state) {
    auto text = graph.describe();
    benchmark::DoNotOptimize(text);
  }
}
BENCHMARK(BM_Describe)->Arg(100)->Arg(1000);

} // namespace
} // namespace agentgraph

BENCHMARK_MAIN();
