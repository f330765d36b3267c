#include "agentgraph/cli/sample_pipeline.hpp"

#include "agentgraph/core/coroutine.hpp"
#include "agentgraph/util/json.hpp"

#include <cctype>
#include <cstdint>
#include <format>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace agentgraph::cli {

namespace {

struct Stage {
  std::string id;
  std::string verb;
  std::vector<std::string> deps;
  bool takes_topic{false};
  std::vector<std::pair<std::string, std::string>> named;
};

// Whitespace-separated words stand in for model tokens.
auto count_tokens(std::string_view text) -> std::uint64_t {
  std::uint64_t count = 0;
  bool in_word = false;
  for (unsigned char ch : text) {
    const bool space = std::isspace(ch) != 0;
    if (!space && !in_word) {
      ++count;
    }
    in_word = !space;
  }
  return count;
}

auto compose_text(std::string_view verb, const Args &args,
                  const NamedInputs &named) -> std::string {
  std::string text{verb};
  for (const auto &arg : args) {
    text.push_back(' ');
    text.append(stringify(arg));
  }
  for (const auto &[key, value] : named) {
    text.append(std::format(" [{}]", key));
  }
  return text;
}

auto simulated_stage(const Stage &stage, const RetryPolicy &policy,
                     UsageTracker &usage, const PipelineOptions &opts)
    -> Operation {
  const bool inject = opts.fail_task && *opts.fail_task == stage.id;
  return make_operation(
      [&policy, &usage, id = stage.id, verb = stage.verb, inject,
       kind = opts.fail_kind, latency = opts.latency](
          const Args &args, const NamedInputs &named) -> task<Result<Value>> {
        int attempts = 0;
        co_return co_await policy.execute([&]() -> task<Result<Value>> {
          ++attempts;
          co_await async_sleep(latency);

          if (inject && (attempts == 1 || !policy.is_retryable(kind))) {
            usage.record_failure(kind);
            co_return fail(kind,
                           std::format("simulated failure in '{}' (attempt {})",
                                       id, attempts));
          }

          auto text = compose_text(verb, args, named);
          usage.record_request(count_tokens(text));
          co_return ok(
              Value{{"task", id},
                    {"attempt", static_cast<std::int64_t>(attempts)},
                    {"inputs", static_cast<std::int64_t>(named.size())},
                    {"text", std::move(text)}});
        });
      });
}

} // namespace

auto build_sample_pipeline(TaskGraph &graph, const RetryPolicy &policy,
                           UsageTracker &usage, const PipelineOptions &opts)
    -> Result<void> {
  const std::vector<Stage> stages = {
      {.id = "research", .verb = "Research notes on", .takes_topic = true},
      {.id = "outline", .verb = "Outline drawn from", .deps = {"research"}},
      {.id = "draft",
       .verb = "Draft combining",
       .deps = {"research", "outline"}},
      {.id = "style", .verb = "Style guide for", .takes_topic = true},
      {.id = "review",
       .verb = "Review of",
       .deps = {"draft", "style"},
       .named = {{"criteria", "clarity"}}},
  };

  for (const auto &stage : stages) {
    TaskSpec spec{.id = TaskId{stage.id},
                  .operation = simulated_stage(stage, policy, usage, opts)};
    for (const auto &dep : stage.deps) {
      spec.depends_on.emplace_back(dep);
    }
    if (stage.takes_topic) {
      spec.args.push_back(Value(opts.topic));
    }
    for (const auto &[key, value] : stage.named) {
      spec.named_inputs.insert_or_assign(key, Value(value));
    }
    if (auto added = graph.add_task(std::move(spec)); !added) {
      return fail(added.error());
    }
  }
  return ok();
}

} // namespace agentgraph::cli
