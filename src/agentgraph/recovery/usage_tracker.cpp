#include "agentgraph/recovery/usage_tracker.hpp"

#include <numeric>
#include <string>

namespace agentgraph {

auto UsageSnapshot::total_failures() const noexcept -> std::uint64_t {
  return std::accumulate(failures.begin(), failures.end(), std::uint64_t{0});
}

auto UsageTracker::snapshot() const noexcept -> UsageSnapshot {
  UsageSnapshot out;
  out.requests = requests_.load(std::memory_order_relaxed);
  out.total_tokens = tokens_.load(std::memory_order_relaxed);
  for (std::size_t i = 0; i < failures_.size(); ++i) {
    out.failures[i] = failures_[i].load(std::memory_order_relaxed);
  }
  return out;
}

auto UsageTracker::to_json() const -> JsonValue {
  const auto snap = snapshot();

  JsonValue failures = JsonValue::object_t{};
  for (std::size_t i = 0; i < snap.failures.size(); ++i) {
    if (snap.failures[i] == 0) {
      continue;
    }
    const auto kind = static_cast<ErrorKind>(i);
    failures[std::string(to_string_view(kind))] =
        static_cast<std::int64_t>(snap.failures[i]);
  }

  return JsonValue{
      {"requests", static_cast<std::int64_t>(snap.requests)},
      {"total_tokens", static_cast<std::int64_t>(snap.total_tokens)},
      {"failures", std::move(failures)},
  };
}

auto UsageTracker::reset() noexcept -> void {
  requests_.store(0, std::memory_order_relaxed);
  tokens_.store(0, std::memory_order_relaxed);
  for (auto &counter : failures_) {
    counter.store(0, std::memory_order_relaxed);
  }
}

} // namespace agentgraph
