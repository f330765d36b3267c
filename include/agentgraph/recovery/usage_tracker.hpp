#pragma once

#include "agentgraph/core/error.hpp"
#include "agentgraph/util/json.hpp"

#include <array>
#include <atomic>
#include <cstdint>

namespace agentgraph {

struct UsageSnapshot {
  std::uint64_t requests{0};
  std::uint64_t total_tokens{0};
  std::array<std::uint64_t, kErrorKindCount> failures{};

  [[nodiscard]] auto failures_of(ErrorKind kind) const -> std::uint64_t {
    return failures.at(util::enum_to_code(kind));
  }
  [[nodiscard]] auto total_failures() const noexcept -> std::uint64_t;
};

// Request and token accounting for the component that issues operations.
// The owner decides its lifetime (one per run in the CLI). Counters are safe
// to bump from concurrently running tasks.
class UsageTracker {
public:
  auto record_request(std::uint64_t tokens = 0) noexcept -> void {
    requests_.fetch_add(1, std::memory_order_relaxed);
    tokens_.fetch_add(tokens, std::memory_order_relaxed);
  }

  auto record_failure(ErrorKind kind) noexcept -> void {
    failures_[util::enum_to_code(kind)].fetch_add(1,
                                                  std::memory_order_relaxed);
  }

  [[nodiscard]] auto snapshot() const noexcept -> UsageSnapshot;
  [[nodiscard]] auto to_json() const -> JsonValue;
  auto reset() noexcept -> void;

private:
  std::atomic<std::uint64_t> requests_{0};
  std::atomic<std::uint64_t> tokens_{0};
  std::array<std::atomic<std::uint64_t>, kErrorKindCount> failures_{};
};

} // namespace agentgraph
