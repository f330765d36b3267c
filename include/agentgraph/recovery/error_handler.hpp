#pragma once

#include "agentgraph/core/error.hpp"
#include "agentgraph/util/enum.hpp"
#include "agentgraph/util/json.hpp"

#include <boost/describe/enum.hpp>

#include <array>
#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace agentgraph {

enum class FallbackStatus : std::uint8_t { Retrying, Error };
BOOST_DESCRIBE_ENUM(FallbackStatus, Retrying, Error)
AGENTGRAPH_DEFINE_ENUM_SERDE(FallbackStatus, FallbackStatus::Error)

enum class RecoveryAction : std::uint8_t {
  None,
  ReduceContext,
  BackoffRetry,
  SimplifyRequest,
};
BOOST_DESCRIBE_ENUM(RecoveryAction, None, ReduceContext, BackoffRetry,
                    SimplifyRequest)
AGENTGRAPH_DEFINE_ENUM_SERDE(RecoveryAction, RecoveryAction::None)

// Degraded outcome produced instead of propagating an error.
struct FallbackAction {
  FallbackStatus status{FallbackStatus::Error};
  RecoveryAction action{RecoveryAction::None};
  std::string message;

  [[nodiscard]] static auto retry(RecoveryAction action) -> FallbackAction {
    return {.status = FallbackStatus::Retrying, .action = action};
  }
  [[nodiscard]] static auto error(std::string message) -> FallbackAction {
    return {.status = FallbackStatus::Error, .message = std::move(message)};
  }

  // {"status": "retrying", "action": ...} or {"status": "error",
  // "message": ...}
  [[nodiscard]] auto to_json() const -> JsonValue;

  friend auto operator==(const FallbackAction &, const FallbackAction &)
      -> bool = default;
};

using HandlerFn = std::function<void(const TaskError &)>;
using FallbackFn = std::function<FallbackAction(const TaskError &)>;
using InterruptHook = std::function<void(const TaskError &)>;

// Registry of per-kind handlers and fallbacks. Dispatch tries the exact kind,
// then its parent (Generic), then the built-in generic behavior. Registration
// is expected to finish before handle()/fallback() are used concurrently.
class ErrorHandler {
public:
  ErrorHandler() : ErrorHandler(false) {}
  explicit ErrorHandler(bool verbose);

  auto register_handler(ErrorKind kind, HandlerFn handler) -> void;
  auto register_fallback(ErrorKind kind, FallbackFn fallback) -> void;

  // Replaces the default interrupt hook, which stops the logger and exits the
  // process with status 0.
  auto set_interrupt_hook(InterruptHook hook) -> void;

  auto set_verbose(bool verbose) noexcept -> void {
    verbose_.store(verbose, std::memory_order_relaxed);
  }
  [[nodiscard]] auto verbose() const noexcept -> bool {
    return verbose_.load(std::memory_order_relaxed);
  }

  auto handle(const TaskError &error) -> void;
  [[nodiscard]] auto fallback(const TaskError &error) const -> FallbackAction;

  [[nodiscard]] auto last_error() const -> std::optional<TaskError>;
  [[nodiscard]] auto handled_count() const noexcept -> std::uint64_t {
    return handled_.load(std::memory_order_relaxed);
  }

private:
  auto register_defaults() -> void;
  auto handle_generic(const TaskError &error) const -> void;
  auto notify_user(std::string_view text) const -> void;

  std::array<HandlerFn, kErrorKindCount> handlers_{};
  std::array<FallbackFn, kErrorKindCount> fallbacks_{};
  InterruptHook interrupt_hook_;
  std::atomic<bool> verbose_{false};
  std::atomic<std::uint64_t> handled_{0};

  mutable std::mutex last_error_mutex_;
  std::optional<TaskError> last_error_;
};

} // namespace agentgraph
