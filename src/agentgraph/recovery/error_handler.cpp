#include "agentgraph/recovery/error_handler.hpp"

#include "agentgraph/util/log.hpp"

#include <cstdio>
#include <cstdlib>
#include <format>
#include <print>
#include <utility>

namespace agentgraph {

namespace {

[[nodiscard]] constexpr auto slot(ErrorKind kind) noexcept -> std::size_t {
  return static_cast<std::size_t>(util::enum_to_code(kind));
}

auto exit_on_interrupt(const TaskError &) -> void {
  log::stop();
  std::exit(0);
}

} // namespace

auto FallbackAction::to_json() const -> JsonValue {
  if (status == FallbackStatus::Error) {
    return JsonValue{{"status", std::string(to_string_view(status))},
                     {"message", message}};
  }
  return JsonValue{{"status", std::string(to_string_view(status))},
                   {"action", std::string(to_string_view(action))}};
}

ErrorHandler::ErrorHandler(bool verbose)
    : interrupt_hook_(exit_on_interrupt), verbose_(verbose) {
  register_defaults();
}

auto ErrorHandler::register_defaults() -> void {
  register_handler(ErrorKind::TokenLimit, [this](const TaskError &e) {
    log::warn("Token limit exceeded: {}", e.message());
    notify_user(std::format("Token limit exceeded: {}", e.message()));
  });
  register_handler(ErrorKind::Timeout, [this](const TaskError &e) {
    log::warn("Request timed out: {}", e.message());
    notify_user("Request timed out. Retrying with adjusted parameters...");
  });
  register_handler(ErrorKind::InvalidOutput, [this](const TaskError &e) {
    log::error("Invalid task output: {}", e.message());
    notify_user(std::format("Task produced invalid output: {}", e.message()));
  });
  register_handler(ErrorKind::UserInterrupt, [this](const TaskError &e) {
    log::info("User interrupted: {}", e.message());
    notify_user("Operation interrupted by user.");
    interrupt_hook_(e);
  });

  register_fallback(ErrorKind::TokenLimit, [](const TaskError &) {
    log::info("Using fallback for token limit error: reducing context");
    return FallbackAction::retry(RecoveryAction::ReduceContext);
  });
  register_fallback(ErrorKind::Timeout, [](const TaskError &) {
    log::info("Using fallback for timeout error: retrying with backoff");
    return FallbackAction::retry(RecoveryAction::BackoffRetry);
  });
  register_fallback(ErrorKind::InvalidOutput, [](const TaskError &) {
    log::info("Using fallback for invalid output: requesting simplified "
              "response");
    return FallbackAction::retry(RecoveryAction::SimplifyRequest);
  });
}

auto ErrorHandler::register_handler(ErrorKind kind, HandlerFn handler)
    -> void {
  handlers_.at(slot(kind)) = std::move(handler);
}

auto ErrorHandler::register_fallback(ErrorKind kind, FallbackFn fallback)
    -> void {
  fallbacks_.at(slot(kind)) = std::move(fallback);
}

auto ErrorHandler::set_interrupt_hook(InterruptHook hook) -> void {
  interrupt_hook_ = hook ? std::move(hook) : InterruptHook{exit_on_interrupt};
}

auto ErrorHandler::handle(const TaskError &error) -> void {
  {
    std::lock_guard lock(last_error_mutex_);
    last_error_ = error;
  }
  handled_.fetch_add(1, std::memory_order_relaxed);

  for (auto kind = error.kind(); kind != ErrorKind::Success;
       kind = parent_kind(kind)) {
    if (const auto &handler = handlers_.at(slot(kind)); handler) {
      handler(error);
      return;
    }
  }
  handle_generic(error);
}

auto ErrorHandler::fallback(const TaskError &error) const -> FallbackAction {
  for (auto kind = error.kind(); kind != ErrorKind::Success;
       kind = parent_kind(kind)) {
    if (const auto &fn = fallbacks_.at(slot(kind)); fn) {
      return fn(error);
    }
  }
  log::info("Using generic fallback strategy");
  return FallbackAction::error(error.message().empty() ? error.describe()
                                                       : error.message());
}

auto ErrorHandler::last_error() const -> std::optional<TaskError> {
  std::lock_guard lock(last_error_mutex_);
  return last_error_;
}

auto ErrorHandler::handle_generic(const TaskError &error) const -> void {
  log::error("Unexpected error: {} (kind={}, severity={}, code={})",
             error.message(), to_string_view(error.kind()),
             to_string_view(error.severity()), error.code().value());
  notify_user(std::format("Unexpected error: {}", error.describe()));
}

auto ErrorHandler::notify_user(std::string_view text) const -> void {
  if (verbose()) {
    std::println(stderr, "{}", text);
  }
}

} // namespace agentgraph
