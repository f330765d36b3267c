#pragma once

#include "agentgraph/core/coroutine.hpp"
#include "agentgraph/core/error.hpp"
#include "agentgraph/util/log.hpp"

#include <chrono>
#include <exception>
#include <expected>
#include <functional>
#include <type_traits>
#include <utility>
#include <vector>

namespace agentgraph {

namespace retry_defaults {
inline constexpr int kMaxAttempts{3};
inline constexpr double kBackoffFactor{1.5};
inline constexpr std::chrono::milliseconds kBackoffUnit{1000};
inline constexpr std::chrono::milliseconds kMaxBackoff{60'000};
// Upper bound accepted for max_backoff; keeps timer arithmetic in range.
inline constexpr std::chrono::milliseconds kMaxBackoffLimit{24LL * 60 * 60 *
                                                           1000};
} // namespace retry_defaults

struct RetryConfig {
  int max_attempts{retry_defaults::kMaxAttempts};
  double backoff_factor{retry_defaults::kBackoffFactor};
  std::chrono::milliseconds backoff_unit{retry_defaults::kBackoffUnit};
  std::chrono::milliseconds max_backoff{retry_defaults::kMaxBackoff};
  std::vector<ErrorKind> retryable{ErrorKind::Timeout, ErrorKind::TokenLimit};
};

namespace detail {

template <typename R> struct unwrap_task {
  using type = R;
};

template <typename T, typename Executor>
struct unwrap_task<boost::asio::awaitable<T, Executor>> {
  using type = T;
};

template <typename R> struct is_result : std::false_type {};
template <typename T>
struct is_result<std::expected<T, TaskError>> : std::true_type {};

// Result<T> produced by `F`, whether F is synchronous or a coroutine.
template <typename F>
using retry_result_t = typename unwrap_task<
    std::remove_cvref_t<std::invoke_result_t<F &>>>::type;

// One invocation; an escaping exception becomes the attempt's error.
template <typename F> auto attempt_once(F &fn) -> task<retry_result_t<F>> {
  using R = retry_result_t<F>;
  std::exception_ptr eptr;
  try {
    if constexpr (is_task_v<std::invoke_result_t<F &>>) {
      co_return co_await std::invoke(fn);
    } else {
      co_return std::invoke(fn);
    }
  } catch (...) {
    eptr = std::current_exception();
  }
  co_return R{std::unexpect, error_from_exception(eptr)};
}

} // namespace detail

// Re-invokes a fallible callable on retryable error kinds with exponential
// backoff. The wait suspends only the calling coroutine.
class RetryPolicy {
public:
  RetryPolicy() = default;

  [[nodiscard]] static auto create(RetryConfig config) -> Result<RetryPolicy>;

  [[nodiscard]] auto config() const noexcept -> const RetryConfig & {
    return config_;
  }

  // UserInterrupt, Configuration and Dependency are never retried.
  [[nodiscard]] auto is_retryable(ErrorKind kind) const noexcept -> bool;

  // Wait inserted after failed attempt `attempt` (1-indexed):
  // min(backoff_unit * backoff_factor^(attempt - 1), max_backoff).
  [[nodiscard]] auto backoff_delay(int attempt) const
      -> std::chrono::milliseconds;

  // `fn` is a nullary callable returning Result<T> or task<Result<T>>.
  // The policy must outlive the returned coroutine.
  template <typename F>
  [[nodiscard]] auto execute(F fn) const -> task<detail::retry_result_t<F>> {
    static_assert(detail::is_result<detail::retry_result_t<F>>::value,
                  "retried callables must return Result<T>");

    for (int attempt = 1;; ++attempt) {
      auto result = co_await detail::attempt_once(fn);
      if (result) {
        co_return result;
      }
      if (!is_retryable(result.error().kind())) {
        co_return result;
      }
      if (attempt >= config_.max_attempts) {
        log::error("Operation failed after {} attempts: {}",
                   config_.max_attempts, result.error());
        co_return result;
      }
      const auto delay = backoff_delay(attempt);
      log::info("Retry attempt {}/{} after {}ms: {}", attempt,
                config_.max_attempts, delay.count(), result.error());
      co_await async_sleep(delay);
    }
  }

private:
  explicit RetryPolicy(RetryConfig config) : config_(std::move(config)) {}

  RetryConfig config_;
};

} // namespace agentgraph
