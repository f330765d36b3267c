#include "agentgraph/recovery/retry_policy.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <format>

namespace agentgraph {

auto RetryPolicy::create(RetryConfig config) -> Result<RetryPolicy> {
  if (config.max_attempts < 1) {
    return fail(ErrorKind::Configuration,
                std::format("retry max_attempts must be at least 1, got {}",
                            config.max_attempts));
  }
  if (!(config.backoff_factor > 0.0) || !std::isfinite(config.backoff_factor)) {
    return fail(ErrorKind::Configuration,
                std::format("retry backoff_factor must be positive, got {}",
                            config.backoff_factor));
  }
  if (config.backoff_unit.count() < 0) {
    return fail(ErrorKind::Configuration,
                "retry backoff unit must not be negative");
  }
  if (config.max_backoff < config.backoff_unit ||
      config.max_backoff > retry_defaults::kMaxBackoffLimit) {
    return fail(ErrorKind::Configuration,
                std::format("retry max_backoff must be between the backoff "
                            "unit ({}ms) and {}ms, got {}ms",
                            config.backoff_unit.count(),
                            retry_defaults::kMaxBackoffLimit.count(),
                            config.max_backoff.count()));
  }
  return RetryPolicy{std::move(config)};
}

auto RetryPolicy::is_retryable(ErrorKind kind) const noexcept -> bool {
  switch (kind) {
  case ErrorKind::Success:
  case ErrorKind::UserInterrupt:
  case ErrorKind::Configuration:
  case ErrorKind::Dependency:
    return false;
  default:
    return std::ranges::find(config_.retryable, kind) !=
           config_.retryable.end();
  }
}

auto RetryPolicy::backoff_delay(int attempt) const
    -> std::chrono::milliseconds {
  if (config_.backoff_unit.count() == 0) {
    return std::chrono::milliseconds{0};
  }
  const auto exponent = static_cast<double>(std::max(attempt, 1) - 1);
  const auto scaled = static_cast<double>(config_.backoff_unit.count()) *
                      std::pow(config_.backoff_factor, exponent);
  // pow may overflow to infinity; std::min still yields the cap.
  const auto capped =
      std::min(scaled, static_cast<double>(config_.max_backoff.count()));
  return std::chrono::milliseconds{
      static_cast<std::int64_t>(std::llround(capped))};
}

} // namespace agentgraph
