#include "agentgraph/config/config.hpp"
#include "agentgraph/config/toml_util.hpp"

#include "agentgraph/util/log.hpp"

#include <boost/lexical_cast.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <format>
#include <string>
#include <string_view>
#include <vector>

namespace agentgraph {
namespace detail {

struct ExecutorToml {
  int max_concurrent{5};
};

struct RetryToml {
  int max_attempts{retry_defaults::kMaxAttempts};
  double backoff_factor{retry_defaults::kBackoffFactor};
  std::int64_t backoff_unit_ms{retry_defaults::kBackoffUnit.count()};
  std::int64_t max_backoff_ms{retry_defaults::kMaxBackoff.count()};
  std::vector<std::string> retryable{"timeout", "token_limit"};
};

struct LogToml {
  std::string level{"info"};
  std::string file;
  bool verbose{false};
};

struct SystemToml {
  ExecutorToml executor{};
  RetryToml retry{};
  LogToml log{};
};

} // namespace detail
} // namespace agentgraph

namespace glz {
template <> struct meta<agentgraph::detail::ExecutorToml> {
  using T = agentgraph::detail::ExecutorToml;
  static constexpr auto value = object("max_concurrent", &T::max_concurrent);
};

template <> struct meta<agentgraph::detail::RetryToml> {
  using T = agentgraph::detail::RetryToml;
  static constexpr auto value =
      object("max_attempts", &T::max_attempts, "backoff_factor",
             &T::backoff_factor, "backoff_unit_ms", &T::backoff_unit_ms,
             "max_backoff_ms", &T::max_backoff_ms, "retryable", &T::retryable);
};

template <> struct meta<agentgraph::detail::LogToml> {
  using T = agentgraph::detail::LogToml;
  static constexpr auto value =
      object("level", &T::level, "file", &T::file, "verbose", &T::verbose);
};

template <> struct meta<agentgraph::detail::SystemToml> {
  using T = agentgraph::detail::SystemToml;
  static constexpr auto value =
      object("executor", &T::executor, "retry", &T::retry, "log", &T::log);
};
} // namespace glz

namespace agentgraph {
namespace {

[[nodiscard]] auto convert_toml(detail::SystemToml raw)
    -> Result<SystemConfig> {
  SystemConfig cfg{};
  cfg.executor.max_concurrent = raw.executor.max_concurrent;

  cfg.retry.max_attempts = raw.retry.max_attempts;
  cfg.retry.backoff_factor = raw.retry.backoff_factor;
  cfg.retry.backoff_unit = std::chrono::milliseconds{raw.retry.backoff_unit_ms};
  cfg.retry.max_backoff = std::chrono::milliseconds{raw.retry.max_backoff_ms};
  cfg.retry.retryable.clear();
  for (const auto &name : raw.retry.retryable) {
    ErrorKind kind{};
    if (!util::try_parse_enum(name, kind)) {
      return fail(ErrorKind::Configuration,
                  std::format("unknown error kind '{}' in [retry].retryable",
                              name));
    }
    cfg.retry.retryable.push_back(kind);
  }

  cfg.log.level = std::move(raw.log.level);
  cfg.log.file = std::move(raw.log.file);
  cfg.log.verbose = raw.log.verbose;
  return ok(std::move(cfg));
}

auto apply_env_overrides(SystemConfig &cfg) -> void {
  if (const char *v = std::getenv("AGENTGRAPH_MAX_CONCURRENT"); v != nullptr) {
    cfg.executor.max_concurrent = boost::lexical_cast<int>(v);
  }
  if (const char *v = std::getenv("AGENTGRAPH_RETRY_MAX_ATTEMPTS");
      v != nullptr) {
    cfg.retry.max_attempts = boost::lexical_cast<int>(v);
  }
  if (const char *v = std::getenv("AGENTGRAPH_RETRY_BACKOFF_FACTOR");
      v != nullptr) {
    cfg.retry.backoff_factor = boost::lexical_cast<double>(v);
  }
  if (const char *v = std::getenv("AGENTGRAPH_RETRY_BACKOFF_UNIT_MS");
      v != nullptr) {
    cfg.retry.backoff_unit =
        std::chrono::milliseconds{boost::lexical_cast<std::int64_t>(v)};
  }
  if (const char *v = std::getenv("AGENTGRAPH_RETRY_MAX_BACKOFF_MS");
      v != nullptr) {
    cfg.retry.max_backoff =
        std::chrono::milliseconds{boost::lexical_cast<std::int64_t>(v)};
  }
  if (const char *v = std::getenv("AGENTGRAPH_LOG_LEVEL"); v != nullptr) {
    cfg.log.level = v;
  }
  if (const char *v = std::getenv("AGENTGRAPH_LOG_FILE"); v != nullptr) {
    cfg.log.file = v;
  }
}

[[nodiscard]] auto validate(const SystemConfig &cfg) -> Result<void> {
  if (cfg.executor.max_concurrent < 1) {
    return fail(ErrorKind::Configuration,
                std::format("[executor].max_concurrent must be at least 1, "
                            "got {}",
                            cfg.executor.max_concurrent));
  }
  if (std::ranges::find(log::level_names, cfg.log.level) ==
      log::level_names.end()) {
    return fail(ErrorKind::Configuration,
                std::format("unknown log level '{}'", cfg.log.level));
  }
  if (auto policy = RetryPolicy::create(cfg.retry); !policy) {
    return fail(policy.error());
  }
  return ok();
}

[[nodiscard]] auto finish(SystemConfig cfg) -> Result<SystemConfig> {
  try {
    apply_env_overrides(cfg);
  } catch (const boost::bad_lexical_cast &e) {
    log::error("Invalid AGENTGRAPH_* environment override: {}", e.what());
    return fail(ErrorKind::Configuration,
                std::format("invalid environment override: {}", e.what()));
  }
  if (auto valid = validate(cfg); !valid) {
    return fail(valid.error());
  }
  return ok(std::move(cfg));
}

} // namespace

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<SystemConfig> {
  auto text = toml_util::read_file(path);
  if (!text) {
    return fail(text.error());
  }
  return load_from_string(*text);
}

auto ConfigLoader::load_from_string(std::string_view toml_str)
    -> Result<SystemConfig> {
  auto raw = toml_util::parse_toml<detail::SystemToml>(toml_str);
  if (!raw) {
    return fail(raw.error());
  }
  auto cfg = convert_toml(std::move(*raw));
  if (!cfg) {
    return fail(cfg.error());
  }
  return finish(std::move(*cfg));
}

auto ConfigLoader::load_defaults() -> Result<SystemConfig> {
  return finish(SystemConfig{});
}

} // namespace agentgraph
