#pragma once

#include "agentgraph/core/error.hpp"
#include "agentgraph/recovery/retry_policy.hpp"

#include <string>
#include <string_view>

namespace agentgraph {

struct ExecutorConfig {
  int max_concurrent{5};

  auto operator==(const ExecutorConfig &) const -> bool = default;
};

struct LogConfig {
  std::string level{"info"};
  std::string file; // empty = stdout
  bool verbose{false};

  auto operator==(const LogConfig &) const -> bool = default;
};

struct SystemConfig {
  ExecutorConfig executor;
  RetryConfig retry;
  LogConfig log;
};

// Reads [executor], [retry] and [log] from TOML, then applies AGENTGRAPH_*
// environment overrides. Every failure is reported as a Configuration error.
class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view toml_str)
      -> Result<SystemConfig>;

  // Defaults plus environment overrides, for runs without a config file.
  [[nodiscard]] static auto load_defaults() -> Result<SystemConfig>;
};

} // namespace agentgraph
