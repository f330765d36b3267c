#pragma once

#include <optional>
#include <string>

namespace agentgraph::cli {

inline constexpr int kExitOk = 0;
inline constexpr int kExitTaskFailed = 1;
inline constexpr int kExitFatal = 2;

struct DescribeOptions {
  std::string config_file;
};

struct RunOptions {
  std::string config_file;
  std::optional<int> max_concurrent;
  std::optional<std::string> log_level;
  std::optional<std::string> fail_task;
  std::string fail_kind{"invalid_output"};
  bool json{false};
};

[[nodiscard]] auto cmd_describe(const DescribeOptions &opts) -> int;
[[nodiscard]] auto cmd_run(const RunOptions &opts) -> int;

} // namespace agentgraph::cli
