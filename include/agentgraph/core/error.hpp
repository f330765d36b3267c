#pragma once

#include "agentgraph/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <array>
#include <cstdint>
#include <exception>
#include <expected>
#include <format>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace agentgraph {

// Flat failure taxonomy. Generic is the root every other kind falls back to
// when dispatching handlers.
enum class ErrorKind : std::uint8_t {
  Success,
  Generic,
  TokenLimit,
  Timeout,
  InvalidOutput,
  UserInterrupt,
  Configuration,
  Dependency,
};
BOOST_DESCRIBE_ENUM(ErrorKind, Success, Generic, TokenLimit, Timeout,
                    InvalidOutput, UserInterrupt, Configuration, Dependency)
AGENTGRAPH_DEFINE_ENUM_SERDE(ErrorKind, ErrorKind::Generic)

inline constexpr std::size_t kErrorKindCount = util::enum_size_v<ErrorKind>;

} // namespace agentgraph

template <>
struct std::is_error_code_enum<agentgraph::ErrorKind> : std::true_type {};

namespace agentgraph {

enum class Severity : std::uint8_t { Info, Warning, Error, Critical };
BOOST_DESCRIBE_ENUM(Severity, Info, Warning, Error, Critical)
AGENTGRAPH_DEFINE_ENUM_SERDE(Severity, Severity::Error)

class ErrorCategory : public std::error_category {
  static constexpr std::array<std::string_view, kErrorKindCount> messages = {
      "success",
      "unclassified error",
      "token limit exceeded",
      "operation timed out",
      "invalid output",
      "interrupted by user",
      "configuration error",
      "dependency error",
  };

public:
  [[nodiscard]] auto name() const noexcept -> const char * override {
    return "agentgraph";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    auto idx = static_cast<std::size_t>(ev);
    if (idx >= std::size(messages)) {
      return "unknown error";
    }
    return std::string{messages.at(idx)};
  }
};

inline auto error_category() -> const ErrorCategory & {
  static const ErrorCategory instance;
  return instance;
}

inline auto make_error_code(ErrorKind e) -> std::error_code {
  return {std::to_underlying(e), error_category()};
}

[[nodiscard]] constexpr auto default_severity(ErrorKind kind) noexcept
    -> Severity {
  switch (kind) {
  case ErrorKind::Success:
  case ErrorKind::UserInterrupt:
    return Severity::Info;
  case ErrorKind::Configuration:
  case ErrorKind::Dependency:
    return Severity::Critical;
  default:
    return Severity::Error;
  }
}

// Structural defects: never retried, always surfaced.
[[nodiscard]] constexpr auto is_fatal(ErrorKind kind) noexcept -> bool {
  return kind == ErrorKind::Configuration || kind == ErrorKind::Dependency;
}

[[nodiscard]] constexpr auto parent_kind(ErrorKind kind) noexcept
    -> ErrorKind {
  switch (kind) {
  case ErrorKind::Success:
  case ErrorKind::Generic:
    return ErrorKind::Success;
  default:
    return ErrorKind::Generic;
  }
}

class TaskError {
public:
  TaskError() = default;
  TaskError(ErrorKind kind, std::string message)
      : code_(make_error_code(kind)), severity_(default_severity(kind)),
        message_(std::move(message)) {}
  TaskError(ErrorKind kind, Severity severity, std::string message)
      : code_(make_error_code(kind)), severity_(severity),
        message_(std::move(message)) {}

  // Codes from foreign categories are classified as Generic.
  TaskError(std::error_code code, std::string message)
      : code_(code.category() == error_category()
                  ? code
                  : make_error_code(ErrorKind::Generic)),
        severity_(default_severity(kind())),
        message_(message.empty() ? code.message() : std::move(message)) {}

  [[nodiscard]] auto kind() const noexcept -> ErrorKind {
    return static_cast<ErrorKind>(code_.value());
  }
  [[nodiscard]] auto code() const noexcept -> std::error_code { return code_; }
  [[nodiscard]] auto severity() const noexcept -> Severity {
    return severity_;
  }
  [[nodiscard]] auto message() const noexcept -> const std::string & {
    return message_;
  }

  // "<kind>: <message>", or the category text when no message was given.
  [[nodiscard]] auto describe() const -> std::string {
    if (message_.empty()) {
      return code_.message();
    }
    return std::format("{}: {}", to_string_view(kind()), message_);
  }

  friend auto operator==(const TaskError &, const TaskError &)
      -> bool = default;

private:
  std::error_code code_{make_error_code(ErrorKind::Generic)};
  Severity severity_{Severity::Error};
  std::string message_;
};

template <typename T> using Result = std::expected<T, TaskError>;

template <typename T>
[[nodiscard]] constexpr auto ok(T &&value) -> Result<std::decay_t<T>> {
  return std::forward<T>(value);
}

[[nodiscard]] constexpr auto ok() -> Result<void> { return {}; }

[[nodiscard]] inline auto fail(TaskError error) -> std::unexpected<TaskError> {
  return std::unexpected{std::move(error)};
}

[[nodiscard]] inline auto fail(ErrorKind kind, std::string message = {})
    -> std::unexpected<TaskError> {
  return std::unexpected{TaskError{kind, std::move(message)}};
}

// Thrown by operations that prefer exceptions over Result; the executor and
// RetryPolicy unwrap it back into the carried TaskError.
class TaskException : public std::runtime_error {
public:
  explicit TaskException(TaskError error)
      : std::runtime_error(error.describe()), error_(std::move(error)) {}
  TaskException(ErrorKind kind, std::string message)
      : TaskException(TaskError{kind, std::move(message)}) {}

  [[nodiscard]] auto error() const noexcept -> const TaskError & {
    return error_;
  }

private:
  TaskError error_;
};

[[nodiscard]] auto error_from_exception(std::exception_ptr eptr) -> TaskError;

} // namespace agentgraph

template <>
struct std::formatter<agentgraph::TaskError> : std::formatter<std::string> {
  auto format(const agentgraph::TaskError &error, auto &ctx) const {
    return std::formatter<std::string>::format(error.describe(), ctx);
  }
};
