#pragma once

#include "agentgraph/core/coroutine.hpp"
#include "agentgraph/core/error.hpp"
#include "agentgraph/graph/task.hpp"
#include "agentgraph/util/id.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

#include <chrono>
#include <cstdlib>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unistd.h>
#include <utility>

namespace agentgraph::test {

// Run a coroutine synchronously on a fresh io_context and return its result.
// Throws if the coroutine does not complete within `timeout`.
template <typename T>
[[nodiscard]] inline auto
run_coro(task<T> coro,
         std::chrono::milliseconds timeout = std::chrono::seconds(10)) -> T {
  boost::asio::io_context io;
  std::exception_ptr eptr;
  std::optional<T> result;
  boost::asio::co_spawn(
      io,
      [&]() -> task<void> {
        result.emplace(co_await std::move(coro));
        co_return;
      },
      [&](std::exception_ptr e) { eptr = e; });
  io.run_for(timeout);
  if (!result && !eptr)
    throw std::runtime_error("run_coro timed out");
  if (eptr)
    std::rethrow_exception(eptr);
  return std::move(*result);
}

inline auto
run_coro(task<void> coro,
         std::chrono::milliseconds timeout = std::chrono::seconds(10)) -> void {
  boost::asio::io_context io;
  std::exception_ptr eptr;
  bool done = false;
  boost::asio::co_spawn(
      io,
      [&]() -> task<void> {
        co_await std::move(coro);
        done = true;
        co_return;
      },
      [&](std::exception_ptr e) { eptr = e; });
  io.run_for(timeout);
  if (!done && !eptr)
    throw std::runtime_error("run_coro timed out");
  if (eptr)
    std::rethrow_exception(eptr);
}

[[nodiscard]] inline auto task_id(std::string_view s) -> TaskId {
  return TaskId{std::string{s}};
}

// Operation returning `value` without suspending.
[[nodiscard]] inline auto constant_op(Value value) -> Operation {
  return make_operation(
      [value = std::move(value)](const Args &, const NamedInputs &)
          -> Result<Value> { return value; });
}

[[nodiscard]] inline auto failing_op(ErrorKind kind,
                                     std::string message = "boom")
    -> Operation {
  return make_operation(
      [kind, message = std::move(message)](const Args &, const NamedInputs &)
          -> Result<Value> { return fail(kind, message); });
}

[[nodiscard]] inline auto
make_temp_path(std::string_view prefix = "agentgraph_test_") -> std::string {
  std::string templ = std::string("/tmp/") + std::string(prefix) + "XXXXXX";
  int fd = ::mkstemp(templ.data());
  if (fd < 0) {
    return "";
  }
  ::close(fd);
  return templ;
}

// Sets an environment variable for the lifetime of the guard.
class ScopedEnv {
public:
  ScopedEnv(const char *name, const char *value) : name_(name) {
    if (const char *old = std::getenv(name); old != nullptr) {
      previous_ = old;
    }
    ::setenv(name, value, 1);
  }
  ~ScopedEnv() {
    if (previous_) {
      ::setenv(name_, previous_->c_str(), 1);
    } else {
      ::unsetenv(name_);
    }
  }
  ScopedEnv(const ScopedEnv &) = delete;
  ScopedEnv &operator=(const ScopedEnv &) = delete;

private:
  const char *name_;
  std::optional<std::string> previous_;
};

} // namespace agentgraph::test
