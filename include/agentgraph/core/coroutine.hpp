#pragma once

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/deferred.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/system_error.hpp>

#include <chrono>
#include <type_traits>

namespace agentgraph {

template <typename T = void> using task = boost::asio::awaitable<T>;

/// Convenience alias for coroutines that produce no value.
using spawn_task = task<void>;

using boost::asio::co_spawn;
using boost::asio::deferred;
using boost::asio::use_awaitable;

template <typename T> struct is_task : std::false_type {};

template <typename T, typename Executor>
struct is_task<boost::asio::awaitable<T, Executor>> : std::true_type {
  using value_type = T;
};

template <typename T>
inline constexpr bool is_task_v = is_task<std::remove_cvref_t<T>>::value;

/// Suspend the calling coroutine (not the thread) for `duration`.
template <typename Rep, typename Period>
[[nodiscard]] auto async_sleep(std::chrono::duration<Rep, Period> duration)
    -> spawn_task {
  boost::asio::steady_timer timer(
      co_await boost::asio::this_coro::executor,
      std::chrono::duration_cast<boost::asio::steady_timer::duration>(
          duration));

  auto [ec] = co_await timer.async_wait(
      boost::asio::as_tuple(boost::asio::use_awaitable));

  if (ec && ec != boost::asio::error::operation_aborted) {
    throw boost::system::system_error(ec);
  }
}

} // namespace agentgraph
