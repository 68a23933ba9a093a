#pragma once

#include "jobforge/core/error.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>

#include <chrono>
#include <tuple>

namespace jobforge {

template <typename T = void> using task = boost::asio::awaitable<T>;

/// Convenience alias for fire-and-forget coroutines.
using spawn_task = task<void>;

using boost::asio::co_spawn;
using boost::asio::detached;
using boost::asio::use_awaitable;

inline constexpr auto use_nothrow =
    boost::asio::as_tuple(boost::asio::use_awaitable);

[[nodiscard]] inline auto as_result(std::tuple<boost::system::error_code> &&v)
    -> Result<void> {
  auto [ec] = std::move(v);
  if (ec) {
    return fail(ec);
  }
  return ok();
}

/// Suspend the calling coroutine on its own executor. Returns Cancelled when
/// the timer was aborted (executor shutdown).
template <typename Rep, typename Period>
[[nodiscard]] auto async_sleep(std::chrono::duration<Rep, Period> duration)
    -> task<Result<void>> {
  auto executor = co_await boost::asio::this_coro::executor;
  boost::asio::steady_timer timer(executor);
  timer.expires_after(
      std::chrono::duration_cast<boost::asio::steady_timer::duration>(
          duration));
  auto waited = as_result(co_await timer.async_wait(use_nothrow));
  if (!waited) {
    co_return fail(Error::Cancelled);
  }
  co_return ok();
}

} // namespace jobforge
