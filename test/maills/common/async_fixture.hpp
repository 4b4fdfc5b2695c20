#pragma once

#include <exception>

#include <asio.hpp>
#include <catch2/catch_all.hpp>

namespace maills::test {

// Runs a coroutine test body on a fresh io_context until it finishes.
// Work the body leaves behind (debounce timers, detached reloads) is
// drained before the result is checked.
template <typename F>
void RunAsyncTest(F&& test_fn) {
  asio::io_context io_context;
  auto executor = io_context.get_executor();

  bool completed = false;
  std::exception_ptr exception;

  asio::co_spawn(
      io_context,
      [fn = std::forward<F>(test_fn), &completed, &exception,
       executor]() -> asio::awaitable<void> {
        try {
          co_await fn(executor);
          completed = true;
        } catch (...) {
          exception = std::current_exception();
          completed = true;
        }
      },
      asio::detached);

  io_context.run();

  if (exception) {
    std::rethrow_exception(exception);
  }

  REQUIRE(completed);
}

// Suspends the calling coroutine for duration
inline auto Sleep(asio::any_io_executor executor, auto duration)
    -> asio::awaitable<void> {
  asio::steady_timer timer(executor, duration);
  co_await timer.async_wait(asio::use_awaitable);
}

}  // namespace maills::test
