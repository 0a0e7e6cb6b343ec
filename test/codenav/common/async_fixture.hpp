#pragma once

#include <chrono>
#include <exception>

#include <asio.hpp>
#include <catch2/catch_all.hpp>

namespace codenav::test {

// Runs a coroutine test body on a fresh io_context until no work is left,
// then rethrows whatever the body threw. Bodies that start language servers
// must shut them down, or the run never drains.
template <typename F>
void RunAsyncTest(F&& test_fn) {
  asio::io_context io_context;
  asio::any_io_executor executor = io_context.get_executor();

  bool finished = false;
  std::exception_ptr failure;
  asio::co_spawn(
      io_context,
      [fn = std::forward<F>(test_fn), executor]() -> asio::awaitable<void> {
        co_await fn(executor);
      },
      [&finished, &failure](std::exception_ptr e) {
        failure = e;
        finished = true;
      });

  io_context.run();

  if (failure) {
    std::rethrow_exception(failure);
  }
  REQUIRE(finished);
}

// Suspends the calling coroutine, for tests that wait on detached work
inline auto Sleep(asio::any_io_executor executor, std::chrono::milliseconds d)
    -> asio::awaitable<void> {
  asio::steady_timer timer(executor, d);
  co_await timer.async_wait(asio::use_awaitable);
}

}  // namespace codenav::test
