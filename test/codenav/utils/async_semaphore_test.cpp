#include "codenav/utils/async_semaphore.hpp"

#include <chrono>
#include <memory>
#include <vector>

#include <asio.hpp>
#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

#include "test/codenav/common/async_fixture.hpp"

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using codenav::test::RunAsyncTest;
using codenav::test::Sleep;
using codenav::utils::AsyncSemaphore;
using std::chrono::milliseconds;

TEST_CASE("AsyncSemaphore grants available permits", "[async_semaphore]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    AsyncSemaphore semaphore(executor, 2);

    auto first = co_await semaphore.Acquire();
    auto second = co_await semaphore.Acquire();
    REQUIRE(first);
    REQUIRE(second);
    REQUIRE(semaphore.Available() == 0);

    first.Reset();
    co_await Sleep(executor, milliseconds(10));
    REQUIRE(semaphore.Available() == 1);
  });
}

TEST_CASE("AsyncSemaphore times out waiters", "[async_semaphore]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    AsyncSemaphore semaphore(executor, 1);
    auto held = co_await semaphore.Acquire();
    REQUIRE(held);

    auto start = AsyncSemaphore::Clock::now();
    auto timed_out =
        co_await semaphore.Acquire(start + milliseconds(50));
    REQUIRE_FALSE(timed_out);
    REQUIRE(AsyncSemaphore::Clock::now() - start >= milliseconds(50));
  });
}

TEST_CASE("AsyncSemaphore hands permits over in FIFO order",
          "[async_semaphore]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    auto semaphore = std::make_shared<AsyncSemaphore>(executor, 1);
    auto order = std::make_shared<std::vector<int>>();

    auto held = co_await semaphore->Acquire();
    for (int i = 0; i < 3; ++i) {
      asio::co_spawn(
          executor,
          [semaphore, order, i]() -> asio::awaitable<void> {
            auto permit = co_await semaphore->Acquire();
            order->push_back(i);
          },
          asio::detached);
      // Let each waiter enqueue before spawning the next
      co_await Sleep(executor, milliseconds(5));
    }

    held.Reset();
    co_await Sleep(executor, milliseconds(50));
    REQUIRE(*order == std::vector<int>{0, 1, 2});
    REQUIRE(semaphore->Available() == 1);
  });
}

TEST_CASE("A timed out waiter does not consume a later permit",
          "[async_semaphore]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    auto semaphore = std::make_shared<AsyncSemaphore>(executor, 1);
    auto held = co_await semaphore->Acquire();

    auto timed_out = co_await semaphore->Acquire(
        AsyncSemaphore::Clock::now() + milliseconds(10));
    REQUIRE_FALSE(timed_out);

    held.Reset();
    auto next = co_await semaphore->Acquire(
        AsyncSemaphore::Clock::now() + milliseconds(100));
    REQUIRE(next);
  });
}
