#include "codenav/utils/async_semaphore.hpp"

#include <asio/use_awaitable.hpp>

namespace codenav::utils {

AsyncSemaphore::AsyncSemaphore(
    asio::any_io_executor executor, std::size_t permits)
    : state_(std::make_shared<State>(std::move(executor), permits)) {
}

auto AsyncSemaphore::Acquire(Clock::time_point deadline)
    -> asio::awaitable<Permit> {
  const bool granted = co_await AsyncAcquire(deadline, asio::use_awaitable);
  if (!granted) {
    co_return Permit{};
  }
  co_return Permit{state_};
}

auto AsyncSemaphore::Release() -> void {
  ReleaseOn(state_);
}

auto AsyncSemaphore::ReleaseOn(const std::shared_ptr<State>& state) -> void {
  asio::post(state->strand, [state]() {
    while (!state->waiters.empty()) {
      auto waiter = std::move(state->waiters.front());
      state->waiters.pop_front();
      if (!waiter->handler) {
        continue;
      }
      waiter->timer.cancel();
      Complete(*state, *waiter, true);
      return;
    }
    ++state->available;
  });
}

auto AsyncSemaphore::Permit::Reset() -> void {
  if (state_) {
    ReleaseOn(state_);
    state_.reset();
  }
}

}  // namespace codenav::utils
