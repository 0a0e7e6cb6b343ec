#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <memory>
#include <utility>

#include <asio/any_io_executor.hpp>
#include <asio/async_result.hpp>
#include <asio/awaitable.hpp>
#include <asio/post.hpp>
#include <asio/steady_timer.hpp>
#include <asio/strand.hpp>

namespace codenav::utils {

// Counting semaphore for coroutines with FIFO hand-off and per-waiter
// deadlines.
//
// A waiter either receives a permit (completes with true) or its deadline
// passes first (completes with false and holds nothing). Release() hands the
// permit directly to the oldest waiter that has not timed out, so waiters are
// served in arrival order.
//
// Usage:
//   auto permit = co_await semaphore.Acquire(deadline);
//   if (!permit) { /* timed out */ }
//   // permit releases on destruction
//
// Internal state is held via shared_ptr, so handlers posted to the strand
// stay valid even if the semaphore is destroyed first.
class AsyncSemaphore {
 public:
  using Clock = std::chrono::steady_clock;

  AsyncSemaphore(asio::any_io_executor executor, std::size_t permits);

  ~AsyncSemaphore() = default;

  AsyncSemaphore(const AsyncSemaphore&) = delete;
  auto operator=(const AsyncSemaphore&) -> AsyncSemaphore& = delete;
  AsyncSemaphore(AsyncSemaphore&&) = delete;
  auto operator=(AsyncSemaphore&&) -> AsyncSemaphore& = delete;

 private:
  struct State;

 public:
  // Move-only ownership of one permit
  class Permit {
   public:
    Permit() = default;
    explicit Permit(std::shared_ptr<State> state) : state_(std::move(state)) {
    }
    ~Permit() {
      Reset();
    }

    Permit(const Permit&) = delete;
    auto operator=(const Permit&) -> Permit& = delete;
    Permit(Permit&& other) noexcept : state_(std::move(other.state_)) {
    }
    auto operator=(Permit&& other) noexcept -> Permit& {
      if (this != &other) {
        Reset();
        state_ = std::move(other.state_);
      }
      return *this;
    }

    explicit operator bool() const {
      return state_ != nullptr;
    }

    auto Reset() -> void;

   private:
    std::shared_ptr<State> state_;
  };

  // Completion signature void(bool): true when a permit was granted
  template <typename CompletionToken>
  auto AsyncAcquire(Clock::time_point deadline, CompletionToken&& token) {
    return asio::async_initiate<CompletionToken, void(bool)>(
        [state = state_, deadline](auto handler) {
          asio::post(
              state->strand,
              [state, deadline, h = std::move(handler)]() mutable {
                if (state->available > 0) {
                  --state->available;
                  asio::post(state->executor, [h = std::move(h)]() mutable {
                    h(true);
                  });
                  return;
                }
                auto waiter = std::make_shared<Waiter>(
                    state->strand,
                    std::make_unique<ConcreteHandler<decltype(h)>>(
                        std::move(h)));
                waiter->timer.expires_at(deadline);
                state->waiters.push_back(waiter);
                waiter->timer.async_wait(
                    [state, waiter](std::error_code /*ec*/) {
                      // Runs on the strand. A granted waiter has already
                      // been completed by Release().
                      if (!waiter->handler) {
                        return;
                      }
                      std::erase(state->waiters, waiter);
                      Complete(*state, *waiter, false);
                    });
              });
        },
        std::forward<CompletionToken>(token));
  }

  // Acquires a permit, an empty Permit means the deadline passed first
  auto Acquire(Clock::time_point deadline = Clock::time_point::max())
      -> asio::awaitable<Permit>;

  // Returns a permit acquired through AsyncAcquire
  auto Release() -> void;

  // Non-blocking query, for tests and diagnostics
  [[nodiscard]] auto Available() const -> std::size_t {
    return state_->available;
  }

 private:
  struct Handler {
    virtual ~Handler() = default;
    Handler() = default;
    Handler(const Handler&) = delete;
    auto operator=(const Handler&) -> Handler& = delete;
    Handler(Handler&&) = delete;
    auto operator=(Handler&&) -> Handler& = delete;
    virtual auto Invoke(bool granted) -> void = 0;
  };

  template <typename F>
  struct ConcreteHandler : Handler {
    explicit ConcreteHandler(F&& f) : func(std::move(f)) {
    }
    auto Invoke(bool granted) -> void override {
      func(granted);
    }
    F func;
  };

  struct Waiter {
    Waiter(
        asio::strand<asio::any_io_executor> strand,
        std::unique_ptr<Handler> h)
        : timer(strand), handler(std::move(h)) {
    }
    asio::steady_timer timer;
    std::unique_ptr<Handler> handler;
  };

  struct State {
    State(asio::any_io_executor exec, std::size_t permits)
        : executor(exec), strand(asio::make_strand(exec)), available(permits) {
    }

    asio::any_io_executor executor;
    asio::strand<asio::any_io_executor> strand;  // Protects the fields below
    std::size_t available;
    std::deque<std::shared_ptr<Waiter>> waiters;
  };

  static auto Complete(State& state, Waiter& waiter, bool granted) -> void {
    auto handler = std::move(waiter.handler);
    asio::post(state.executor, [h = std::move(handler), granted]() mutable {
      h->Invoke(granted);
    });
  }

  static auto ReleaseOn(const std::shared_ptr<State>& state) -> void;

  std::shared_ptr<State> state_;
};

}  // namespace codenav::utils
