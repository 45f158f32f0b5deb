#pragma once

#include <atomic>
#include <memory>
#include <utility>
#include <vector>

#include <asio/any_completion_handler.hpp>
#include <asio/any_io_executor.hpp>
#include <asio/async_result.hpp>
#include <asio/post.hpp>
#include <asio/strand.hpp>

namespace bsp::utils {

// One-shot signal that resumes every waiter at once.
//
//   co_await event.AsyncWait(asio::use_awaitable);   // waiter
//   event.Set();                                     // any thread
//
// Waits issued after Set() complete immediately. Set() is idempotent. State
// lives behind a shared_ptr so work already posted to the strand stays valid
// if the event is destroyed first.
class BroadcastEvent {
 public:
  explicit BroadcastEvent(asio::any_io_executor executor)
      : state_(std::make_shared<State>(std::move(executor))) {
  }

  ~BroadcastEvent() = default;

  BroadcastEvent(const BroadcastEvent&) = delete;
  auto operator=(const BroadcastEvent&) -> BroadcastEvent& = delete;
  BroadcastEvent(BroadcastEvent&&) = delete;
  auto operator=(BroadcastEvent&&) -> BroadcastEvent& = delete;

  template <typename CompletionToken>
  auto AsyncWait(CompletionToken&& token) {
    return asio::async_initiate<CompletionToken, void()>(
        [state = state_](auto handler) {
          asio::post(
              state->strand,
              [state, waiter = Waiter(std::move(handler))]() mutable {
                if (state->ready) {
                  asio::post(state->executor, std::move(waiter));
                  return;
                }
                state->waiters.push_back(std::move(waiter));
              });
        },
        std::forward<CompletionToken>(token));
  }

  auto Set() -> void {
    asio::post(state_->strand, [state = state_] {
      if (state->ready) {
        return;
      }
      state->ready = true;
      for (auto& waiter : std::exchange(state->waiters, {})) {
        asio::post(state->executor, std::move(waiter));
      }
    });
  }

  // Racy by nature; for tests and diagnostics only
  [[nodiscard]] auto IsSet() const -> bool {
    return state_->ready;
  }

 private:
  using Waiter = asio::any_completion_handler<void()>;

  struct State {
    explicit State(asio::any_io_executor exec)
        : executor(exec), strand(asio::make_strand(exec)) {
    }

    asio::any_io_executor executor;
    // Serializes access to waiters
    asio::strand<asio::any_io_executor> strand;
    std::atomic<bool> ready{false};
    std::vector<Waiter> waiters;
  };

  std::shared_ptr<State> state_;
};

}  // namespace bsp::utils
