#include "bsp/utils/broadcast_event.hpp"

#include <atomic>
#include <chrono>
#include <memory>

#include <asio.hpp>
#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

#include "test/bsp/common/async_fixture.hpp"

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using bsp::test::RunAsyncTest;
using bsp::utils::BroadcastEvent;

TEST_CASE("BroadcastEvent wait after set", "[broadcast_event]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    BroadcastEvent event(executor);
    event.Set();
    event.Set();

    co_await event.AsyncWait(asio::use_awaitable);
    co_await event.AsyncWait(asio::use_awaitable);

    REQUIRE(event.IsSet());
  });
}

TEST_CASE("BroadcastEvent wakes every waiter", "[broadcast_event]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    auto event = std::make_shared<BroadcastEvent>(executor);
    auto woken = std::make_shared<std::atomic<int>>(0);

    for (int i = 0; i < 3; ++i) {
      asio::co_spawn(
          executor,
          [event, woken]() -> asio::awaitable<void> {
            co_await event->AsyncWait(asio::use_awaitable);
            woken->fetch_add(1);
          },
          asio::detached);
    }

    asio::steady_timer timer(executor);
    timer.expires_after(std::chrono::milliseconds(20));
    co_await timer.async_wait(asio::use_awaitable);
    REQUIRE(woken->load() == 0);

    event->Set();

    timer.expires_after(std::chrono::milliseconds(20));
    co_await timer.async_wait(asio::use_awaitable);
    REQUIRE(woken->load() == 3);
  });
}
