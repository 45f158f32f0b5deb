#include "bsp/rpc_build_client.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/use_awaitable.hpp>

namespace bsp {

using bsp::error::Ok;

namespace {

constexpr std::string_view kPublishDiagnosticsMethod =
    "build/publishDiagnostics";
constexpr std::string_view kTaskStartMethod = "build/taskStart";
constexpr std::string_view kTaskFinishMethod = "build/taskFinish";

}  // namespace

RpcBuildClient::RpcBuildClient(
    asio::any_io_executor executor,
    std::shared_ptr<jsonrpc::endpoint::RpcEndpoint> endpoint,
    std::shared_ptr<spdlog::logger> logger)
    : RpcBuildClient(
          executor,
          [endpoint = std::move(endpoint)](
              std::string method, nlohmann::json params)
              -> asio::awaitable<std::expected<void, RpcError>> {
            co_return co_await endpoint->SendNotification(
                method, std::move(params));
          },
          std::move(logger)) {
}

RpcBuildClient::RpcBuildClient(
    asio::any_io_executor executor, NotificationSender sender,
    std::shared_ptr<spdlog::logger> logger)
    : executor_(executor),
      sender_(std::move(sender)),
      logger_(logger ? logger : spdlog::default_logger()),
      state_(std::make_shared<SendState>(executor)) {
}

auto RpcBuildClient::OnBuildPublishDiagnostics(PublishDiagnosticsParams params)
    -> void {
  Spawn(std::string(kPublishDiagnosticsMethod), nlohmann::json(params));
}

auto RpcBuildClient::OnBuildTaskStart(TaskStartParams params) -> void {
  Spawn(std::string(kTaskStartMethod), nlohmann::json(params));
}

auto RpcBuildClient::OnBuildTaskFinish(TaskFinishParams params) -> void {
  Spawn(std::string(kTaskFinishMethod), nlohmann::json(params));
}

auto RpcBuildClient::WaitForPendingSends() -> asio::awaitable<void> {
  // Pairs with the decrement in Spawn: whichever side observes the other
  // last sets the event
  state_->draining.store(true);
  if (state_->pending.load() == 0) {
    state_->drained.Set();
  }
  co_await state_->drained.AsyncWait(asio::use_awaitable);
  logger_->debug(
      "RpcBuildClient drained pending notifications ({} failed)",
      state_->failed.load());
}

auto RpcBuildClient::Send(std::string method, nlohmann::json params)
    -> asio::awaitable<std::expected<void, BspError>> {
  auto result = co_await sender_(method, std::move(params));
  if (!result) {
    logger_->error(
        "RpcBuildClient failed to send {}: {}", method,
        result.error().Message());
    co_return BspError::UnexpectedFromRpcError(
        std::move(method), result.error());
  }
  co_return Ok();
}

auto RpcBuildClient::Spawn(std::string method, nlohmann::json params) -> void {
  state_->pending.fetch_add(1);
  auto coroutine = [this, state = state_, method = std::move(method),
                    params = std::move(params)]() mutable
      -> asio::awaitable<void> {
    auto result = co_await Send(method, std::move(params));
    if (!result) {
      state->failed.fetch_add(1);
    }
    if (state->pending.fetch_sub(1) == 1 && state->draining.load()) {
      state->drained.Set();
    }
  };
  asio::co_spawn(executor_, std::move(coroutine), asio::detached);
}

}  // namespace bsp
