#pragma once

#include <atomic>
#include <expected>
#include <functional>
#include <memory>
#include <string>

#include <asio.hpp>
#include <jsonrpc/endpoint/endpoint.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "bsp/build_client.hpp"
#include "bsp/error.hpp"
#include "bsp/utils/broadcast_event.hpp"

namespace bsp {

using bsp::error::BspError;
using bsp::error::RpcError;

// BuildClient that forwards every notification over a JSON-RPC endpoint.
// Each notification is spawned onto the executor, so callers on compiler
// threads return immediately. Send failures are logged and counted, never
// rethrown.
class RpcBuildClient : public BuildClient {
 public:
  // Sends one notification; RpcEndpoint::SendNotification in production
  using NotificationSender =
      std::function<asio::awaitable<std::expected<void, RpcError>>(
          std::string method, nlohmann::json params)>;

  RpcBuildClient(
      asio::any_io_executor executor,
      std::shared_ptr<jsonrpc::endpoint::RpcEndpoint> endpoint,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  RpcBuildClient(
      asio::any_io_executor executor, NotificationSender sender,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  auto OnBuildPublishDiagnostics(PublishDiagnosticsParams params)
      -> void override;
  auto OnBuildTaskStart(TaskStartParams params) -> void override;
  auto OnBuildTaskFinish(TaskFinishParams params) -> void override;

  // Completes once every notification spawned before the call has been sent.
  // Used before shutting the endpoint down.
  auto WaitForPendingSends() -> asio::awaitable<void>;

  [[nodiscard]] auto PendingSends() const -> int {
    return state_->pending.load();
  }

  [[nodiscard]] auto FailedSends() const -> int {
    return state_->failed.load();
  }

 private:
  // Shared with in-flight send coroutines
  struct SendState {
    explicit SendState(asio::any_io_executor executor)
        : drained(std::move(executor)) {
    }

    std::atomic<int> pending{0};
    std::atomic<int> failed{0};
    std::atomic<bool> draining{false};
    utils::BroadcastEvent drained;
  };

  auto Send(std::string method, nlohmann::json params)
      -> asio::awaitable<std::expected<void, BspError>>;

  auto Spawn(std::string method, nlohmann::json params) -> void;

  asio::any_io_executor executor_;
  NotificationSender sender_;
  std::shared_ptr<spdlog::logger> logger_;
  std::shared_ptr<SendState> state_;
};

}  // namespace bsp
