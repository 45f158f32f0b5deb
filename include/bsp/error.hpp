#pragma once

#include <expected>
#include <string>
#include <utility>

#include <jsonrpc/error/error.hpp>

namespace bsp::error {

using RpcError = jsonrpc::error::RpcError;
using RpcErrorCode = jsonrpc::error::RpcErrorCode;

// A notification that could not be delivered to the build client
class BspError {
 public:
  BspError(std::string method, RpcErrorCode code, std::string message)
      : method_(std::move(method)), code_(code), message_(std::move(message)) {
  }

  [[nodiscard]] auto Method() const -> const std::string& {
    return method_;
  }

  [[nodiscard]] auto Code() const -> RpcErrorCode {
    return code_;
  }

  [[nodiscard]] auto Message() const -> const std::string& {
    return message_;
  }

  static auto FromRpcError(std::string method, const RpcError& error)
      -> BspError {
    return {std::move(method), error.Code(), error.Message()};
  }

  static auto UnexpectedFromRpcError(std::string method, const RpcError& error)
      -> std::unexpected<BspError> {
    return std::unexpected<BspError>(
        FromRpcError(std::move(method), error));
  }

 private:
  std::string method_;
  RpcErrorCode code_;
  std::string message_;
};

inline auto Ok() -> std::expected<void, BspError> {
  return {};
}

}  // namespace bsp::error
