#pragma once

#include <expected>
#include <string>
#include <utility>

namespace bspd {

/**
 * @brief Error codes for the bspd reporter and its tooling
 */
enum class BspdErrorCode {
  // No error
  kSuccess = 0,

  // File system errors
  kFileNotFound,

  // Configuration errors
  kInvalidConfig,

  // Compiler event stream errors
  kInvalidEvent,
  kUnknownEvent,

  // Internal errors
  kUnknownError
};

/**
 * @brief Error value carried in std::expected by bspd loaders and readers
 */
class BspdError {
 public:
  // Default constructor - no error
  BspdError() : code_(BspdErrorCode::kSuccess) {
  }

  // Construct from error code
  explicit BspdError(BspdErrorCode code)
      : code_(code), message_(GetDefaultMessage(code)) {
  }

  // Construct from error code and message
  BspdError(BspdErrorCode code, std::string message)
      : code_(code), message_(std::move(message)) {
  }

  [[nodiscard]] auto Ok() const -> bool {
    return code_ == BspdErrorCode::kSuccess;
  }

  [[nodiscard]] auto Code() const -> BspdErrorCode {
    return code_;
  }

  [[nodiscard]] auto Message() const -> const std::string& {
    return message_;
  }

  // Allow if(error) checks
  explicit operator bool() const {
    return !Ok();
  }

  static auto GetDefaultMessage(BspdErrorCode code) -> std::string {
    switch (code) {
      case BspdErrorCode::kSuccess:
        return "Success";
      case BspdErrorCode::kFileNotFound:
        return "File not found";
      case BspdErrorCode::kInvalidConfig:
        return "Invalid configuration";
      case BspdErrorCode::kInvalidEvent:
        return "Invalid compiler event";
      case BspdErrorCode::kUnknownEvent:
        return "Unknown compiler event";
      case BspdErrorCode::kUnknownError:
        return "Unknown error";
    }
    return "Unknown error";
  }

  // Default message followed by the details, if any
  static auto Make(BspdErrorCode code, const std::string& details = "")
      -> BspdError {
    if (details.empty()) {
      return BspdError(code);
    }
    return {code, GetDefaultMessage(code) + ": " + details};
  }

  static auto Unexpected(BspdErrorCode code, const std::string& details = "")
      -> std::unexpected<BspdError> {
    return std::unexpected<BspdError>(Make(code, details));
  }

 private:
  BspdErrorCode code_ = BspdErrorCode::kSuccess;
  std::string message_;
};

}  // namespace bspd
