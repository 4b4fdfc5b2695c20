#pragma once

#include <expected>
#include <string>
#include <unordered_map>
#include <utility>

namespace maills {

enum class MaillsErrorCode {
  kSuccess = 0,

  // File system errors
  kFileNotFound,
  kFileAccessDenied,
  kWriteFailed,

  // Contact source errors
  kParseFailed,

  // Document errors
  kStaleVersion,
  kUnknownDocument,
  kInvalidEdit,

  // Configuration errors
  kInvalidConfig,

  kUnknownError
};

class MaillsError {
 public:
  MaillsError() : code_(MaillsErrorCode::kSuccess) {
  }

  explicit MaillsError(MaillsErrorCode code)
      : code_(code), message_(GetDefaultMessage(code)) {
  }

  MaillsError(MaillsErrorCode code, std::string message)
      : code_(code), message_(std::move(message)) {
  }

  [[nodiscard]] auto ok() const -> bool {
    return code_ == MaillsErrorCode::kSuccess;
  }

  [[nodiscard]] auto code() const -> MaillsErrorCode {
    return code_;
  }

  [[nodiscard]] auto message() const -> const std::string& {
    return message_;
  }

  explicit operator bool() const {
    return !ok();
  }

  static auto GetDefaultMessage(MaillsErrorCode code) -> std::string {
    static const std::unordered_map<MaillsErrorCode, std::string> messages = {
        {MaillsErrorCode::kSuccess, "Success"},
        {MaillsErrorCode::kFileNotFound, "File not found"},
        {MaillsErrorCode::kFileAccessDenied, "Access to file denied"},
        {MaillsErrorCode::kWriteFailed, "Failed to write file"},
        {MaillsErrorCode::kParseFailed, "Failed to parse file"},
        {MaillsErrorCode::kStaleVersion, "Stale document version"},
        {MaillsErrorCode::kUnknownDocument, "Unknown document"},
        {MaillsErrorCode::kInvalidEdit, "Invalid edit"},
        {MaillsErrorCode::kInvalidConfig, "Invalid configuration"},
        {MaillsErrorCode::kUnknownError, "Unknown error"}};

    auto it = messages.find(code);
    if (it != messages.end()) {
      return it->second;
    }
    return "Unknown error";
  }

  // "<default message>: <details>", or the default message alone
  static auto Make(MaillsErrorCode code, const std::string& details = "")
      -> MaillsError {
    if (details.empty()) {
      return MaillsError(code);
    }
    return {code, GetDefaultMessage(code) + ": " + details};
  }

  static auto Unexpected(MaillsErrorCode code, const std::string& details = "")
      -> std::unexpected<MaillsError> {
    return std::unexpected<MaillsError>(Make(code, details));
  }

 private:
  MaillsErrorCode code_ = MaillsErrorCode::kSuccess;
  std::string message_;
};

}  // namespace maills
