#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace payledger {
namespace common {

enum class ErrorCode : std::uint8_t {
  kOk,
  kParseError,
  kInvalidAmount,
  kInsufficientFunds,
  kUnknownTransaction,
  kNotDisputed,
  kAlreadyDisputed,
  kAccountLocked,
  kUnrecognizedType,
};

inline constexpr std::size_t kErrorCodeCount = 9;

inline constexpr std::array<ErrorCode, kErrorCodeCount> kAllErrorCodes = {
    ErrorCode::kOk,
    ErrorCode::kParseError,
    ErrorCode::kInvalidAmount,
    ErrorCode::kInsufficientFunds,
    ErrorCode::kUnknownTransaction,
    ErrorCode::kNotDisputed,
    ErrorCode::kAlreadyDisputed,
    ErrorCode::kAccountLocked,
    ErrorCode::kUnrecognizedType,
};

inline constexpr std::string_view to_string(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::kOk:
      return "ok";
    case ErrorCode::kParseError:
      return "parse_error";
    case ErrorCode::kInvalidAmount:
      return "invalid_amount";
    case ErrorCode::kInsufficientFunds:
      return "insufficient_funds";
    case ErrorCode::kUnknownTransaction:
      return "unknown_transaction";
    case ErrorCode::kNotDisputed:
      return "not_disputed";
    case ErrorCode::kAlreadyDisputed:
      return "already_disputed";
    case ErrorCode::kAccountLocked:
      return "account_locked";
    case ErrorCode::kUnrecognizedType:
      return "unrecognized_type";
  }
  return "unknown_error";
}

inline constexpr std::size_t index_of(ErrorCode code) noexcept {
  return static_cast<std::size_t>(code);
}

// Outcome of applying or parsing a single record.
struct Status {
  ErrorCode code{ErrorCode::kOk};
  std::string reason{};

  [[nodiscard]] bool ok() const noexcept { return code == ErrorCode::kOk; }

  // "<code>: <reason>", the form written to the failed-records report.
  [[nodiscard]] std::string message() const {
    std::string text{to_string(code)};
    if (!reason.empty()) {
      text += ": ";
      text += reason;
    }
    return text;
  }

  static Status success() { return Status{}; }
  static Status failure(ErrorCode code, std::string reason) {
    return Status{code, std::move(reason)};
  }
};

}  // namespace common
}  // namespace payledger
