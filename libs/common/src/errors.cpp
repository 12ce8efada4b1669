#include "lendcore/common/errors.hpp"

namespace lendcore {
namespace common {

std::string_view to_string(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::kOk:
      return "Ok";
    case ErrorCode::kInvalidAmount:
      return "InvalidAmount";
    case ErrorCode::kInsufficientBalance:
      return "InsufficientBalance";
    case ErrorCode::kInsufficientLiquidity:
      return "InsufficientLiquidity";
    case ErrorCode::kCollateralLimitExceeded:
      return "CollateralLimitExceeded";
    case ErrorCode::kNoActiveLoan:
      return "NoActiveLoan";
    case ErrorCode::kOverRepayment:
      return "OverRepayment";
    case ErrorCode::kNotLiquidatable:
      return "NotLiquidatable";
    case ErrorCode::kTransferFailed:
      return "TransferFailed";
    case ErrorCode::kReentrantCall:
      return "ReentrantCall";
    case ErrorCode::kNotOwner:
      return "NotOwner";
    case ErrorCode::kUnauthorized:
      return "Unauthorized";
    case ErrorCode::kMalformedRequest:
      return "MalformedRequest";
    case ErrorCode::kInvalidConfig:
      return "InvalidConfig";
  }
  return "Unknown";
}

LendingError::LendingError(ErrorCode code, const std::string& detail)
    : std::runtime_error(std::string(to_string(code)) + ": " + detail), code_(code) {}

}  // namespace common
}  // namespace lendcore
