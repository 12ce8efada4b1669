#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace lendcore {
namespace common {

enum class ErrorCode : std::uint8_t {
  kOk,
  kInvalidAmount,
  kInsufficientBalance,
  kInsufficientLiquidity,
  kCollateralLimitExceeded,
  kNoActiveLoan,
  kOverRepayment,
  kNotLiquidatable,
  kTransferFailed,
  kReentrantCall,
  kNotOwner,
  kUnauthorized,
  kMalformedRequest,
  kInvalidConfig,
};

[[nodiscard]] std::string_view to_string(ErrorCode code) noexcept;

// Raised before any state is touched when a precondition fails, and after a
// full rollback when settlement fails.
class LendingError : public std::runtime_error {
 public:
  LendingError(ErrorCode code, const std::string& detail);

  [[nodiscard]] ErrorCode code() const noexcept { return code_; }

 private:
  ErrorCode code_;
};

}  // namespace common
}  // namespace lendcore
