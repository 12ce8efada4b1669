#include "lendcore/pool/events.hpp"

namespace lendcore {
namespace pool {

const char* to_string(EventKind kind) noexcept {
  switch (kind) {
    case EventKind::kDeposit:
      return "deposit";
    case EventKind::kWithdraw:
      return "withdraw";
    case EventKind::kCollateralDeposit:
      return "collateral-deposit";
    case EventKind::kBorrow:
      return "borrow";
    case EventKind::kRepay:
      return "repay";
    case EventKind::kLiquidate:
      return "liquidate";
    case EventKind::kFeeRecipientChanged:
      return "fee-recipient-changed";
  }
  return "unknown";
}

bool is_known(std::uint16_t kind) noexcept {
  return kind >= static_cast<std::uint16_t>(EventKind::kDeposit) &&
         kind <= static_cast<std::uint16_t>(EventKind::kFeeRecipientChanged);
}

}  // namespace pool
}  // namespace lendcore
