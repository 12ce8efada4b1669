#pragma once

#include <cstdint>

#include "lendcore/common/types.hpp"

namespace lendcore {
namespace pool {

enum class EventKind : std::uint16_t {
  kDeposit = 1,
  kWithdraw = 2,
  kCollateralDeposit = 3,
  kBorrow = 4,
  kRepay = 5,
  kLiquidate = 6,
  kFeeRecipientChanged = 7,
};

// Audit record of one committed mutation.
//
//   kind                  account    counterparty    amount     secondary    fee
//   kDeposit..kBorrow     caller     -               amount     -            -
//   kRepay                caller     fee recipient   principal  interest     fee
//   kLiquidate            borrower   liquidator      debt       collateral   -
//   kFeeRecipientChanged  owner      new recipient   -          -            -
struct LendingEvent {
  EventKind kind{EventKind::kDeposit};
  common::AccountId account{common::kNoAccount};
  common::AccountId counterparty{common::kNoAccount};
  common::Amount amount{0};
  common::Amount secondary{0};
  common::Amount fee{0};
  common::Timestamp timestamp{0};
};

class EventSink {
 public:
  virtual ~EventSink() = default;
  virtual void publish(const LendingEvent& event) = 0;
};

[[nodiscard]] const char* to_string(EventKind kind) noexcept;
[[nodiscard]] bool is_known(std::uint16_t kind) noexcept;

}  // namespace pool
}  // namespace lendcore
