#pragma once

#include <cstdint>

#include "lendcore/common/types.hpp"
#include "lendcore/credit/credit_engine.hpp"
#include "lendcore/ledger/ledger_store.hpp"

namespace lendcore {
namespace risk {

// Repayment milestones: by the end of Q3 a quarter of the lifetime principal
// must be repaid, by the end of the term half of it.
inline constexpr common::BasisPoints kMidTermRepaymentBp = 2'500;
inline constexpr common::BasisPoints kLateTermRepaymentBp = 5'000;

class LiquidationEngine {
 public:
  enum class Trigger : std::uint8_t {
    kNone,
    kMatured,
    kUndercollateralized,
    kMidTermRepaymentShortfall,
    kLateTermRepaymentShortfall,
  };

  struct Assessment {
    Trigger trigger{Trigger::kNone};
    common::Timestamp loan_age{0};
    std::uint64_t collateral_ratio{common::kInfiniteRatio};
    common::Amount required_repaid{0};

    [[nodiscard]] bool liquidatable() const noexcept { return trigger != Trigger::kNone; }
  };

  struct Result {
    common::Amount debt{0};
    common::Amount collateral{0};
    Trigger trigger{Trigger::kNone};
  };

  LiquidationEngine(ledger::LedgerStore& store, const credit::CreditEngine& credit)
      : store_(store), credit_(credit) {}

  [[nodiscard]] Assessment evaluate(common::AccountId borrower, common::Timestamp now) const;
  [[nodiscard]] bool is_liquidatable(common::AccountId borrower, common::Timestamp now) const;

  // Full seizure: clears principal and collateral. Moving the debt and the
  // collateral is left to the caller.
  Result liquidate(common::AccountId borrower, common::Timestamp now);

 private:
  ledger::LedgerStore& store_;
  const credit::CreditEngine& credit_;
};

[[nodiscard]] const char* to_string(LiquidationEngine::Trigger trigger) noexcept;

}  // namespace risk
}  // namespace lendcore
