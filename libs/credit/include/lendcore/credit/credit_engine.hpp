#pragma once

#include <cstdint>

#include "lendcore/common/types.hpp"
#include "lendcore/credit/interest_schedule.hpp"
#include "lendcore/ledger/ledger_store.hpp"

namespace lendcore {
namespace credit {

struct RepayResult {
  common::Amount principal{0};
  common::Amount interest{0};
  common::Amount fee{0};  // non-zero only when the loan closed
  bool closed{false};

  [[nodiscard]] common::Amount amount_due() const noexcept { return principal + interest; }
};

class CreditEngine {
 public:
  CreditEngine(ledger::LedgerStore& store, const InterestSchedule& schedule)
      : store_(store), schedule_(schedule) {}

  void borrow(common::AccountId account, common::Amount amount, common::Timestamp now);
  RepayResult repay(common::AccountId account, common::Amount principal, common::Timestamp now);

  [[nodiscard]] common::Amount max_borrowable(common::AccountId account) const;
  [[nodiscard]] common::Timestamp loan_age(common::AccountId account, common::Timestamp now) const;
  [[nodiscard]] common::Amount accrued_interest(common::AccountId account, common::Timestamp now) const;
  [[nodiscard]] common::Amount total_debt(common::AccountId account, common::Timestamp now) const;
  // collateral * 10000 / principal; kInfiniteRatio without an active loan.
  [[nodiscard]] std::uint64_t collateral_ratio(common::AccountId account) const;

  [[nodiscard]] const InterestSchedule& schedule() const noexcept { return schedule_; }

 private:
  ledger::LedgerStore& store_;
  const InterestSchedule& schedule_;

  static common::Timestamp age_of(const ledger::BorrowerRecord& record, common::Timestamp now) noexcept;
};

}  // namespace credit
}  // namespace lendcore
