#pragma once

#include "lendcore/common/types.hpp"
#include "lendcore/ledger/ledger_store.hpp"

namespace lendcore {
namespace ledger {

// Lender side of the pool. Only bookkeeping: moving the base asset is left
// to the caller, which must roll the store back if that fails.
class SupplyLedger {
 public:
  explicit SupplyLedger(LedgerStore& store) : store_(store) {}

  void deposit(common::AccountId account, common::Amount amount, common::Timestamp now);
  void withdraw(common::AccountId account, common::Amount amount);

  [[nodiscard]] common::Amount lender_balance(common::AccountId account) const;
  [[nodiscard]] common::Amount total_supplied() const noexcept { return store_.pool().total_supplied; }

 private:
  LedgerStore& store_;
};

}  // namespace ledger
}  // namespace lendcore
