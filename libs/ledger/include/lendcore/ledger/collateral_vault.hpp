#pragma once

#include "lendcore/common/types.hpp"
#include "lendcore/ledger/ledger_store.hpp"

namespace lendcore {
namespace ledger {

class CollateralVault {
 public:
  explicit CollateralVault(LedgerStore& store) : store_(store) {}

  // Also stamps borrow_timestamp with `now`, whether or not a loan is open;
  // a later borrow overwrites it.
  void deposit_collateral(common::AccountId account, common::Amount amount, common::Timestamp now);

  [[nodiscard]] common::Amount collateral_of(common::AccountId account) const;

 private:
  LedgerStore& store_;
};

}  // namespace ledger
}  // namespace lendcore
