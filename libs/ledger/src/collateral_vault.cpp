#include "lendcore/ledger/collateral_vault.hpp"

#include "lendcore/common/basis_points.hpp"
#include "lendcore/common/errors.hpp"

namespace lendcore {
namespace ledger {

void CollateralVault::deposit_collateral(common::AccountId account, common::Amount amount, common::Timestamp now) {
  if (amount == 0) {
    throw common::LendingError(common::ErrorCode::kInvalidAmount, "collateral amount must be positive");
  }

  const auto new_collateral = common::checked_add(store_.borrower(account).collateral_deposited, amount);

  auto& record = store_.ensure_borrower(account);
  record.collateral_deposited = new_collateral;
  record.borrow_timestamp = now;
}

common::Amount CollateralVault::collateral_of(common::AccountId account) const {
  return store_.borrower(account).collateral_deposited;
}

}  // namespace ledger
}  // namespace lendcore
