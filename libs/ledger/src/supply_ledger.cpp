#include "lendcore/ledger/supply_ledger.hpp"

#include "lendcore/common/basis_points.hpp"
#include "lendcore/common/errors.hpp"

namespace lendcore {
namespace ledger {

using common::ErrorCode;
using common::LendingError;

void SupplyLedger::deposit(common::AccountId account, common::Amount amount, common::Timestamp now) {
  if (amount == 0) {
    throw LendingError(ErrorCode::kInvalidAmount, "deposit amount must be positive");
  }

  const auto current = store_.lender(account).amount_supplied;
  const auto new_balance = common::checked_add(current, amount);
  const auto new_total = common::checked_add(store_.pool().total_supplied, amount);

  auto& record = store_.ensure_lender(account);
  record.amount_supplied = new_balance;
  record.deposit_timestamp = now;
  store_.pool().total_supplied = new_total;
}

void SupplyLedger::withdraw(common::AccountId account, common::Amount amount) {
  if (amount == 0) {
    throw LendingError(ErrorCode::kInvalidAmount, "withdraw amount must be positive");
  }

  const auto balance = store_.lender(account).amount_supplied;
  if (amount > balance) {
    throw LendingError(ErrorCode::kInsufficientBalance, "withdraw exceeds supplied balance");
  }
  if (amount > store_.pool().total_supplied) {
    throw LendingError(ErrorCode::kInsufficientLiquidity, "withdraw exceeds pool liquidity");
  }

  store_.ensure_lender(account).amount_supplied = balance - amount;
  store_.pool().total_supplied -= amount;
}

common::Amount SupplyLedger::lender_balance(common::AccountId account) const {
  return store_.lender(account).amount_supplied;
}

}  // namespace ledger
}  // namespace lendcore
