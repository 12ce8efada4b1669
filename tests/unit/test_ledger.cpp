#include "test_ledger.hpp"

#include <cassert>
#include <limits>

#include "lendcore/ledger/collateral_vault.hpp"
#include "lendcore/ledger/ledger_store.hpp"
#include "lendcore/ledger/supply_ledger.hpp"
#include "test_support.hpp"

namespace lendcore::tests {

namespace {

ledger::LedgerStore make_store() {
  return ledger::LedgerStore{ledger::PoolState{
      .total_supplied = 0,
      .collateral_ratio_bp = 8'000,
      .protocol_fee_bp = 100,
      .fee_recipient = kFeeRecipient,
      .owner = kOwner,
  }};
}

}  // namespace

void test_ledger_store_checkpoint() {
  auto store = make_store();
  store.ensure_lender(7).amount_supplied = 50;
  store.pool().total_supplied = 50;

  const auto saved = store.checkpoint(7);
  store.ensure_lender(7).amount_supplied = 0;
  store.ensure_borrower(7).collateral_deposited = 99;
  store.pool().total_supplied = 0;

  store.restore(saved);
  assert(store.lender(7).amount_supplied == 50);
  assert(store.pool().total_supplied == 50);
  // The borrower record did not exist at the checkpoint.
  assert(!store.has_borrower(7));

  // Unknown accounts read as empty records without being created.
  assert(store.borrower(8).amount_borrowed == 0);
  assert(!store.has_borrower(8));
  assert(store.find_borrower(8) == nullptr);
  assert(store.has_lender(7));
  assert(!store.has_lender(8));

  store.ensure_borrower(30);
  store.ensure_borrower(4);
  const auto borrowers = store.borrowers();
  assert(borrowers.size() == 2);
  assert(borrowers[0] == 4);
  assert(borrowers[1] == 30);
}

void test_supply_deposit_withdraw() {
  auto store = make_store();
  ledger::SupplyLedger supply{store};

  supply.deposit(kLender, 500, 100);
  assert(supply.lender_balance(kLender) == 500);
  assert(store.lender(kLender).deposit_timestamp == 100);
  assert(supply.total_supplied() == 500);

  // Depositing then withdrawing the same amount restores the totals.
  supply.deposit(kLender, 250, 200);
  supply.withdraw(kLender, 250);
  assert(supply.lender_balance(kLender) == 500);
  assert(supply.total_supplied() == 500);
  assert(store.lender(kLender).deposit_timestamp == 200);

  expect_error(common::ErrorCode::kInsufficientBalance, [&] { supply.withdraw(kLender, 501); });
  expect_error(common::ErrorCode::kInsufficientBalance, [&] { supply.withdraw(kBorrower, 1); });
  expect_error(common::ErrorCode::kInvalidAmount, [&] { supply.withdraw(kLender, 0); });
  expect_error(common::ErrorCode::kInvalidAmount, [&] { supply.deposit(kLender, 0, 300); });
  assert(supply.total_supplied() == 500);

  // Liquidity lent out cannot be withdrawn.
  store.pool().total_supplied = 100;
  expect_error(common::ErrorCode::kInsufficientLiquidity, [&] { supply.withdraw(kLender, 200); });
  assert(supply.lender_balance(kLender) == 500);

  expect_error(common::ErrorCode::kInvalidAmount,
               [&] { supply.deposit(kLender, std::numeric_limits<common::Amount>::max(), 400); });
  assert(supply.lender_balance(kLender) == 500);
}

void test_supply_invariant() {
  auto store = make_store();
  ledger::SupplyLedger supply{store};

  const common::AccountId lenders[] = {11, 12, 13, 14};
  common::Amount amount = 37;
  for (int round = 0; round < 20; ++round) {
    const auto account = lenders[round % 4];
    supply.deposit(account, amount, round);
    if (round % 3 == 0 && amount > 1) {
      supply.withdraw(account, amount / 2);
    }
    amount = (amount * 7) % 101 + 1;
    assert(store.total_lender_balances() == supply.total_supplied());
  }

  for (const auto account : store.lenders()) {
    supply.withdraw(account, supply.lender_balance(account));
  }
  assert(supply.total_supplied() == 0);
  // Records survive with a zero balance.
  assert(store.lenders().size() == 4);
}

void test_collateral_vault() {
  auto store = make_store();
  ledger::CollateralVault vault{store};

  vault.deposit_collateral(kBorrower, 300, 1'000);
  assert(vault.collateral_of(kBorrower) == 300);
  assert(store.borrower(kBorrower).borrow_timestamp == 1'000);
  assert(!store.borrower(kBorrower).has_active_loan());

  vault.deposit_collateral(kBorrower, 200, 2'000);
  assert(vault.collateral_of(kBorrower) == 500);
  assert(store.borrower(kBorrower).borrow_timestamp == 2'000);

  expect_error(common::ErrorCode::kInvalidAmount, [&] { vault.deposit_collateral(kBorrower, 0, 3'000); });
  assert(store.borrower(kBorrower).borrow_timestamp == 2'000);
}

}  // namespace lendcore::tests
