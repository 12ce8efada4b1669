#include "test_risk.hpp"

#include <cassert>

#include "lendcore/credit/credit_engine.hpp"
#include "lendcore/credit/interest_schedule.hpp"
#include "lendcore/ledger/collateral_vault.hpp"
#include "lendcore/ledger/ledger_store.hpp"
#include "lendcore/ledger/supply_ledger.hpp"
#include "lendcore/risk/liquidation_engine.hpp"
#include "test_support.hpp"

namespace lendcore::tests {

namespace {

using Trigger = risk::LiquidationEngine::Trigger;

constexpr common::Timestamp kStart = common::days(1);

struct RiskFixture {
  ledger::LedgerStore store{ledger::PoolState{
      .total_supplied = 0,
      .collateral_ratio_bp = 8'000,
      .protocol_fee_bp = 100,
      .fee_recipient = kFeeRecipient,
      .owner = kOwner,
  }};
  credit::InterestSchedule schedule{};
  ledger::SupplyLedger supply{store};
  ledger::CollateralVault vault{store};
  credit::CreditEngine credit{store, schedule};
  risk::LiquidationEngine liquidation{store, credit};

  RiskFixture() {
    supply.deposit(kLender, 1'000, 0);
    vault.deposit_collateral(kBorrower, 1'000, 0);
  }

  Trigger trigger_at(common::Timestamp age) const {
    return liquidation.evaluate(kBorrower, kStart + age).trigger;
  }
};

}  // namespace

void test_liquidation_triggers() {
  RiskFixture f;

  // Collateral alone, however old its timestamp, is never liquidatable.
  assert(!f.liquidation.is_liquidatable(kBorrower, common::days(900)));
  assert(f.liquidation.evaluate(kBorrower, common::days(900)).collateral_ratio == common::kInfiniteRatio);

  f.credit.borrow(kBorrower, 800, kStart);
  assert(f.trigger_at(0) == Trigger::kNone);
  assert(f.trigger_at(common::days(180)) == Trigger::kNone);

  const auto mid = f.liquidation.evaluate(kBorrower, kStart + common::days(180) + 1);
  assert(mid.trigger == Trigger::kMidTermRepaymentShortfall);
  assert(mid.required_repaid == 200);
  assert(mid.collateral_ratio == 12'500);

  assert(f.trigger_at(common::days(270)) == Trigger::kMidTermRepaymentShortfall);
  assert(f.trigger_at(common::days(271)) == Trigger::kLateTermRepaymentShortfall);
  assert(f.trigger_at(common::days(365)) == Trigger::kLateTermRepaymentShortfall);
  assert(f.trigger_at(common::days(365) + 1) == Trigger::kMatured);

  // A quarter repaid clears the mid-term check but not the late-term one.
  f.credit.repay(kBorrower, 200, kStart + common::days(100));
  assert(f.trigger_at(common::days(200)) == Trigger::kNone);
  assert(f.trigger_at(common::days(300)) == Trigger::kLateTermRepaymentShortfall);
  f.credit.repay(kBorrower, 200, kStart + common::days(100));
  assert(f.trigger_at(common::days(300)) == Trigger::kNone);
  // Maturity applies regardless of repayments.
  assert(f.trigger_at(common::days(400)) == Trigger::kMatured);

  // Ratio below the pool threshold; borrow() cannot get here, so edit the
  // record directly.
  f.store.find_borrower(kBorrower)->amount_borrowed = 1'300;
  const auto under = f.liquidation.evaluate(kBorrower, kStart + common::days(1));
  assert(under.trigger == Trigger::kUndercollateralized);
  assert(under.collateral_ratio == 7'692);
}

void test_liquidation_execution() {
  RiskFixture f;
  expect_error(common::ErrorCode::kNoActiveLoan, [&] { f.liquidation.liquidate(kBorrower, kStart); });

  f.credit.borrow(kBorrower, 800, kStart);
  expect_error(common::ErrorCode::kNotLiquidatable,
               [&] { f.liquidation.liquidate(kBorrower, kStart + common::days(30)); });
  assert(f.store.borrower(kBorrower).amount_borrowed == 800);

  const auto now = kStart + common::days(370);
  const auto result = f.liquidation.liquidate(kBorrower, now);
  assert(result.debt == 800);
  assert(result.collateral == 1'000);
  assert(result.trigger == Trigger::kMatured);

  const auto record = f.store.borrower(kBorrower);
  assert(record.amount_borrowed == 0);
  assert(record.collateral_deposited == 0);
  assert(record.borrow_timestamp == 0);
  assert(record.last_iteration == now);
  assert(record.initial_borrow_amount == 800);
  assert(record.amount_repaid == 0);
  assert(!f.liquidation.is_liquidatable(kBorrower, now + common::days(1)));
}

}  // namespace lendcore::tests
