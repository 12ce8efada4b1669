#include "lendcore/risk/liquidation_engine.hpp"

#include "lendcore/common/basis_points.hpp"
#include "lendcore/common/errors.hpp"
#include "lendcore/credit/interest_schedule.hpp"

namespace lendcore {
namespace risk {

namespace {
constexpr common::Timestamp kMidTermStart = 2 * credit::kQuarterLength;
constexpr common::Timestamp kLateTermStart = 3 * credit::kQuarterLength;
}  // namespace

LiquidationEngine::Assessment LiquidationEngine::evaluate(common::AccountId borrower,
                                                          common::Timestamp now) const {
  Assessment result;
  const auto record = store_.borrower(borrower);
  if (!record.has_active_loan()) {
    return result;
  }

  result.loan_age = credit_.loan_age(borrower, now);
  result.collateral_ratio = credit_.collateral_ratio(borrower);

  if (result.loan_age > credit::kLoanTerm) {
    result.trigger = Trigger::kMatured;
    return result;
  }

  if (result.collateral_ratio < store_.pool().collateral_ratio_bp) {
    result.trigger = Trigger::kUndercollateralized;
    return result;
  }

  if (result.loan_age > kMidTermStart && result.loan_age <= kLateTermStart) {
    result.required_repaid = common::apply_basis_points(record.initial_borrow_amount, kMidTermRepaymentBp);
    if (record.amount_repaid < result.required_repaid) {
      result.trigger = Trigger::kMidTermRepaymentShortfall;
    }
    return result;
  }

  if (result.loan_age > kLateTermStart) {
    result.required_repaid = common::apply_basis_points(record.initial_borrow_amount, kLateTermRepaymentBp);
    if (record.amount_repaid < result.required_repaid) {
      result.trigger = Trigger::kLateTermRepaymentShortfall;
    }
  }

  return result;
}

bool LiquidationEngine::is_liquidatable(common::AccountId borrower, common::Timestamp now) const {
  return evaluate(borrower, now).liquidatable();
}

LiquidationEngine::Result LiquidationEngine::liquidate(common::AccountId borrower, common::Timestamp now) {
  auto* record = store_.find_borrower(borrower);
  if (record == nullptr || !record->has_active_loan()) {
    throw common::LendingError(common::ErrorCode::kNoActiveLoan, "borrower has no active loan");
  }

  const auto assessment = evaluate(borrower, now);
  if (!assessment.liquidatable()) {
    throw common::LendingError(common::ErrorCode::kNotLiquidatable, "position is healthy");
  }

  Result result{
      .debt = record->amount_borrowed,
      .collateral = record->collateral_deposited,
      .trigger = assessment.trigger,
  };

  record->amount_borrowed = 0;
  record->collateral_deposited = 0;
  record->borrow_timestamp = 0;
  record->last_iteration = now;
  return result;
}

const char* to_string(LiquidationEngine::Trigger trigger) noexcept {
  switch (trigger) {
    case LiquidationEngine::Trigger::kNone:
      return "none";
    case LiquidationEngine::Trigger::kMatured:
      return "matured";
    case LiquidationEngine::Trigger::kUndercollateralized:
      return "undercollateralized";
    case LiquidationEngine::Trigger::kMidTermRepaymentShortfall:
      return "mid-term-repayment-shortfall";
    case LiquidationEngine::Trigger::kLateTermRepaymentShortfall:
      return "late-term-repayment-shortfall";
  }
  return "unknown";
}

}  // namespace risk
}  // namespace lendcore
