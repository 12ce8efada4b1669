#include "lendcore/credit/credit_engine.hpp"

#include <limits>

#include "lendcore/common/basis_points.hpp"
#include "lendcore/common/errors.hpp"

namespace lendcore {
namespace credit {

using common::ErrorCode;
using common::LendingError;

common::Timestamp CreditEngine::age_of(const ledger::BorrowerRecord& record, common::Timestamp now) noexcept {
  return now > record.borrow_timestamp ? now - record.borrow_timestamp : 0;
}

void CreditEngine::borrow(common::AccountId account, common::Amount amount, common::Timestamp now) {
  if (amount == 0) {
    throw LendingError(ErrorCode::kInvalidAmount, "borrow amount must be positive");
  }

  const auto record = store_.borrower(account);
  if (record.collateral_deposited == 0) {
    throw LendingError(ErrorCode::kCollateralLimitExceeded, "no collateral deposited");
  }

  const auto limit = max_borrowable(account);
  if (amount > limit || record.amount_borrowed > limit - amount) {
    throw LendingError(ErrorCode::kCollateralLimitExceeded, "borrow exceeds collateral limit");
  }

  auto& pool = store_.pool();
  if (amount > pool.total_supplied) {
    throw LendingError(ErrorCode::kInsufficientLiquidity, "borrow exceeds pool liquidity");
  }

  const auto lifetime_drawn = common::checked_add(record.initial_borrow_amount, amount);

  auto& borrower = store_.ensure_borrower(account);
  borrower.amount_borrowed += amount;
  borrower.initial_borrow_amount = lifetime_drawn;
  borrower.borrow_timestamp = now;
  borrower.last_iteration = now;
  pool.total_supplied -= amount;
}

RepayResult CreditEngine::repay(common::AccountId account, common::Amount principal, common::Timestamp now) {
  if (principal == 0) {
    throw LendingError(ErrorCode::kInvalidAmount, "repay amount must be positive");
  }

  auto* borrower = store_.find_borrower(account);
  if (borrower == nullptr || !borrower->has_active_loan()) {
    throw LendingError(ErrorCode::kNoActiveLoan, "no active loan to repay");
  }
  if (principal > borrower->amount_borrowed) {
    throw LendingError(ErrorCode::kOverRepayment, "repayment exceeds outstanding principal");
  }

  const auto age = age_of(*borrower, now);
  RepayResult result;
  result.principal = principal;
  result.interest = schedule_.interest(borrower->amount_borrowed, age);
  if (result.interest > std::numeric_limits<common::Amount>::max() - principal) {
    throw LendingError(ErrorCode::kInvalidAmount, "amount due overflows");
  }

  const auto lifetime_repaid = common::checked_add(borrower->amount_repaid, principal);
  borrower->amount_borrowed -= principal;
  borrower->amount_repaid = lifetime_repaid;

  if (borrower->amount_borrowed == 0) {
    // Fee is only charged when the loan closes, and is carved out of the
    // interest collected.
    result.closed = true;
    result.fee = schedule_.fee(result.interest, age);
    borrower->borrow_timestamp = 0;
    borrower->last_iteration = now;
  }

  return result;
}

common::Amount CreditEngine::max_borrowable(common::AccountId account) const {
  return common::apply_basis_points(store_.borrower(account).collateral_deposited,
                                    store_.pool().collateral_ratio_bp);
}

common::Timestamp CreditEngine::loan_age(common::AccountId account, common::Timestamp now) const {
  const auto record = store_.borrower(account);
  if (!record.has_active_loan()) {
    return 0;
  }
  return age_of(record, now);
}

common::Amount CreditEngine::accrued_interest(common::AccountId account, common::Timestamp now) const {
  const auto record = store_.borrower(account);
  if (!record.has_active_loan()) {
    return 0;
  }
  return schedule_.interest(record.amount_borrowed, age_of(record, now));
}

common::Amount CreditEngine::total_debt(common::AccountId account, common::Timestamp now) const {
  const auto record = store_.borrower(account);
  if (!record.has_active_loan()) {
    return 0;
  }
  const auto interest = schedule_.interest(record.amount_borrowed, age_of(record, now));
  return common::checked_add(record.amount_borrowed, interest);
}

std::uint64_t CreditEngine::collateral_ratio(common::AccountId account) const {
  const auto record = store_.borrower(account);
  if (!record.has_active_loan()) {
    return common::kInfiniteRatio;
  }
  return common::ratio_basis_points(record.collateral_deposited, record.amount_borrowed);
}

}  // namespace credit
}  // namespace lendcore
