#include "lendcore/credit/interest_schedule.hpp"

#include "lendcore/common/basis_points.hpp"

namespace lendcore {
namespace credit {

Quarter InterestSchedule::quarter_for(common::Timestamp loan_age) noexcept {
  if (loan_age <= kQuarterLength) {
    return Quarter::kQ1;
  }
  if (loan_age <= 2 * kQuarterLength) {
    return Quarter::kQ2;
  }
  if (loan_age <= 3 * kQuarterLength) {
    return Quarter::kQ3;
  }
  return Quarter::kQ4;
}

QuarterRates InterestSchedule::rates(Quarter quarter) const noexcept {
  return rates_[static_cast<std::size_t>(quarter)];
}

QuarterRates InterestSchedule::rates_for_age(common::Timestamp loan_age) const noexcept {
  return rates(quarter_for(loan_age));
}

common::Amount InterestSchedule::interest(common::Amount principal, common::Timestamp loan_age) const noexcept {
  return common::apply_basis_points(principal, rates_for_age(loan_age).interest_bp);
}

common::Amount InterestSchedule::fee(common::Amount interest, common::Timestamp loan_age) const noexcept {
  return common::apply_basis_points(interest, rates_for_age(loan_age).fee_bp);
}

}  // namespace credit
}  // namespace lendcore
