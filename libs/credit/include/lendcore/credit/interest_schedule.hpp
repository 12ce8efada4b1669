#pragma once

#include <array>
#include <cstdint>

#include "lendcore/common/types.hpp"

namespace lendcore {
namespace credit {

enum class Quarter : std::uint8_t {
  kQ1,
  kQ2,
  kQ3,
  kQ4,
};

struct QuarterRates {
  common::BasisPoints interest_bp{0};
  common::BasisPoints fee_bp{0};
};

inline constexpr common::Timestamp kQuarterLength = common::days(90);
inline constexpr common::Timestamp kLoanTerm = common::days(365);

// Fixed simple-interest schedule keyed by loan age. Each bracket's upper
// bound is inclusive: day 90 is still Q1. Loans older than 270 days stay in
// Q4 indefinitely.
class InterestSchedule {
 public:
  using RateTable = std::array<QuarterRates, 4>;

  static constexpr RateTable kDefaultRates{{
      {.interest_bp = 450, .fee_bp = 100},
      {.interest_bp = 800, .fee_bp = 150},
      {.interest_bp = 1050, .fee_bp = 200},
      {.interest_bp = 1300, .fee_bp = 250},
  }};

  [[nodiscard]] static Quarter quarter_for(common::Timestamp loan_age) noexcept;
  [[nodiscard]] QuarterRates rates(Quarter quarter) const noexcept;
  [[nodiscard]] QuarterRates rates_for_age(common::Timestamp loan_age) const noexcept;

  // principal * interest_bp, truncated to ledger units.
  [[nodiscard]] common::Amount interest(common::Amount principal, common::Timestamp loan_age) const noexcept;
  [[nodiscard]] common::Amount fee(common::Amount interest, common::Timestamp loan_age) const noexcept;

 private:
  RateTable rates_{kDefaultRates};
};

}  // namespace credit
}  // namespace lendcore
