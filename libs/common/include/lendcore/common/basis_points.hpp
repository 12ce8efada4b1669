#pragma once

#include <cstdint>
#include <limits>

#include "lendcore/common/errors.hpp"
#include "lendcore/common/types.hpp"

namespace lendcore {
namespace common {

inline constexpr BasisPoints kBasisPointDenominator = 10'000;

// amount * bp / 10000, truncating. The product is formed in 128 bits so it
// cannot wrap for any Amount.
inline constexpr Amount apply_basis_points(Amount amount, BasisPoints bp) noexcept {
  const auto product = static_cast<unsigned __int128>(amount) * bp;
  return static_cast<Amount>(product / kBasisPointDenominator);
}

// numerator * 10000 / denominator, saturating at kInfiniteRatio.
inline constexpr std::uint64_t ratio_basis_points(Amount numerator, Amount denominator) noexcept {
  if (denominator == 0) {
    return kInfiniteRatio;
  }
  const auto ratio = static_cast<unsigned __int128>(numerator) * kBasisPointDenominator / denominator;
  if (ratio > std::numeric_limits<std::uint64_t>::max()) {
    return kInfiniteRatio;
  }
  return static_cast<std::uint64_t>(ratio);
}

inline Amount checked_add(Amount lhs, Amount rhs) {
  if (lhs > std::numeric_limits<Amount>::max() - rhs) {
    throw LendingError(ErrorCode::kInvalidAmount, "amount overflow");
  }
  return lhs + rhs;
}

}  // namespace common
}  // namespace lendcore
