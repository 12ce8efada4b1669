#pragma once

#include <cstdint>
#include <limits>

namespace lendcore {
namespace common {

using AccountId = std::uint64_t;
using Amount = std::uint64_t;
using Timestamp = std::int64_t;  // seconds since epoch
using BasisPoints = std::uint32_t;

inline constexpr AccountId kNoAccount = 0;

inline constexpr Timestamp kSecondsPerDay = 86'400;

inline constexpr Timestamp days(std::int64_t count) noexcept {
  return count * kSecondsPerDay;
}

// Ratio reported for a borrower without an active loan.
inline constexpr std::uint64_t kInfiniteRatio = std::numeric_limits<std::uint64_t>::max();

}  // namespace common
}  // namespace lendcore
