#pragma once

#include <cassert>
#include <vector>

#include "lendcore/common/errors.hpp"
#include "lendcore/common/time_utils.hpp"
#include "lendcore/pool/events.hpp"
#include "lendcore/pool/lending_pool.hpp"
#include "lendcore/transfer/in_memory_asset.hpp"

namespace lendcore::tests {

template <typename Fn>
void expect_error(common::ErrorCode expected, Fn&& fn) {
  try {
    fn();
  } catch (const common::LendingError& ex) {
    assert(ex.code() == expected);
    return;
  }
  assert(false && "expected LendingError");
}

inline constexpr common::AccountId kOwner = 1;
inline constexpr common::AccountId kFeeRecipient = 2;
inline constexpr common::AccountId kLender = 10;
inline constexpr common::AccountId kBorrower = 20;
inline constexpr common::AccountId kLiquidator = 30;

class RecordingSink : public pool::EventSink {
 public:
  void publish(const pool::LendingEvent& event) override { events.push_back(event); }

  std::vector<pool::LendingEvent> events;
};

// Pool at an 80% collateral ratio with both assets held in memory.
struct PoolFixture {
  common::ManualClock clock{1'700'000'000};
  transfer::InMemoryAsset base{"BASE"};
  transfer::InMemoryAsset collateral{"COLL"};
  pool::LendingPool pool{pool::PoolConfig{.owner = kOwner,
                                          .fee_recipient = kFeeRecipient,
                                          .collateral_ratio_bp = 8'000,
                                          .protocol_fee_bp = 100},
                         base, collateral, clock};

  // Mints and authorizes the pool to pull the account's whole balance.
  void fund(common::AccountId account, common::Amount base_amount, common::Amount collateral_amount) {
    base.mint(account, base_amount);
    base.approve(account, base.balance_of(account));
    collateral.mint(account, collateral_amount);
    collateral.approve(account, collateral.balance_of(account));
  }

  void advance_days(std::int64_t count) { clock.advance(common::days(count)); }

  // 1000 supplied by the lender, 1000 collateral locked by the borrower.
  void seed_scenario() {
    fund(kLender, 1'000, 0);
    fund(kBorrower, 0, 1'000);
    pool.deposit(kLender, 1'000);
    pool.deposit_collateral(kBorrower, 1'000);
  }
};

}  // namespace lendcore::tests
