#pragma once

#include "lendcore/common/types.hpp"

namespace lendcore {
namespace transfer {

// Moves one asset between an account and the pool. Both calls report
// failure through their return value and leave balances untouched when they
// fail.
class AssetTransfer {
 public:
  virtual ~AssetTransfer() = default;

  // Account -> pool. Requires the account to have authorized the pool for
  // at least `amount` beforehand.
  virtual bool pull(common::AccountId from, common::Amount amount) = 0;

  // Pool -> account.
  virtual bool push(common::AccountId to, common::Amount amount) = 0;
};

}  // namespace transfer
}  // namespace lendcore
