#include "lendcore/transfer/settlement.hpp"

#include <stdexcept>

#include "lendcore/common/errors.hpp"

namespace lendcore {
namespace transfer {

void Settlement::add_pull(AssetTransfer& asset, common::AccountId from, common::Amount amount) {
  if (has_push_) {
    throw std::logic_error("settlement pulls must precede pushes");
  }
  legs_.push_back(Leg{.asset = &asset, .direction = Direction::kPull, .account = from, .amount = amount});
}

void Settlement::add_push(AssetTransfer& asset, common::AccountId to, common::Amount amount) {
  has_push_ = true;
  legs_.push_back(Leg{.asset = &asset, .direction = Direction::kPush, .account = to, .amount = amount});
}

bool Settlement::execute() {
  std::size_t completed = 0;
  try {
    for (; completed < legs_.size(); ++completed) {
      const auto& leg = legs_[completed];
      if (leg.amount == 0) {
        continue;
      }
      if (!run(leg)) {
        unwind(completed);
        return false;
      }
    }
  } catch (const std::exception&) {
    // A throwing leg ran nothing; hand back what the earlier legs moved.
    unwind(completed);
    throw;
  }
  return true;
}

void Settlement::unwind(std::size_t completed) {
  while (completed > 0) {
    const auto& leg = legs_[--completed];
    if (leg.amount == 0) {
      continue;
    }
    if (!reverse(leg)) {
      throw common::LendingError(common::ErrorCode::kTransferFailed, "settlement could not be reversed");
    }
  }
}

bool Settlement::run(const Leg& leg) {
  if (leg.direction == Direction::kPull) {
    return leg.asset->pull(leg.account, leg.amount);
  }
  return leg.asset->push(leg.account, leg.amount);
}

bool Settlement::reverse(const Leg& leg) {
  if (leg.direction == Direction::kPull) {
    return leg.asset->push(leg.account, leg.amount);
  }
  return leg.asset->pull(leg.account, leg.amount);
}

}  // namespace transfer
}  // namespace lendcore
