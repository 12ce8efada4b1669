#include "lendcore/transfer/in_memory_asset.hpp"

#include <utility>

#include "lendcore/common/basis_points.hpp"

namespace lendcore {
namespace transfer {

InMemoryAsset::InMemoryAsset(std::string symbol) : symbol_(std::move(symbol)) {}

void InMemoryAsset::mint(common::AccountId account, common::Amount amount) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& balance = balances_[account];
  balance = common::checked_add(balance, amount);
}

void InMemoryAsset::approve(common::AccountId account, common::Amount amount) {
  std::lock_guard<std::mutex> lock(mutex_);
  allowances_[account] = amount;
}

bool InMemoryAsset::pull(common::AccountId from, common::Amount amount) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto balance_it = balances_.find(from);
  auto allowance_it = allowances_.find(from);
  if (balance_it == balances_.end() || allowance_it == allowances_.end()) {
    return false;
  }
  if (balance_it->second < amount || allowance_it->second < amount) {
    return false;
  }
  balance_it->second -= amount;
  allowance_it->second -= amount;
  reserve_ += amount;
  return true;
}

bool InMemoryAsset::push(common::AccountId to, common::Amount amount) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (reserve_ < amount) {
    return false;
  }
  reserve_ -= amount;
  balances_[to] += amount;
  return true;
}

common::Amount InMemoryAsset::balance_of(common::AccountId account) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto it = balances_.find(account); it != balances_.end()) {
    return it->second;
  }
  return 0;
}

common::Amount InMemoryAsset::allowance_of(common::AccountId account) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto it = allowances_.find(account); it != allowances_.end()) {
    return it->second;
  }
  return 0;
}

common::Amount InMemoryAsset::reserve() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return reserve_;
}

}  // namespace transfer
}  // namespace lendcore
