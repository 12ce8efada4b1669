#pragma once

#include <mutex>
#include <string>
#include <unordered_map>

#include "lendcore/common/types.hpp"
#include "lendcore/transfer/asset_transfer.hpp"

namespace lendcore {
namespace transfer {

class InMemoryAsset : public AssetTransfer {
 public:
  explicit InMemoryAsset(std::string symbol);

  void mint(common::AccountId account, common::Amount amount);
  // Authorizes the pool to pull up to `amount` from `account`.
  void approve(common::AccountId account, common::Amount amount);

  bool pull(common::AccountId from, common::Amount amount) override;
  bool push(common::AccountId to, common::Amount amount) override;

  [[nodiscard]] common::Amount balance_of(common::AccountId account) const;
  [[nodiscard]] common::Amount allowance_of(common::AccountId account) const;
  [[nodiscard]] common::Amount reserve() const;
  [[nodiscard]] const std::string& symbol() const noexcept { return symbol_; }

 private:
  std::string symbol_;
  mutable std::mutex mutex_;
  std::unordered_map<common::AccountId, common::Amount> balances_{};
  std::unordered_map<common::AccountId, common::Amount> allowances_{};
  common::Amount reserve_{0};
};

}  // namespace transfer
}  // namespace lendcore
