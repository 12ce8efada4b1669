#pragma once

#include <cstdint>
#include <mutex>

#include "lendcore/common/time_utils.hpp"
#include "lendcore/common/types.hpp"
#include "lendcore/credit/credit_engine.hpp"
#include "lendcore/credit/interest_schedule.hpp"
#include "lendcore/ledger/collateral_vault.hpp"
#include "lendcore/ledger/ledger_store.hpp"
#include "lendcore/ledger/supply_ledger.hpp"
#include "lendcore/pool/events.hpp"
#include "lendcore/risk/liquidation_engine.hpp"
#include "lendcore/telemetry/telemetry_sink.hpp"
#include "lendcore/transfer/asset_transfer.hpp"
#include "lendcore/transfer/settlement.hpp"

namespace lendcore {
namespace pool {

inline constexpr common::BasisPoints kMinCollateralRatioBp = 5'000;
inline constexpr common::BasisPoints kMaxCollateralRatioBp = 9'500;

struct PoolConfig {
  common::AccountId owner{common::kNoAccount};
  common::AccountId fee_recipient{common::kNoAccount};
  common::BasisPoints collateral_ratio_bp{8'000};
  common::BasisPoints protocol_fee_bp{0};
};

// Telemetry ids reported by the pool.
enum class Metric : std::uint64_t {
  kDeposit = 1,
  kWithdraw = 2,
  kCollateralDeposit = 3,
  kBorrow = 4,
  kRepay = 5,
  kLiquidate = 6,
  kFeeRecipientChanged = 7,
  kRejected = 8,
  kRolledBack = 9,
  kPublishFailed = 10,
};

[[nodiscard]] const char* to_string(Metric metric) noexcept;

// Entry point of the ledger. Mutations are serialized on one lock; each one
// samples the clock once, applies its bookkeeping, then settles the asset
// movements and restores the touched records if settlement fails. A
// collaborator calling back into a mutator from inside a settlement is
// rejected with ReentrantCall.
class LendingPool {
 public:
  LendingPool(PoolConfig config,
              transfer::AssetTransfer& base_asset,
              transfer::AssetTransfer& collateral_asset,
              const common::Clock& clock);
  LendingPool(const LendingPool&) = delete;
  LendingPool& operator=(const LendingPool&) = delete;

  void set_event_sink(EventSink* sink);
  void set_telemetry(telemetry::TelemetrySink* telemetry);

  void deposit(common::AccountId caller, common::Amount amount);
  void withdraw(common::AccountId caller, common::Amount amount);
  void deposit_collateral(common::AccountId caller, common::Amount amount);
  void borrow(common::AccountId caller, common::Amount amount);
  credit::RepayResult repay(common::AccountId caller, common::Amount principal);
  risk::LiquidationEngine::Result liquidate(common::AccountId caller, common::AccountId borrower);

  // Owner only.
  void set_fee_recipient(common::AccountId caller, common::AccountId recipient);

  [[nodiscard]] common::Amount lender_balance(common::AccountId account) const;
  [[nodiscard]] ledger::LenderRecord lender(common::AccountId account) const;
  [[nodiscard]] ledger::BorrowerRecord borrower(common::AccountId account) const;
  [[nodiscard]] common::Amount total_debt(common::AccountId account) const;
  [[nodiscard]] std::uint64_t collateral_ratio(common::AccountId account) const;
  [[nodiscard]] bool is_liquidatable(common::AccountId account) const;
  [[nodiscard]] risk::LiquidationEngine::Assessment assess(common::AccountId account) const;
  [[nodiscard]] ledger::PoolState pool_state() const;
  [[nodiscard]] common::Amount total_lender_balances() const;

 private:
  mutable std::recursive_mutex mutex_;
  bool in_operation_{false};

  ledger::LedgerStore store_;
  credit::InterestSchedule schedule_{};
  ledger::SupplyLedger supply_;
  ledger::CollateralVault vault_;
  credit::CreditEngine credit_;
  risk::LiquidationEngine liquidation_;

  transfer::AssetTransfer& base_asset_;
  transfer::AssetTransfer& collateral_asset_;
  const common::Clock& clock_;
  EventSink* events_{nullptr};
  telemetry::TelemetrySink* telemetry_{nullptr};

  // `mutation` receives the operation time and the settlement to fill, and
  // returns the event published once the settlement succeeds.
  template <typename Mutation>
  void execute(Metric metric, common::AccountId account, Mutation&& mutation);

  void count(Metric metric);
  static ledger::PoolState validate(const PoolConfig& config);
};

}  // namespace pool
}  // namespace lendcore
