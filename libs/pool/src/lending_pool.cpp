#include "lendcore/pool/lending_pool.hpp"

#include <iostream>
#include <string>
#include <utility>

#include "lendcore/common/basis_points.hpp"
#include "lendcore/common/errors.hpp"

namespace lendcore {
namespace pool {

using common::ErrorCode;
using common::LendingError;

namespace {

class OperationGuard {
 public:
  explicit OperationGuard(bool& flag) : flag_(flag) { flag_ = true; }
  ~OperationGuard() { flag_ = false; }
  OperationGuard(const OperationGuard&) = delete;
  OperationGuard& operator=(const OperationGuard&) = delete;

 private:
  bool& flag_;
};

}  // namespace

const char* to_string(Metric metric) noexcept {
  switch (metric) {
    case Metric::kDeposit:
      return "deposit";
    case Metric::kWithdraw:
      return "withdraw";
    case Metric::kCollateralDeposit:
      return "collateral-deposit";
    case Metric::kBorrow:
      return "borrow";
    case Metric::kRepay:
      return "repay";
    case Metric::kLiquidate:
      return "liquidate";
    case Metric::kFeeRecipientChanged:
      return "fee-recipient-changed";
    case Metric::kRejected:
      return "rejected";
    case Metric::kRolledBack:
      return "rolled-back";
    case Metric::kPublishFailed:
      return "publish-failed";
  }
  return "unknown";
}

ledger::PoolState LendingPool::validate(const PoolConfig& config) {
  if (config.collateral_ratio_bp < kMinCollateralRatioBp || config.collateral_ratio_bp > kMaxCollateralRatioBp) {
    throw LendingError(ErrorCode::kInvalidConfig,
                       "collateral ratio " + std::to_string(config.collateral_ratio_bp) + "bp outside [5000, 9500]");
  }
  if (config.protocol_fee_bp > common::kBasisPointDenominator) {
    throw LendingError(ErrorCode::kInvalidConfig, "protocol fee above 10000bp");
  }
  if (config.owner == common::kNoAccount) {
    throw LendingError(ErrorCode::kInvalidConfig, "owner must be set");
  }
  if (config.fee_recipient == common::kNoAccount) {
    throw LendingError(ErrorCode::kInvalidConfig, "fee recipient must be set");
  }

  return ledger::PoolState{
      .total_supplied = 0,
      .collateral_ratio_bp = config.collateral_ratio_bp,
      .protocol_fee_bp = config.protocol_fee_bp,
      .fee_recipient = config.fee_recipient,
      .owner = config.owner,
  };
}

LendingPool::LendingPool(PoolConfig config,
                         transfer::AssetTransfer& base_asset,
                         transfer::AssetTransfer& collateral_asset,
                         const common::Clock& clock)
    : store_(validate(config)),
      supply_(store_),
      vault_(store_),
      credit_(store_, schedule_),
      liquidation_(store_, credit_),
      base_asset_(base_asset),
      collateral_asset_(collateral_asset),
      clock_(clock) {}

void LendingPool::set_event_sink(EventSink* sink) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  events_ = sink;
}

void LendingPool::set_telemetry(telemetry::TelemetrySink* telemetry) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  telemetry_ = telemetry;
}

void LendingPool::count(Metric metric) {
  if (telemetry_) {
    telemetry_->increment(static_cast<std::uint64_t>(metric));
  }
}

template <typename Mutation>
void LendingPool::execute(Metric metric, common::AccountId account, Mutation&& mutation) {
  const auto started = common::now_steady();
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  if (in_operation_) {
    count(Metric::kRejected);
    throw LendingError(ErrorCode::kReentrantCall, "ledger is already applying an operation");
  }
  OperationGuard guard(in_operation_);

  const common::Timestamp now = clock_.now();
  const auto checkpoint = store_.checkpoint(account);
  transfer::Settlement settlement;

  LendingEvent event;
  try {
    event = mutation(now, settlement);
  } catch (const std::exception&) {
    store_.restore(checkpoint);
    count(Metric::kRejected);
    throw;
  }

  bool settled = false;
  try {
    settled = settlement.execute();
  } catch (const std::exception&) {
    store_.restore(checkpoint);
    count(Metric::kRolledBack);
    throw;
  }
  if (!settled) {
    store_.restore(checkpoint);
    count(Metric::kRolledBack);
    throw LendingError(ErrorCode::kTransferFailed, std::string(to_string(metric)) + " settlement failed");
  }

  event.timestamp = now;
  if (events_) {
    // The mutation is committed; a sink failure must not report it as failed.
    try {
      events_->publish(event);
    } catch (const std::exception& ex) {
      count(Metric::kPublishFailed);
      std::cerr << "pool: " << to_string(event.kind) << " event for account " << event.account
                << " not published: " << ex.what() << "\n";
    }
  }
  if (telemetry_) {
    telemetry_->increment(static_cast<std::uint64_t>(metric));
    telemetry_->record_latency(static_cast<std::uint64_t>(metric), common::now_steady() - started);
  }
}

void LendingPool::deposit(common::AccountId caller, common::Amount amount) {
  execute(Metric::kDeposit, caller, [&](common::Timestamp now, transfer::Settlement& settlement) {
    supply_.deposit(caller, amount, now);
    settlement.add_pull(base_asset_, caller, amount);
    return LendingEvent{.kind = EventKind::kDeposit, .account = caller, .amount = amount};
  });
}

void LendingPool::withdraw(common::AccountId caller, common::Amount amount) {
  execute(Metric::kWithdraw, caller, [&](common::Timestamp /*now*/, transfer::Settlement& settlement) {
    supply_.withdraw(caller, amount);
    settlement.add_push(base_asset_, caller, amount);
    return LendingEvent{.kind = EventKind::kWithdraw, .account = caller, .amount = amount};
  });
}

void LendingPool::deposit_collateral(common::AccountId caller, common::Amount amount) {
  execute(Metric::kCollateralDeposit, caller, [&](common::Timestamp now, transfer::Settlement& settlement) {
    vault_.deposit_collateral(caller, amount, now);
    settlement.add_pull(collateral_asset_, caller, amount);
    return LendingEvent{.kind = EventKind::kCollateralDeposit, .account = caller, .amount = amount};
  });
}

void LendingPool::borrow(common::AccountId caller, common::Amount amount) {
  execute(Metric::kBorrow, caller, [&](common::Timestamp now, transfer::Settlement& settlement) {
    credit_.borrow(caller, amount, now);
    settlement.add_push(base_asset_, caller, amount);
    return LendingEvent{.kind = EventKind::kBorrow, .account = caller, .amount = amount};
  });
}

credit::RepayResult LendingPool::repay(common::AccountId caller, common::Amount principal) {
  credit::RepayResult result;
  execute(Metric::kRepay, caller, [&](common::Timestamp now, transfer::Settlement& settlement) {
    result = credit_.repay(caller, principal, now);
    const auto recipient = store_.pool().fee_recipient;
    settlement.add_pull(base_asset_, caller, result.amount_due());
    if (result.closed) {
      settlement.add_push(base_asset_, recipient, result.fee);
    }
    return LendingEvent{
        .kind = EventKind::kRepay,
        .account = caller,
        .counterparty = recipient,
        .amount = result.principal,
        .secondary = result.interest,
        .fee = result.fee,
    };
  });
  return result;
}

risk::LiquidationEngine::Result LendingPool::liquidate(common::AccountId caller, common::AccountId borrower) {
  risk::LiquidationEngine::Result result;
  execute(Metric::kLiquidate, borrower, [&](common::Timestamp now, transfer::Settlement& settlement) {
    result = liquidation_.liquidate(borrower, now);
    settlement.add_pull(base_asset_, caller, result.debt);
    settlement.add_push(collateral_asset_, caller, result.collateral);
    return LendingEvent{
        .kind = EventKind::kLiquidate,
        .account = borrower,
        .counterparty = caller,
        .amount = result.debt,
        .secondary = result.collateral,
    };
  });
  return result;
}

void LendingPool::set_fee_recipient(common::AccountId caller, common::AccountId recipient) {
  execute(Metric::kFeeRecipientChanged, caller, [&](common::Timestamp /*now*/, transfer::Settlement& /*settlement*/) {
    if (caller != store_.pool().owner) {
      throw LendingError(ErrorCode::kNotOwner, "only the owner may change the fee recipient");
    }
    if (recipient == common::kNoAccount) {
      throw LendingError(ErrorCode::kInvalidConfig, "fee recipient must be set");
    }
    store_.pool().fee_recipient = recipient;
    return LendingEvent{.kind = EventKind::kFeeRecipientChanged, .account = caller, .counterparty = recipient};
  });
}

common::Amount LendingPool::lender_balance(common::AccountId account) const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  return supply_.lender_balance(account);
}

ledger::LenderRecord LendingPool::lender(common::AccountId account) const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  return store_.lender(account);
}

ledger::BorrowerRecord LendingPool::borrower(common::AccountId account) const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  return store_.borrower(account);
}

common::Amount LendingPool::total_debt(common::AccountId account) const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  return credit_.total_debt(account, clock_.now());
}

std::uint64_t LendingPool::collateral_ratio(common::AccountId account) const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  return credit_.collateral_ratio(account);
}

bool LendingPool::is_liquidatable(common::AccountId account) const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  return liquidation_.is_liquidatable(account, clock_.now());
}

risk::LiquidationEngine::Assessment LendingPool::assess(common::AccountId account) const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  return liquidation_.evaluate(account, clock_.now());
}

ledger::PoolState LendingPool::pool_state() const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  return store_.pool();
}

common::Amount LendingPool::total_lender_balances() const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  return store_.total_lender_balances();
}

}  // namespace pool
}  // namespace lendcore
