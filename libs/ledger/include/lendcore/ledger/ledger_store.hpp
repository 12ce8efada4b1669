#pragma once

#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

#include "lendcore/common/types.hpp"

namespace lendcore {
namespace ledger {

struct LenderRecord {
  common::Amount amount_supplied{0};
  common::Timestamp deposit_timestamp{0};
};

struct BorrowerRecord {
  common::Amount amount_borrowed{0};
  common::Amount initial_borrow_amount{0};  // lifetime principal drawn, never reset
  common::Amount collateral_deposited{0};
  common::Timestamp borrow_timestamp{0};
  common::Timestamp last_iteration{0};
  common::Amount amount_repaid{0};  // lifetime principal repaid, never reset

  [[nodiscard]] bool has_active_loan() const noexcept { return amount_borrowed > 0; }
};

struct PoolState {
  common::Amount total_supplied{0};
  common::BasisPoints collateral_ratio_bp{0};
  common::BasisPoints protocol_fee_bp{0};
  common::AccountId fee_recipient{common::kNoAccount};
  common::AccountId owner{common::kNoAccount};
};

class LedgerStore {
 public:
  // Saved view of one account and the pool totals; restore() puts them back
  // exactly, including the absence of records created after the checkpoint.
  struct Checkpoint {
    common::AccountId account{};
    std::optional<LenderRecord> lender{};
    std::optional<BorrowerRecord> borrower{};
    PoolState pool{};
  };

  explicit LedgerStore(PoolState pool);

  [[nodiscard]] LenderRecord lender(common::AccountId account) const;
  [[nodiscard]] BorrowerRecord borrower(common::AccountId account) const;
  [[nodiscard]] bool has_lender(common::AccountId account) const;
  [[nodiscard]] bool has_borrower(common::AccountId account) const;

  LenderRecord& ensure_lender(common::AccountId account);
  BorrowerRecord& ensure_borrower(common::AccountId account);

  // Mutable access to an existing borrower; nullptr when unknown.
  BorrowerRecord* find_borrower(common::AccountId account);

  [[nodiscard]] const PoolState& pool() const noexcept { return pool_; }
  PoolState& pool() noexcept { return pool_; }

  [[nodiscard]] Checkpoint checkpoint(common::AccountId account) const;
  void restore(const Checkpoint& checkpoint);

  [[nodiscard]] common::Amount total_lender_balances() const;
  [[nodiscard]] std::vector<common::AccountId> lenders() const;
  [[nodiscard]] std::vector<common::AccountId> borrowers() const;

 private:
  PoolState pool_;
  std::unordered_map<common::AccountId, LenderRecord> lenders_{};
  std::unordered_map<common::AccountId, BorrowerRecord> borrowers_{};
};

}  // namespace ledger
}  // namespace lendcore
