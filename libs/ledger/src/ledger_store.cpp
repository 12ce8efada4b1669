#include "lendcore/ledger/ledger_store.hpp"

#include <algorithm>

namespace lendcore {
namespace ledger {

LedgerStore::LedgerStore(PoolState pool) : pool_(pool) {}

LenderRecord LedgerStore::lender(common::AccountId account) const {
  if (auto it = lenders_.find(account); it != lenders_.end()) {
    return it->second;
  }
  return {};
}

BorrowerRecord LedgerStore::borrower(common::AccountId account) const {
  if (auto it = borrowers_.find(account); it != borrowers_.end()) {
    return it->second;
  }
  return {};
}

bool LedgerStore::has_lender(common::AccountId account) const {
  return lenders_.find(account) != lenders_.end();
}

bool LedgerStore::has_borrower(common::AccountId account) const {
  return borrowers_.find(account) != borrowers_.end();
}

LenderRecord& LedgerStore::ensure_lender(common::AccountId account) {
  return lenders_.try_emplace(account).first->second;
}

BorrowerRecord& LedgerStore::ensure_borrower(common::AccountId account) {
  return borrowers_.try_emplace(account).first->second;
}

BorrowerRecord* LedgerStore::find_borrower(common::AccountId account) {
  auto it = borrowers_.find(account);
  if (it == borrowers_.end()) {
    return nullptr;
  }
  return &it->second;
}

LedgerStore::Checkpoint LedgerStore::checkpoint(common::AccountId account) const {
  Checkpoint saved{.account = account, .pool = pool_};
  if (auto it = lenders_.find(account); it != lenders_.end()) {
    saved.lender = it->second;
  }
  if (auto it = borrowers_.find(account); it != borrowers_.end()) {
    saved.borrower = it->second;
  }
  return saved;
}

void LedgerStore::restore(const Checkpoint& checkpoint) {
  pool_ = checkpoint.pool;

  if (checkpoint.lender) {
    lenders_[checkpoint.account] = *checkpoint.lender;
  } else {
    lenders_.erase(checkpoint.account);
  }

  if (checkpoint.borrower) {
    borrowers_[checkpoint.account] = *checkpoint.borrower;
  } else {
    borrowers_.erase(checkpoint.account);
  }
}

common::Amount LedgerStore::total_lender_balances() const {
  common::Amount total = 0;
  for (const auto& [account, record] : lenders_) {
    total += record.amount_supplied;
  }
  return total;
}

std::vector<common::AccountId> LedgerStore::lenders() const {
  std::vector<common::AccountId> accounts;
  accounts.reserve(lenders_.size());
  for (const auto& [account, record] : lenders_) {
    accounts.push_back(account);
  }
  std::sort(accounts.begin(), accounts.end());
  return accounts;
}

std::vector<common::AccountId> LedgerStore::borrowers() const {
  std::vector<common::AccountId> accounts;
  accounts.reserve(borrowers_.size());
  for (const auto& [account, record] : borrowers_) {
    accounts.push_back(account);
  }
  std::sort(accounts.begin(), accounts.end());
  return accounts;
}

}  // namespace ledger
}  // namespace lendcore
