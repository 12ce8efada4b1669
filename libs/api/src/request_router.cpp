#include "lendcore/api/request_router.hpp"

#include <string>
#include <utility>

namespace lendcore {
namespace api {

namespace {

Outcome reject(common::ErrorCode code, std::string detail) {
  return Outcome{.code = code, .detail = std::move(detail)};
}

}  // namespace

Outcome RequestRouter::handle(std::span<const std::byte> frame) {
  const auto view = auth::Authenticator::split_frame(frame);
  if (!view) {
    return reject(common::ErrorCode::kMalformedRequest, "frame shorter than signature");
  }

  const auto request = decode_request(view->message);
  if (!request) {
    return reject(common::ErrorCode::kMalformedRequest, "undecodable request");
  }

  if (!authenticator_.verify(request->caller, view->message, view->signature)) {
    return reject(common::ErrorCode::kUnauthorized, "bad signature for account " + std::to_string(request->caller));
  }

  if (!accept_nonce(request->caller, request->nonce)) {
    return reject(common::ErrorCode::kUnauthorized, "stale nonce " + std::to_string(request->nonce));
  }

  return dispatch(*request);
}

Outcome RequestRouter::dispatch(const Request& request) {
  Outcome outcome;
  try {
    switch (request.operation) {
      case Operation::kDeposit:
        pool_.deposit(request.caller, request.amount);
        break;
      case Operation::kWithdraw:
        pool_.withdraw(request.caller, request.amount);
        break;
      case Operation::kDepositCollateral:
        pool_.deposit_collateral(request.caller, request.amount);
        break;
      case Operation::kBorrow:
        pool_.borrow(request.caller, request.amount);
        break;
      case Operation::kRepay:
        outcome.repayment = pool_.repay(request.caller, request.amount);
        break;
      case Operation::kLiquidate:
        outcome.liquidation = pool_.liquidate(request.caller, request.target);
        break;
      case Operation::kSetFeeRecipient:
        pool_.set_fee_recipient(request.caller, request.target);
        break;
    }
  } catch (const common::LendingError& ex) {
    return reject(ex.code(), ex.what());
  }
  return outcome;
}

std::uint64_t RequestRouter::last_nonce(common::AccountId caller) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto it = nonces_.find(caller); it != nonces_.end()) {
    return it->second;
  }
  return 0;
}

bool RequestRouter::accept_nonce(common::AccountId caller, std::uint64_t nonce) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& last = nonces_[caller];
  if (nonce <= last) {
    return false;
  }
  last = nonce;
  return true;
}

}  // namespace api
}  // namespace lendcore
