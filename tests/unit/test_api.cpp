#include "test_api.hpp"

#include <cassert>
#include <vector>

#include "lendcore/api/request.hpp"
#include "lendcore/api/request_router.hpp"
#include "lendcore/auth/authenticator.hpp"
#include "test_support.hpp"

namespace lendcore::tests {

using common::ErrorCode;

namespace {

struct SignedCaller {
  auth::PublicKey public_key{};
  auth::SecretKey secret_key{};

  std::vector<std::byte> frame(api::Request request) const {
    const auto payload = api::encode_request(request);
    return auth::Authenticator::sign_frame(secret_key, payload);
  }
};

SignedCaller enroll(auth::Authenticator& authenticator, common::AccountId account) {
  SignedCaller caller;
  auth::Authenticator::generate_keypair(caller.public_key, caller.secret_key);
  authenticator.register_account(account, caller.public_key);
  return caller;
}

}  // namespace

void test_request_codec() {
  const api::Request request{
      .operation = api::Operation::kLiquidate,
      .caller = kLiquidator,
      .target = kBorrower,
      .amount = 0x0102030405060708ULL,
      .nonce = 9,
  };
  const auto bytes = api::encode_request(request);
  assert(bytes.size() == api::kEncodedRequestSize);
  assert(bytes[0] == std::byte{api::kRequestVersion});
  assert(bytes[1] == std::byte{6});
  assert(bytes[2] == std::byte{30});
  // Little endian: the low byte of the amount comes first.
  assert(bytes[18] == std::byte{0x08});
  assert(bytes[25] == std::byte{0x01});

  const auto decoded = api::decode_request(bytes);
  assert(decoded);
  assert(decoded->operation == api::Operation::kLiquidate);
  assert(decoded->caller == kLiquidator);
  assert(decoded->target == kBorrower);
  assert(decoded->amount == request.amount);
  assert(decoded->nonce == 9);

  auto short_frame = bytes;
  short_frame.pop_back();
  assert(!api::decode_request(short_frame));

  auto bad_version = bytes;
  bad_version[0] = std::byte{2};
  assert(!api::decode_request(bad_version));

  auto bad_operation = bytes;
  bad_operation[1] = std::byte{0};
  assert(!api::decode_request(bad_operation));
  bad_operation[1] = std::byte{8};
  assert(!api::decode_request(bad_operation));

  assert(api::parse_operation("collateral") == api::Operation::kDepositCollateral);
  assert(api::parse_operation("fee-recipient") == api::Operation::kSetFeeRecipient);
  assert(!api::parse_operation("flashloan"));
  assert(api::to_string(api::Operation::kRepay) == "repay");
}

void test_request_router() {
  PoolFixture f;
  auth::Authenticator authenticator;
  api::RequestRouter router(f.pool, authenticator);

  const auto lender = enroll(authenticator, kLender);
  const auto borrower = enroll(authenticator, kBorrower);
  const auto owner = enroll(authenticator, kOwner);
  f.fund(kLender, 1'000, 0);
  f.fund(kBorrower, 0, 1'000);

  auto outcome = router.handle(lender.frame({.operation = api::Operation::kDeposit,
                                             .caller = kLender,
                                             .amount = 1'000,
                                             .nonce = 1}));
  assert(outcome.ok());
  assert(f.pool.lender_balance(kLender) == 1'000);
  assert(router.last_nonce(kLender) == 1);

  // Replays and reordered nonces are refused before reaching the pool.
  outcome = router.handle(lender.frame({.operation = api::Operation::kWithdraw,
                                        .caller = kLender,
                                        .amount = 10,
                                        .nonce = 1}));
  assert(outcome.code == ErrorCode::kUnauthorized);
  assert(f.pool.lender_balance(kLender) == 1'000);

  // A frame signed by someone else is refused.
  outcome = router.handle(borrower.frame({.operation = api::Operation::kWithdraw,
                                          .caller = kLender,
                                          .amount = 10,
                                          .nonce = 2}));
  assert(outcome.code == ErrorCode::kUnauthorized);
  assert(router.last_nonce(kLender) == 1);

  // Tampering with the payload breaks the signature.
  auto tampered = lender.frame({.operation = api::Operation::kWithdraw, .caller = kLender, .amount = 10, .nonce = 2});
  tampered[auth::kSignatureSize + 18] = std::byte{0xff};
  assert(router.handle(tampered).code == ErrorCode::kUnauthorized);

  const std::vector<std::byte> truncated(10);
  assert(router.handle(truncated).code == ErrorCode::kMalformedRequest);
  auto garbage = lender.frame({.operation = api::Operation::kDeposit, .caller = kLender, .amount = 1, .nonce = 3});
  garbage.push_back(std::byte{0});
  assert(router.handle(garbage).code == ErrorCode::kMalformedRequest);

  // Unknown callers cannot sign anything.
  SignedCaller stranger;
  auth::Authenticator::generate_keypair(stranger.public_key, stranger.secret_key);
  outcome = router.handle(stranger.frame({.operation = api::Operation::kDeposit,
                                          .caller = 99,
                                          .amount = 1,
                                          .nonce = 1}));
  assert(outcome.code == ErrorCode::kUnauthorized);

  outcome = router.handle(borrower.frame({.operation = api::Operation::kDepositCollateral,
                                          .caller = kBorrower,
                                          .amount = 1'000,
                                          .nonce = 1}));
  assert(outcome.ok());

  // Ledger failures come back as outcomes; the nonce is still consumed.
  outcome = router.handle(borrower.frame({.operation = api::Operation::kBorrow,
                                          .caller = kBorrower,
                                          .amount = 801,
                                          .nonce = 5}));
  assert(outcome.code == ErrorCode::kCollateralLimitExceeded);
  assert(!outcome.detail.empty());
  assert(router.last_nonce(kBorrower) == 5);

  outcome = router.handle(borrower.frame({.operation = api::Operation::kBorrow,
                                          .caller = kBorrower,
                                          .amount = 800,
                                          .nonce = 6}));
  assert(outcome.ok());

  f.advance_days(95);
  f.fund(kBorrower, 64, 0);
  outcome = router.handle(borrower.frame({.operation = api::Operation::kRepay,
                                          .caller = kBorrower,
                                          .amount = 800,
                                          .nonce = 7}));
  assert(outcome.ok());
  assert(outcome.repayment);
  assert(outcome.repayment->interest == 64);
  assert(outcome.repayment->closed);

  outcome = router.handle(borrower.frame({.operation = api::Operation::kLiquidate,
                                          .caller = kBorrower,
                                          .target = kBorrower,
                                          .nonce = 8}));
  assert(outcome.code == ErrorCode::kNoActiveLoan);

  outcome = router.handle(lender.frame({.operation = api::Operation::kSetFeeRecipient,
                                        .caller = kLender,
                                        .target = kLender,
                                        .nonce = 9}));
  assert(outcome.code == ErrorCode::kNotOwner);
  outcome = router.handle(owner.frame({.operation = api::Operation::kSetFeeRecipient,
                                       .caller = kOwner,
                                       .target = 3,
                                       .nonce = 1}));
  assert(outcome.ok());
  assert(f.pool.pool_state().fee_recipient == 3);

  // dispatch() trusts its caller.
  outcome = router.dispatch({.operation = api::Operation::kWithdraw, .caller = kLender, .amount = 100});
  assert(outcome.ok());
  assert(f.pool.lender_balance(kLender) == 900);

  assert(authenticator.account_count() == 3);
  const auto frame = lender.frame({.operation = api::Operation::kWithdraw, .caller = kLender, .amount = 1, .nonce = 10});
  assert(authenticator.verify_frame(kLender, frame));
  assert(!authenticator.verify_frame(kBorrower, frame));
  assert(authenticator.public_key(kLender) == lender.public_key);

  authenticator.unregister_account(kLender);
  assert(!authenticator.has_account(kLender));
  assert(!authenticator.public_key(kLender));
  assert(router.handle(frame).code == ErrorCode::kUnauthorized);
  assert(f.pool.lender_balance(kLender) == 900);
}

}  // namespace lendcore::tests
