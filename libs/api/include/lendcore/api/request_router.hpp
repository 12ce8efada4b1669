#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>

#include "lendcore/api/request.hpp"
#include "lendcore/auth/authenticator.hpp"
#include "lendcore/common/errors.hpp"
#include "lendcore/credit/credit_engine.hpp"
#include "lendcore/pool/lending_pool.hpp"
#include "lendcore/risk/liquidation_engine.hpp"

namespace lendcore {
namespace api {

struct Outcome {
  common::ErrorCode code{common::ErrorCode::kOk};
  std::string detail{};
  std::optional<credit::RepayResult> repayment{};
  std::optional<risk::LiquidationEngine::Result> liquidation{};

  [[nodiscard]] bool ok() const noexcept { return code == common::ErrorCode::kOk; }
};

// Front door of the pool: authenticates signed request frames, enforces
// strictly increasing nonces per caller and maps ledger failures to
// outcomes.
class RequestRouter {
 public:
  RequestRouter(pool::LendingPool& pool, const auth::Authenticator& authenticator)
      : pool_(pool), authenticator_(authenticator) {}

  // frame = [signature:64][encoded request]
  Outcome handle(std::span<const std::byte> frame);

  // Runs a request whose caller has already been authenticated.
  Outcome dispatch(const Request& request);

  [[nodiscard]] std::uint64_t last_nonce(common::AccountId caller) const;

 private:
  pool::LendingPool& pool_;
  const auth::Authenticator& authenticator_;
  mutable std::mutex mutex_;
  std::unordered_map<common::AccountId, std::uint64_t> nonces_{};

  bool accept_nonce(common::AccountId caller, std::uint64_t nonce);
};

}  // namespace api
}  // namespace lendcore
