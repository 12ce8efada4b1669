#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "lendcore/common/types.hpp"

namespace lendcore {
namespace api {

enum class Operation : std::uint8_t {
  kDeposit = 1,
  kWithdraw = 2,
  kDepositCollateral = 3,
  kBorrow = 4,
  kRepay = 5,
  kLiquidate = 6,
  kSetFeeRecipient = 7,
};

// `target` is the borrower for kLiquidate and the new recipient for
// kSetFeeRecipient; `amount` is unused by both.
struct Request {
  Operation operation{Operation::kDeposit};
  common::AccountId caller{common::kNoAccount};
  common::AccountId target{common::kNoAccount};
  common::Amount amount{0};
  std::uint64_t nonce{0};
};

inline constexpr std::uint8_t kRequestVersion = 1;
// version:1 operation:1 caller:8 target:8 amount:8 nonce:8, little endian
inline constexpr std::size_t kEncodedRequestSize = 34;

[[nodiscard]] std::vector<std::byte> encode_request(const Request& request);
[[nodiscard]] std::optional<Request> decode_request(std::span<const std::byte> bytes);

[[nodiscard]] std::string_view to_string(Operation operation) noexcept;
[[nodiscard]] std::optional<Operation> parse_operation(std::string_view name) noexcept;

}  // namespace api
}  // namespace lendcore
