#include "lendcore/api/request.hpp"

#include <array>
#include <cstddef>
#include <utility>

namespace lendcore {
namespace api {

namespace {

constexpr std::array<std::pair<Operation, std::string_view>, 7> kOperationNames{{
    {Operation::kDeposit, "deposit"},
    {Operation::kWithdraw, "withdraw"},
    {Operation::kDepositCollateral, "collateral"},
    {Operation::kBorrow, "borrow"},
    {Operation::kRepay, "repay"},
    {Operation::kLiquidate, "liquidate"},
    {Operation::kSetFeeRecipient, "fee-recipient"},
}};

void put_u64(std::vector<std::byte>& out, std::uint64_t value) {
  for (int shift = 0; shift < 64; shift += 8) {
    out.push_back(static_cast<std::byte>((value >> shift) & 0xff));
  }
}

std::uint64_t get_u64(std::span<const std::byte> bytes, std::size_t offset) {
  std::uint64_t value = 0;
  for (std::size_t i = 0; i < 8; ++i) {
    value |= static_cast<std::uint64_t>(std::to_integer<std::uint8_t>(bytes[offset + i])) << (8 * i);
  }
  return value;
}

}  // namespace

std::vector<std::byte> encode_request(const Request& request) {
  std::vector<std::byte> out;
  out.reserve(kEncodedRequestSize);
  out.push_back(static_cast<std::byte>(kRequestVersion));
  out.push_back(static_cast<std::byte>(request.operation));
  put_u64(out, request.caller);
  put_u64(out, request.target);
  put_u64(out, request.amount);
  put_u64(out, request.nonce);
  return out;
}

std::optional<Request> decode_request(std::span<const std::byte> bytes) {
  if (bytes.size() != kEncodedRequestSize) {
    return std::nullopt;
  }
  if (std::to_integer<std::uint8_t>(bytes[0]) != kRequestVersion) {
    return std::nullopt;
  }

  const auto op = std::to_integer<std::uint8_t>(bytes[1]);
  if (op < static_cast<std::uint8_t>(Operation::kDeposit) ||
      op > static_cast<std::uint8_t>(Operation::kSetFeeRecipient)) {
    return std::nullopt;
  }

  return Request{
      .operation = static_cast<Operation>(op),
      .caller = get_u64(bytes, 2),
      .target = get_u64(bytes, 10),
      .amount = get_u64(bytes, 18),
      .nonce = get_u64(bytes, 26),
  };
}

std::string_view to_string(Operation operation) noexcept {
  for (const auto& [op, name] : kOperationNames) {
    if (op == operation) {
      return name;
    }
  }
  return "unknown";
}

std::optional<Operation> parse_operation(std::string_view name) noexcept {
  for (const auto& [op, op_name] : kOperationNames) {
    if (op_name == name) {
      return op;
    }
  }
  return std::nullopt;
}

}  // namespace api
}  // namespace lendcore
