#pragma once

#include <array>
#include <cstdint>
#include <mutex>
#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

#include "lendcore/common/types.hpp"

namespace lendcore {
namespace auth {

// ed25519 key sizes
constexpr std::size_t kPublicKeySize = 32;
constexpr std::size_t kSecretKeySize = 64;
constexpr std::size_t kSignatureSize = 64;

using PublicKey = std::array<std::uint8_t, kPublicKeySize>;
using SecretKey = std::array<std::uint8_t, kSecretKeySize>;
using Signature = std::array<std::uint8_t, kSignatureSize>;

// Signed frame wire format:
// [signature:64][message:N]
// The signature covers the message bytes only.
struct FrameView {
  Signature signature{};
  std::span<const std::byte> message{};
};

class Authenticator {
 public:
  Authenticator();
  ~Authenticator();

  void register_account(common::AccountId account, const PublicKey& public_key);
  void unregister_account(common::AccountId account);
  bool has_account(common::AccountId account) const;
  std::optional<PublicKey> public_key(common::AccountId account) const;

  // False when the account is unknown or the signature does not match.
  bool verify(common::AccountId account,
              std::span<const std::byte> message,
              const Signature& signature) const;

  // Verifies a signed frame as produced by sign_frame().
  bool verify_frame(common::AccountId account, std::span<const std::byte> frame) const;

  static bool verify_with_key(const PublicKey& public_key,
                              std::span<const std::byte> message,
                              const Signature& signature);

  static bool sign(const SecretKey& secret_key,
                   std::span<const std::byte> message,
                   Signature& out_signature);

  // Prepends the signature of `message`. Throws if signing fails.
  static std::vector<std::byte> sign_frame(const SecretKey& secret_key, std::span<const std::byte> message);

  // nullopt when the frame is too short to hold a signature.
  static std::optional<FrameView> split_frame(std::span<const std::byte> frame);

  static void generate_keypair(PublicKey& out_public, SecretKey& out_secret);

  std::size_t account_count() const;

 private:
  mutable std::mutex mutex_;
  std::unordered_map<common::AccountId, PublicKey> keys_;
};

}  // namespace auth
}  // namespace lendcore
