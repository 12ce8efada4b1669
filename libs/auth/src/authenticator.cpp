#include "lendcore/auth/authenticator.hpp"

#include <sodium.h>

#include <cstring>
#include <stdexcept>

namespace lendcore {
namespace auth {

namespace {

class SodiumInitializer {
 public:
  SodiumInitializer() {
    if (sodium_init() < 0) {
      throw std::runtime_error("Failed to initialize libsodium");
    }
  }
};

void ensure_sodium_init() {
  static SodiumInitializer init;
}

}  // namespace

Authenticator::Authenticator() {
  ensure_sodium_init();
}

Authenticator::~Authenticator() = default;

void Authenticator::register_account(common::AccountId account, const PublicKey& public_key) {
  std::lock_guard<std::mutex> lock(mutex_);
  keys_[account] = public_key;
}

void Authenticator::unregister_account(common::AccountId account) {
  std::lock_guard<std::mutex> lock(mutex_);
  keys_.erase(account);
}

bool Authenticator::has_account(common::AccountId account) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return keys_.find(account) != keys_.end();
}

std::optional<PublicKey> Authenticator::public_key(common::AccountId account) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = keys_.find(account);
  if (it == keys_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool Authenticator::verify(common::AccountId account,
                           std::span<const std::byte> message,
                           const Signature& signature) const {
  const auto key = public_key(account);
  if (!key) {
    return false;
  }
  return verify_with_key(*key, message, signature);
}

bool Authenticator::verify_frame(common::AccountId account, std::span<const std::byte> frame) const {
  const auto view = split_frame(frame);
  if (!view) {
    return false;
  }
  return verify(account, view->message, view->signature);
}

bool Authenticator::verify_with_key(const PublicKey& public_key,
                                    std::span<const std::byte> message,
                                    const Signature& signature) {
  ensure_sodium_init();

  return crypto_sign_verify_detached(
             signature.data(),
             reinterpret_cast<const unsigned char*>(message.data()),
             message.size(),
             public_key.data()) == 0;
}

bool Authenticator::sign(const SecretKey& secret_key,
                         std::span<const std::byte> message,
                         Signature& out_signature) {
  ensure_sodium_init();

  return crypto_sign_detached(
             out_signature.data(),
             nullptr,
             reinterpret_cast<const unsigned char*>(message.data()),
             message.size(),
             secret_key.data()) == 0;
}

std::vector<std::byte> Authenticator::sign_frame(const SecretKey& secret_key, std::span<const std::byte> message) {
  Signature signature{};
  if (!sign(secret_key, message, signature)) {
    throw std::runtime_error("failed to sign frame");
  }

  std::vector<std::byte> frame(kSignatureSize + message.size());
  std::memcpy(frame.data(), signature.data(), kSignatureSize);
  if (!message.empty()) {
    std::memcpy(frame.data() + kSignatureSize, message.data(), message.size());
  }
  return frame;
}

std::optional<FrameView> Authenticator::split_frame(std::span<const std::byte> frame) {
  if (frame.size() < kSignatureSize) {
    return std::nullopt;
  }

  FrameView view;
  std::memcpy(view.signature.data(), frame.data(), kSignatureSize);
  view.message = frame.subspan(kSignatureSize);
  return view;
}

void Authenticator::generate_keypair(PublicKey& out_public, SecretKey& out_secret) {
  ensure_sodium_init();
  crypto_sign_keypair(out_public.data(), out_secret.data());
}

std::size_t Authenticator::account_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return keys_.size();
}

}  // namespace auth
}  // namespace lendcore
