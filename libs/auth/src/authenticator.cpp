#include "lendcore/auth/authenticator.hpp"

#include <sodium.h>

#include <stdexcept>

namespace lendcore {
namespace auth {

namespace {

// sodium_init() is idempotent but must precede every other call.
void require_sodium() {
  static const bool ready = [] {
    if (sodium_init() < 0) {
      throw std::runtime_error("Failed to initialize libsodium");
    }
    return true;
  }();
  (void)ready;
}

const unsigned char* bytes_of(std::span<const std::byte> data) {
  return reinterpret_cast<const unsigned char*>(data.data());
}

}  // namespace

Authenticator::Authenticator() {
  require_sodium();
}

void Authenticator::register_account(common::AccountId account, const PublicKey& public_key) {
  std::lock_guard<std::mutex> lock(mutex_);
  keys_.insert_or_assign(account, public_key);
}

bool Authenticator::verify(common::AccountId account,
                           std::span<const std::byte> message,
                           const Signature& signature) const {
  PublicKey key;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = keys_.find(account);
    if (it == keys_.end()) {
      return false;
    }
    key = it->second;
  }
  return crypto_sign_verify_detached(signature.data(), bytes_of(message), message.size(), key.data()) == 0;
}

KeyPair generate_keypair() {
  require_sodium();
  KeyPair pair;
  crypto_sign_keypair(pair.public_key.data(), pair.secret_key.data());
  return pair;
}

Signature sign(const SecretKey& secret_key, std::span<const std::byte> message) {
  require_sodium();
  Signature signature{};
  if (crypto_sign_detached(signature.data(), nullptr, bytes_of(message), message.size(), secret_key.data()) != 0) {
    throw std::runtime_error("failed to sign message");
  }
  return signature;
}

Digest digest(std::span<const std::byte> data) {
  require_sodium();
  Digest out{};
  if (crypto_generichash(out.data(), out.size(), bytes_of(data), data.size(), nullptr, 0) != 0) {
    throw std::runtime_error("crypto_generichash failed");
  }
  return out;
}

std::optional<PublicKey> parse_public_key(std::string_view hex) {
  require_sodium();
  PublicKey key{};
  std::size_t decoded = 0;
  if (sodium_hex2bin(key.data(), key.size(), hex.data(), hex.size(), nullptr, &decoded, nullptr) != 0 ||
      decoded != key.size()) {
    return std::nullopt;
  }
  return key;
}

std::string to_hex(std::span<const std::uint8_t> bytes) {
  std::string out(bytes.size() * 2 + 1, '\0');
  sodium_bin2hex(out.data(), out.size(), bytes.data(), bytes.size());
  out.pop_back();
  return out;
}

}  // namespace auth
}  // namespace lendcore
