#pragma once

#include <array>
#include <cstdint>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>

#include "lendcore/common/types.hpp"

namespace lendcore {
namespace auth {

// ed25519 key sizes
constexpr std::size_t kPublicKeySize = 32;
constexpr std::size_t kSecretKeySize = 64;
constexpr std::size_t kSignatureSize = 64;
constexpr std::size_t kDigestSize = 32;

using PublicKey = std::array<std::uint8_t, kPublicKeySize>;
using SecretKey = std::array<std::uint8_t, kSecretKeySize>;
using Signature = std::array<std::uint8_t, kSignatureSize>;
using Digest = std::array<std::uint8_t, kDigestSize>;

struct KeyPair {
  PublicKey public_key{};
  SecretKey secret_key{};
};

// Key book of the accounts allowed to issue ledger commands.
class Authenticator {
 public:
  Authenticator();

  // Replaces any key already held for `account`.
  void register_account(common::AccountId account, const PublicKey& public_key);

  // True only when `account` is registered and `signature` is its key's
  // signature over `message`.
  [[nodiscard]] bool verify(common::AccountId account,
                            std::span<const std::byte> message,
                            const Signature& signature) const;

 private:
  mutable std::mutex mutex_;
  std::unordered_map<common::AccountId, PublicKey> keys_;
};

// Client side: key generation and signing for the console and tests.
KeyPair generate_keypair();
// Throws std::runtime_error if libsodium refuses the key.
Signature sign(const SecretKey& secret_key, std::span<const std::byte> message);

// BLAKE2b-256 of `data`.
Digest digest(std::span<const std::byte> data);

std::optional<PublicKey> parse_public_key(std::string_view hex);
std::string to_hex(std::span<const std::uint8_t> bytes);

}  // namespace auth
}  // namespace lendcore
