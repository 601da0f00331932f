#pragma once

#include <cassert>
#include <cstdint>
#include <string_view>

#include "lendcore/api/ledger_gateway.hpp"
#include "lendcore/assets/collateral_custody.hpp"
#include "lendcore/assets/debt_token.hpp"
#include "lendcore/auth/authenticator.hpp"
#include "lendcore/common/amount.hpp"
#include "lendcore/ledger/position_ledger.hpp"
#include "lendcore/oracle/price_oracle.hpp"

namespace lendcore::tests {

inline common::Amount units(std::string_view text) {
  const auto value = common::parse_units(text);
  assert(value.has_value());
  return *value;
}

class FlakyCustody : public assets::InMemoryCollateralCustody {
 public:
  bool fail_receive{false};
  bool fail_send{false};

  bool receive(common::AccountId from, const common::Amount& amount) override {
    return !fail_receive && InMemoryCollateralCustody::receive(from, amount);
  }
  bool send(common::AccountId to, const common::Amount& amount) override {
    return !fail_send && InMemoryCollateralCustody::send(to, amount);
  }
};

class FlakyDebtToken : public assets::InMemoryDebtToken {
 public:
  bool fail_transfer{false};
  bool fail_transfer_from{false};

  bool transfer(common::AccountId from, common::AccountId to, const common::Amount& amount) override {
    return !fail_transfer && InMemoryDebtToken::transfer(from, to, amount);
  }
  bool transfer_from(common::AccountId spender,
                     common::AccountId from,
                     common::AccountId to,
                     const common::Amount& amount) override {
    return !fail_transfer_from && InMemoryDebtToken::transfer_from(spender, from, to, amount);
  }
};

// Ledger wired to in-memory collaborators: the ledger holds 1,000,000 of
// liquidity, alice owns 100 collateral, bob owns 100,000 debt asset.
struct Harness {
  static constexpr common::AccountId kLedger = 0;
  static constexpr common::AccountId kAlice = 1;
  static constexpr common::AccountId kBob = 2;

  FlakyDebtToken token;
  FlakyCustody custody;
  oracle::ManualPriceOracle oracle{units("2000")};
  ledger::PositionLedger ledger{kLedger, token, custody, oracle};

  Harness() {
    token.mint(kLedger, units("1000000"));
    custody.fund(kAlice, units("100"));
    token.mint(kBob, units("100000"));
  }
};

// Key holder that signs commands with increasing nonces.
struct Client {
  common::AccountId account;
  auth::PublicKey public_key{};
  auth::SecretKey secret_key{};
  std::uint64_t nonce{0};

  Client(auth::Authenticator& authenticator, common::AccountId id) : account(id) {
    const auto pair = auth::generate_keypair();
    public_key = pair.public_key;
    secret_key = pair.secret_key;
    authenticator.register_account(account, public_key);
  }

  api::SignedCommand sign(api::CommandKind kind, std::string_view amount, common::AccountId target = 0) {
    return api::sign_command(
        api::Command{.kind = kind, .account = account, .target = target, .amount = units(amount), .nonce = ++nonce},
        secret_key);
  }

  api::SignedCommand liquidate(common::AccountId target) {
    return api::sign_command(
        api::Command{.kind = api::CommandKind::kLiquidate, .account = account, .target = target, .nonce = ++nonce},
        secret_key);
  }
};

}  // namespace lendcore::tests
