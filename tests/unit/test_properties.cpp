#include "test_properties.hpp"

#include <array>
#include <cassert>
#include <cstdint>
#include <random>
#include <vector>

#include "lendcore/ledger/position_ledger.hpp"
#include "test_fixtures.hpp"

namespace lendcore::tests {

using ledger::Status;

namespace {

constexpr std::array<common::AccountId, 3> kUsers{1, 2, 3};

struct WorldState {
  ledger::PositionTable positions;
  std::vector<common::Amount> token_balances;
  std::vector<common::Amount> wallet_balances;
  common::Amount held{0};

  friend bool operator==(const WorldState&, const WorldState&) = default;
};

WorldState capture(const Harness& h) {
  WorldState state;
  state.positions = h.ledger.export_positions();
  state.token_balances.push_back(h.token.balance_of(Harness::kLedger));
  for (const auto user : kUsers) {
    state.token_balances.push_back(h.token.balance_of(user));
    state.wallet_balances.push_back(h.custody.wallet_balance(user));
  }
  state.held = h.custody.held();
  return state;
}

bool solvent(const ledger::Position& position, const common::Amount& price) {
  if (position.debt == 0) {
    return true;
  }
  const common::Amount value = position.collateral * price / common::kScale;
  return value * common::kPercentDenominator >= position.debt * common::kMinCollateralRatioPct;
}

}  // namespace

void test_random_operation_sequences() {
  std::mt19937_64 rng(0x1e4dc0de);
  std::uniform_int_distribution<int> pick_op(0, 5);
  std::uniform_int_distribution<std::size_t> pick_user(0, kUsers.size() - 1);
  std::uniform_int_distribution<std::uint64_t> cents(0, 2'000'000);
  std::uniform_int_distribution<std::uint64_t> price_cents(50'000, 300'000);

  for (int run = 0; run < 8; ++run) {
    Harness h;
    const common::Amount treasury = h.token.balance_of(Harness::kLedger);
    for (const auto user : kUsers) {
      h.custody.fund(user, units("500"));
      h.token.mint(user, units("50000"));
      h.token.approve(user, Harness::kLedger, common::max_amount());
    }
    const common::Amount minted_to_users = h.token.balance_of(Harness::kBob) + h.token.balance_of(3) +
                                           h.token.balance_of(Harness::kAlice);

    for (int step = 0; step < 400; ++step) {
      const auto user = kUsers[pick_user(rng)];
      const auto op = pick_op(rng);
      // Amounts in hundredths of a unit; occasionally zero.
      const common::Amount amount = common::Amount{cents(rng)} * common::kScale / 100;
      const common::Amount small = amount / 1000;
      const auto before = capture(h);
      const ledger::Position position_before = h.ledger.position(user);

      ledger::OperationResult result;
      switch (op) {
        case 0:
          result = h.ledger.add_collateral(user, small);
          break;
        case 1:
          result = h.ledger.withdraw_collateral(user, small);
          break;
        case 2:
          result = h.ledger.borrow(user, amount);
          break;
        case 3:
          result = h.ledger.repay(user, amount / 4);
          break;
        case 4: {
          const auto target = kUsers[pick_user(rng)];
          const ledger::Position target_before = h.ledger.position(target);
          const common::Amount liquidator_tokens = h.token.balance_of(user);
          result = h.ledger.liquidate(user, target);
          if (result.ok()) {
            const ledger::Position target_after = h.ledger.position(target);
            assert(target_after.debt == 0);
            assert(result.amount <= target_before.collateral);
            assert(target_after.collateral == target_before.collateral - result.amount);
            assert(h.token.balance_of(user) == liquidator_tokens - target_before.debt);
          }
          break;
        }
        default:
          h.oracle.set_price(common::Amount{price_cents(rng)} * common::kScale / 100);
          continue;
      }

      if (!result.ok()) {
        assert(capture(h) == before);
      } else if (op == 1 || op == 2) {
        assert(solvent(h.ledger.position(user), result.price));
      } else if (op == 0) {
        assert(h.ledger.position(user).collateral == position_before.collateral + small);
      }

      assert(h.custody.held() == h.ledger.total_collateral());
      assert(h.token.balance_of(Harness::kLedger) == treasury - h.ledger.total_debt());
      common::Amount circulating = h.token.balance_of(Harness::kLedger);
      for (const auto account : kUsers) {
        circulating += h.token.balance_of(account);
      }
      assert(circulating == treasury + minted_to_users);
    }
  }
}

}  // namespace lendcore::tests
