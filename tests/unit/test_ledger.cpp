#include "test_ledger.hpp"

#include <cassert>
#include <stdexcept>
#include <vector>

#include "lendcore/ledger/position_ledger.hpp"
#include "test_fixtures.hpp"

namespace lendcore::tests {

using ledger::Status;

void test_amount_units() {
  assert(units("1") == common::kScale);
  assert(units("0.5") * 2 == common::kScale);
  assert(units("2000") == common::Amount{2000} * common::kScale);
  assert(common::format_units(units("1500.25")) == "1500.25");
  assert(common::format_units(units("0.000000000000000001")) == "0.000000000000000001");
  assert(common::format_units(0) == "0");

  assert(!common::parse_units("").has_value());
  assert(!common::parse_units(".").has_value());
  assert(!common::parse_units("1.2.3").has_value());
  assert(!common::parse_units("-5").has_value());
  assert(!common::parse_units("0.0000000000000000001").has_value());
}

void test_ledger_deposit_and_borrow() {
  Harness h;
  std::vector<ledger::LedgerEvent> events;
  h.ledger.subscribe([&](const ledger::LedgerEvent& event) { events.push_back(event); });

  auto deposit = h.ledger.add_collateral(Harness::kAlice, units("10"));
  assert(deposit.ok());
  assert(h.ledger.collateral_value(Harness::kAlice) == units("20000"));
  assert(h.custody.wallet_balance(Harness::kAlice) == units("90"));
  assert(h.custody.held() == units("10"));

  auto borrow = h.ledger.borrow(Harness::kAlice, units("15000"));
  assert(borrow.ok());
  assert(h.ledger.position_ratio(Harness::kAlice) == common::Amount{133});
  assert(h.token.balance_of(Harness::kAlice) == units("15000"));

  auto too_much = h.ledger.borrow(Harness::kAlice, units("3000"));
  assert(too_much.status == Status::kUnsafePositionRatio);
  assert(too_much.reject_code == ledger::reject_code(Status::kUnsafePositionRatio));
  assert(h.ledger.position(Harness::kAlice).debt == units("15000"));
  assert(h.token.balance_of(Harness::kAlice) == units("15000"));

  assert(events.size() == 2);
  assert(events[0].kind == ledger::EventKind::kCollateralAdded);
  assert(events[0].amount == units("10"));
  assert(events[0].price == units("2000"));
  assert(events[1].kind == ledger::EventKind::kAssetBorrowed);
  assert(events[1].user == Harness::kAlice);
}

void test_ledger_invalid_amounts() {
  Harness h;
  assert(h.ledger.add_collateral(Harness::kAlice, 0).status == Status::kInvalidAmount);
  assert(h.ledger.borrow(Harness::kAlice, 0).status == Status::kInvalidAmount);
  assert(h.ledger.withdraw_collateral(Harness::kAlice, units("1")).status == Status::kInvalidAmount);
  assert(h.ledger.repay(Harness::kAlice, units("1")).status == Status::kInvalidAmount);

  assert(h.ledger.add_collateral(Harness::kAlice, units("5")).ok());
  assert(h.ledger.withdraw_collateral(Harness::kAlice, 0).status == Status::kInvalidAmount);
  assert(h.ledger.withdraw_collateral(Harness::kAlice, units("5.000000000000000001")).status ==
         Status::kInvalidAmount);
  assert(h.ledger.position(Harness::kAlice).collateral == units("5"));
}

void test_ledger_unsafe_withdraw() {
  Harness h;
  assert(h.ledger.add_collateral(Harness::kAlice, units("10")).ok());
  assert(h.ledger.borrow(Harness::kAlice, units("15000")).ok());

  // 18000 of value backs 15000 of debt at 120%, i.e. 9 collateral at 2000.
  assert(h.ledger.max_withdrawable_collateral(Harness::kAlice) == units("1"));

  auto unsafe = h.ledger.withdraw_collateral(Harness::kAlice, units("2"));
  assert(unsafe.status == Status::kUnsafePositionRatio);
  assert(h.ledger.position(Harness::kAlice).collateral == units("10"));
  assert(h.custody.wallet_balance(Harness::kAlice) == units("90"));

  assert(h.ledger.withdraw_collateral(Harness::kAlice, units("1")).ok());
  assert(h.ledger.position(Harness::kAlice).collateral == units("9"));
  assert(h.ledger.max_withdrawable_collateral(Harness::kAlice) == common::Amount{0});
  assert(h.ledger.withdraw_collateral(Harness::kAlice, 1).status == Status::kUnsafePositionRatio);
}

void test_ledger_debt_free_withdraw() {
  Harness h;
  assert(h.ledger.add_collateral(Harness::kAlice, units("10")).ok());
  assert(h.ledger.position_ratio(Harness::kAlice) == common::max_amount());
  assert(h.ledger.is_liquidatable(Harness::kAlice) == false);
  assert(h.ledger.max_withdrawable_collateral(Harness::kAlice) == units("10"));

  assert(h.ledger.withdraw_collateral(Harness::kAlice, units("10")).ok());
  assert(h.ledger.position(Harness::kAlice) == ledger::Position{});
  assert(h.custody.wallet_balance(Harness::kAlice) == units("100"));
  assert(h.custody.held() == 0);
}

void test_ledger_repay() {
  Harness h;
  assert(h.ledger.add_collateral(Harness::kAlice, units("10")).ok());
  assert(h.ledger.borrow(Harness::kAlice, units("15000")).ok());

  assert(h.ledger.repay(Harness::kAlice, units("15000.1")).status == Status::kInvalidAmount);

  // No allowance granted yet.
  auto refused = h.ledger.repay(Harness::kAlice, units("5000"));
  assert(refused.status == Status::kRepayingFailed);
  assert(h.ledger.position(Harness::kAlice).debt == units("15000"));
  assert(h.token.balance_of(Harness::kAlice) == units("15000"));

  h.token.approve(Harness::kAlice, Harness::kLedger, units("15000"));
  assert(h.ledger.repay(Harness::kAlice, units("5000")).ok());
  assert(h.ledger.position(Harness::kAlice).debt == units("10000"));

  // Repaying the remainder never needs a solvency check, even underwater.
  h.oracle.set_price(units("1"));
  assert(h.ledger.repay(Harness::kAlice, units("10000")).ok());
  assert(h.ledger.position(Harness::kAlice).debt == 0);
  assert(h.token.balance_of(Harness::kAlice) == 0);
  assert(h.token.balance_of(Harness::kLedger) == units("1000000"));
  assert(h.ledger.is_liquidatable(Harness::kAlice) == false);
}

void test_ledger_collaborator_failures() {
  Harness h;

  h.custody.fail_receive = true;
  assert(h.ledger.add_collateral(Harness::kAlice, units("10")).status == Status::kTransferFailed);
  assert(h.ledger.position(Harness::kAlice).collateral == 0);
  assert(h.ledger.accounts().empty());
  h.custody.fail_receive = false;

  // Wallet only holds 100.
  assert(h.ledger.add_collateral(Harness::kAlice, units("101")).status == Status::kTransferFailed);

  assert(h.ledger.add_collateral(Harness::kAlice, units("10")).ok());

  h.token.fail_transfer = true;
  assert(h.ledger.borrow(Harness::kAlice, units("1000")).status == Status::kBorrowingFailed);
  assert(h.ledger.position(Harness::kAlice).debt == 0);
  assert(h.token.balance_of(Harness::kAlice) == 0);
  h.token.fail_transfer = false;

  h.custody.fail_send = true;
  assert(h.ledger.withdraw_collateral(Harness::kAlice, units("1")).status == Status::kTransferFailed);
  assert(h.ledger.position(Harness::kAlice).collateral == units("10"));
  h.custody.fail_send = false;
}

void test_ledger_journal_refusal() {
  Harness h;
  bool accept = true;
  std::vector<ledger::LedgerEvent> journaled;
  std::vector<ledger::LedgerEvent> published;
  h.ledger.set_journal([&](const ledger::LedgerEvent& event) {
    if (accept) {
      journaled.push_back(event);
    }
    return accept;
  });
  h.ledger.subscribe([&](const ledger::LedgerEvent& event) { published.push_back(event); });

  bool replaced = false;
  try {
    h.ledger.set_journal([](const ledger::LedgerEvent&) { return true; });
  } catch (const std::logic_error&) {
    replaced = true;
  }
  assert(replaced);

  assert(h.ledger.add_collateral(Harness::kAlice, units("10")).ok());
  assert(h.ledger.borrow(Harness::kAlice, units("15000")).ok());
  h.token.approve(Harness::kAlice, Harness::kLedger, common::max_amount());
  h.token.approve(Harness::kBob, Harness::kLedger, common::max_amount());

  accept = false;
  const auto deposit = h.ledger.add_collateral(Harness::kAlice, units("5"));
  assert(deposit.status == Status::kJournalFailed);
  assert(deposit.reject_code == ledger::reject_code(Status::kJournalFailed));
  assert(h.custody.wallet_balance(Harness::kAlice) == units("90"));
  assert(h.custody.held() == units("10"));

  assert(h.ledger.borrow(Harness::kAlice, units("100")).status == Status::kJournalFailed);
  assert(h.token.balance_of(Harness::kAlice) == units("15000"));
  assert(h.token.balance_of(Harness::kLedger) == units("985000"));

  assert(h.ledger.repay(Harness::kAlice, units("100")).status == Status::kJournalFailed);
  assert(h.token.balance_of(Harness::kAlice) == units("15000"));

  h.oracle.set_price(units("1500"));
  assert(h.ledger.liquidate(Harness::kBob, Harness::kAlice).status == Status::kJournalFailed);
  assert(h.token.balance_of(Harness::kBob) == units("100000"));
  assert(h.custody.wallet_balance(Harness::kBob) == 0);
  assert(h.custody.held() == units("10"));

  const auto position = h.ledger.position(Harness::kAlice);
  assert(position.collateral == units("10"));
  assert(position.debt == units("15000"));
  assert(journaled.size() == 2);
  assert(published.size() == 2);

  // Detaching lets operations commit unjournaled.
  h.ledger.set_journal(nullptr);
  assert(h.ledger.liquidate(Harness::kBob, Harness::kAlice).ok());
  assert(published.size() == 3);
}

void test_ledger_rejects_bad_params() {
  const auto rejects = [](ledger::LedgerParams params) {
    Harness h;
    try {
      ledger::PositionLedger candidate(Harness::kLedger, h.token, h.custody, h.oracle, params);
    } catch (const std::invalid_argument&) {
      return true;
    }
    return false;
  };
  assert(rejects({.min_collateral_ratio_pct = 0}));
  assert(rejects({.min_collateral_ratio_pct = 100}));
  assert(rejects({.min_collateral_ratio_pct = 150, .liquidation_bonus_pct = 101}));
  assert(!rejects({.min_collateral_ratio_pct = 101, .liquidation_bonus_pct = 100}));
  assert(!rejects({}));

  Harness h;
  bool overflowed = false;
  try {
    (void)h.ledger.max_borrow_amount(common::max_amount());
  } catch (const std::overflow_error&) {
    overflowed = true;
  }
  assert(overflowed);
  assert(h.ledger.max_borrow_amount(units("10")).has_value());
}

void test_ledger_borrow_limits() {
  Harness h;
  assert(h.ledger.add_collateral(Harness::kAlice, units("10")).ok());

  const auto limit = h.ledger.max_borrow_amount(units("10"));
  assert(limit == common::Amount{"16666666666666666666666"});

  assert(h.ledger.borrow(Harness::kAlice, *limit).ok());
  assert(h.ledger.position_ratio(Harness::kAlice) == common::Amount{120});
  assert(h.ledger.is_liquidatable(Harness::kAlice) == false);
  assert(h.ledger.borrow(Harness::kAlice, 1).status == Status::kUnsafePositionRatio);
}

void test_ledger_oracle_and_overflow() {
  Harness h;
  assert(h.ledger.add_collateral(Harness::kAlice, units("10")).ok());

  h.oracle.set_available(false);
  assert(h.ledger.add_collateral(Harness::kAlice, units("1")).status == Status::kOracleUnavailable);
  assert(h.ledger.borrow(Harness::kAlice, units("1")).status == Status::kOracleUnavailable);
  assert(!h.ledger.collateral_value(Harness::kAlice).has_value());
  assert(!h.ledger.position_ratio(Harness::kAlice).has_value());
  assert(!h.ledger.is_liquidatable(Harness::kAlice).has_value());
  assert(h.ledger.position(Harness::kAlice).collateral == units("10"));
  h.oracle.set_available(true);

  auto overflow = h.ledger.borrow(Harness::kAlice, common::max_amount());
  assert(overflow.status == Status::kArithmeticOverflow);
  assert(h.ledger.position(Harness::kAlice).debt == 0);
}

void test_ledger_read_idempotence() {
  Harness h;
  assert(h.ledger.add_collateral(Harness::kAlice, units("7.5")).ok());
  assert(h.ledger.borrow(Harness::kAlice, units("9000")).ok());

  const auto before = h.ledger.export_positions();
  const auto value = h.ledger.collateral_value(Harness::kAlice);
  const auto ratio = h.ledger.position_ratio(Harness::kAlice);
  for (int i = 0; i < 3; ++i) {
    assert(h.ledger.collateral_value(Harness::kAlice) == value);
    assert(h.ledger.position_ratio(Harness::kAlice) == ratio);
    assert(h.ledger.is_liquidatable(Harness::kAlice) == false);
    assert(h.ledger.max_withdrawable_collateral(Harness::kAlice).has_value());
  }
  assert(h.ledger.export_positions() == before);
  assert(h.ledger.collateral_value(Harness::kBob) == common::Amount{0});
  assert(h.ledger.accounts().size() == 1);
}

}  // namespace lendcore::tests
