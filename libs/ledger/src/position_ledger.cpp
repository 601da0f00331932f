#include "lendcore/ledger/position_ledger.hpp"

#include <algorithm>
#include <stdexcept>

namespace lendcore {
namespace ledger {

namespace {
constexpr std::uint16_t kRejectCodeBase = 3000;

OperationResult make_result(Status status, const common::Amount& price = 0, const common::Amount& amount = 0) {
  OperationResult result;
  result.status = status;
  result.reject_code = reject_code(status);
  result.price = price;
  result.amount = amount;
  return result;
}

// Checked 256-bit arithmetic throws on overflow/underflow. Operations stage
// their changes, so nothing has been committed when one of these escapes.
template <typename Fn>
OperationResult guarded(Fn&& fn) {
  try {
    return fn();
  } catch (const std::overflow_error&) {
    return make_result(Status::kArithmeticOverflow);
  } catch (const std::range_error&) {
    return make_result(Status::kArithmeticOverflow);
  }
}
}  // namespace

std::string_view to_string(Status status) noexcept {
  switch (status) {
    case Status::kOk:
      return "ok";
    case Status::kInvalidAmount:
      return "invalid-amount";
    case Status::kTransferFailed:
      return "transfer-failed";
    case Status::kUnsafePositionRatio:
      return "unsafe-position-ratio";
    case Status::kBorrowingFailed:
      return "borrowing-failed";
    case Status::kRepayingFailed:
      return "repaying-failed";
    case Status::kNotLiquidatable:
      return "not-liquidatable";
    case Status::kInsufficientLiquidatorFunds:
      return "insufficient-liquidator-funds";
    case Status::kOracleUnavailable:
      return "oracle-unavailable";
    case Status::kZeroCollateralValue:
      return "zero-collateral-value";
    case Status::kArithmeticOverflow:
      return "arithmetic-overflow";
    case Status::kUnauthorized:
      return "unauthorized";
    case Status::kJournalFailed:
      return "journal-failed";
  }
  return "unknown";
}

std::uint16_t reject_code(Status status) noexcept {
  if (status == Status::kOk) {
    return 0;
  }
  return static_cast<std::uint16_t>(kRejectCodeBase + static_cast<std::uint16_t>(status));
}

PositionLedger::PositionLedger(common::AccountId self,
                               assets::DebtAssetLedger& debt_asset,
                               assets::CollateralCustody& custody,
                               const oracle::PriceOracle& oracle,
                               LedgerParams params)
    : self_(self), debt_asset_(debt_asset), custody_(custody), oracle_(oracle), params_(params) {
  if (params_.min_collateral_ratio_pct <= common::kPercentDenominator) {
    throw std::invalid_argument("minimum collateral ratio must be above 100 percent");
  }
  if (params_.liquidation_bonus_pct > common::kPercentDenominator) {
    throw std::invalid_argument("liquidation bonus must be at most 100 percent");
  }
  // Standing authorization to move the ledger's own balance with transfer_from.
  debt_asset_.approve(self_, self_, common::max_amount());
}

void PositionLedger::subscribe(EventHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  handlers_.push_back(std::move(handler));
}

void PositionLedger::set_journal(Journal journal) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (journal && journal_) {
    throw std::logic_error("ledger already has a journal attached");
  }
  journal_ = std::move(journal);
}

OperationResult PositionLedger::add_collateral(common::AccountId user, const common::Amount& amount) {
  std::lock_guard<std::mutex> lock(mutex_);
  return guarded([&] {
    if (amount == 0) {
      return make_result(Status::kInvalidAmount);
    }
    const auto price = oracle_.current_price();
    if (!price) {
      return make_result(Status::kOracleUnavailable);
    }

    Position staged = find_locked(user);
    staged.collateral += amount;

    if (!custody_.receive(user, amount)) {
      return make_result(Status::kTransferFailed, *price);
    }

    return finish_locked(user, staged,
                         LedgerEvent{.kind = EventKind::kCollateralAdded, .user = user, .amount = amount, .price = *price},
                         [&] { return custody_.send(user, amount); });
  });
}

OperationResult PositionLedger::withdraw_collateral(common::AccountId user, const common::Amount& amount) {
  std::lock_guard<std::mutex> lock(mutex_);
  return guarded([&] {
    Position staged = find_locked(user);
    if (amount == 0 || amount > staged.collateral) {
      return make_result(Status::kInvalidAmount);
    }
    const auto price = oracle_.current_price();
    if (!price) {
      return make_result(Status::kOracleUnavailable);
    }

    staged.collateral -= amount;
    if (!is_safe(staged, *price)) {
      return make_result(Status::kUnsafePositionRatio, *price);
    }

    if (!custody_.send(user, amount)) {
      return make_result(Status::kTransferFailed, *price);
    }

    return finish_locked(
        user, staged,
        LedgerEvent{.kind = EventKind::kCollateralWithdrawn, .user = user, .amount = amount, .price = *price},
        [&] { return custody_.receive(user, amount); });
  });
}

OperationResult PositionLedger::borrow(common::AccountId user, const common::Amount& amount) {
  std::lock_guard<std::mutex> lock(mutex_);
  return guarded([&] {
    if (amount == 0) {
      return make_result(Status::kInvalidAmount);
    }
    const auto price = oracle_.current_price();
    if (!price) {
      return make_result(Status::kOracleUnavailable);
    }

    Position staged = find_locked(user);
    staged.debt += amount;
    if (!is_safe(staged, *price)) {
      return make_result(Status::kUnsafePositionRatio, *price);
    }

    if (!debt_asset_.transfer(self_, user, amount)) {
      return make_result(Status::kBorrowingFailed, *price);
    }

    return finish_locked(user, staged,
                         LedgerEvent{.kind = EventKind::kAssetBorrowed, .user = user, .amount = amount, .price = *price},
                         [&] { return debt_asset_.transfer(user, self_, amount); });
  });
}

OperationResult PositionLedger::repay(common::AccountId user, const common::Amount& amount) {
  std::lock_guard<std::mutex> lock(mutex_);
  return guarded([&] {
    Position staged = find_locked(user);
    if (amount == 0 || amount > staged.debt) {
      return make_result(Status::kInvalidAmount);
    }
    const auto price = oracle_.current_price();
    if (!price) {
      return make_result(Status::kOracleUnavailable);
    }

    // Repaying only improves the ratio; no solvency check.
    staged.debt -= amount;

    if (!debt_asset_.transfer_from(self_, user, self_, amount)) {
      return make_result(Status::kRepayingFailed, *price);
    }

    return finish_locked(user, staged,
                         LedgerEvent{.kind = EventKind::kAssetRepaid, .user = user, .amount = amount, .price = *price},
                         [&] { return debt_asset_.transfer(self_, user, amount); });
  });
}

OperationResult PositionLedger::liquidate(common::AccountId liquidator, common::AccountId user) {
  std::lock_guard<std::mutex> lock(mutex_);
  return guarded([&] {
    const auto price = oracle_.current_price();
    if (!price) {
      return make_result(Status::kOracleUnavailable);
    }

    const Position before = find_locked(user);
    if (before.debt == 0 || ratio_of(before, *price) >= params_.min_collateral_ratio_pct) {
      return make_result(Status::kNotLiquidatable, *price);
    }

    const common::Amount user_debt = before.debt;
    const common::Amount user_collateral = before.collateral;
    const common::Amount collateral_value = value_of(user_collateral, *price);
    if (collateral_value == 0) {
      return make_result(Status::kZeroCollateralValue, *price);
    }

    if (debt_asset_.balance_of(liquidator) < user_debt) {
      return make_result(Status::kInsufficientLiquidatorFunds, *price);
    }

    const common::Amount collateral_portion = user_debt * user_collateral / collateral_value;
    const common::Amount bonus = collateral_portion * params_.liquidation_bonus_pct / common::kPercentDenominator;
    const common::Amount payout = std::min(common::Amount{collateral_portion + bonus}, user_collateral);

    Position staged;
    staged.debt = 0;
    staged.collateral = user_collateral - payout;

    if (!debt_asset_.transfer_from(self_, liquidator, self_, user_debt)) {
      return make_result(Status::kRepayingFailed, *price);
    }

    if (!custody_.send(liquidator, payout)) {
      if (!debt_asset_.transfer(self_, liquidator, user_debt)) {
        throw std::runtime_error("failed to refund liquidator after aborted liquidation");
      }
      return make_result(Status::kTransferFailed, *price);
    }

    return finish_locked(user, staged,
                         LedgerEvent{.kind = EventKind::kLiquidation,
                                     .user = user,
                                     .liquidator = liquidator,
                                     .amount = payout,
                                     .debt = user_debt,
                                     .price = *price},
                         [&] {
                           return custody_.receive(liquidator, payout) &&
                                  debt_asset_.transfer(self_, liquidator, user_debt);
                         });
  });
}

std::optional<common::Amount> PositionLedger::collateral_value(common::AccountId user) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto price = oracle_.current_price();
  if (!price) {
    return std::nullopt;
  }
  return value_of(find_locked(user).collateral, *price);
}

std::optional<common::Amount> PositionLedger::position_ratio(common::AccountId user) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto price = oracle_.current_price();
  if (!price) {
    return std::nullopt;
  }
  return ratio_of(find_locked(user), *price);
}

std::optional<bool> PositionLedger::is_liquidatable(common::AccountId user) const {
  const auto ratio = position_ratio(user);
  if (!ratio) {
    return std::nullopt;
  }
  return *ratio < params_.min_collateral_ratio_pct;
}

std::optional<common::Amount> PositionLedger::max_borrow_amount(const common::Amount& collateral_amount) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto price = oracle_.current_price();
  if (!price) {
    return std::nullopt;
  }
  return value_of(collateral_amount, *price) * common::kPercentDenominator / params_.min_collateral_ratio_pct;
}

std::optional<common::Amount> PositionLedger::max_withdrawable_collateral(common::AccountId user) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto price = oracle_.current_price();
  if (!price) {
    return std::nullopt;
  }

  const Position position = find_locked(user);
  if (position.debt == 0) {
    return position.collateral;
  }
  if (*price == 0) {
    return common::Amount{0};
  }

  // Smallest value that satisfies value * 100 >= debt * ratio, then the
  // smallest collateral whose floored value reaches it.
  const common::Amount required_value =
      (position.debt * params_.min_collateral_ratio_pct + (common::kPercentDenominator - 1)) /
      common::kPercentDenominator;
  const common::Amount required_collateral = (required_value * common::kScale + (*price - 1)) / *price;

  if (position.collateral <= required_collateral) {
    return common::Amount{0};
  }
  return common::Amount{position.collateral - required_collateral};
}

Position PositionLedger::position(common::AccountId user) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return find_locked(user);
}

std::vector<common::AccountId> PositionLedger::accounts() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<common::AccountId> ids;
  ids.reserve(positions_.size());
  for (const auto& [id, position] : positions_) {
    ids.push_back(id);
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

common::Amount PositionLedger::total_collateral() const {
  std::lock_guard<std::mutex> lock(mutex_);
  common::Amount total{0};
  for (const auto& [id, position] : positions_) {
    total += position.collateral;
  }
  return total;
}

common::Amount PositionLedger::total_debt() const {
  std::lock_guard<std::mutex> lock(mutex_);
  common::Amount total{0};
  for (const auto& [id, position] : positions_) {
    total += position.debt;
  }
  return total;
}

PositionTable PositionLedger::export_positions() const {
  std::lock_guard<std::mutex> lock(mutex_);
  PositionTable table(positions_.begin(), positions_.end());
  std::sort(table.begin(), table.end(), [](const auto& lhs, const auto& rhs) { return lhs.first < rhs.first; });
  return table;
}

void PositionLedger::restore(const PositionTable& table) {
  std::lock_guard<std::mutex> lock(mutex_);
  positions_.clear();
  for (const auto& [id, position] : table) {
    positions_[id] = position;
  }
}

void PositionLedger::apply(const LedgerEvent& event) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& position = positions_[event.user];
  switch (event.kind) {
    case EventKind::kCollateralAdded:
      position.collateral += event.amount;
      return;
    case EventKind::kCollateralWithdrawn:
      position.collateral -= event.amount;
      return;
    case EventKind::kAssetBorrowed:
      position.debt += event.amount;
      return;
    case EventKind::kAssetRepaid:
      position.debt -= event.amount;
      return;
    case EventKind::kLiquidation:
      if (position.debt != event.debt) {
        throw std::runtime_error("liquidation event does not match recorded debt");
      }
      position.debt = 0;
      position.collateral -= event.amount;
      return;
  }
  throw std::runtime_error("unknown ledger event kind");
}

Position PositionLedger::find_locked(common::AccountId user) const {
  if (auto it = positions_.find(user); it != positions_.end()) {
    return it->second;
  }
  return {};
}

OperationResult PositionLedger::finish_locked(common::AccountId user,
                                             const Position& position,
                                             const LedgerEvent& event,
                                             const std::function<bool()>& reverse) {
  if (journal_ && !journal_(event)) {
    if (!reverse()) {
      throw std::runtime_error("failed to reverse transfers of an unjournaled operation");
    }
    return make_result(Status::kJournalFailed, event.price);
  }
  commit_locked(user, position, event);
  return make_result(Status::kOk, event.price, event.amount);
}

void PositionLedger::commit_locked(common::AccountId user, const Position& position, const LedgerEvent& event) {
  positions_[user] = position;
  for (const auto& handler : handlers_) {
    handler(event);
  }
}

common::Amount PositionLedger::value_of(const common::Amount& collateral, const common::Amount& price) {
  return collateral * price / common::kScale;
}

common::Amount PositionLedger::ratio_of(const Position& position, const common::Amount& price) const {
  if (position.debt == 0) {
    return common::max_amount();
  }
  return value_of(position.collateral, price) * common::kPercentDenominator / position.debt;
}

bool PositionLedger::is_safe(const Position& position, const common::Amount& price) const {
  if (position.debt == 0) {
    return true;
  }
  return value_of(position.collateral, price) * common::kPercentDenominator >=
         position.debt * params_.min_collateral_ratio_pct;
}

}  // namespace ledger
}  // namespace lendcore
