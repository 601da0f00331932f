#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "lendcore/assets/collateral_custody.hpp"
#include "lendcore/assets/debt_token.hpp"
#include "lendcore/common/types.hpp"
#include "lendcore/ledger/ledger_events.hpp"
#include "lendcore/oracle/price_oracle.hpp"

namespace lendcore {
namespace ledger {

enum class Status : std::uint8_t {
  kOk,
  kInvalidAmount,
  kTransferFailed,
  kUnsafePositionRatio,
  kBorrowingFailed,
  kRepayingFailed,
  kNotLiquidatable,
  kInsufficientLiquidatorFunds,
  kOracleUnavailable,
  kZeroCollateralValue,
  kArithmeticOverflow,
  kUnauthorized,
  kJournalFailed,
};

struct OperationResult {
  Status status{Status::kOk};
  std::uint16_t reject_code{0};
  common::Amount price{0};
  // Amount moved by the operation; the liquidator payout for liquidations.
  common::Amount amount{0};

  [[nodiscard]] bool ok() const noexcept { return status == Status::kOk; }
};

std::string_view to_string(Status status) noexcept;
std::uint16_t reject_code(Status status) noexcept;

struct LedgerParams {
  std::uint32_t min_collateral_ratio_pct{common::kMinCollateralRatioPct};
  std::uint32_t liquidation_bonus_pct{common::kLiquidationBonusPct};
};

using PositionTable = std::vector<std::pair<common::AccountId, Position>>;

// Collateral/debt book of every user. Each mutating call runs under one lock,
// reads the oracle once, and commits the touched position only after every
// check, collaborator call and the journal accepted it. Event handlers run
// under that lock after commit and must not call back into the ledger.
class PositionLedger {
 public:
  using EventHandler = std::function<void(const LedgerEvent&)>;
  // Runs under the ledger lock after the collaborators moved funds and before
  // the position commits. Returning false reverses those transfers and fails
  // the operation with kJournalFailed.
  using Journal = std::function<bool(const LedgerEvent&)>;

  // `self` is the ledger's own account on the debt-asset ledger; it must hold
  // the liquidity handed out by borrow(). Throws std::invalid_argument unless
  // the minimum ratio is above 100 and the bonus at most 100.
  PositionLedger(common::AccountId self,
                 assets::DebtAssetLedger& debt_asset,
                 assets::CollateralCustody& custody,
                 const oracle::PriceOracle& oracle,
                 LedgerParams params = {});
  PositionLedger(const PositionLedger&) = delete;
  PositionLedger& operator=(const PositionLedger&) = delete;

  // Handlers are never removed and must outlive the ledger.
  void subscribe(EventHandler handler);
  // At most one journal is attached; pass an empty function to detach it.
  // Throws std::logic_error when replacing an attached journal.
  void set_journal(Journal journal);

  OperationResult add_collateral(common::AccountId user, const common::Amount& amount);
  OperationResult withdraw_collateral(common::AccountId user, const common::Amount& amount);
  OperationResult borrow(common::AccountId user, const common::Amount& amount);
  OperationResult repay(common::AccountId user, const common::Amount& amount);
  OperationResult liquidate(common::AccountId liquidator, common::AccountId user);

  // Reads return nullopt when the oracle cannot be read and throw
  // std::overflow_error when the result does not fit in 256 bits.
  [[nodiscard]] std::optional<common::Amount> collateral_value(common::AccountId user) const;
  // Percentage, floored. A debt-free position reports the maximum amount.
  [[nodiscard]] std::optional<common::Amount> position_ratio(common::AccountId user) const;
  [[nodiscard]] std::optional<bool> is_liquidatable(common::AccountId user) const;
  [[nodiscard]] std::optional<common::Amount> max_borrow_amount(const common::Amount& collateral_amount) const;
  [[nodiscard]] std::optional<common::Amount> max_withdrawable_collateral(common::AccountId user) const;

  [[nodiscard]] Position position(common::AccountId user) const;
  [[nodiscard]] std::vector<common::AccountId> accounts() const;
  [[nodiscard]] common::Amount total_collateral() const;
  [[nodiscard]] common::Amount total_debt() const;
  [[nodiscard]] const LedgerParams& params() const noexcept { return params_; }
  [[nodiscard]] common::AccountId self() const noexcept { return self_; }

  // Recovery hooks. Neither touches collaborators nor publishes events.
  [[nodiscard]] PositionTable export_positions() const;
  void restore(const PositionTable& table);
  void apply(const LedgerEvent& event);

 private:
  common::AccountId self_;
  assets::DebtAssetLedger& debt_asset_;
  assets::CollateralCustody& custody_;
  const oracle::PriceOracle& oracle_;
  LedgerParams params_;

  mutable std::mutex mutex_;
  std::unordered_map<common::AccountId, Position> positions_{};
  std::vector<EventHandler> handlers_{};
  Journal journal_{};

  [[nodiscard]] Position find_locked(common::AccountId user) const;
  // Journals `event`, then commits `position`. When the journal refuses,
  // `reverse` undoes the collaborator transfers already made.
  OperationResult finish_locked(common::AccountId user,
                                const Position& position,
                                const LedgerEvent& event,
                                const std::function<bool()>& reverse);
  void commit_locked(common::AccountId user, const Position& position, const LedgerEvent& event);

  [[nodiscard]] static common::Amount value_of(const common::Amount& collateral, const common::Amount& price);
  [[nodiscard]] common::Amount ratio_of(const Position& position, const common::Amount& price) const;
  [[nodiscard]] bool is_safe(const Position& position, const common::Amount& price) const;
};

}  // namespace ledger
}  // namespace lendcore
