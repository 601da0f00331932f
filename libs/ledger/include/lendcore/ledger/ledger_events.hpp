#pragma once

#include <cstdint>
#include <string_view>

#include "lendcore/common/types.hpp"

namespace lendcore {
namespace ledger {

enum class EventKind : std::uint8_t {
  kCollateralAdded = 1,
  kCollateralWithdrawn = 2,
  kAssetBorrowed = 3,
  kAssetRepaid = 4,
  kLiquidation = 5,
};

// Notification emitted once per committed operation. `price` is the oracle
// price the operation ran against. For liquidations `amount` is the collateral
// paid to `liquidator` and `debt` the debt that was cleared.
struct LedgerEvent {
  EventKind kind{EventKind::kCollateralAdded};
  common::AccountId user{0};
  common::AccountId liquidator{0};
  common::Amount amount{0};
  common::Amount debt{0};
  common::Amount price{0};

  friend bool operator==(const LedgerEvent&, const LedgerEvent&) = default;
};

struct Position {
  common::Amount collateral{0};
  common::Amount debt{0};

  friend bool operator==(const Position&, const Position&) = default;
};

constexpr std::string_view to_string(EventKind kind) noexcept {
  switch (kind) {
    case EventKind::kCollateralAdded:
      return "collateral-added";
    case EventKind::kCollateralWithdrawn:
      return "collateral-withdrawn";
    case EventKind::kAssetBorrowed:
      return "asset-borrowed";
    case EventKind::kAssetRepaid:
      return "asset-repaid";
    case EventKind::kLiquidation:
      return "liquidation";
  }
  return "unknown";
}

}  // namespace ledger
}  // namespace lendcore
