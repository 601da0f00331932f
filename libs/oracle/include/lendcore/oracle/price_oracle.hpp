#pragma once

#include <mutex>
#include <optional>

#include "lendcore/common/types.hpp"

namespace lendcore {
namespace oracle {

// Source of the collateral price in debt-asset units, scaled by 10^18.
// An empty result means the source could not be read.
class PriceOracle {
 public:
  virtual ~PriceOracle() = default;

  [[nodiscard]] virtual std::optional<common::Amount> current_price() const = 0;
};

// Operator-driven price source used by the daemon and tests.
class ManualPriceOracle final : public PriceOracle {
 public:
  explicit ManualPriceOracle(common::Amount initial_price);

  void set_price(common::Amount price);
  void set_available(bool available);

  [[nodiscard]] std::optional<common::Amount> current_price() const override;

 private:
  mutable std::mutex mutex_;
  common::Amount price_;
  bool available_{true};
};

}  // namespace oracle
}  // namespace lendcore
