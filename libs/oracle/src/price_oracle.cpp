#include "lendcore/oracle/price_oracle.hpp"

#include <utility>

namespace lendcore {
namespace oracle {

ManualPriceOracle::ManualPriceOracle(common::Amount initial_price)
    : price_(std::move(initial_price)) {}

void ManualPriceOracle::set_price(common::Amount price) {
  std::lock_guard<std::mutex> lock(mutex_);
  price_ = std::move(price);
}

void ManualPriceOracle::set_available(bool available) {
  std::lock_guard<std::mutex> lock(mutex_);
  available_ = available;
}

std::optional<common::Amount> ManualPriceOracle::current_price() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!available_) {
    return std::nullopt;
  }
  return price_;
}

}  // namespace oracle
}  // namespace lendcore
