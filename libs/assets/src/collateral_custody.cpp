#include "lendcore/assets/collateral_custody.hpp"

namespace lendcore {
namespace assets {

void InMemoryCollateralCustody::fund(common::AccountId account, const common::Amount& amount) {
  std::lock_guard<std::mutex> lock(mutex_);
  wallets_[account] += amount;
}

bool InMemoryCollateralCustody::receive(common::AccountId from, const common::Amount& amount) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& wallet = wallets_[from];
  if (wallet < amount) {
    return false;
  }
  wallet -= amount;
  held_ += amount;
  return true;
}

bool InMemoryCollateralCustody::send(common::AccountId to, const common::Amount& amount) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (held_ < amount) {
    return false;
  }
  held_ -= amount;
  wallets_[to] += amount;
  return true;
}

common::Amount InMemoryCollateralCustody::wallet_balance(common::AccountId account) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto it = wallets_.find(account); it != wallets_.end()) {
    return it->second;
  }
  return 0;
}

common::Amount InMemoryCollateralCustody::held() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return held_;
}

}  // namespace assets
}  // namespace lendcore
