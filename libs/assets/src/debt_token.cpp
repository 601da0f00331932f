#include "lendcore/assets/debt_token.hpp"

namespace lendcore {
namespace assets {

void InMemoryDebtToken::mint(common::AccountId to, const common::Amount& amount) {
  std::lock_guard<std::mutex> lock(mutex_);
  total_supply_ += amount;
  balances_[to] += amount;
}

bool InMemoryDebtToken::transfer(common::AccountId from, common::AccountId to, const common::Amount& amount) {
  std::lock_guard<std::mutex> lock(mutex_);
  return move_locked(from, to, amount);
}

bool InMemoryDebtToken::transfer_from(common::AccountId spender,
                                      common::AccountId from,
                                      common::AccountId to,
                                      const common::Amount& amount) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = allowances_.find({from, spender});
  if (it == allowances_.end() || it->second < amount) {
    return false;
  }
  if (!move_locked(from, to, amount)) {
    return false;
  }
  // An unlimited allowance is never consumed.
  if (it->second != common::max_amount()) {
    it->second -= amount;
  }
  return true;
}

void InMemoryDebtToken::approve(common::AccountId owner, common::AccountId spender, const common::Amount& amount) {
  std::lock_guard<std::mutex> lock(mutex_);
  allowances_[{owner, spender}] = amount;
}

common::Amount InMemoryDebtToken::balance_of(common::AccountId who) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto it = balances_.find(who); it != balances_.end()) {
    return it->second;
  }
  return 0;
}

common::Amount InMemoryDebtToken::allowance(common::AccountId owner, common::AccountId spender) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto it = allowances_.find({owner, spender}); it != allowances_.end()) {
    return it->second;
  }
  return 0;
}

common::Amount InMemoryDebtToken::total_supply() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return total_supply_;
}

bool InMemoryDebtToken::move_locked(common::AccountId from, common::AccountId to, const common::Amount& amount) {
  auto& source = balances_[from];
  if (source < amount) {
    return false;
  }
  source -= amount;
  balances_[to] += amount;
  return true;
}

}  // namespace assets
}  // namespace lendcore
