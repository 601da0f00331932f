#pragma once

#include <map>
#include <mutex>
#include <unordered_map>
#include <utility>

#include "lendcore/common/types.hpp"

namespace lendcore {
namespace assets {

// Token ledger of the borrowed asset. Calls report failure through their
// return value and leave balances untouched when they fail.
class DebtAssetLedger {
 public:
  virtual ~DebtAssetLedger() = default;

  // Moves `amount` from `from` to `to`.
  virtual bool transfer(common::AccountId from, common::AccountId to, const common::Amount& amount) = 0;

  // Moves `amount` from `from` to `to` on behalf of `spender`, consuming
  // the allowance `from` granted to `spender`.
  virtual bool transfer_from(common::AccountId spender,
                             common::AccountId from,
                             common::AccountId to,
                             const common::Amount& amount) = 0;

  virtual void approve(common::AccountId owner, common::AccountId spender, const common::Amount& amount) = 0;

  [[nodiscard]] virtual common::Amount balance_of(common::AccountId who) const = 0;
};

class InMemoryDebtToken : public DebtAssetLedger {
 public:
  void mint(common::AccountId to, const common::Amount& amount);

  bool transfer(common::AccountId from, common::AccountId to, const common::Amount& amount) override;
  bool transfer_from(common::AccountId spender,
                     common::AccountId from,
                     common::AccountId to,
                     const common::Amount& amount) override;
  void approve(common::AccountId owner, common::AccountId spender, const common::Amount& amount) override;

  [[nodiscard]] common::Amount balance_of(common::AccountId who) const override;
  [[nodiscard]] common::Amount allowance(common::AccountId owner, common::AccountId spender) const;
  [[nodiscard]] common::Amount total_supply() const;

 private:
  mutable std::mutex mutex_;
  std::unordered_map<common::AccountId, common::Amount> balances_{};
  std::map<std::pair<common::AccountId, common::AccountId>, common::Amount> allowances_{};
  common::Amount total_supply_{0};

  bool move_locked(common::AccountId from, common::AccountId to, const common::Amount& amount);
};

}  // namespace assets
}  // namespace lendcore
