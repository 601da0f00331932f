#pragma once

#include <mutex>
#include <unordered_map>

#include "lendcore/common/types.hpp"

namespace lendcore {
namespace assets {

// Native collateral movements between user wallets and the ledger's custody.
// A failed call moves nothing.
class CollateralCustody {
 public:
  virtual ~CollateralCustody() = default;

  virtual bool receive(common::AccountId from, const common::Amount& amount) = 0;
  virtual bool send(common::AccountId to, const common::Amount& amount) = 0;
};

class InMemoryCollateralCustody : public CollateralCustody {
 public:
  // Credits an external wallet (faucet for simulations and tests).
  void fund(common::AccountId account, const common::Amount& amount);

  bool receive(common::AccountId from, const common::Amount& amount) override;
  bool send(common::AccountId to, const common::Amount& amount) override;

  [[nodiscard]] common::Amount wallet_balance(common::AccountId account) const;
  [[nodiscard]] common::Amount held() const;

 private:
  mutable std::mutex mutex_;
  std::unordered_map<common::AccountId, common::Amount> wallets_{};
  common::Amount held_{0};
};

}  // namespace assets
}  // namespace lendcore
