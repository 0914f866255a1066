#pragma once

#include "gold/domain/types.hpp"

#include <utility>

namespace gold {

class AssetCustody;

// -----------------------------------------------------------------------------
// SettlementCapability: permission to move custody-locked bars
// -----------------------------------------------------------------------------
//
// @brief  Grants access to AssetCustody::settleTransfer(), the one ownership
//         path that does not check the custody lock.
//
// @details
// Only AssetCustody can construct one, and it does so exactly once per
// instance (issueSettlementCapability). The engine hands it to
// OrderSettlement at wiring time. Nothing else in the process can obtain
// one, so a unilateral caller has no route around the lock.
// -----------------------------------------------------------------------------
class SettlementCapability {
 public:
  const domain::Address& holder() const { return holder_; }

 private:
  friend class AssetCustody;

  explicit SettlementCapability(domain::Address holder)
      : holder_(std::move(holder)) {}

  domain::Address holder_;
};

}  // namespace gold
