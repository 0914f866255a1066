#pragma once

#include "gold/domain/types.hpp"

#include <cstdint>
#include <utility>

namespace gold {

class AccountLedger;

// -----------------------------------------------------------------------------
// LedgerWriteCapability: permission to move balances programmatically
// -----------------------------------------------------------------------------
//
// @brief  Token proving that its holder was wired to the AccountLedger as a
//         balance updater.
//
// @details
// Only AccountLedger can construct one (private constructor, friend
// class). The engine asks the ledger for one capability per component that
// must move balances (AssetCustody for mint/burn, OrderSettlement for
// execution) and hands it over at construction time. Human operators never
// receive one; they use AccountLedger::updateBalance with a role instead.
//
// Holding the object is necessary but not sufficient: the ledger also checks
// that the holder is still on its updater allowlist, so
// AccountLedger::setBalanceUpdater(..., false) revokes a capability that is
// already out in the wild.
//
// Copyable value type. The serial ties the object to one issuance so that a
// re-issued capability invalidates older copies.
// -----------------------------------------------------------------------------
class LedgerWriteCapability {
 public:
  const domain::Address& holder() const { return holder_; }
  std::uint64_t serial() const { return serial_; }

 private:
  friend class AccountLedger;

  LedgerWriteCapability(domain::Address holder, std::uint64_t serial)
      : holder_(std::move(holder)), serial_(serial) {}

  domain::Address holder_;
  std::uint64_t serial_{0};
};

}  // namespace gold
