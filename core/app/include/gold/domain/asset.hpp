#pragma once

#include "gold/domain/types.hpp"

#include <cstdint>
#include <string>

namespace gold {
namespace domain {

// -----------------------------------------------------------------------------
// AssetStatus: custody lifecycle of a physical bar
// -----------------------------------------------------------------------------
//
// @details
//
//   Registered ──> InVault ──> InTransit ──> InVault ...
//        │            │            │
//        │            └──> Pledged ┘
//        └────────────────────────────────────> Burned (terminal)
//
// InTransit and Pledged are the custody-locked states: a bar in either of
// them cannot change owner through transfer() or forceTransfer(). Only
// settlement execution moves a locked bar.
// -----------------------------------------------------------------------------
enum class AssetStatus {
  Registered,
  InVault,
  InTransit,
  Pledged,
  Burned,
};

inline bool isLockedStatus(AssetStatus s) {
  return s == AssetStatus::InTransit || s == AssetStatus::Pledged;
}

inline const char* assetStatusToString(AssetStatus s) {
  switch (s) {
    case AssetStatus::Registered: return "REGISTERED";
    case AssetStatus::InVault:    return "IN_VAULT";
    case AssetStatus::InTransit:  return "IN_TRANSIT";
    case AssetStatus::Pledged:    return "PLEDGED";
    case AssetStatus::Burned:     return "BURNED";
  }
  return "UNKNOWN";
}

// -----------------------------------------------------------------------------
// Asset: one tokenized gold bar
// -----------------------------------------------------------------------------
//
// @brief  Physical attributes, provenance and custody state of a bar.
//
// @details
// fine_weight is derived at mint time:
//   fine_weight = weight * fineness / 10000   (integer division, truncated)
//
// mint_account_id is the ledger account credited when the bar was minted. It
// is fixed for the lifetime of the token and is the account debited on burn,
// whatever account id the burn caller passes.
//
// warrant_id is unique across every token ever minted. serial_number and
// refiner may repeat.
// -----------------------------------------------------------------------------
struct Asset {
  TokenId token_id{0};
  std::string serial_number;
  std::string refiner;
  std::int64_t weight{0};    // Scaled integer (grams * scale)
  std::int64_t fineness{0};  // Basis points out of 10000
  std::int64_t fine_weight{0};
  std::string product_type;
  std::string certificate_hash;
  MemberId member_id;  // Originating member
  bool certified{false};
  std::string warrant_id;
  Address owner;
  Address custodian;
  AssetStatus status{AssetStatus::Registered};
  std::string status_reason;
  AccountId mint_account_id;
  std::int64_t minted_at_ms{0};
  std::int64_t updated_at_ms{0};
};

}  // namespace domain
}  // namespace gold
