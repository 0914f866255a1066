#pragma once

#include "gold/domain/types.hpp"

#include <cstdint>
#include <string>

namespace gold {
namespace domain {

// -----------------------------------------------------------------------------
// Account: one gold account in the ledger
// -----------------------------------------------------------------------------
//
// @brief  Balance record owned by a member and linked to one address.
//
// @details
// The id is allocated by AccountLedger ("IGAN-1000", "IGAN-1001", ...) and is
// never reused. balance never drops below zero; it only changes through the
// two ledger update paths. last_reason / last_ref_id describe the most recent
// change, the full history lives in the event log.
//
// Value semantics: copies handed out by AccountLedger are snapshots.
// -----------------------------------------------------------------------------
struct Account {
  AccountId id;
  MemberId member_id;
  Address address;
  std::string name;          // Display name, e.g. "Main allocated"
  std::string account_type;  // e.g. "ALLOCATED", "UNALLOCATED"
  std::string unit;          // e.g. "BAR", "GRAM"
  Amount balance{0};
  std::string last_reason;
  std::string last_ref_id;
  std::int64_t created_at_ms{0};
  std::int64_t updated_at_ms{0};
};

}  // namespace domain
}  // namespace gold
