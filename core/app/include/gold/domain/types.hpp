#pragma once

#include <cstdint>
#include <string>

namespace gold {
namespace domain {

// -----------------------------------------------------------------------------
// Identifier aliases
// -----------------------------------------------------------------------------
//
// @brief  Opaque identifiers used across the ledger, custody and settlement
//         components.
//
// @details
// String identifiers keep their exact external format ("IGAN-1000",
// "GIFTCHZZ", "0xabc...", "TX-1"). They are never parsed into numbers.
// TokenId is the only numeric identifier: token ids are allocated
// sequentially by AssetCustody starting at 1 (0 means "unset").
// -----------------------------------------------------------------------------
using Address = std::string;    // Caller / owner address
using MemberId = std::string;   // GIC member identifier
using AccountId = std::string;  // IGAN account identifier
using TxRef = std::string;      // Caller-supplied order reference
using TokenId = std::uint64_t;  // Sequential asset token identifier

// Balances and deltas are signed 64-bit integers (asset units or grams).
using Amount = std::int64_t;

// Denominator for fineness expressed in basis points (9999 = 99.99 %).
constexpr std::int64_t kFinenessScale = 10000;

}  // namespace domain
}  // namespace gold
