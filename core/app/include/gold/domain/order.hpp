#pragma once

#include "gold/domain/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace gold {
namespace domain {

// -----------------------------------------------------------------------------
// OrderStatus: settlement order lifecycle
// -----------------------------------------------------------------------------
//
// @details
//
//   PendingCounterparty ──sign──> PendingExecution ──execute──> Executed
//          │                            │
//          └──────────cancel────────────┴──────────> Cancelled
//
// Every transition is one-way. Executed and Cancelled are terminal.
// -----------------------------------------------------------------------------
enum class OrderStatus {
  PendingCounterparty,
  PendingExecution,
  Executed,
  Cancelled,
};

inline const char* orderStatusToString(OrderStatus s) {
  switch (s) {
    case OrderStatus::PendingCounterparty: return "PENDING_COUNTERPARTY";
    case OrderStatus::PendingExecution:    return "PENDING_EXECUTION";
    case OrderStatus::Executed:            return "EXECUTED";
    case OrderStatus::Cancelled:           return "CANCELLED";
  }
  return "UNKNOWN";
}

// Commercial nature of the instruction. Informational only; execution
// behaves the same for every type.
enum class OrderType {
  Purchase,
  Sale,
  Transfer,
  Swap,
};

inline const char* orderTypeToString(OrderType t) {
  switch (t) {
    case OrderType::Purchase: return "PURCHASE";
    case OrderType::Sale:     return "SALE";
    case OrderType::Transfer: return "TRANSFER";
    case OrderType::Swap:     return "SWAP";
  }
  return "UNKNOWN";
}

// Counterparty signature captured by signOrder().
struct OrderSignature {
  Address signer;
  std::string party_label;
  std::vector<std::uint8_t> signature;
  std::int64_t signed_at_ms{0};
};

// -----------------------------------------------------------------------------
// Order: pre-agreed bilateral settlement instruction
// -----------------------------------------------------------------------------
//
// @brief  Everything needed to settle a set of bars between two accounts.
//
// @details
// quantity is derived from token_ids.size() when the order is prepared and
// is the magnitude of the ledger debit/credit applied on execution.
// price and fee are scaled integers in the settlement currency.
// -----------------------------------------------------------------------------
struct Order {
  TxRef tx_ref;
  std::string external_ref;
  OrderType type{OrderType::Transfer};
  MemberId initiator_id;
  MemberId counterparty_id;
  AccountId source_account_id;
  AccountId dest_account_id;
  std::vector<TokenId> token_ids;
  std::vector<std::string> requested_assets;
  Amount quantity{0};
  std::int64_t settlement_date{0};
  std::string currency;
  std::int64_t price{0};
  std::int64_t fee{0};
  std::string metadata;
  OrderStatus status{OrderStatus::PendingCounterparty};
  Address prepared_by;
  std::vector<OrderSignature> signatures;
  std::string cancel_reason;
  std::int64_t created_at_ms{0};
  std::int64_t executed_at_ms{0};
};

}  // namespace domain
}  // namespace gold
