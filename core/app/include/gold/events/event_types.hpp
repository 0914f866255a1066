#pragma once

#include "gold/domain/asset.hpp"
#include "gold/domain/order.hpp"
#include "gold/domain/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace gold {

// -----------------------------------------------------------------------------
// Timestamp
// -----------------------------------------------------------------------------
// Wall-clock (or simulated) time at which an event was committed. Components
// obtain it from ITimeProvider::now_ms() via ms_to_timestamp().
// -----------------------------------------------------------------------------
using Timestamp = std::chrono::system_clock::time_point;

// =============================================================================
// Account ledger events
// =============================================================================

struct AccountCreatedEvent {
  domain::AccountId account_id;
  domain::MemberId member_id;
  domain::Address address;
  std::string name;
  std::string account_type;
  std::string unit;
  domain::Address created_by;
  Timestamp timestamp{};
};

// -----------------------------------------------------------------------------
// BalanceUpdatedEvent
// -----------------------------------------------------------------------------
// One per applied balance change, from either update path. via_capability
// tells operator corrections (false) apart from component-driven movements
// such as mint, burn and settlement (true).
// -----------------------------------------------------------------------------
struct BalanceUpdatedEvent {
  domain::AccountId account_id;
  domain::Amount delta{0};
  domain::Amount new_balance{0};
  std::string reason;
  std::string ref_id;
  domain::Address updated_by;
  bool via_capability{false};
  Timestamp timestamp{};
};

struct BalanceUpdaterSetEvent {
  domain::Address updater;
  bool enabled{false};
  domain::Address set_by;
  Timestamp timestamp{};
};

// =============================================================================
// Asset custody events
// =============================================================================

struct AssetMintedEvent {
  domain::TokenId token_id{0};
  std::string serial_number;
  std::string refiner;
  std::int64_t weight{0};
  std::int64_t fine_weight{0};
  domain::Address owner;
  domain::AccountId account_id;
  std::string warrant_id;
  domain::Address minted_by;
  Timestamp timestamp{};
};

struct AssetBurnedEvent {
  domain::TokenId token_id{0};
  std::string reason;
  domain::Address owner;
  domain::AccountId account_id;  // The mint-time account that was debited
  domain::Address burned_by;
  Timestamp timestamp{};
};

struct StatusChangedEvent {
  domain::TokenId token_id{0};
  domain::AssetStatus old_status{domain::AssetStatus::Registered};
  domain::AssetStatus new_status{domain::AssetStatus::Registered};
  std::string reason;
  domain::Address changed_by;
  Timestamp timestamp{};
};

struct CustodyChangedEvent {
  domain::TokenId token_id{0};
  domain::Address from_custodian;
  domain::Address to_custodian;
  std::string method;
  domain::Address changed_by;
  Timestamp timestamp{};
};

// -----------------------------------------------------------------------------
// OwnershipUpdatedEvent
// -----------------------------------------------------------------------------
// reason is "TRANSFER" for the ordinary path, the caller-supplied reason for
// forceTransfer, and "SETTLEMENT:<txRef>" when an order moves the bar.
// -----------------------------------------------------------------------------
struct OwnershipUpdatedEvent {
  domain::TokenId token_id{0};
  domain::Address from;
  domain::Address to;
  std::string reason;
  Timestamp timestamp{};
};

struct AssetTransferredEvent {
  domain::TokenId token_id{0};
  domain::Address from;
  domain::Address to;
  Timestamp timestamp{};
};

struct WarrantLinkedEvent {
  std::string warrant_id;
  domain::TokenId token_id{0};
  domain::Address owner;
  Timestamp timestamp{};
};

// =============================================================================
// Order settlement events
// =============================================================================

struct OrderCreatedEvent {
  domain::TxRef tx_ref;
  std::string external_ref;
  domain::OrderType type{domain::OrderType::Transfer};
  domain::MemberId initiator_id;
  domain::MemberId counterparty_id;
  domain::Amount quantity{0};
  std::string currency;
  std::int64_t price{0};
  domain::OrderStatus status{domain::OrderStatus::PendingCounterparty};
  std::int64_t settlement_date{0};
  Timestamp timestamp{};
};

struct OrderPreparedEvent {
  domain::TxRef tx_ref;
  std::size_t token_count{0};
  domain::Address prepared_by;
  Timestamp timestamp{};
};

struct OrderSignedEvent {
  domain::TxRef tx_ref;
  domain::Address signer;
  std::string party_label;
  domain::OrderStatus status{domain::OrderStatus::PendingExecution};
  std::size_t signature_size{0};
  Timestamp timestamp{};
};

struct OrderExecutedEvent {
  domain::TxRef tx_ref;
  domain::Amount quantity{0};
  bool tokens_moved{false};
  bool ledger_updated{false};
  domain::Address executed_by;
  Timestamp timestamp{};
};

struct OrderCancelledEvent {
  domain::TxRef tx_ref;
  std::string reason;
  domain::Address cancelled_by;
  Timestamp timestamp{};
};

}  // namespace gold
