#pragma once

#include "gold/concurrent/unit_of_work.hpp"
#include "gold/custody/asset_custody.hpp"
#include "gold/custody/settlement_capability.hpp"
#include "gold/domain/execution_options.hpp"
#include "gold/domain/order.hpp"
#include "gold/domain/types.hpp"
#include "gold/ledger/account_ledger.hpp"
#include "gold/ledger/ledger_write_capability.hpp"
#include "gold/registry/i_authorization_registry.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace gold {

// Terms of a settlement instruction passed to prepareOrder().
struct OrderRequest {
  std::string external_ref;
  domain::TxRef tx_ref;
  domain::OrderType type{domain::OrderType::Transfer};
  domain::MemberId initiator_id;
  domain::MemberId counterparty_id;
  domain::AccountId source_account_id;
  domain::AccountId dest_account_id;
  std::vector<domain::TokenId> token_ids;
  std::vector<std::string> requested_assets;
  std::int64_t settlement_date{0};
  std::string currency;
  std::int64_t price{0};
  std::int64_t fee{0};
  std::string metadata;
};

// -----------------------------------------------------------------------------
// OrderSettlement: bilateral prepare / sign / execute protocol
// -----------------------------------------------------------------------------
//
// @brief  Owns order records and drives AssetCustody and AccountLedger when
//         an order executes.
//
// @details
// Lifecycle (see domain::OrderStatus):
//
//   prepareOrder   initiator side     -> PENDING_COUNTERPARTY
//   signOrder      counterparty side  -> PENDING_EXECUTION
//   executeOrder   operator side      -> EXECUTED
//   cancelOrder    initiator/platform -> CANCELLED
//
// executeOrder is the only transition that touches the other components. In
// one unit of work it:
//   1. moves every listed bar to the destination account's address through
//      AssetCustody::settleTransfer (lock not checked, bar lands IN_VAULT)
//   2. debits the source account and credits the destination account by
//      the order quantity through the ledger capability
// Each step runs only if the matching ExecutionOptions flag is set. Any
// failure rolls back the bars, the balances and the order status together,
// leaving the order in PENDING_EXECUTION.
//
// A txRef is consumed on prepare and never released, so an order can be
// executed at most once.
// -----------------------------------------------------------------------------
class OrderSettlement {
 public:
  OrderSettlement(TransactionManager& tm,
                  const IAuthorizationRegistry& registry,
                  AccountLedger& ledger, AssetCustody& custody,
                  LedgerWriteCapability ledger_capability,
                  SettlementCapability settlement_capability,
                  domain::ExecutionOptions options = {});

  OrderSettlement(const OrderSettlement&) = delete;
  OrderSettlement& operator=(const OrderSettlement&) = delete;

  // Platform role.
  void setExecutionOptions(const domain::Address& caller,
                           bool enable_on_chain_transfer,
                           bool enable_auto_ledger_update);
  domain::ExecutionOptions executionOptions() const;

  // -------------------------------------------------------------------------
  // prepareOrder(caller, request)
  // -------------------------------------------------------------------------
  // @brief  Records a new order in PENDING_COUNTERPARTY.
  //
  // @throws AuthorizationError    caller neither platform nor linked to the
  //                               initiator
  //         ValidationError       empty txRef, empty or repeated token list
  //         DuplicateError        txRef already used
  //         NotFoundError         member, account or token unknown
  //         MemberNotActiveError  initiator or counterparty not ACTIVE
  //
  // Emits OrderCreated and OrderPrepared.
  // -------------------------------------------------------------------------
  domain::TxRef prepareOrder(const domain::Address& caller,
                             const OrderRequest& request);

  // Platform role or an address linked to the counterparty. Emits
  // OrderSigned.
  void signOrder(const domain::Address& caller, const domain::TxRef& tx_ref,
                 const std::vector<std::uint8_t>& signature,
                 const std::string& party_label);

  // Platform, custodian or logistics-provider role. Emits OrderExecuted.
  void executeOrder(const domain::Address& caller, const domain::TxRef& tx_ref);

  // Platform role or an address linked to the initiator. Only pending
  // orders can be cancelled. Emits OrderCancelled.
  void cancelOrder(const domain::Address& caller, const domain::TxRef& tx_ref,
                   const std::string& reason);

  // Throws NotFoundError for an unknown txRef.
  domain::Order getOrder(const domain::TxRef& tx_ref) const;

  // Orders where the member is initiator or counterparty, in txRef order.
  std::vector<domain::TxRef> ordersByMember(
      const domain::MemberId& member_id) const;

  std::size_t orderCount() const;

 private:
  domain::Order& requireOrder(const domain::TxRef& tx_ref);
  const domain::Order& requireOrder(const domain::TxRef& tx_ref) const;

  bool isLinkedTo(const domain::Address& caller,
                  const domain::MemberId& member_id) const;

  void requireActive(const domain::MemberId& member_id) const;

  void journal(UnitOfWork& uow, const domain::Order& order);

  TransactionManager& tm_;
  const IAuthorizationRegistry& registry_;
  AccountLedger& ledger_;
  AssetCustody& custody_;
  const LedgerWriteCapability ledger_capability_;
  const SettlementCapability settlement_capability_;
  domain::ExecutionOptions options_;

  std::map<domain::TxRef, domain::Order> orders_;
};

}  // namespace gold
