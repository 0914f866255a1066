#include "gold/settlement/order_settlement.hpp"
#include "gold/errors/ledger_error.hpp"

#include <iostream>
#include <set>
#include <utility>

namespace gold {

namespace {

const domain::RoleSet kExecuteRoles{domain::Role::Platform,
                                    domain::Role::Custodian,
                                    domain::Role::LogisticsProvider};

bool isPending(domain::OrderStatus status) {
  return status == domain::OrderStatus::PendingCounterparty ||
         status == domain::OrderStatus::PendingExecution;
}

}  // namespace

OrderSettlement::OrderSettlement(TransactionManager& tm,
                                 const IAuthorizationRegistry& registry,
                                 AccountLedger& ledger, AssetCustody& custody,
                                 LedgerWriteCapability ledger_capability,
                                 SettlementCapability settlement_capability,
                                 domain::ExecutionOptions options)
    : tm_(tm),
      registry_(registry),
      ledger_(ledger),
      custody_(custody),
      ledger_capability_(std::move(ledger_capability)),
      settlement_capability_(std::move(settlement_capability)),
      options_(options) {}

// -----------------------------------------------------------------------------
// Execution options
// -----------------------------------------------------------------------------
void OrderSettlement::setExecutionOptions(const domain::Address& caller,
                                          bool enable_on_chain_transfer,
                                          bool enable_auto_ledger_update) {
  if (!registry_.isInRole(caller, domain::Role::Platform)) {
    throw AuthorizationError("setExecutionOptions requires the platform role");
  }

  UnitOfWork uow = tm_.begin();
  const domain::ExecutionOptions previous = options_;
  options_.enable_on_chain_transfer = enable_on_chain_transfer;
  options_.enable_auto_ledger_update = enable_auto_ledger_update;
  uow.onRollback([this, previous] { options_ = previous; });
  uow.commit();

  std::cout << "[OrderSettlement] execution options: on_chain_transfer="
            << enable_on_chain_transfer
            << " auto_ledger_update=" << enable_auto_ledger_update << "\n";
}

domain::ExecutionOptions OrderSettlement::executionOptions() const {
  auto lock = tm_.readLock();
  return options_;
}

// -----------------------------------------------------------------------------
// prepareOrder()
// -----------------------------------------------------------------------------
domain::TxRef OrderSettlement::prepareOrder(const domain::Address& caller,
                                            const OrderRequest& request) {
  if (request.tx_ref.empty()) {
    throw ValidationError("txRef must not be empty");
  }
  if (request.token_ids.empty()) {
    throw ValidationError("order " + request.tx_ref + " lists no tokens");
  }
  const std::set<domain::TokenId> distinct(request.token_ids.begin(),
                                           request.token_ids.end());
  if (distinct.size() != request.token_ids.size()) {
    throw ValidationError("order " + request.tx_ref +
                          " lists a token more than once");
  }
  if (!registry_.isInRole(caller, domain::Role::Platform) &&
      !isLinkedTo(caller, request.initiator_id)) {
    throw AuthorizationError("prepareOrder: caller does not act for " +
                             request.initiator_id);
  }

  UnitOfWork uow = tm_.begin();

  if (orders_.count(request.tx_ref) != 0) {
    throw DuplicateError("txRef already used: " + request.tx_ref);
  }

  requireActive(request.initiator_id);
  requireActive(request.counterparty_id);

  for (const auto& account_id :
       {request.source_account_id, request.dest_account_id}) {
    if (ledger_.findAccount(account_id, uow) == nullptr) {
      throw NotFoundError("account not found: " + account_id);
    }
  }
  for (domain::TokenId token_id : request.token_ids) {
    if (custody_.findAsset(token_id, uow) == nullptr) {
      throw NotFoundError("asset not found: " + std::to_string(token_id));
    }
  }

  domain::Order order;
  order.tx_ref = request.tx_ref;
  order.external_ref = request.external_ref;
  order.type = request.type;
  order.initiator_id = request.initiator_id;
  order.counterparty_id = request.counterparty_id;
  order.source_account_id = request.source_account_id;
  order.dest_account_id = request.dest_account_id;
  order.token_ids = request.token_ids;
  order.requested_assets = request.requested_assets;
  order.quantity = static_cast<domain::Amount>(request.token_ids.size());
  order.settlement_date = request.settlement_date;
  order.currency = request.currency;
  order.price = request.price;
  order.fee = request.fee;
  order.metadata = request.metadata;
  order.status = domain::OrderStatus::PendingCounterparty;
  order.prepared_by = caller;
  order.created_at_ms = uow.now_ms();

  orders_.emplace(order.tx_ref, order);
  uow.onRollback([this, tx_ref = order.tx_ref] { orders_.erase(tx_ref); });

  OrderCreatedEvent created;
  created.tx_ref = order.tx_ref;
  created.external_ref = order.external_ref;
  created.type = order.type;
  created.initiator_id = order.initiator_id;
  created.counterparty_id = order.counterparty_id;
  created.quantity = order.quantity;
  created.currency = order.currency;
  created.price = order.price;
  created.status = order.status;
  created.settlement_date = order.settlement_date;
  created.timestamp = uow.timestamp();
  uow.stage(std::move(created));

  OrderPreparedEvent prepared;
  prepared.tx_ref = order.tx_ref;
  prepared.token_count = order.token_ids.size();
  prepared.prepared_by = caller;
  prepared.timestamp = uow.timestamp();
  uow.stage(std::move(prepared));

  uow.commit();

  std::cout << "[OrderSettlement] prepared " << request.tx_ref << " "
            << request.source_account_id << " -> " << request.dest_account_id
            << " quantity=" << request.token_ids.size() << "\n";
  return request.tx_ref;
}

// -----------------------------------------------------------------------------
// signOrder()
// -----------------------------------------------------------------------------
void OrderSettlement::signOrder(const domain::Address& caller,
                                const domain::TxRef& tx_ref,
                                const std::vector<std::uint8_t>& signature,
                                const std::string& party_label) {
  if (signature.empty()) {
    throw ValidationError("signature must not be empty");
  }

  UnitOfWork uow = tm_.begin();

  domain::Order& order = requireOrder(tx_ref);
  if (!registry_.isInRole(caller, domain::Role::Platform) &&
      !isLinkedTo(caller, order.counterparty_id)) {
    throw AuthorizationError("signOrder: caller does not act for " +
                             order.counterparty_id);
  }
  if (order.status != domain::OrderStatus::PendingCounterparty) {
    throw InvalidStateError("order " + tx_ref + " is " +
                            domain::orderStatusToString(order.status) +
                            ", expected PENDING_COUNTERPARTY");
  }

  journal(uow, order);
  order.signatures.push_back(
      domain::OrderSignature{caller, party_label, signature, uow.now_ms()});
  order.status = domain::OrderStatus::PendingExecution;

  OrderSignedEvent event;
  event.tx_ref = tx_ref;
  event.signer = caller;
  event.party_label = party_label;
  event.status = order.status;
  event.signature_size = signature.size();
  event.timestamp = uow.timestamp();
  uow.stage(std::move(event));

  uow.commit();

  std::cout << "[OrderSettlement] signed " << tx_ref << " by " << caller
            << " (" << party_label << ")\n";
}

// -----------------------------------------------------------------------------
// executeOrder(): bars and balances move together or not at all
// -----------------------------------------------------------------------------
void OrderSettlement::executeOrder(const domain::Address& caller,
                                   const domain::TxRef& tx_ref) {
  if (!registry_.hasAnyRole(caller, kExecuteRoles)) {
    throw AuthorizationError(
        "executeOrder requires the platform, custodian or logistics role");
  }

  UnitOfWork uow = tm_.begin();

  domain::Order& order = requireOrder(tx_ref);
  if (order.status != domain::OrderStatus::PendingExecution) {
    throw InvalidStateError("order " + tx_ref + " is " +
                            domain::orderStatusToString(order.status) +
                            ", expected PENDING_EXECUTION");
  }

  journal(uow, order);

  if (options_.enable_on_chain_transfer) {
    const domain::Account* dest = ledger_.findAccount(order.dest_account_id, uow);
    if (dest == nullptr) {
      throw NotFoundError("account not found: " + order.dest_account_id);
    }
    for (domain::TokenId token_id : order.token_ids) {
      custody_.settleTransfer(settlement_capability_, token_id, dest->address,
                              tx_ref, uow);
    }
  }

  if (options_.enable_auto_ledger_update) {
    ledger_.updateBalanceFromContract(ledger_capability_,
                                      order.source_account_id, -order.quantity,
                                      "ORDER", tx_ref, uow);
    ledger_.updateBalanceFromContract(ledger_capability_,
                                      order.dest_account_id, order.quantity,
                                      "ORDER", tx_ref, uow);
  }

  order.status = domain::OrderStatus::Executed;
  order.executed_at_ms = uow.now_ms();

  OrderExecutedEvent event;
  event.tx_ref = tx_ref;
  event.quantity = order.quantity;
  event.tokens_moved = options_.enable_on_chain_transfer;
  event.ledger_updated = options_.enable_auto_ledger_update;
  event.executed_by = caller;
  event.timestamp = uow.timestamp();
  uow.stage(std::move(event));

  uow.commit();

  std::cout << "[OrderSettlement] executed " << tx_ref
            << " quantity=" << order.quantity << "\n";
}

// -----------------------------------------------------------------------------
// cancelOrder()
// -----------------------------------------------------------------------------
void OrderSettlement::cancelOrder(const domain::Address& caller,
                                  const domain::TxRef& tx_ref,
                                  const std::string& reason) {
  UnitOfWork uow = tm_.begin();

  domain::Order& order = requireOrder(tx_ref);
  if (!registry_.isInRole(caller, domain::Role::Platform) &&
      !isLinkedTo(caller, order.initiator_id)) {
    throw AuthorizationError("cancelOrder: caller does not act for " +
                             order.initiator_id);
  }
  if (!isPending(order.status)) {
    throw InvalidStateError("order " + tx_ref + " is " +
                            domain::orderStatusToString(order.status) +
                            " and cannot be cancelled");
  }

  journal(uow, order);
  order.status = domain::OrderStatus::Cancelled;
  order.cancel_reason = reason;

  OrderCancelledEvent event;
  event.tx_ref = tx_ref;
  event.reason = reason;
  event.cancelled_by = caller;
  event.timestamp = uow.timestamp();
  uow.stage(std::move(event));

  uow.commit();

  std::cerr << "[OrderSettlement] cancelled " << tx_ref << ": " << reason
            << "\n";
}

// -----------------------------------------------------------------------------
// Reads
// -----------------------------------------------------------------------------
domain::Order OrderSettlement::getOrder(const domain::TxRef& tx_ref) const {
  auto lock = tm_.readLock();
  return requireOrder(tx_ref);
}

std::vector<domain::TxRef> OrderSettlement::ordersByMember(
    const domain::MemberId& member_id) const {
  auto lock = tm_.readLock();
  std::vector<domain::TxRef> refs;
  for (const auto& [tx_ref, order] : orders_) {
    if (order.initiator_id == member_id || order.counterparty_id == member_id) {
      refs.push_back(tx_ref);
    }
  }
  return refs;
}

std::size_t OrderSettlement::orderCount() const {
  auto lock = tm_.readLock();
  return orders_.size();
}

// -----------------------------------------------------------------------------
// Internal helpers
// -----------------------------------------------------------------------------
domain::Order& OrderSettlement::requireOrder(const domain::TxRef& tx_ref) {
  auto it = orders_.find(tx_ref);
  if (it == orders_.end()) {
    throw NotFoundError("order not found: " + tx_ref);
  }
  return it->second;
}

const domain::Order& OrderSettlement::requireOrder(
    const domain::TxRef& tx_ref) const {
  auto it = orders_.find(tx_ref);
  if (it == orders_.end()) {
    throw NotFoundError("order not found: " + tx_ref);
  }
  return it->second;
}

bool OrderSettlement::isLinkedTo(const domain::Address& caller,
                                 const domain::MemberId& member_id) const {
  const auto linked = registry_.memberOf(caller);
  return linked && *linked == member_id;
}

void OrderSettlement::requireActive(const domain::MemberId& member_id) const {
  if (registry_.getMemberStatus(member_id) != domain::MemberStatus::Active) {
    throw MemberNotActiveError("member is not active: " + member_id);
  }
}

void OrderSettlement::journal(UnitOfWork& uow, const domain::Order& order) {
  uow.onRollback([this, before = order] { orders_[before.tx_ref] = before; });
}

}  // namespace gold
