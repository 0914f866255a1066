#include "gold/audit/json_format.hpp"
#include "gold/time/time_utils.hpp"


namespace gold {

namespace {

using nlohmann::json;

std::string toHex(const std::vector<std::uint8_t>& bytes) {
  static const char* kDigits = "0123456789abcdef";
  std::string out;
  out.reserve(bytes.size() * 2);
  for (std::uint8_t b : bytes) {
    out.push_back(kDigits[b >> 4]);
    out.push_back(kDigits[b & 0x0F]);
  }
  return out;
}

// -----------------------------------------------------------------------------
// Per-event field writers
// -----------------------------------------------------------------------------
void writeFields(json& j, const AccountCreatedEvent& e) {
  j["account_id"] = e.account_id;
  j["member_id"] = e.member_id;
  j["address"] = e.address;
  j["name"] = e.name;
  j["account_type"] = e.account_type;
  j["unit"] = e.unit;
  j["created_by"] = e.created_by;
}

void writeFields(json& j, const BalanceUpdatedEvent& e) {
  j["account_id"] = e.account_id;
  j["delta"] = e.delta;
  j["new_balance"] = e.new_balance;
  j["reason"] = e.reason;
  j["ref_id"] = e.ref_id;
  j["updated_by"] = e.updated_by;
  j["via_capability"] = e.via_capability;
}

void writeFields(json& j, const BalanceUpdaterSetEvent& e) {
  j["updater"] = e.updater;
  j["enabled"] = e.enabled;
  j["set_by"] = e.set_by;
}

void writeFields(json& j, const AssetMintedEvent& e) {
  j["token_id"] = e.token_id;
  j["serial_number"] = e.serial_number;
  j["refiner"] = e.refiner;
  j["weight"] = e.weight;
  j["fine_weight"] = e.fine_weight;
  j["owner"] = e.owner;
  j["account_id"] = e.account_id;
  j["warrant_id"] = e.warrant_id;
  j["minted_by"] = e.minted_by;
}

void writeFields(json& j, const AssetBurnedEvent& e) {
  j["token_id"] = e.token_id;
  j["reason"] = e.reason;
  j["owner"] = e.owner;
  j["account_id"] = e.account_id;
  j["burned_by"] = e.burned_by;
}

void writeFields(json& j, const StatusChangedEvent& e) {
  j["token_id"] = e.token_id;
  j["old_status"] = domain::assetStatusToString(e.old_status);
  j["new_status"] = domain::assetStatusToString(e.new_status);
  j["reason"] = e.reason;
  j["changed_by"] = e.changed_by;
}

void writeFields(json& j, const CustodyChangedEvent& e) {
  j["token_id"] = e.token_id;
  j["from_custodian"] = e.from_custodian;
  j["to_custodian"] = e.to_custodian;
  j["method"] = e.method;
  j["changed_by"] = e.changed_by;
}

void writeFields(json& j, const OwnershipUpdatedEvent& e) {
  j["token_id"] = e.token_id;
  j["from"] = e.from;
  j["to"] = e.to;
  j["reason"] = e.reason;
}

void writeFields(json& j, const AssetTransferredEvent& e) {
  j["token_id"] = e.token_id;
  j["from"] = e.from;
  j["to"] = e.to;
}

void writeFields(json& j, const WarrantLinkedEvent& e) {
  j["warrant_id"] = e.warrant_id;
  j["token_id"] = e.token_id;
  j["owner"] = e.owner;
}

void writeFields(json& j, const OrderCreatedEvent& e) {
  j["tx_ref"] = e.tx_ref;
  j["external_ref"] = e.external_ref;
  j["order_type"] = domain::orderTypeToString(e.type);
  j["initiator_id"] = e.initiator_id;
  j["counterparty_id"] = e.counterparty_id;
  j["quantity"] = e.quantity;
  j["currency"] = e.currency;
  j["price"] = e.price;
  j["status"] = domain::orderStatusToString(e.status);
  j["settlement_date"] = e.settlement_date;
}

void writeFields(json& j, const OrderPreparedEvent& e) {
  j["tx_ref"] = e.tx_ref;
  j["token_count"] = e.token_count;
  j["prepared_by"] = e.prepared_by;
}

void writeFields(json& j, const OrderSignedEvent& e) {
  j["tx_ref"] = e.tx_ref;
  j["signer"] = e.signer;
  j["party_label"] = e.party_label;
  j["status"] = domain::orderStatusToString(e.status);
  j["signature_size"] = e.signature_size;
}

void writeFields(json& j, const OrderExecutedEvent& e) {
  j["tx_ref"] = e.tx_ref;
  j["quantity"] = e.quantity;
  j["tokens_moved"] = e.tokens_moved;
  j["ledger_updated"] = e.ledger_updated;
  j["executed_by"] = e.executed_by;
}

void writeFields(json& j, const OrderCancelledEvent& e) {
  j["tx_ref"] = e.tx_ref;
  j["reason"] = e.reason;
  j["cancelled_by"] = e.cancelled_by;
}

}  // namespace

// -----------------------------------------------------------------------------
// toJson(Event)
// -----------------------------------------------------------------------------
nlohmann::json toJson(const Event& event) {
  json j;
  j["type"] = eventName(event);
  j["timestamp_ms"] = timestamp_to_ms(eventTimestamp(event));
  std::visit([&j](const auto& e) { writeFields(j, e); }, event);
  return j;
}

// -----------------------------------------------------------------------------
// Entity snapshots
// -----------------------------------------------------------------------------
nlohmann::json toJson(const domain::Account& account) {
  json j;
  j["account_id"] = account.id;
  j["member_id"] = account.member_id;
  j["address"] = account.address;
  j["name"] = account.name;
  j["account_type"] = account.account_type;
  j["unit"] = account.unit;
  j["balance"] = account.balance;
  j["last_reason"] = account.last_reason;
  j["last_ref_id"] = account.last_ref_id;
  j["created_at_ms"] = account.created_at_ms;
  j["updated_at_ms"] = account.updated_at_ms;
  return j;
}

nlohmann::json toJson(const domain::Asset& asset) {
  json j;
  j["token_id"] = asset.token_id;
  j["serial_number"] = asset.serial_number;
  j["refiner"] = asset.refiner;
  j["weight"] = asset.weight;
  j["fineness"] = asset.fineness;
  j["fine_weight"] = asset.fine_weight;
  j["product_type"] = asset.product_type;
  j["certificate_hash"] = asset.certificate_hash;
  j["member_id"] = asset.member_id;
  j["certified"] = asset.certified;
  j["warrant_id"] = asset.warrant_id;
  j["owner"] = asset.owner;
  j["custodian"] = asset.custodian;
  j["status"] = domain::assetStatusToString(asset.status);
  j["locked"] = domain::isLockedStatus(asset.status);
  j["status_reason"] = asset.status_reason;
  j["mint_account_id"] = asset.mint_account_id;
  j["minted_at_ms"] = asset.minted_at_ms;
  j["updated_at_ms"] = asset.updated_at_ms;
  return j;
}

nlohmann::json toJson(const domain::Order& order) {
  json j;
  j["tx_ref"] = order.tx_ref;
  j["external_ref"] = order.external_ref;
  j["order_type"] = domain::orderTypeToString(order.type);
  j["initiator_id"] = order.initiator_id;
  j["counterparty_id"] = order.counterparty_id;
  j["source_account_id"] = order.source_account_id;
  j["dest_account_id"] = order.dest_account_id;
  j["token_ids"] = order.token_ids;
  j["requested_assets"] = order.requested_assets;
  j["quantity"] = order.quantity;
  j["settlement_date"] = order.settlement_date;
  j["currency"] = order.currency;
  j["price"] = order.price;
  j["fee"] = order.fee;
  j["metadata"] = order.metadata;
  j["status"] = domain::orderStatusToString(order.status);
  j["prepared_by"] = order.prepared_by;
  j["cancel_reason"] = order.cancel_reason;
  j["created_at_ms"] = order.created_at_ms;
  j["executed_at_ms"] = order.executed_at_ms;

  json signatures = json::array();
  for (const auto& sig : order.signatures) {
    signatures.push_back({{"signer", sig.signer},
                          {"party_label", sig.party_label},
                          {"signature", toHex(sig.signature)},
                          {"signed_at_ms", sig.signed_at_ms}});
  }
  j["signatures"] = std::move(signatures);
  return j;
}

}  // namespace gold
