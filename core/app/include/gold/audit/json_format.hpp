#pragma once

#include "gold/domain/account.hpp"
#include "gold/domain/asset.hpp"
#include "gold/domain/order.hpp"
#include "gold/events/event.hpp"

#include <nlohmann/json.hpp>

namespace gold {

// -----------------------------------------------------------------------------
// JSON formatting for telemetry, the event log and command replies
// -----------------------------------------------------------------------------
//
// @details
// Every event becomes one flat object:
//
//   {"type":"AssetMinted","timestamp_ms":1700000000000,"token_id":1,...}
//
// Enumerations are written with their upper-case wire names ("IN_VAULT",
// "PENDING_EXECUTION"). Signatures are lower-case hex.
// -----------------------------------------------------------------------------

nlohmann::json toJson(const Event& event);

nlohmann::json toJson(const domain::Account& account);
nlohmann::json toJson(const domain::Asset& asset);
nlohmann::json toJson(const domain::Order& order);

}  // namespace gold
