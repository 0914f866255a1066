#pragma once

#include "gold/events/event_types.hpp"

#include <variant>

namespace gold {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// The single envelope for every audit event. Components stage Event values on
// their UnitOfWork; the EventBus delivers them after commit. Adding a new
// event type means adding it here and to eventName() and toJson().
// -----------------------------------------------------------------------------
using Event = std::variant<
    AccountCreatedEvent,
    BalanceUpdatedEvent,
    BalanceUpdaterSetEvent,
    AssetMintedEvent,
    AssetBurnedEvent,
    StatusChangedEvent,
    CustodyChangedEvent,
    OwnershipUpdatedEvent,
    AssetTransferredEvent,
    WarrantLinkedEvent,
    OrderCreatedEvent,
    OrderPreparedEvent,
    OrderSignedEvent,
    OrderExecutedEvent,
    OrderCancelledEvent>;

// Name of the event type as it appears in telemetry ("AssetMinted", ...).
const char* eventName(const Event& event);

// Commit time carried by the event.
Timestamp eventTimestamp(const Event& event);

}  // namespace gold
