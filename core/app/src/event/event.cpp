#include "gold/events/event.hpp"

#include <type_traits>

namespace gold {

const char* eventName(const Event& event) {
  return std::visit(
      [](const auto& e) -> const char* {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, AccountCreatedEvent>) return "AccountCreated";
        else if constexpr (std::is_same_v<T, BalanceUpdatedEvent>) return "BalanceUpdated";
        else if constexpr (std::is_same_v<T, BalanceUpdaterSetEvent>) return "BalanceUpdaterSet";
        else if constexpr (std::is_same_v<T, AssetMintedEvent>) return "AssetMinted";
        else if constexpr (std::is_same_v<T, AssetBurnedEvent>) return "AssetBurned";
        else if constexpr (std::is_same_v<T, StatusChangedEvent>) return "StatusChanged";
        else if constexpr (std::is_same_v<T, CustodyChangedEvent>) return "CustodyChanged";
        else if constexpr (std::is_same_v<T, OwnershipUpdatedEvent>) return "OwnershipUpdated";
        else if constexpr (std::is_same_v<T, AssetTransferredEvent>) return "AssetTransferred";
        else if constexpr (std::is_same_v<T, WarrantLinkedEvent>) return "WarrantLinked";
        else if constexpr (std::is_same_v<T, OrderCreatedEvent>) return "OrderCreated";
        else if constexpr (std::is_same_v<T, OrderPreparedEvent>) return "OrderPrepared";
        else if constexpr (std::is_same_v<T, OrderSignedEvent>) return "OrderSigned";
        else if constexpr (std::is_same_v<T, OrderExecutedEvent>) return "OrderExecuted";
        else return "OrderCancelled";
      },
      event);
}

Timestamp eventTimestamp(const Event& event) {
  return std::visit([](const auto& e) { return e.timestamp; }, event);
}

}  // namespace gold
