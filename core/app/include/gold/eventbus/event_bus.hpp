#pragma once

#include "gold/events/event.hpp"

#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace gold {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: Fan-out channel for committed audit events. The
// TransactionManager publishes here once a UnitOfWork commits; the EventLog,
// the IPC telemetry bridge and tests subscribe.
//
// Only committed events ever reach the bus. A rolled-back operation never
// publishes, so subscribers can treat every delivery as durable fact.
//
// Thread model: subscribe, unsubscribe and publish are safe from any thread.
// Callbacks run synchronously on the publishing thread, after the commit
// lock has been released, so a callback may call back into the read API.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  // Receives every event; use std::visit or std::get_if to inspect it.
  using GenericCallback = std::function<void(const Event&)>;

  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // -------------------------------------------------------------------------
  // subscribe(GenericCallback)
  // -------------------------------------------------------------------------
  // Registers a callback invoked for every published event. Used by the
  // EventLog, which records the full stream.
  // -------------------------------------------------------------------------
  SubscriptionId subscribe(GenericCallback callback);

  // -------------------------------------------------------------------------
  // subscribe<EventType>(callback)
  // -------------------------------------------------------------------------
  // Registers a callback invoked only when the event holds EventType (for
  // example OrderExecutedEvent).
  // -------------------------------------------------------------------------
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // Removes a subscription. Unknown ids are ignored.
  void unsubscribe(SubscriptionId id);

  // -------------------------------------------------------------------------
  // publish(event)
  // -------------------------------------------------------------------------
  // Delivers the event to every subscriber registered at the time of the
  // call, in subscription order. The subscriber list is copied under the
  // lock and callbacks run without it, so a callback may subscribe,
  // unsubscribe or publish without deadlocking. A callback that throws is
  // logged to stderr and skipped; delivery continues with the next one.
  // -------------------------------------------------------------------------
  void publish(const Event& event);

  std::size_t subscriberCount() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;
  SubscriptionId next_id_{0};
  std::vector<SubscriberEntry> subscribers_;
};

template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  GenericCallback wrapped = [cb = std::move(callback)](const Event& event) {
    if (const auto* ptr = std::get_if<EventType>(&event)) {
      cb(*ptr);
    }
  };
  return subscribe(std::move(wrapped));
}

}  // namespace gold
