#pragma once

#include "gold/eventbus/event_bus.hpp"
#include "gold/events/event.hpp"

#include <cstdint>
#include <mutex>
#include <ostream>
#include <utility>
#include <vector>

namespace gold {

// One committed event with its position in the log (1-based).
struct EventLogEntry {
  std::uint64_t sequence{0};
  Event event;
};

// -----------------------------------------------------------------------------
// EventLog: append-only audit record of every committed event
// -----------------------------------------------------------------------------
//
// @brief  Subscribes to the EventBus on construction and keeps every event
//         it sees, numbered in delivery order.
//
// @details
// Because the TransactionManager only publishes after a commit, the log
// holds exactly the durable history: a rolled-back operation never shows
// up. Sequence numbers start at 1 and have no gaps, which lets telemetry
// clients resume with events_since(n).
//
// Thread model: append (from the bus) and every read are guarded by one
// mutex. Reads return copies.
//
// Ownership: unsubscribes from the bus in the destructor, so the bus must
// outlive the log.
// -----------------------------------------------------------------------------
class EventLog {
 public:
  explicit EventLog(EventBus& bus);
  ~EventLog();

  EventLog(const EventLog&) = delete;
  EventLog& operator=(const EventLog&) = delete;

  std::vector<EventLogEntry> entries() const;

  // Entries with sequence > after.
  std::vector<EventLogEntry> entriesSince(std::uint64_t after) const;

  // Every logged event of one type, oldest first.
  template <typename EventType>
  std::vector<EventType> entriesOf() const;

  std::size_t size() const;
  std::uint64_t lastSequence() const;

  // One JSON object per line (see json_format.hpp), with a "seq" field.
  void writeJsonLines(std::ostream& out) const;

 private:
  void append(const Event& event);

  EventBus& bus_;
  EventBus::SubscriptionId subscription_;

  mutable std::mutex mutex_;
  std::vector<EventLogEntry> entries_;
};

template <typename EventType>
std::vector<EventType> EventLog::entriesOf() const {
  std::lock_guard lock(mutex_);
  std::vector<EventType> out;
  for (const auto& entry : entries_) {
    if (const auto* e = std::get_if<EventType>(&entry.event)) {
      out.push_back(*e);
    }
  }
  return out;
}

}  // namespace gold
