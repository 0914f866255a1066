#include "gold/audit/event_log.hpp"
#include "gold/audit/json_format.hpp"

namespace gold {

EventLog::EventLog(EventBus& bus) : bus_(bus) {
  subscription_ = bus_.subscribe([this](const Event& event) { append(event); });
}

EventLog::~EventLog() { bus_.unsubscribe(subscription_); }

void EventLog::append(const Event& event) {
  std::lock_guard lock(mutex_);
  entries_.push_back(EventLogEntry{entries_.size() + 1, event});
}

std::vector<EventLogEntry> EventLog::entries() const {
  std::lock_guard lock(mutex_);
  return entries_;
}

std::vector<EventLogEntry> EventLog::entriesSince(std::uint64_t after) const {
  std::lock_guard lock(mutex_);
  if (after >= entries_.size()) {
    return {};
  }
  return {entries_.begin() + static_cast<std::ptrdiff_t>(after),
          entries_.end()};
}

std::size_t EventLog::size() const {
  std::lock_guard lock(mutex_);
  return entries_.size();
}

std::uint64_t EventLog::lastSequence() const {
  std::lock_guard lock(mutex_);
  return entries_.empty() ? 0 : entries_.back().sequence;
}

void EventLog::writeJsonLines(std::ostream& out) const {
  std::lock_guard lock(mutex_);
  for (const auto& entry : entries_) {
    nlohmann::json j = toJson(entry.event);
    j["seq"] = entry.sequence;
    out << j.dump() << '\n';
  }
}

}  // namespace gold
