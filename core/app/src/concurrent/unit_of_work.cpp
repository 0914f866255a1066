#include "gold/concurrent/unit_of_work.hpp"
#include "gold/time/time_utils.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace gold {

// -----------------------------------------------------------------------------
// TransactionManager
// -----------------------------------------------------------------------------
TransactionManager::TransactionManager(EventBus& bus,
                                       const ITimeProvider& clock)
    : bus_(bus), clock_(clock) {}

UnitOfWork TransactionManager::begin() { return UnitOfWork(*this); }

std::shared_lock<std::shared_mutex> TransactionManager::readLock() const {
  return std::shared_lock<std::shared_mutex>(mutex_);
}

// -----------------------------------------------------------------------------
// UnitOfWork: acquire the exclusive lock and pin the commit timestamp
// -----------------------------------------------------------------------------
UnitOfWork::UnitOfWork(TransactionManager& tm)
    : tm_(tm), lock_(tm.mutex_), now_ms_(tm.clock_.now_ms()) {}

UnitOfWork::~UnitOfWork() {
  if (active_) {
    rollback();
  }
}

void UnitOfWork::onRollback(std::function<void()> undo) {
  undo_.push_back(std::move(undo));
}

void UnitOfWork::stage(Event event) { staged_.push_back(std::move(event)); }

Timestamp UnitOfWork::timestamp() const { return ms_to_timestamp(now_ms_); }

// -----------------------------------------------------------------------------
// commit(): drop undo journal, take a publish ticket, release lock, publish
// -----------------------------------------------------------------------------
namespace {

// Hands the publish turn to the next ticket even if a subscriber throws.
class PublishTurn {
 public:
  PublishTurn(std::mutex& mutex, std::condition_variable& turn,
              std::uint64_t& now_serving)
      : mutex_(mutex), turn_(turn), now_serving_(now_serving) {}

  ~PublishTurn() {
    {
      std::lock_guard<std::mutex> guard(mutex_);
      ++now_serving_;
    }
    turn_.notify_all();
  }

 private:
  std::mutex& mutex_;
  std::condition_variable& turn_;
  std::uint64_t& now_serving_;
};

}  // namespace

void UnitOfWork::commit() {
  if (!active_) {
    throw std::logic_error("UnitOfWork::commit called on a closed unit");
  }

  undo_.clear();
  std::vector<Event> events = std::move(staged_);
  staged_.clear();
  active_ = false;
  tm_.commits_.fetch_add(1);

  std::uint64_t ticket = 0;
  {
    std::lock_guard<std::mutex> guard(tm_.publish_mutex_);
    ticket = tm_.next_ticket_++;
  }

  lock_.unlock();

  {
    std::unique_lock<std::mutex> wait(tm_.publish_mutex_);
    tm_.publish_turn_.wait(wait, [&] { return tm_.now_serving_ == ticket; });
  }
  PublishTurn turn(tm_.publish_mutex_, tm_.publish_turn_, tm_.now_serving_);

  for (const Event& event : events) {
    tm_.bus_.publish(event);
  }
}

// -----------------------------------------------------------------------------
// rollback(): run compensating actions newest-first
// -----------------------------------------------------------------------------
void UnitOfWork::rollback() noexcept {
  const std::size_t undone = undo_.size();
  for (auto it = undo_.rbegin(); it != undo_.rend(); ++it) {
    (*it)();
  }
  undo_.clear();
  staged_.clear();
  active_ = false;
  tm_.rollbacks_.fetch_add(1);

  if (undone > 0) {
    std::cerr << "[UnitOfWork] rolled back " << undone
              << " staged mutation(s).\n";
  }
}

}  // namespace gold
