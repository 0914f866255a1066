#pragma once

#include "gold/eventbus/event_bus.hpp"
#include "gold/events/event.hpp"
#include "gold/time/i_time_provider.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <vector>

namespace gold {

class UnitOfWork;

// -----------------------------------------------------------------------------
// TransactionManager: the commit boundary shared by all ledgers
// -----------------------------------------------------------------------------
//
// @brief  Serializes every state-changing operation across AccountLedger,
//         AssetCustody and OrderSettlement, and publishes their events only
//         after they commit.
//
// @details
// The three components own separate stores but share one TransactionManager.
// A mutating operation calls begin(), which takes the exclusive side of a
// std::shared_mutex and returns a UnitOfWork. Read operations take the shared
// side through readLock(), so readers never observe a half-applied mint,
// burn or settlement.
//
// Component methods that accept a `UnitOfWork&` (or `const UnitOfWork&`)
// run inside a caller's boundary and do not lock again. That is how
// AssetCustody::mint and OrderSettlement::executeOrder drive the ledger
// without nesting locks.
//
// Thread model:
//   begin() blocks while another UnitOfWork is open or readers hold the
//   shared lock. Event delivery happens after the exclusive lock is
//   released, but each commit draws a ticket while still exclusive and
//   delivers in ticket order, so subscribers see batches in commit order
//   and never interleaved. Subscribers may read through readLock() but must
//   not open a UnitOfWork from inside a callback.
//
// Ownership:
//   Owned by CustodyEngine (or a test fixture). Holds references to the
//   EventBus and the clock, which must outlive it.
// -----------------------------------------------------------------------------
class TransactionManager {
 public:
  TransactionManager(EventBus& bus, const ITimeProvider& clock);

  TransactionManager(const TransactionManager&) = delete;
  TransactionManager& operator=(const TransactionManager&) = delete;
  TransactionManager(TransactionManager&&) = delete;
  TransactionManager& operator=(TransactionManager&&) = delete;

  // -------------------------------------------------------------------------
  // begin()
  // -------------------------------------------------------------------------
  // @brief  Opens a unit of work holding the exclusive commit lock.
  //
  // @return A UnitOfWork that must be committed, or it rolls back when it
  //         goes out of scope.
  // -------------------------------------------------------------------------
  UnitOfWork begin();

  // Shared lock for read-only queries.
  std::shared_lock<std::shared_mutex> readLock() const;

  std::int64_t now_ms() const { return clock_.now_ms(); }

  EventBus& bus() { return bus_; }

  std::uint64_t commitCount() const { return commits_.load(); }
  std::uint64_t rollbackCount() const { return rollbacks_.load(); }

 private:
  friend class UnitOfWork;

  mutable std::shared_mutex mutex_;
  EventBus& bus_;
  const ITimeProvider& clock_;
  std::atomic<std::uint64_t> commits_{0};
  std::atomic<std::uint64_t> rollbacks_{0};

  // Publish ordering: tickets are drawn under the exclusive lock.
  std::mutex publish_mutex_;
  std::condition_variable publish_turn_;
  std::uint64_t next_ticket_{0};
  std::uint64_t now_serving_{0};
};

// -----------------------------------------------------------------------------
// UnitOfWork: staged mutations and events for one public operation
// -----------------------------------------------------------------------------
//
// @brief  All-or-nothing scope around a state-changing operation.
//
// @details
// Components mutate their stores directly and register a compensating
// action with onRollback() for every mutation. Events are staged with
// stage() and held back.
//
//   commit()     drops the undo journal, releases the lock, then publishes
//                the staged events in staging order.
//   destructor   if commit() never ran (an exception unwound the
//                operation), runs the undo journal in reverse order and
//                discards the staged events.
//
// A failed operation therefore leaves no observable trace: no store change
// and no event.
//
// Every event staged in one unit of work carries the same timestamp,
// captured at begin().
//
// Not copyable or movable; obtain one from TransactionManager::begin().
// -----------------------------------------------------------------------------
class UnitOfWork {
 public:
  ~UnitOfWork();

  UnitOfWork(const UnitOfWork&) = delete;
  UnitOfWork& operator=(const UnitOfWork&) = delete;
  UnitOfWork(UnitOfWork&&) = delete;
  UnitOfWork& operator=(UnitOfWork&&) = delete;

  // Registers the inverse of a mutation that has just been applied.
  void onRollback(std::function<void()> undo);

  // Queues an event for publication on commit.
  void stage(Event event);

  // -------------------------------------------------------------------------
  // commit()
  // -------------------------------------------------------------------------
  // @brief  Makes every mutation permanent and publishes staged events.
  //
  // @details
  // Calling commit() twice throws std::logic_error. Subscriber callbacks run
  // after the exclusive lock is released; an exception thrown by a
  // subscriber propagates to the caller but does not undo the commit.
  // -------------------------------------------------------------------------
  void commit();

  bool active() const { return active_; }

  // Commit timestamp shared by every event staged in this unit.
  Timestamp timestamp() const;
  std::int64_t now_ms() const { return now_ms_; }

  std::size_t stagedEventCount() const { return staged_.size(); }

 private:
  friend class TransactionManager;

  explicit UnitOfWork(TransactionManager& tm);

  void rollback() noexcept;

  TransactionManager& tm_;
  std::unique_lock<std::shared_mutex> lock_;
  std::int64_t now_ms_{0};
  std::vector<std::function<void()>> undo_;
  std::vector<Event> staged_;
  bool active_{true};
};

}  // namespace gold
