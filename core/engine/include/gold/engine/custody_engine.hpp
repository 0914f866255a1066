#pragma once

#include "gold/audit/event_log.hpp"
#include "gold/concurrent/unit_of_work.hpp"
#include "gold/config/engine_config.hpp"
#include "gold/custody/asset_custody.hpp"
#include "gold/eventbus/event_bus.hpp"
#include "gold/ledger/account_ledger.hpp"
#include "gold/network/ipc_server.hpp"
#include "gold/registry/member_registry.hpp"
#include "gold/settlement/order_settlement.hpp"
#include "gold/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace gold {

// -----------------------------------------------------------------------------
// CustodyEngine
// -----------------------------------------------------------------------------
//
// @brief  Programmatic root of the custody system: owns the bus, the commit
//         boundary, the registry, the three core components and the audit
//         log, and wires their capabilities.
//
// @details
// Wiring (constructor):
//
//   AccountLedger ──LedgerWriteCapability──> AssetCustody     (mint / burn)
//   AccountLedger ──LedgerWriteCapability──> OrderSettlement  (execute)
//   AssetCustody  ──SettlementCapability───> OrderSettlement  (execute)
//
// Capabilities are issued under "<operator_address>/custody" and
// "<operator_address>/settlement". The EventLog is subscribed before any
// capability is issued, so the BalanceUpdaterSet events of the wiring are
// the first entries of the log.
//
// The registry is seeded from EngineConfig. Everything else starts empty.
//
// start() brings up the IpcServer when both endpoints are configured and
// bridges every committed event to its telemetry queue. The engine is fully
// usable without start(); tests drive the components directly.
//
// Ownership:
//   CustodyEngine
//    ├── bus_            (EventBus, value)
//    ├── registry_       (MemberRegistry, value)
//    ├── transactions_   (TransactionManager, value)
//    ├── event_log_      (EventLog, value)
//    ├── ledger_         (AccountLedger, value)
//    ├── custody_        (AssetCustody, value)
//    ├── settlement_     (OrderSettlement, value)
//    └── ipc_server_     (shared_ptr<IpcServer>, only while running)
//
// The telemetry bridge holds a weak_ptr to the server, so an event
// delivered while stop() tears the server down is dropped rather than
// pushed into a destroyed queue. start() and stop() are serialized by
// lifecycle_mutex_; stop() joins the IPC worker after releasing it.
//
// Members are declared in dependency order and destroyed in reverse.
// -----------------------------------------------------------------------------
class CustodyEngine {
 public:
  // `clock` must outlive the engine.
  CustodyEngine(EngineConfig config, const ITimeProvider& clock);

  // Destructor calls stop().
  ~CustodyEngine();

  CustodyEngine(const CustodyEngine&) = delete;
  CustodyEngine& operator=(const CustodyEngine&) = delete;
  CustodyEngine(CustodyEngine&&) = delete;
  CustodyEngine& operator=(CustodyEngine&&) = delete;

  // Starts the IPC server if configured. Idempotent.
  void start();

  // Stops the IPC server and detaches the telemetry bridge. Idempotent.
  void stop();

  bool running() const { return running_.load(); }

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  //
  // @brief  Answers one JSON command and returns a JSON reply.
  //
  // @details
  // Request:  {"cmd": "get_balance", "account_id": "IGAN-1000"}
  //           A bare word ("PING", "status") is accepted as a command with
  //           no arguments.
  // Reply:    {"status": "ok", ...}
  //           {"status": "error", "kind": "NotFound", "message": "..."}
  //
  // Queries: ping, status, get_balance, get_account, accounts_by_member,
  // accounts_by_address, get_asset, is_locked, tokens_of,
  // verify_certificate, get_order, orders_by_member, events_since.
  //
  // Administrative commands carry a "caller" address and go through the
  // same role checks as the C++ API: create_account, update_balance, mint,
  // burn, execute_order, cancel_order, set_execution_options.
  //
  // Never throws for a bad request: LedgerError and JSON errors become
  // error replies.
  //
  // Thread-safety: Safe from any thread (runs on the IPC thread in
  // production).
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  // --- Component access ----------------------------------------------------
  EventBus& eventBus() { return bus_; }
  MemberRegistry& registry() { return registry_; }
  TransactionManager& transactions() { return transactions_; }
  EventLog& eventLog() { return event_log_; }
  AccountLedger& ledger() { return ledger_; }
  AssetCustody& custody() { return custody_; }
  OrderSettlement& settlement() { return settlement_; }

  const EngineConfig& config() const { return config_; }

 private:
  nlohmann::json dispatch(const std::string& name, const nlohmann::json& args);
  nlohmann::json dispatchAdmin(const std::string& name,
                               const nlohmann::json& args);

  std::shared_ptr<IpcServer> ipcServer() const;

  const EngineConfig config_;

  EventBus bus_;
  MemberRegistry registry_;
  TransactionManager transactions_;
  EventLog event_log_;
  AccountLedger ledger_;
  AssetCustody custody_;
  OrderSettlement settlement_;

  mutable std::mutex lifecycle_mutex_;
  std::shared_ptr<IpcServer> ipc_server_;
  std::optional<EventBus::SubscriptionId> telemetry_subscription_;
  std::atomic<bool> running_{false};
};

}  // namespace gold
