#include "gold/engine/custody_engine.hpp"
#include "gold/audit/json_format.hpp"
#include "gold/errors/ledger_error.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iostream>
#include <iterator>
#include <utility>

namespace gold {

namespace {

std::string custodyHolder(const EngineConfig& config) {
  return config.operator_address + "/custody";
}

std::string settlementHolder(const EngineConfig& config) {
  return config.operator_address + "/settlement";
}

std::string lowercase(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

nlohmann::json errorReply(const char* kind, const std::string& message) {
  nlohmann::json reply;
  reply["status"] = "error";
  reply["kind"] = kind;
  reply["message"] = message;
  return reply;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: build components in dependency order and wire capabilities
// -----------------------------------------------------------------------------
CustodyEngine::CustodyEngine(EngineConfig config, const ITimeProvider& clock)
    : config_(std::move(config)),
      transactions_(bus_, clock),
      event_log_(bus_),
      ledger_(transactions_, registry_, config_.account_ids),
      custody_(transactions_, registry_, ledger_,
               ledger_.issueWriteCapability(custodyHolder(config_)),
               config_.custody),
      settlement_(transactions_, registry_, ledger_, custody_,
                  ledger_.issueWriteCapability(settlementHolder(config_)),
                  custody_.issueSettlementCapability(settlementHolder(config_)),
                  config_.execution) {
  seedRegistry(config_, registry_);

  std::cout << "[CustodyEngine] wired. members=" << registry_.memberCount()
            << " account_prefix=" << config_.account_ids.prefix << "\n";
}

CustodyEngine::~CustodyEngine() { stop(); }

// -----------------------------------------------------------------------------
// start(): IPC server and telemetry bridge
// -----------------------------------------------------------------------------
void CustodyEngine::start() {
  std::lock_guard<std::mutex> guard(lifecycle_mutex_);
  if (running_.load()) {
    return;
  }

  if (config_.ipcEnabled()) {
    auto server = std::make_shared<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.ipc_command_endpoint, config_.ipc_telemetry_endpoint);
    server->start();

    std::weak_ptr<IpcServer> bridge = server;
    telemetry_subscription_ = bus_.subscribe([bridge](const Event& event) {
      if (auto target = bridge.lock()) {
        target->pushTelemetry(event);
      }
    });
    ipc_server_ = std::move(server);
  }

  running_.store(true);
  std::cout << "[CustodyEngine] started"
            << (ipc_server_ ? " with IPC." : " without IPC.") << "\n";
}

// -----------------------------------------------------------------------------
// stop(): detach the bridge, then join the IPC worker outside the lock
// -----------------------------------------------------------------------------
void CustodyEngine::stop() {
  std::shared_ptr<IpcServer> server;
  std::optional<EventBus::SubscriptionId> subscription;
  {
    std::lock_guard<std::mutex> guard(lifecycle_mutex_);
    if (!running_.exchange(false)) {
      return;
    }
    server = std::move(ipc_server_);
    ipc_server_.reset();
    subscription = telemetry_subscription_;
    telemetry_subscription_.reset();
  }

  if (subscription) {
    bus_.unsubscribe(*subscription);
  }
  if (server) {
    server->stop();
  }

  std::cout << "[CustodyEngine] stopped.\n";
}

std::shared_ptr<IpcServer> CustodyEngine::ipcServer() const {
  std::lock_guard<std::mutex> guard(lifecycle_mutex_);
  return ipc_server_;
}

// -----------------------------------------------------------------------------
// executeCommand(): parse, dispatch, convert failures to error replies
// -----------------------------------------------------------------------------
std::string CustodyEngine::executeCommand(const std::string& cmd) {
  nlohmann::json reply;

  try {
    nlohmann::json request =
        nlohmann::json::parse(cmd, nullptr, /*allow_exceptions=*/false);

    std::string name;
    nlohmann::json args = nlohmann::json::object();
    if (request.is_object()) {
      name = request.at("cmd").get<std::string>();
      args = request;
    } else if (request.is_string()) {
      name = request.get<std::string>();
    } else {
      name = cmd;
    }

    reply = dispatch(lowercase(name), args);
  } catch (const LedgerError& e) {
    reply = errorReply(errorKindToString(e.kind()), e.what());
  } catch (const nlohmann::json::exception& e) {
    reply = errorReply(errorKindToString(ErrorKind::Validation), e.what());
  }

  return reply.dump();
}

// -----------------------------------------------------------------------------
// dispatch(): one branch per query command
// -----------------------------------------------------------------------------
nlohmann::json CustodyEngine::dispatch(const std::string& name,
                                       const nlohmann::json& args) {
  nlohmann::json reply;
  reply["status"] = "ok";

  if (name == "ping") {
    reply["response"] = "PONG";
  } else if (name == "status") {
    reply["running"] = running_.load();
    reply["members"] = registry_.memberCount();
    reply["accounts"] = ledger_.accountCount();
    reply["assets"] = custody_.totalMinted();
    reply["orders"] = settlement_.orderCount();
    reply["events"] = event_log_.size();
    reply["commits"] = transactions_.commitCount();
    reply["rollbacks"] = transactions_.rollbackCount();
    const auto options = settlement_.executionOptions();
    reply["execution"] = {
        {"enable_on_chain_transfer", options.enable_on_chain_transfer},
        {"enable_auto_ledger_update", options.enable_auto_ledger_update}};
    if (const auto server = ipcServer()) {
      reply["ipc"] = {{"commands_served", server->commandsServed()},
                      {"events_published", server->eventsPublished()}};
    }
  } else if (name == "get_balance") {
    const auto id = args.at("account_id").get<std::string>();
    reply["account_id"] = id;
    reply["balance"] = ledger_.getAccountBalance(id);
  } else if (name == "get_account") {
    reply["account"] =
        toJson(ledger_.getAccount(args.at("account_id").get<std::string>()));
  } else if (name == "accounts_by_member") {
    reply["accounts"] =
        ledger_.accountsByMember(args.at("member_id").get<std::string>());
  } else if (name == "accounts_by_address") {
    reply["accounts"] =
        ledger_.accountsByAddress(args.at("address").get<std::string>());
  } else if (name == "get_asset") {
    reply["asset"] =
        toJson(custody_.getAsset(args.at("token_id").get<domain::TokenId>()));
  } else if (name == "is_locked") {
    const auto token_id = args.at("token_id").get<domain::TokenId>();
    reply["token_id"] = token_id;
    reply["locked"] = custody_.isAssetLocked(token_id);
  } else if (name == "tokens_of") {
    reply["tokens"] =
        custody_.tokensOfOwner(args.at("address").get<std::string>());
  } else if (name == "verify_certificate") {
    const auto token_id = args.at("token_id").get<domain::TokenId>();
    reply["token_id"] = token_id;
    reply["valid"] = custody_.verifyCertificate(
        token_id, args.at("certificate_hash").get<std::string>());
  } else if (name == "get_order") {
    reply["order"] =
        toJson(settlement_.getOrder(args.at("tx_ref").get<std::string>()));
  } else if (name == "orders_by_member") {
    reply["orders"] =
        settlement_.ordersByMember(args.at("member_id").get<std::string>());
  } else if (name == "events_since") {
    const auto after = args.value("seq", std::uint64_t{0});
    nlohmann::json events = nlohmann::json::array();
    for (const auto& entry : event_log_.entriesSince(after)) {
      nlohmann::json j = toJson(entry.event);
      j["seq"] = entry.sequence;
      events.push_back(std::move(j));
    }
    reply["events"] = std::move(events);
    reply["last_seq"] = event_log_.lastSequence();
  } else {
    return dispatchAdmin(name, args);
  }

  return reply;
}

// -----------------------------------------------------------------------------
// dispatchAdmin(): state-changing commands
// -----------------------------------------------------------------------------
// Each request names its `caller`; the component call it maps to performs
// the same role check as the C++ API.
nlohmann::json CustodyEngine::dispatchAdmin(const std::string& name,
                                            const nlohmann::json& args) {
  static const char* const kAdminCommands[] = {
      "create_account", "update_balance", "mint",
      "burn",           "execute_order",  "cancel_order",
      "set_execution_options"};
  const bool known =
      std::find(std::begin(kAdminCommands), std::end(kAdminCommands), name) !=
      std::end(kAdminCommands);
  if (!known) {
    return errorReply(errorKindToString(ErrorKind::Validation),
                      "unknown command: " + name);
  }

  const auto caller = args.at("caller").get<std::string>();
  nlohmann::json reply;
  reply["status"] = "ok";

  if (name == "create_account") {
    AccountDetails details;
    details.name = args.value("name", std::string());
    details.account_type = args.value("account_type", std::string());
    details.unit = args.value("unit", std::string());
    reply["account_id"] = ledger_.createAccount(
        caller, args.at("member_id").get<std::string>(),
        args.at("address").get<std::string>(), details);
  } else if (name == "update_balance") {
    const auto id = args.at("account_id").get<std::string>();
    reply["account_id"] = id;
    reply["balance"] = ledger_.updateBalance(
        caller, id, args.at("delta").get<domain::Amount>(),
        args.value("reason", std::string("ADMIN")),
        args.value("ref_id", std::string()));
  } else if (name == "mint") {
    MintRequest request;
    request.owner = args.at("owner").get<std::string>();
    request.account_id = args.at("account_id").get<std::string>();
    request.serial_number = args.value("serial_number", std::string());
    request.refiner = args.value("refiner", std::string());
    request.weight = args.at("weight").get<std::int64_t>();
    request.fineness = args.at("fineness").get<std::int64_t>();
    request.product_type = args.value("product_type", std::string());
    request.certificate_hash = args.value("certificate_hash", std::string());
    request.member_id = args.value("member_id", std::string());
    request.certified = args.value("certified", false);
    request.warrant_id = args.at("warrant_id").get<std::string>();
    reply["token_id"] = custody_.mint(caller, request);
  } else if (name == "burn") {
    const auto token_id = args.at("token_id").get<domain::TokenId>();
    custody_.burn(caller, token_id, args.value("account_id", std::string()),
                  args.value("reason", std::string("ADMIN")));
    reply["token_id"] = token_id;
  } else if (name == "execute_order") {
    const auto tx_ref = args.at("tx_ref").get<std::string>();
    settlement_.executeOrder(caller, tx_ref);
    reply["order"] = toJson(settlement_.getOrder(tx_ref));
  } else if (name == "cancel_order") {
    const auto tx_ref = args.at("tx_ref").get<std::string>();
    settlement_.cancelOrder(caller, tx_ref,
                            args.value("reason", std::string("ADMIN")));
    reply["order"] = toJson(settlement_.getOrder(tx_ref));
  } else {
    const auto current = settlement_.executionOptions();
    settlement_.setExecutionOptions(
        caller,
        args.value("enable_on_chain_transfer",
                   current.enable_on_chain_transfer),
        args.value("enable_auto_ledger_update",
                   current.enable_auto_ledger_update));
    const auto options = settlement_.executionOptions();
    reply["execution"] = {
        {"enable_on_chain_transfer", options.enable_on_chain_transfer},
        {"enable_auto_ledger_update", options.enable_auto_ledger_update}};
  }

  std::cout << "[CustodyEngine] admin " << name << " by " << caller << "\n";
  return reply;
}

}  // namespace gold
