// =============================================================================
// command_protocol_test.cpp
// =============================================================================
// Tests for CustodyEngine::executeCommand(), the handler behind the IPC
// command socket. IPC itself stays disabled; the handler is called directly.
//
// Validates:
//   - command name forms: bare text, JSON string, {"cmd": ...}, any case
//   - each read command returns the state the components hold
//   - events_since cursor replies
//   - failures come back as {"status":"error","kind":...}
//   - administrative commands mutate state under the caller's roles
//   - status stays answerable while the engine starts and stops
// =============================================================================

#include "gold/engine/custody_engine.hpp"
#include "gold/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

using gold::domain::AssetStatus;
using gold::domain::TokenId;
using nlohmann::json;

namespace {

constexpr const char* kConfig = R"({
  "members": [
    { "id": "GIC-OPS", "addresses": [ { "address": "0xops", "roles": ["platform"] } ] },
    { "id": "GIC-REF", "addresses": [ { "address": "0xref", "roles": ["minter"] } ] },
    { "id": "GIC-A", "addresses": [ { "address": "0xalice" } ] },
    { "id": "GIC-B", "addresses": [ { "address": "0xbob" } ] }
  ],
  "operators": [ { "address": "0xvault", "roles": ["custodian"] } ]
})";

}  // namespace

class CommandProtocolTest : public ::testing::Test {
 protected:
  CommandProtocolTest()
      : engine(gold::parseEngineConfig(std::string(kConfig)), clock) {
    alice = engine.ledger().createAccount("0xops", "GIC-A", "0xalice");
    bob = engine.ledger().createAccount("0xops", "GIC-B", "0xbob");

    gold::MintRequest r;
    r.owner = "0xalice";
    r.account_id = alice;
    r.serial_number = "AR-1";
    r.refiner = "Alpine Refinery";
    r.weight = 10'000;
    r.fineness = 9'999;
    r.certificate_hash = "sha256:bar1";
    r.member_id = "GIC-A";
    r.warrant_id = "W-1";
    token = engine.custody().mint("0xref", r);
  }

  json call(const std::string& text) {
    return json::parse(engine.executeCommand(text));
  }
  json send(const json& request) { return call(request.dump()); }

  gold::SimulationTimeProvider clock{86'400'000};
  gold::CustodyEngine engine;
  std::string alice;
  std::string bob;
  TokenId token{0};
};

// -----------------------------------------------------------------------------
// 1. ping in every accepted form.
// -----------------------------------------------------------------------------
TEST_F(CommandProtocolTest, PingForms) {
  for (const std::string text : {"ping", "PING", "\"ping\"", R"({"cmd":"Ping"})"}) {
    const auto reply = call(text);
    EXPECT_EQ(reply["status"], "ok") << text;
    EXPECT_EQ(reply["response"], "PONG") << text;
  }
}

// -----------------------------------------------------------------------------
// 2. status summarises component counters.
// -----------------------------------------------------------------------------
TEST_F(CommandProtocolTest, StatusReportsCounts) {
  auto reply = call("status");
  EXPECT_EQ(reply["running"], false);
  EXPECT_EQ(reply["members"], 4);
  EXPECT_EQ(reply["accounts"], 2);
  EXPECT_EQ(reply["assets"], 1);
  EXPECT_EQ(reply["orders"], 0);
  EXPECT_EQ(reply["rollbacks"], 0);
  EXPECT_EQ(reply["execution"]["enable_auto_ledger_update"], true);
  EXPECT_EQ(reply["events"], engine.eventLog().size());

  engine.start();
  EXPECT_EQ(call("status")["running"], true);
  engine.stop();
  EXPECT_EQ(call("status")["running"], false);
}

// -----------------------------------------------------------------------------
// 3. Account reads.
// -----------------------------------------------------------------------------
TEST_F(CommandProtocolTest, AccountCommands) {
  auto reply = send(json{{"cmd", "get_balance"}, {"account_id", alice}});
  EXPECT_EQ(reply["account_id"], alice);
  EXPECT_EQ(reply["balance"], 1);

  reply = send(json{{"cmd", "get_account"}, {"account_id", bob}});
  EXPECT_EQ(reply["account"]["member_id"], "GIC-B");
  EXPECT_EQ(reply["account"]["address"], "0xbob");
  EXPECT_EQ(reply["account"]["balance"], 0);

  reply = send(json{{"cmd", "accounts_by_member"}, {"member_id", "GIC-A"}});
  EXPECT_EQ(reply["accounts"], json::array({alice}));

  reply = send(json{{"cmd", "accounts_by_address"}, {"address", "0xbob"}});
  EXPECT_EQ(reply["accounts"], json::array({bob}));
}

// -----------------------------------------------------------------------------
// 4. Asset reads.
// -----------------------------------------------------------------------------
TEST_F(CommandProtocolTest, AssetCommands) {
  engine.custody().updateStatus("0xalice", token, AssetStatus::Pledged, "loan");

  auto reply = send(json{{"cmd", "get_asset"}, {"token_id", token}});
  EXPECT_EQ(reply["asset"]["warrant_id"], "W-1");
  EXPECT_EQ(reply["asset"]["status"], "PLEDGED");
  EXPECT_EQ(reply["asset"]["owner"], "0xalice");

  reply = send(json{{"cmd", "is_locked"}, {"token_id", token}});
  EXPECT_EQ(reply["locked"], true);

  reply = send(json{{"cmd", "tokens_of"}, {"address", "0xalice"}});
  EXPECT_EQ(reply["tokens"], json::array({token}));

  reply = send(json{{"cmd", "verify_certificate"},
                    {"token_id", token},
                    {"certificate_hash", "sha256:bar1"}});
  EXPECT_EQ(reply["valid"], true);
  reply = send(json{{"cmd", "verify_certificate"},
                    {"token_id", token},
                    {"certificate_hash", "sha256:forged"}});
  EXPECT_EQ(reply["valid"], false);
}

// -----------------------------------------------------------------------------
// 5. Order reads.
// -----------------------------------------------------------------------------
TEST_F(CommandProtocolTest, OrderCommands) {
  gold::OrderRequest r;
  r.tx_ref = "TX-7";
  r.initiator_id = "GIC-A";
  r.counterparty_id = "GIC-B";
  r.source_account_id = alice;
  r.dest_account_id = bob;
  r.token_ids = {token};
  engine.settlement().prepareOrder("0xalice", r);
  engine.settlement().signOrder("0xbob", "TX-7", {0x01, 0x02}, "buyer");

  auto reply = send(json{{"cmd", "get_order"}, {"tx_ref", "TX-7"}});
  EXPECT_EQ(reply["order"]["status"], "PENDING_EXECUTION");
  EXPECT_EQ(reply["order"]["quantity"], 1);
  EXPECT_EQ(reply["order"]["signatures"][0]["signature"], "0102");

  reply = send(json{{"cmd", "orders_by_member"}, {"member_id", "GIC-B"}});
  EXPECT_EQ(reply["orders"], json::array({"TX-7"}));
}

// -----------------------------------------------------------------------------
// 6. events_since returns the tail after a cursor plus the newest seq.
// -----------------------------------------------------------------------------
TEST_F(CommandProtocolTest, EventsSinceCursor) {
  auto reply = send(json{{"cmd", "events_since"}, {"seq", 0}});
  const auto last = reply["last_seq"].get<std::uint64_t>();
  ASSERT_GT(last, 0u);
  ASSERT_EQ(reply["events"].size(), last);
  EXPECT_EQ(reply["events"][0]["seq"], 1);

  reply = send(json{{"cmd", "events_since"}, {"seq", last}});
  EXPECT_TRUE(reply["events"].empty());

  engine.custody().updateStatus("0xalice", token, AssetStatus::InVault, "in");
  reply = send(json{{"cmd", "events_since"}, {"seq", last}});
  ASSERT_EQ(reply["events"].size(), 1u);
  EXPECT_EQ(reply["events"][0]["type"], "StatusChanged");
  EXPECT_EQ(reply["events"][0]["seq"], last + 1);
  EXPECT_EQ(reply["last_seq"], last + 1);
}

// -----------------------------------------------------------------------------
// 7. Errors are replies, never exceptions through the handler.
// -----------------------------------------------------------------------------
TEST_F(CommandProtocolTest, ErrorsBecomeReplies) {
  auto reply = call("reticulate");
  EXPECT_EQ(reply["status"], "error");
  EXPECT_EQ(reply["kind"], "Validation");
  EXPECT_EQ(reply["message"], "unknown command: reticulate");

  reply = send(json{{"cmd", "get_balance"}});
  EXPECT_EQ(reply["status"], "error");
  EXPECT_EQ(reply["kind"], "Validation");

  reply = send(json{{"cmd", "get_balance"}, {"account_id", "IGAN-404"}});
  EXPECT_EQ(reply["status"], "error");
  EXPECT_EQ(reply["kind"], "NotFound");

  reply = send(json{{"cmd", "get_asset"}, {"token_id", "one"}});
  EXPECT_EQ(reply["kind"], "Validation");

  reply = send(json{{"cmd", "get_order"}, {"tx_ref", "TX-404"}});
  EXPECT_EQ(reply["kind"], "NotFound");
}

// -----------------------------------------------------------------------------
// 8. Administrative commands change state through the component API.
// -----------------------------------------------------------------------------
TEST_F(CommandProtocolTest, AdminCommandsMutateState) {
  auto reply = send(json{{"cmd", "create_account"},
                         {"caller", "0xops"},
                         {"member_id", "GIC-B"},
                         {"address", "0xbob"},
                         {"name", "Bob allocated"}});
  ASSERT_EQ(reply["status"], "ok") << reply.dump();
  const auto carol = reply["account_id"].get<std::string>();
  EXPECT_EQ(engine.ledger().getAccount(carol).member_id, "GIC-B");

  reply = send(json{{"cmd", "update_balance"},
                    {"caller", "0xops"},
                    {"account_id", carol},
                    {"delta", 3},
                    {"ref_id", "ADJ-1"}});
  ASSERT_EQ(reply["status"], "ok") << reply.dump();
  EXPECT_EQ(reply["balance"], 3);

  reply = send(json{{"cmd", "mint"},
                    {"caller", "0xref"},
                    {"owner", "0xbob"},
                    {"account_id", bob},
                    {"weight", 10'000},
                    {"fineness", 9'995},
                    {"member_id", "GIC-B"},
                    {"warrant_id", "W-2"}});
  ASSERT_EQ(reply["status"], "ok") << reply.dump();
  const auto minted = reply["token_id"].get<TokenId>();
  EXPECT_EQ(engine.custody().ownerOf(minted), "0xbob");
  EXPECT_EQ(engine.ledger().getAccountBalance(bob), 1);

  reply = send(json{{"cmd", "burn"},
                    {"caller", "0xref"},
                    {"token_id", minted},
                    {"reason", "REFINED"}});
  ASSERT_EQ(reply["status"], "ok") << reply.dump();
  EXPECT_EQ(engine.custody().getAsset(minted).status, AssetStatus::Burned);
  EXPECT_EQ(engine.ledger().getAccountBalance(bob), 0);
  EXPECT_TRUE(call(R"({"cmd":"tokens_of","address":"0xbob"})")["tokens"].empty());

  reply = send(json{{"cmd", "set_execution_options"},
                    {"caller", "0xops"},
                    {"enable_on_chain_transfer", false}});
  ASSERT_EQ(reply["status"], "ok") << reply.dump();
  EXPECT_EQ(reply["execution"]["enable_on_chain_transfer"], false);
  EXPECT_EQ(reply["execution"]["enable_auto_ledger_update"], true);
  EXPECT_FALSE(engine.settlement().executionOptions().enable_on_chain_transfer);
}

// -----------------------------------------------------------------------------
// 9. Administrative commands enforce roles and leave state untouched.
// Why: The command socket must not widen what an address may do.
// -----------------------------------------------------------------------------
TEST_F(CommandProtocolTest, AdminCommandsEnforceRoles) {
  const auto events_before = engine.eventLog().size();

  auto reply = send(json{{"cmd", "update_balance"},
                         {"caller", "0xalice"},
                         {"account_id", alice},
                         {"delta", 100}});
  EXPECT_EQ(reply["status"], "error");
  EXPECT_EQ(reply["kind"], "Authorization");
  EXPECT_EQ(engine.ledger().getAccountBalance(alice), 1);

  reply = send(json{{"cmd", "burn"}, {"caller", "0xalice"}, {"token_id", token}});
  EXPECT_EQ(reply["kind"], "Authorization");
  EXPECT_EQ(engine.custody().getAsset(token).status, AssetStatus::Registered);

  reply = send(json{{"cmd", "mint"}, {"owner", "0xalice"}});
  EXPECT_EQ(reply["kind"], "Validation");

  reply = send(json{{"cmd", "update_balance"},
                    {"caller", "0xops"},
                    {"account_id", bob},
                    {"delta", -1}});
  EXPECT_EQ(reply["kind"], "InsufficientBalance");

  EXPECT_EQ(engine.eventLog().size(), events_before);
}

// -----------------------------------------------------------------------------
// 10. status is answered while another thread starts and stops the engine.
// -----------------------------------------------------------------------------
TEST_F(CommandProtocolTest, StatusDuringStartStop) {
  std::atomic<bool> done{false};
  std::atomic<int> failures{0};

  std::thread poller([this, &done, &failures] {
    while (!done.load()) {
      const auto reply = json::parse(engine.executeCommand("status"));
      if (reply["status"] != "ok" || !reply["running"].is_boolean()) {
        failures.fetch_add(1);
      }
    }
  });

  for (int i = 0; i < 50; ++i) {
    engine.start();
    EXPECT_TRUE(engine.running());
    engine.stop();
    EXPECT_FALSE(engine.running());
  }

  done.store(true);
  poller.join();
  EXPECT_EQ(failures.load(), 0);
}
