// =============================================================================
// account_ledger_test.cpp
// =============================================================================
// Unit tests for gold::AccountLedger.
//
// Validates:
//   - Sequential IGAN ids, platform-only creation, active members only
//   - Operator updates: role gate, non-negativity, reason/ref bookkeeping
//   - Capability updates: allowlist, revocation, supersession
//   - Reads by member and address, and event emission
//
// Each test gets a fresh registry, bus and ledger on a simulated clock.
// =============================================================================

#include "gold/concurrent/unit_of_work.hpp"
#include "gold/errors/ledger_error.hpp"
#include "gold/eventbus/event_bus.hpp"
#include "gold/ledger/account_ledger.hpp"
#include "gold/registry/member_registry.hpp"
#include "gold/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using gold::domain::MemberStatus;
using gold::domain::Role;
using gold::domain::RoleSet;

class AccountLedgerTest : public ::testing::Test {
 protected:
  gold::SimulationTimeProvider clock{1'000};
  gold::EventBus bus;
  gold::TransactionManager tm{bus, clock};
  gold::MemberRegistry registry;
  gold::AccountLedger ledger{tm, registry};

  std::vector<gold::Event> events;

  void SetUp() override {
    registry.registerMember("GIC-1", "Alpine Refinery", "CH");
    registry.setMemberStatus("GIC-1", MemberStatus::Active);
    registry.linkAddress("0xa1", "GIC-1");

    registry.registerMember("GIC-2", "Harbour Trust", "SG");  // stays PENDING

    registry.assignRoles("0xplatform", RoleSet{Role::Platform});
    registry.assignRoles("0xcustodian", RoleSet{Role::Custodian});
    registry.assignRoles("0xauditor", RoleSet{Role::Auditor});

    bus.subscribe([this](const gold::Event& e) { events.push_back(e); });
  }

  std::string open() { return ledger.createAccount("0xplatform", "GIC-1", "0xa1"); }

  template <typename T>
  std::vector<T> eventsOf() const {
    std::vector<T> out;
    for (const auto& e : events) {
      if (const auto* p = std::get_if<T>(&e)) out.push_back(*p);
    }
    return out;
  }
};

// -----------------------------------------------------------------------------
// 1. Ids are IGAN-1000, IGAN-1001, ... and balances start at zero.
// -----------------------------------------------------------------------------
TEST_F(AccountLedgerTest, CreateAccountAllocatesSequentialIds) {
  EXPECT_EQ(open(), "IGAN-1000");
  EXPECT_EQ(ledger.createAccount("0xplatform", "GIC-1", "0xa1",
                                 {"Main allocated", "ALLOCATED", "BAR"}),
            "IGAN-1001");

  EXPECT_EQ(ledger.getAccountBalance("IGAN-1000"), 0);
  EXPECT_EQ(ledger.accountCount(), 2u);

  const auto account = ledger.getAccount("IGAN-1001");
  EXPECT_EQ(account.member_id, "GIC-1");
  EXPECT_EQ(account.address, "0xa1");
  EXPECT_EQ(account.name, "Main allocated");
  EXPECT_EQ(account.account_type, "ALLOCATED");
  EXPECT_EQ(account.unit, "BAR");
  EXPECT_EQ(account.created_at_ms, 1'000);

  const auto created = eventsOf<gold::AccountCreatedEvent>();
  ASSERT_EQ(created.size(), 2u);
  EXPECT_EQ(created[0].account_id, "IGAN-1000");
  EXPECT_EQ(created[0].created_by, "0xplatform");
}

// -----------------------------------------------------------------------------
// 2. Only the platform role opens accounts, only for ACTIVE members.
// Why: A failed creation must not consume a sequence number either.
// -----------------------------------------------------------------------------
TEST_F(AccountLedgerTest, CreateAccountChecksRoleAndMemberStatus) {
  EXPECT_THROW(ledger.createAccount("0xcustodian", "GIC-1", "0xa1"),
               gold::AuthorizationError);
  EXPECT_THROW(ledger.createAccount("0xplatform", "GIC-2", "0xb1"),
               gold::MemberNotActiveError);
  EXPECT_THROW(ledger.createAccount("0xplatform", "GIC-404", "0xc1"),
               gold::NotFoundError);
  EXPECT_THROW(ledger.createAccount("0xplatform", "GIC-1", ""),
               gold::ValidationError);

  EXPECT_EQ(ledger.accountCount(), 0u);
  EXPECT_TRUE(events.empty());
  EXPECT_EQ(open(), "IGAN-1000");
}

// -----------------------------------------------------------------------------
// 3. The +10 / -15 scenario: the overdraft fails and the balance stays 10.
// -----------------------------------------------------------------------------
TEST_F(AccountLedgerTest, UpdateBalanceRejectsNegativeResult) {
  const auto id = open();

  EXPECT_EQ(ledger.updateBalance("0xplatform", id, 10, "mint", "1"), 10);
  EXPECT_THROW(ledger.updateBalance("0xplatform", id, -15, "redeem", "2"),
               gold::InsufficientBalanceError);
  EXPECT_EQ(ledger.getAccountBalance(id), 10);

  EXPECT_EQ(ledger.updateBalance("0xcustodian", id, -10, "redeem", "3"), 0);
  EXPECT_EQ(ledger.getAccountBalance(id), 0);
}

// -----------------------------------------------------------------------------
// 4. Operator updates need platform or custodian.
// -----------------------------------------------------------------------------
TEST_F(AccountLedgerTest, UpdateBalanceRequiresOperatorRole) {
  const auto id = open();

  EXPECT_THROW(ledger.updateBalance("0xauditor", id, 1, "x", "1"),
               gold::AuthorizationError);
  EXPECT_THROW(ledger.updateBalance("0xa1", id, 1, "x", "1"),
               gold::AuthorizationError);
  EXPECT_THROW(ledger.updateBalance("0xplatform", "IGAN-9999", 1, "x", "1"),
               gold::NotFoundError);
  EXPECT_EQ(ledger.getAccountBalance(id), 0);
}

// -----------------------------------------------------------------------------
// 5. The applied change is recorded and emitted with delta, balance, reason
//    and reference.
// -----------------------------------------------------------------------------
TEST_F(AccountLedgerTest, UpdateBalanceRecordsReasonAndEmitsEvent) {
  const auto id = open();
  clock.advance_by(500);

  ledger.updateBalance("0xcustodian", id, 7, "DEPOSIT", "REF-7");

  const auto account = ledger.getAccount(id);
  EXPECT_EQ(account.balance, 7);
  EXPECT_EQ(account.last_reason, "DEPOSIT");
  EXPECT_EQ(account.last_ref_id, "REF-7");
  EXPECT_EQ(account.updated_at_ms, 1'500);

  const auto updates = eventsOf<gold::BalanceUpdatedEvent>();
  ASSERT_EQ(updates.size(), 1u);
  EXPECT_EQ(updates[0].account_id, id);
  EXPECT_EQ(updates[0].delta, 7);
  EXPECT_EQ(updates[0].new_balance, 7);
  EXPECT_EQ(updates[0].reason, "DEPOSIT");
  EXPECT_EQ(updates[0].ref_id, "REF-7");
  EXPECT_EQ(updates[0].updated_by, "0xcustodian");
  EXPECT_FALSE(updates[0].via_capability);
}

// -----------------------------------------------------------------------------
// 6. The capability path moves balances with the same invariant.
// Why: Mint, burn and settlement use this path exclusively.
// -----------------------------------------------------------------------------
TEST_F(AccountLedgerTest, CapabilityUpdatesShareTheInvariant) {
  const auto id = open();
  auto cap = ledger.issueWriteCapability("engine/custody");

  EXPECT_TRUE(ledger.isBalanceUpdater("engine/custody"));
  EXPECT_EQ(ledger.updateBalanceFromContract(cap, id, 1, "MINT", "1"), 1);
  EXPECT_THROW(ledger.updateBalanceFromContract(cap, id, -2, "BURN", "1"),
               gold::InsufficientBalanceError);
  EXPECT_EQ(ledger.getAccountBalance(id), 1);

  const auto updates = eventsOf<gold::BalanceUpdatedEvent>();
  ASSERT_EQ(updates.size(), 1u);
  EXPECT_TRUE(updates[0].via_capability);
  EXPECT_EQ(updates[0].updated_by, "engine/custody");

  const auto allow = eventsOf<gold::BalanceUpdaterSetEvent>();
  ASSERT_EQ(allow.size(), 1u);
  EXPECT_EQ(allow[0].updater, "engine/custody");
  EXPECT_TRUE(allow[0].enabled);
}

// -----------------------------------------------------------------------------
// 7. Removing a holder from the allowlist revokes its capability.
// -----------------------------------------------------------------------------
TEST_F(AccountLedgerTest, SetBalanceUpdaterRevokesAndRestores) {
  const auto id = open();
  auto cap = ledger.issueWriteCapability("engine/settlement");

  EXPECT_THROW(ledger.setBalanceUpdater("0xcustodian", "engine/settlement",
                                        false),
               gold::AuthorizationError);

  ledger.setBalanceUpdater("0xplatform", "engine/settlement", false);
  EXPECT_FALSE(ledger.isBalanceUpdater("engine/settlement"));
  EXPECT_THROW(ledger.updateBalanceFromContract(cap, id, 1, "ORDER", "TX-1"),
               gold::AuthorizationError);

  ledger.setBalanceUpdater("0xplatform", "engine/settlement", true);
  EXPECT_EQ(ledger.updateBalanceFromContract(cap, id, 1, "ORDER", "TX-1"), 1);

  const auto allow = eventsOf<gold::BalanceUpdaterSetEvent>();
  ASSERT_EQ(allow.size(), 3u);
  EXPECT_FALSE(allow[1].enabled);
  EXPECT_EQ(allow[1].set_by, "0xplatform");
}

// -----------------------------------------------------------------------------
// 8. Re-issuing a capability supersedes earlier copies.
// -----------------------------------------------------------------------------
TEST_F(AccountLedgerTest, ReissuedCapabilitySupersedesOldCopy) {
  const auto id = open();
  auto first = ledger.issueWriteCapability("engine/custody");
  auto second = ledger.issueWriteCapability("engine/custody");

  EXPECT_NE(first.serial(), second.serial());
  EXPECT_THROW(ledger.updateBalanceFromContract(first, id, 1, "MINT", "1"),
               gold::AuthorizationError);
  EXPECT_EQ(ledger.updateBalanceFromContract(second, id, 1, "MINT", "1"), 1);
}

// -----------------------------------------------------------------------------
// 9. Joining a caller's unit of work: the ledger change rolls back with it.
// -----------------------------------------------------------------------------
TEST_F(AccountLedgerTest, CapabilityUpdateInsideRolledBackUnitIsUndone) {
  const auto id = open();
  auto cap = ledger.issueWriteCapability("engine/custody");
  events.clear();

  {
    gold::UnitOfWork uow = tm.begin();
    ledger.updateBalanceFromContract(cap, id, 3, "MINT", "1", uow);
    EXPECT_EQ(ledger.findAccount(id, uow)->balance, 3);
  }

  EXPECT_EQ(ledger.getAccountBalance(id), 0);
  EXPECT_TRUE(events.empty());
}

// -----------------------------------------------------------------------------
// 10. Reads by member and address; unknown keys give empty lists.
// -----------------------------------------------------------------------------
TEST_F(AccountLedgerTest, AccountsByMemberAndAddress) {
  registry.linkAddress("0xa2", "GIC-1");
  const auto a = open();
  const auto b = ledger.createAccount("0xplatform", "GIC-1", "0xa2");

  EXPECT_EQ(ledger.accountsByMember("GIC-1"),
            (std::vector<std::string>{a, b}));
  EXPECT_EQ(ledger.accountsByAddress("0xa2"), std::vector<std::string>{b});
  EXPECT_TRUE(ledger.accountsByMember("GIC-404").empty());
  EXPECT_TRUE(ledger.accountsByAddress("0xnone").empty());
  EXPECT_THROW(ledger.getAccountBalance("IGAN-1"), gold::NotFoundError);
}

// -----------------------------------------------------------------------------
// 11. Custom id format.
// -----------------------------------------------------------------------------
TEST(AccountLedgerFormatTest, CustomPrefixAndFirstSequence) {
  gold::SimulationTimeProvider clock;
  gold::EventBus bus;
  gold::TransactionManager tm{bus, clock};
  gold::MemberRegistry registry;
  registry.registerMember("GIC-1", "A", "CH");
  registry.setMemberStatus("GIC-1", MemberStatus::Active);
  registry.assignRoles("0xplatform", RoleSet{Role::Platform});

  gold::AccountLedger ledger{tm, registry, gold::AccountIdFormat{"IGAN-", 1}};
  EXPECT_EQ(ledger.createAccount("0xplatform", "GIC-1", "0xa"), "IGAN-1");
  EXPECT_EQ(ledger.createAccount("0xplatform", "GIC-1", "0xa"), "IGAN-2");
}
