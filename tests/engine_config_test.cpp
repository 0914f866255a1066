// =============================================================================
// engine_config_test.cpp
// =============================================================================
// Unit tests for the JSON engine configuration and registry seeding.
//
// Validates:
//   - defaults when keys are absent
//   - every section is read, roles and statuses by name
//   - malformed documents surface as ValidationError
//   - seedRegistry() reproduces members, links, roles and the blacklist
// =============================================================================

#include "gold/config/engine_config.hpp"
#include "gold/errors/ledger_error.hpp"
#include "gold/registry/member_registry.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

using gold::domain::MemberStatus;
using gold::domain::Role;
using gold::domain::RoleSet;

namespace {

constexpr const char* kFullConfig = R"({
  "account_prefix": "VAULT-",
  "first_account_sequence": 7,
  "operator_address": "engine-a",
  "execution": { "enable_on_chain_transfer": false },
  "custody": { "allow_operator_status_updates": false },
  "ipc": {
    "command_endpoint": "tcp://127.0.0.1:6000",
    "telemetry_endpoint": "tcp://127.0.0.1:6001"
  },
  "members": [
    { "id": "GIC-1", "name": "Alpine Refinery", "country": "CH",
      "status": "ACTIVE",
      "addresses": [
        { "address": "0xa1", "roles": ["refiner", "minter"] },
        { "address": "0xa2" }
      ] },
    { "id": "GIC-2", "name": "Harbour Trust", "country": "SG",
      "status": "SUSPENDED" }
  ],
  "operators": [
    { "address": "0xvault", "roles": ["custodian", "vault_operator"] }
  ],
  "blacklist": ["0xbad"]
})";

}  // namespace

// -----------------------------------------------------------------------------
// 1. An empty object yields the defaults: IGAN-1000, both execution flags
//    on, IPC disabled.
// -----------------------------------------------------------------------------
TEST(EngineConfigTest, EmptyObjectUsesDefaults) {
  const auto config = gold::parseEngineConfig(std::string("{}"));

  EXPECT_EQ(config.account_ids.prefix, "IGAN-");
  EXPECT_EQ(config.account_ids.first_sequence, 1000u);
  EXPECT_EQ(config.operator_address, "gold-engine");
  EXPECT_TRUE(config.execution.enable_on_chain_transfer);
  EXPECT_TRUE(config.execution.enable_auto_ledger_update);
  EXPECT_TRUE(config.custody.allow_operator_status_updates);
  EXPECT_FALSE(config.ipcEnabled());
  EXPECT_TRUE(config.members.empty());
}

// -----------------------------------------------------------------------------
// 2. Every section is read.
// -----------------------------------------------------------------------------
TEST(EngineConfigTest, ParsesAllSections) {
  const auto config = gold::parseEngineConfig(std::string(kFullConfig));

  EXPECT_EQ(config.account_ids.prefix, "VAULT-");
  EXPECT_EQ(config.account_ids.first_sequence, 7u);
  EXPECT_EQ(config.operator_address, "engine-a");
  EXPECT_FALSE(config.execution.enable_on_chain_transfer);
  EXPECT_TRUE(config.execution.enable_auto_ledger_update);
  EXPECT_FALSE(config.custody.allow_operator_status_updates);
  EXPECT_TRUE(config.ipcEnabled());
  EXPECT_EQ(config.ipc_command_endpoint, "tcp://127.0.0.1:6000");

  ASSERT_EQ(config.members.size(), 2u);
  const auto& refinery = config.members[0];
  EXPECT_EQ(refinery.id, "GIC-1");
  EXPECT_EQ(refinery.status, MemberStatus::Active);
  ASSERT_EQ(refinery.addresses.size(), 2u);
  EXPECT_EQ(refinery.addresses[0].roles, (RoleSet{Role::Refiner, Role::Minter}));
  EXPECT_TRUE(refinery.addresses[1].roles.empty());
  EXPECT_EQ(config.members[1].status, MemberStatus::Suspended);

  ASSERT_EQ(config.operators.size(), 1u);
  EXPECT_TRUE(config.operators[0].roles.contains(Role::VaultOperator));
  EXPECT_EQ(config.blacklist, std::vector<std::string>{"0xbad"});
}

// -----------------------------------------------------------------------------
// 3. Malformed input is a ValidationError, never a raw JSON exception.
// -----------------------------------------------------------------------------
TEST(EngineConfigTest, RejectsMalformedDocuments) {
  EXPECT_THROW(gold::parseEngineConfig(std::string("{not json")),
               gold::ValidationError);
  EXPECT_THROW(gold::parseEngineConfig(std::string("[1, 2]")),
               gold::ValidationError);
  EXPECT_THROW(
      gold::parseEngineConfig(std::string(R"({"first_account_sequence": "x"})")),
      gold::ValidationError);
  EXPECT_THROW(gold::parseEngineConfig(std::string(
                   R"({"members": [{"id": "M", "status": "DORMANT"}]})")),
               gold::ValidationError);
  EXPECT_THROW(gold::parseEngineConfig(std::string(
                   R"({"operators": [{"address": "0x1", "roles": ["king"]}]})")),
               gold::ValidationError);
  EXPECT_THROW(gold::parseEngineConfig(std::string(R"({"account_prefix": ""})")),
               gold::ValidationError);
  EXPECT_THROW(gold::parseEngineConfig(std::string(R"({"members": [{}]})")),
               gold::ValidationError);
}

// -----------------------------------------------------------------------------
// 4. Seeding reproduces the configured registry state.
// -----------------------------------------------------------------------------
TEST(EngineConfigTest, SeedRegistry) {
  const auto config = gold::parseEngineConfig(std::string(kFullConfig));
  gold::MemberRegistry registry;
  gold::seedRegistry(config, registry);

  EXPECT_EQ(registry.memberCount(), 2u);
  EXPECT_EQ(registry.getMemberStatus("GIC-1"), MemberStatus::Active);
  EXPECT_EQ(registry.getMemberStatus("GIC-2"), MemberStatus::Suspended);
  EXPECT_EQ(registry.memberOf("0xa2"), std::optional<std::string>("GIC-1"));
  EXPECT_TRUE(registry.isInRole("0xa1", Role::Minter));
  EXPECT_FALSE(registry.isInRole("0xa2", Role::Minter));
  EXPECT_TRUE(registry.isInRole("0xvault", Role::Custodian));
  EXPECT_FALSE(registry.memberOf("0xvault").has_value());
  EXPECT_TRUE(registry.isBlacklisted("0xbad"));
}

// -----------------------------------------------------------------------------
// 5. Loading from disk; a missing file is NotFound.
// -----------------------------------------------------------------------------
TEST(EngineConfigTest, LoadFromFile) {
  const std::string path = ::testing::TempDir() + "gold_engine_config_test.json";
  {
    std::ofstream out(path);
    out << kFullConfig;
  }

  const auto config = gold::loadEngineConfig(path);
  EXPECT_EQ(config.account_ids.prefix, "VAULT-");
  std::remove(path.c_str());

  EXPECT_THROW(gold::loadEngineConfig(path), gold::NotFoundError);
}
