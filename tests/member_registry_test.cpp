// =============================================================================
// member_registry_test.cpp
// =============================================================================
// Unit tests for gold::domain::RoleSet and gold::MemberRegistry.
//
// Validates:
//   - Role bit positions are the fixed external contract
//   - RoleSet combination, membership and name parsing
//   - Member lifecycle, address links, role grants and the blacklist
// =============================================================================

#include "gold/domain/role.hpp"
#include "gold/errors/ledger_error.hpp"
#include "gold/registry/member_registry.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

using gold::domain::Role;
using gold::domain::RoleSet;

// -----------------------------------------------------------------------------
// 1. Bit positions never move.
// Why: Role bitmasks are exchanged with external registries; reordering the
//      enum would silently grant the wrong permissions.
// -----------------------------------------------------------------------------
TEST(RoleSetTest, BitPositionsMatchRegistryContract) {
  EXPECT_EQ(RoleSet{Role::Refiner}.bits(), 1u << 0);
  EXPECT_EQ(RoleSet{Role::Minter}.bits(), 1u << 1);
  EXPECT_EQ(RoleSet{Role::Custodian}.bits(), 1u << 2);
  EXPECT_EQ(RoleSet{Role::VaultOperator}.bits(), 1u << 3);
  EXPECT_EQ(RoleSet{Role::LogisticsProvider}.bits(), 1u << 4);
  EXPECT_EQ(RoleSet{Role::Auditor}.bits(), 1u << 5);
  EXPECT_EQ(RoleSet{Role::Platform}.bits(), 1u << 6);
  EXPECT_EQ(RoleSet{Role::Governance}.bits(), 1u << 7);
}

// -----------------------------------------------------------------------------
// 2. Combination and membership tests.
// -----------------------------------------------------------------------------
TEST(RoleSetTest, CombineAndTestMembership) {
  RoleSet set = Role::Refiner | Role::Minter;
  EXPECT_TRUE(set.contains(Role::Refiner));
  EXPECT_TRUE(set.contains(Role::Minter));
  EXPECT_FALSE(set.contains(Role::Platform));

  EXPECT_TRUE(set.containsAny(RoleSet{Role::Minter, Role::Platform}));
  EXPECT_FALSE(set.containsAny(RoleSet{Role::Custodian, Role::Platform}));
  EXPECT_FALSE(set.containsAny(RoleSet{}));

  set |= RoleSet{Role::Auditor};
  EXPECT_EQ(set, (RoleSet{Role::Refiner, Role::Minter, Role::Auditor}));
  EXPECT_EQ(set.without(Role::Minter),
            (RoleSet{Role::Refiner, Role::Auditor}));
  EXPECT_EQ(set.roles().size(), 3u);
}

// -----------------------------------------------------------------------------
// 3. fromBits drops undefined bits; names parse both ways.
// -----------------------------------------------------------------------------
TEST(RoleSetTest, FromBitsAndNames) {
  EXPECT_EQ(RoleSet::fromBits(0x1FFu).bits(), 0xFFu);
  EXPECT_TRUE(RoleSet{}.empty());

  for (Role role : RoleSet::fromBits(0xFFu).roles()) {
    auto parsed = gold::domain::roleFromString(gold::domain::roleToString(role));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, role);
  }
  EXPECT_EQ(gold::domain::roleFromString("vault_operator"),
            Role::VaultOperator);
  EXPECT_FALSE(gold::domain::roleFromString("Platform").has_value());
}

// =============================================================================
// MemberRegistry
// =============================================================================
class MemberRegistryTest : public ::testing::Test {
 protected:
  gold::MemberRegistry registry;
};

// -----------------------------------------------------------------------------
// 4. Members start PENDING and move through setMemberStatus.
// Why: A freshly registered member must not be able to open accounts until
//      explicitly activated.
// -----------------------------------------------------------------------------
TEST_F(MemberRegistryTest, MemberLifecycle) {
  registry.registerMember("GIC-1", "Alpine Refinery", "CH");
  EXPECT_EQ(registry.getMemberStatus("GIC-1"),
            gold::domain::MemberStatus::Pending);

  registry.setMemberStatus("GIC-1", gold::domain::MemberStatus::Active);
  EXPECT_EQ(registry.getMemberStatus("GIC-1"),
            gold::domain::MemberStatus::Active);

  auto member = registry.member("GIC-1");
  ASSERT_TRUE(member.has_value());
  EXPECT_EQ(member->name, "Alpine Refinery");
  EXPECT_EQ(member->country, "CH");
  EXPECT_EQ(registry.memberCount(), 1u);
}

// -----------------------------------------------------------------------------
// 5. Duplicate, unknown and empty ids are rejected with the right kind.
// -----------------------------------------------------------------------------
TEST_F(MemberRegistryTest, RejectsBadMemberOperations) {
  registry.registerMember("GIC-1", "A", "CH");

  EXPECT_THROW(registry.registerMember("GIC-1", "B", "GB"),
               gold::DuplicateError);
  EXPECT_THROW(registry.registerMember("", "B", "GB"), gold::ValidationError);
  EXPECT_THROW(registry.getMemberStatus("GIC-404"), gold::NotFoundError);
  EXPECT_THROW(registry.setMemberStatus("GIC-404",
                                        gold::domain::MemberStatus::Active),
               gold::NotFoundError);
  EXPECT_THROW(registry.linkAddress("0xa", "GIC-404"), gold::NotFoundError);
  EXPECT_FALSE(registry.member("GIC-404").has_value());
}

// -----------------------------------------------------------------------------
// 6. Address links map addresses back to members; relinking moves them.
// Why: Order initiators and counterparties are recognised through memberOf.
// -----------------------------------------------------------------------------
TEST_F(MemberRegistryTest, AddressLinks) {
  registry.registerMember("GIC-1", "A", "CH");
  registry.registerMember("GIC-2", "B", "GB");

  registry.linkAddress("0xa1", "GIC-1");
  registry.linkAddress("0xa2", "GIC-1");
  EXPECT_EQ(registry.memberOf("0xa1"), std::optional<std::string>("GIC-1"));
  EXPECT_FALSE(registry.memberOf("0xzz").has_value());

  auto addresses = registry.addressesOf("GIC-1");
  std::sort(addresses.begin(), addresses.end());
  EXPECT_EQ(addresses, (std::vector<std::string>{"0xa1", "0xa2"}));

  registry.linkAddress("0xa2", "GIC-2");
  EXPECT_EQ(registry.memberOf("0xa2"), std::optional<std::string>("GIC-2"));
  EXPECT_EQ(registry.addressesOf("GIC-1").size(), 1u);
}

// -----------------------------------------------------------------------------
// 7. Role grants accumulate; revocation removes only what is named.
// -----------------------------------------------------------------------------
TEST_F(MemberRegistryTest, AssignAndRevokeRoles) {
  registry.assignRoles("0xops", RoleSet{Role::Custodian});
  registry.assignRoles("0xops", RoleSet{Role::Platform});

  EXPECT_TRUE(registry.isInRole("0xops", Role::Custodian));
  EXPECT_TRUE(registry.isInRole("0xops", Role::Platform));
  EXPECT_TRUE(registry.hasAnyRole("0xops", Role::Refiner | Role::Platform));

  registry.revokeRoles("0xops", RoleSet{Role::Platform});
  EXPECT_FALSE(registry.isInRole("0xops", Role::Platform));
  EXPECT_TRUE(registry.isInRole("0xops", Role::Custodian));

  EXPECT_TRUE(registry.rolesOf("0xnobody").empty());
  EXPECT_NO_THROW(registry.revokeRoles("0xnobody", RoleSet{Role::Auditor}));
}

// -----------------------------------------------------------------------------
// 8. Blacklist add and remove.
// -----------------------------------------------------------------------------
TEST_F(MemberRegistryTest, Blacklist) {
  EXPECT_FALSE(registry.isBlacklisted("0xbad"));
  registry.setBlacklisted("0xbad", true);
  EXPECT_TRUE(registry.isBlacklisted("0xbad"));
  registry.setBlacklisted("0xbad", false);
  EXPECT_FALSE(registry.isBlacklisted("0xbad"));
}
