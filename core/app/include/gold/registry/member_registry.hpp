#pragma once

#include "gold/domain/member_status.hpp"
#include "gold/domain/role.hpp"
#include "gold/domain/types.hpp"
#include "gold/registry/i_authorization_registry.hpp"

#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace gold {

// Registered participant as seen by the registry.
struct Member {
  domain::MemberId id;
  std::string name;
  std::string country;
  domain::MemberStatus status{domain::MemberStatus::Pending};
};

// -----------------------------------------------------------------------------
// MemberRegistry: in-memory IAuthorizationRegistry
// -----------------------------------------------------------------------------
//
// @brief  Holds members, address links, role bitsets and the blacklist.
//
// @details
// The registry is an external collaborator of the core: it is populated at
// start-up from EngineConfig (and directly by tests) and then only read.
// Setup operations are therefore not transactional and emit no audit events;
// they log to stdout.
//
// Thread model:
//   All methods are safe from any thread. A std::shared_mutex lets the core
//   query concurrently while setup writes take the exclusive side.
// -----------------------------------------------------------------------------
class MemberRegistry final : public IAuthorizationRegistry {
 public:
  MemberRegistry() = default;

  MemberRegistry(const MemberRegistry&) = delete;
  MemberRegistry& operator=(const MemberRegistry&) = delete;

  // Registers a member in PENDING status. Throws DuplicateError if the id
  // is taken and ValidationError if it is empty.
  void registerMember(const domain::MemberId& id, const std::string& name,
                      const std::string& country);

  // Throws NotFoundError for an unknown member.
  void setMemberStatus(const domain::MemberId& id,
                       domain::MemberStatus status);

  // Links an address to a member (one member per address; relinking moves
  // the address). Throws NotFoundError for an unknown member.
  void linkAddress(const domain::Address& address,
                   const domain::MemberId& member_id);

  // Adds the given roles to whatever the address already holds.
  void assignRoles(const domain::Address& address, domain::RoleSet roles);
  void revokeRoles(const domain::Address& address, domain::RoleSet roles);

  void setBlacklisted(const domain::Address& address, bool blacklisted);

  std::optional<Member> member(const domain::MemberId& id) const;
  std::vector<domain::Address> addressesOf(const domain::MemberId& id) const;
  std::size_t memberCount() const;

  // --- IAuthorizationRegistry ----------------------------------------------
  bool isInRole(const domain::Address& address,
                domain::Role role) const override;
  domain::RoleSet rolesOf(const domain::Address& address) const override;
  domain::MemberStatus getMemberStatus(
      const domain::MemberId& member_id) const override;
  std::optional<domain::MemberId> memberOf(
      const domain::Address& address) const override;
  bool isBlacklisted(const domain::Address& address) const override;

 private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<domain::MemberId, Member> members_;
  std::unordered_map<domain::Address, domain::MemberId> address_links_;
  std::unordered_map<domain::Address, domain::RoleSet> roles_;
  std::unordered_set<domain::Address> blacklist_;
};

}  // namespace gold
