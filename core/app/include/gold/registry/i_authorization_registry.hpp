#pragma once

#include "gold/domain/member_status.hpp"
#include "gold/domain/role.hpp"
#include "gold/domain/types.hpp"

#include <optional>

namespace gold {

// -----------------------------------------------------------------------------
// IAuthorizationRegistry: role, status and compliance oracle
// -----------------------------------------------------------------------------
//
// @brief  Read-only view of member identity, role assignments and the address
//         blacklist, consulted by every core component.
//
// @details
// The ledger, custody and settlement components never mutate the registry.
// They ask three questions before acting:
//   - does the caller hold a role?            isInRole / rolesOf
//   - is the member allowed to transact?      getMemberStatus
//   - is an address barred by compliance?     isBlacklisted
// memberOf() maps an address to the member it was linked to, which is how
// order initiators and counterparties are recognised.
//
// Implementations must be safe for concurrent reads.
// -----------------------------------------------------------------------------
class IAuthorizationRegistry {
 public:
  virtual ~IAuthorizationRegistry() = default;

  virtual bool isInRole(const domain::Address& address,
                        domain::Role role) const = 0;

  virtual domain::RoleSet rolesOf(const domain::Address& address) const = 0;

  // Throws NotFoundError for an unknown member.
  virtual domain::MemberStatus getMemberStatus(
      const domain::MemberId& member_id) const = 0;

  virtual std::optional<domain::MemberId> memberOf(
      const domain::Address& address) const = 0;

  virtual bool isBlacklisted(const domain::Address& address) const = 0;

  // True if the address holds at least one role in `any_of`.
  bool hasAnyRole(const domain::Address& address,
                  const domain::RoleSet& any_of) const {
    return rolesOf(address).containsAny(any_of);
  }
};

}  // namespace gold
