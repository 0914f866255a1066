#include "gold/domain/role.hpp"

namespace gold {
namespace domain {

namespace {

constexpr Role kAllRoles[] = {
    Role::Refiner,       Role::Minter,  Role::Custodian,
    Role::VaultOperator, Role::LogisticsProvider,
    Role::Auditor,       Role::Platform, Role::Governance,
};

constexpr std::uint32_t kValidBits = 0xFFu;

}  // namespace

const char* roleToString(Role role) {
  switch (role) {
    case Role::Refiner:           return "refiner";
    case Role::Minter:            return "minter";
    case Role::Custodian:         return "custodian";
    case Role::VaultOperator:     return "vault_operator";
    case Role::LogisticsProvider: return "logistics_provider";
    case Role::Auditor:           return "auditor";
    case Role::Platform:          return "platform";
    case Role::Governance:        return "governance";
  }
  return "unknown";
}

std::optional<Role> roleFromString(const std::string& name) {
  for (Role role : kAllRoles) {
    if (name == roleToString(role)) {
      return role;
    }
  }
  return std::nullopt;
}

RoleSet::RoleSet(std::initializer_list<Role> roles) {
  for (Role role : roles) {
    bits_ |= mask(role);
  }
}

RoleSet RoleSet::fromBits(std::uint32_t bits) {
  RoleSet set;
  // Bits above Governance have no meaning and are dropped.
  set.bits_ = bits & kValidBits;
  return set;
}

RoleSet RoleSet::with(Role role) const {
  RoleSet copy = *this;
  copy.bits_ |= mask(role);
  return copy;
}

RoleSet RoleSet::without(Role role) const {
  RoleSet copy = *this;
  copy.bits_ &= ~mask(role);
  return copy;
}

bool RoleSet::contains(Role role) const { return (bits_ & mask(role)) != 0; }

bool RoleSet::containsAny(const RoleSet& other) const {
  return (bits_ & other.bits_) != 0;
}

std::vector<Role> RoleSet::roles() const {
  std::vector<Role> out;
  for (Role role : kAllRoles) {
    if (contains(role)) {
      out.push_back(role);
    }
  }
  return out;
}

RoleSet RoleSet::operator|(const RoleSet& other) const {
  return fromBits(bits_ | other.bits_);
}

RoleSet& RoleSet::operator|=(const RoleSet& other) {
  bits_ |= other.bits_;
  return *this;
}

}  // namespace domain
}  // namespace gold
