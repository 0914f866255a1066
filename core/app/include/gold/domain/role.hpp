#pragma once

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

namespace gold {
namespace domain {

// -----------------------------------------------------------------------------
// Role: closed set of platform roles
// -----------------------------------------------------------------------------
//
// @brief  Every role an address can hold in the authorization registry. The
//         enumerator value is the bit position inside a RoleSet.
//
// @details
// Bit positions are part of the external contract and must not be
// reordered:
//
//   Refiner=0  Minter=1  Custodian=2  VaultOperator=3
//   LogisticsProvider=4  Auditor=5  Platform=6  Governance=7
// -----------------------------------------------------------------------------
enum class Role : std::uint8_t {
  Refiner = 0,
  Minter = 1,
  Custodian = 2,
  VaultOperator = 3,
  LogisticsProvider = 4,
  Auditor = 5,
  Platform = 6,
  Governance = 7,
};

const char* roleToString(Role role);

// Parses a lower-case role name ("refiner", "vault_operator", ...).
std::optional<Role> roleFromString(const std::string& name);

// -----------------------------------------------------------------------------
// RoleSet: bitset of Role values
// -----------------------------------------------------------------------------
//
// @brief  Value type holding any combination of roles.
//
// @details
// Combination is bitwise OR (operator|, with()). Membership tests come in
// two flavours: contains(role) for a single role and containsAny(set) for
// "holds at least one of". There is no implicit conversion to or from an
// integer; bits() / fromBits() exist for serialization only.
// -----------------------------------------------------------------------------
class RoleSet {
 public:
  RoleSet() = default;
  RoleSet(std::initializer_list<Role> roles);

  static RoleSet fromBits(std::uint32_t bits);

  RoleSet with(Role role) const;
  RoleSet without(Role role) const;

  bool contains(Role role) const;
  bool containsAny(const RoleSet& other) const;
  bool empty() const { return bits_ == 0; }

  std::uint32_t bits() const { return bits_; }
  std::vector<Role> roles() const;

  RoleSet operator|(const RoleSet& other) const;
  RoleSet& operator|=(const RoleSet& other);
  bool operator==(const RoleSet& other) const { return bits_ == other.bits_; }
  bool operator!=(const RoleSet& other) const { return bits_ != other.bits_; }

 private:
  static std::uint32_t mask(Role role) {
    return 1u << static_cast<std::uint32_t>(role);
  }

  std::uint32_t bits_{0};
};

inline RoleSet operator|(Role a, Role b) { return RoleSet{a, b}; }

}  // namespace domain
}  // namespace gold
