#pragma once

namespace gold {
namespace domain {

// Lifecycle of a registered member. Only Active members may open accounts
// or take part in a settlement order.
enum class MemberStatus {
  Pending,
  Active,
  Suspended,
  Terminated,
};

inline const char* memberStatusToString(MemberStatus s) {
  switch (s) {
    case MemberStatus::Pending:    return "PENDING";
    case MemberStatus::Active:     return "ACTIVE";
    case MemberStatus::Suspended:  return "SUSPENDED";
    case MemberStatus::Terminated: return "TERMINATED";
  }
  return "UNKNOWN";
}

}  // namespace domain
}  // namespace gold
