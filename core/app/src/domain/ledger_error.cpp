#include "gold/errors/ledger_error.hpp"

namespace gold {

const char* errorKindToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Authorization:       return "Authorization";
    case ErrorKind::MemberNotActive:     return "MemberNotActive";
    case ErrorKind::NotFound:            return "NotFound";
    case ErrorKind::InsufficientBalance: return "InsufficientBalance";
    case ErrorKind::Duplicate:           return "Duplicate";
    case ErrorKind::InvalidState:        return "InvalidState";
    case ErrorKind::Compliance:          return "Compliance";
    case ErrorKind::Validation:          return "Validation";
  }
  return "Unknown";
}

}  // namespace gold
