#pragma once

#include <stdexcept>
#include <string>

namespace gold {

// -----------------------------------------------------------------------------
// ErrorKind: failure taxonomy shared by every component
// -----------------------------------------------------------------------------
//
// @details
// Every failure is terminal for the triggering call. No component retries
// or compensates: the failing operation throws before its UnitOfWork
// commits, and the UnitOfWork rolls back whatever the operation had staged.
// -----------------------------------------------------------------------------
enum class ErrorKind {
  Authorization,        // Role or ownership check failed
  MemberNotActive,      // Member is not in ACTIVE status
  NotFound,             // Unknown account, asset, order or member
  InsufficientBalance,  // Would drive a balance negative / caller lacks the bar
  Duplicate,            // Warrant, txRef or member id reused
  InvalidState,         // Custody lock, terminal asset, order in wrong phase
  Compliance,           // Blacklisted party
  Validation,           // Malformed input
};

const char* errorKindToString(ErrorKind kind);

// -----------------------------------------------------------------------------
// LedgerError: base of every exception thrown by the engine
// -----------------------------------------------------------------------------
class LedgerError : public std::runtime_error {
 public:
  LedgerError(ErrorKind kind, const std::string& message)
      : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const noexcept { return kind_; }

 private:
  ErrorKind kind_;
};

class AuthorizationError : public LedgerError {
 public:
  explicit AuthorizationError(const std::string& message)
      : LedgerError(ErrorKind::Authorization, message) {}
};

class MemberNotActiveError : public LedgerError {
 public:
  explicit MemberNotActiveError(const std::string& message)
      : LedgerError(ErrorKind::MemberNotActive, message) {}
};

class NotFoundError : public LedgerError {
 public:
  explicit NotFoundError(const std::string& message)
      : LedgerError(ErrorKind::NotFound, message) {}
};

class InsufficientBalanceError : public LedgerError {
 public:
  explicit InsufficientBalanceError(const std::string& message)
      : LedgerError(ErrorKind::InsufficientBalance, message) {}
};

class DuplicateError : public LedgerError {
 public:
  explicit DuplicateError(const std::string& message)
      : LedgerError(ErrorKind::Duplicate, message) {}
};

class InvalidStateError : public LedgerError {
 public:
  explicit InvalidStateError(const std::string& message)
      : LedgerError(ErrorKind::InvalidState, message) {}
};

class ComplianceError : public LedgerError {
 public:
  explicit ComplianceError(const std::string& message)
      : LedgerError(ErrorKind::Compliance, message) {}
};

class ValidationError : public LedgerError {
 public:
  explicit ValidationError(const std::string& message)
      : LedgerError(ErrorKind::Validation, message) {}
};

}  // namespace gold
