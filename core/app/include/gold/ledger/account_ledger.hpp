#pragma once

#include "gold/concurrent/unit_of_work.hpp"
#include "gold/domain/account.hpp"
#include "gold/domain/types.hpp"
#include "gold/ledger/ledger_write_capability.hpp"
#include "gold/registry/i_authorization_registry.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace gold {

// Optional descriptive attributes recorded on an account at creation.
struct AccountDetails {
  std::string name;
  std::string account_type;
  std::string unit;
};

// Identifier format of the ledger: prefix + sequence ("IGAN-1000").
struct AccountIdFormat {
  std::string prefix{"IGAN-"};
  std::uint64_t first_sequence{1000};
};

// -----------------------------------------------------------------------------
// AccountLedger: signed-balance bookkeeping per gold account
// -----------------------------------------------------------------------------
//
// @brief  Owns every account balance. Balances change only through
//         updateBalance (operators) or updateBalanceFromContract (wired
//         components holding a LedgerWriteCapability).
//
// @details
// Both update paths share applyDelta(), which enforces the one invariant of
// the ledger: no balance ever goes below zero. They differ only in who may
// call them:
//
//   updateBalance               caller holds Platform or Custodian role
//   updateBalanceFromContract   caller presents a LedgerWriteCapability whose
//                               holder is on the updater allowlist
//
// Account ids are allocated sequentially from AccountIdFormat and never
// reused. A createAccount that fails (or is rolled back as part of a larger
// unit of work) releases nothing, because the sequence only advances once
// the account is inserted, and the rollback restores it.
//
// Thread model:
//   Mutations run inside a UnitOfWork (exclusive commit lock). Public reads
//   take TransactionManager::readLock(). Overloads taking a UnitOfWork run
//   inside the caller's boundary and do not lock.
//
// Ownership:
//   Owned by CustodyEngine. Holds references to the TransactionManager and
//   the registry, both of which outlive it.
// -----------------------------------------------------------------------------
class AccountLedger {
 public:
  AccountLedger(TransactionManager& tm, const IAuthorizationRegistry& registry,
                AccountIdFormat id_format = {});

  AccountLedger(const AccountLedger&) = delete;
  AccountLedger& operator=(const AccountLedger&) = delete;

  // -------------------------------------------------------------------------
  // createAccount(caller, member_id, address, details)
  // -------------------------------------------------------------------------
  // @brief  Opens a zero-balance account for an active member.
  //
  // @return The allocated account id.
  //
  // @throws AuthorizationError    caller lacks the Platform role
  //         NotFoundError         member unknown to the registry
  //         MemberNotActiveError  member is not ACTIVE
  //         ValidationError       empty address
  //
  // Emits AccountCreated.
  // -------------------------------------------------------------------------
  domain::AccountId createAccount(const domain::Address& caller,
                                  const domain::MemberId& member_id,
                                  const domain::Address& address,
                                  const AccountDetails& details = {});

  // -------------------------------------------------------------------------
  // updateBalance(caller, account_id, delta, reason, ref_id)
  // -------------------------------------------------------------------------
  // @brief  Operator balance correction.
  //
  // @return The new balance.
  //
  // @throws AuthorizationError        caller lacks Platform and Custodian
  //         NotFoundError             unknown account
  //         InsufficientBalanceError  balance + delta < 0
  //
  // Emits BalanceUpdated.
  // -------------------------------------------------------------------------
  domain::Amount updateBalance(const domain::Address& caller,
                               const domain::AccountId& account_id,
                               domain::Amount delta, const std::string& reason,
                               const std::string& ref_id);

  // -------------------------------------------------------------------------
  // updateBalanceFromContract(capability, account_id, delta, reason, ref_id)
  // -------------------------------------------------------------------------
  // @brief  Component-driven balance movement. Same effect and same checks
  //         as updateBalance, authorized by capability instead of role.
  //
  // @throws AuthorizationError  holder not on the updater allowlist or the
  //                             capability was superseded
  //         NotFoundError, InsufficientBalanceError as updateBalance.
  //
  // The first overload opens its own unit of work; the second joins the
  // caller's, so its effect commits or rolls back with the caller's other
  // mutations.
  // -------------------------------------------------------------------------
  domain::Amount updateBalanceFromContract(
      const LedgerWriteCapability& capability,
      const domain::AccountId& account_id, domain::Amount delta,
      const std::string& reason, const std::string& ref_id);

  domain::Amount updateBalanceFromContract(
      const LedgerWriteCapability& capability,
      const domain::AccountId& account_id, domain::Amount delta,
      const std::string& reason, const std::string& ref_id, UnitOfWork& uow);

  // -------------------------------------------------------------------------
  // issueWriteCapability(holder)
  // -------------------------------------------------------------------------
  // @brief  Wiring-time issuance of a LedgerWriteCapability. Puts the holder
  //         on the allowlist and emits BalanceUpdaterSet.
  //
  // Re-issuing for the same holder supersedes earlier copies.
  // -------------------------------------------------------------------------
  LedgerWriteCapability issueWriteCapability(const domain::Address& holder);

  // Platform-gated allowlist toggle. Emits BalanceUpdaterSet.
  void setBalanceUpdater(const domain::Address& caller,
                         const domain::Address& holder, bool enabled);

  bool isBalanceUpdater(const domain::Address& holder) const;

  // --- Reads (never mutate) ------------------------------------------------

  // Throws NotFoundError for an unknown account.
  domain::Amount getAccountBalance(const domain::AccountId& account_id) const;
  domain::Account getAccount(const domain::AccountId& account_id) const;

  std::vector<domain::AccountId> accountsByMember(
      const domain::MemberId& member_id) const;
  std::vector<domain::AccountId> accountsByAddress(
      const domain::Address& address) const;

  std::size_t accountCount() const;

  // Lookup inside a caller's unit of work. nullptr if unknown.
  const domain::Account* findAccount(const domain::AccountId& account_id,
                                     const UnitOfWork& uow) const;

 private:
  domain::Amount applyDelta(UnitOfWork& uow,
                            const domain::AccountId& account_id,
                            domain::Amount delta, const std::string& reason,
                            const std::string& ref_id,
                            const domain::Address& updated_by,
                            bool via_capability);

  void checkCapability(const LedgerWriteCapability& capability) const;

  void setUpdater(UnitOfWork& uow, const domain::Address& holder, bool enabled,
                  const domain::Address& set_by);

  domain::AccountId formatId(std::uint64_t sequence) const;

  const domain::Account& requireAccount(
      const domain::AccountId& account_id) const;

  TransactionManager& tm_;
  const IAuthorizationRegistry& registry_;
  const AccountIdFormat id_format_;

  std::uint64_t next_sequence_;
  std::uint64_t next_capability_serial_{1};

  // Ordered by id so that listings are deterministic.
  std::map<domain::AccountId, domain::Account> accounts_;
  std::unordered_map<domain::MemberId, std::vector<domain::AccountId>>
      by_member_;
  std::unordered_map<domain::Address, std::vector<domain::AccountId>>
      by_address_;

  std::unordered_set<domain::Address> updaters_;
  std::unordered_map<domain::Address, std::uint64_t> issued_serials_;
};

}  // namespace gold
