#include "gold/ledger/account_ledger.hpp"
#include "gold/errors/ledger_error.hpp"

#include <algorithm>
#include <iostream>
#include <limits>
#include <utility>

namespace gold {

namespace {

// Removes the last occurrence of `id` from an index bucket, erasing the
// bucket when it becomes empty.
template <typename Map>
void eraseFromIndex(Map& index, const typename Map::key_type& key,
                    const domain::AccountId& id) {
  auto it = index.find(key);
  if (it == index.end()) {
    return;
  }
  auto& ids = it->second;
  auto pos = std::find(ids.rbegin(), ids.rend(), id);
  if (pos != ids.rend()) {
    ids.erase(std::next(pos).base());
  }
  if (ids.empty()) {
    index.erase(it);
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
AccountLedger::AccountLedger(TransactionManager& tm,
                             const IAuthorizationRegistry& registry,
                             AccountIdFormat id_format)
    : tm_(tm),
      registry_(registry),
      id_format_(std::move(id_format)),
      next_sequence_(id_format_.first_sequence) {}

// -----------------------------------------------------------------------------
// createAccount
// -----------------------------------------------------------------------------
domain::AccountId AccountLedger::createAccount(const domain::Address& caller,
                                               const domain::MemberId& member_id,
                                               const domain::Address& address,
                                               const AccountDetails& details) {
  if (!registry_.isInRole(caller, domain::Role::Platform)) {
    throw AuthorizationError("createAccount requires the platform role");
  }
  if (address.empty()) {
    throw ValidationError("account address must not be empty");
  }
  if (registry_.getMemberStatus(member_id) != domain::MemberStatus::Active) {
    throw MemberNotActiveError("member is not active: " + member_id);
  }

  UnitOfWork uow = tm_.begin();

  const std::uint64_t sequence = next_sequence_;
  domain::AccountId id = formatId(sequence);
  if (accounts_.count(id) != 0) {
    throw DuplicateError("account id already allocated: " + id);
  }

  domain::Account account;
  account.id = id;
  account.member_id = member_id;
  account.address = address;
  account.name = details.name;
  account.account_type = details.account_type;
  account.unit = details.unit;
  account.created_at_ms = uow.now_ms();
  account.updated_at_ms = uow.now_ms();

  accounts_.emplace(id, account);
  by_member_[member_id].push_back(id);
  by_address_[address].push_back(id);
  ++next_sequence_;

  uow.onRollback([this, id, member_id, address, sequence] {
    accounts_.erase(id);
    eraseFromIndex(by_member_, member_id, id);
    eraseFromIndex(by_address_, address, id);
    next_sequence_ = sequence;
  });

  AccountCreatedEvent event;
  event.account_id = id;
  event.member_id = member_id;
  event.address = address;
  event.name = details.name;
  event.account_type = details.account_type;
  event.unit = details.unit;
  event.created_by = caller;
  event.timestamp = uow.timestamp();
  uow.stage(std::move(event));

  uow.commit();

  std::cout << "[AccountLedger] created account=" << id
            << " member=" << member_id << " address=" << address << "\n";
  return id;
}

// -----------------------------------------------------------------------------
// updateBalance: operator path
// -----------------------------------------------------------------------------
domain::Amount AccountLedger::updateBalance(const domain::Address& caller,
                                            const domain::AccountId& account_id,
                                            domain::Amount delta,
                                            const std::string& reason,
                                            const std::string& ref_id) {
  const domain::RoleSet allowed{domain::Role::Platform,
                                domain::Role::Custodian};
  if (!registry_.hasAnyRole(caller, allowed)) {
    throw AuthorizationError(
        "updateBalance requires the platform or custodian role");
  }

  UnitOfWork uow = tm_.begin();
  domain::Amount balance =
      applyDelta(uow, account_id, delta, reason, ref_id, caller, false);
  uow.commit();
  return balance;
}

// -----------------------------------------------------------------------------
// updateBalanceFromContract: capability path
// -----------------------------------------------------------------------------
domain::Amount AccountLedger::updateBalanceFromContract(
    const LedgerWriteCapability& capability,
    const domain::AccountId& account_id, domain::Amount delta,
    const std::string& reason, const std::string& ref_id) {
  UnitOfWork uow = tm_.begin();
  domain::Amount balance = updateBalanceFromContract(
      capability, account_id, delta, reason, ref_id, uow);
  uow.commit();
  return balance;
}

domain::Amount AccountLedger::updateBalanceFromContract(
    const LedgerWriteCapability& capability,
    const domain::AccountId& account_id, domain::Amount delta,
    const std::string& reason, const std::string& ref_id, UnitOfWork& uow) {
  checkCapability(capability);
  return applyDelta(uow, account_id, delta, reason, ref_id,
                    capability.holder(), true);
}

// -----------------------------------------------------------------------------
// applyDelta: shared invariant-checked core of both update paths
// -----------------------------------------------------------------------------
domain::Amount AccountLedger::applyDelta(UnitOfWork& uow,
                                         const domain::AccountId& account_id,
                                         domain::Amount delta,
                                         const std::string& reason,
                                         const std::string& ref_id,
                                         const domain::Address& updated_by,
                                         bool via_capability) {
  auto it = accounts_.find(account_id);
  if (it == accounts_.end()) {
    throw NotFoundError("account not found: " + account_id);
  }

  domain::Account& account = it->second;
  const domain::Amount previous = account.balance;

  if (delta > 0 &&
      previous > std::numeric_limits<domain::Amount>::max() - delta) {
    throw ValidationError("balance overflow on account " + account_id);
  }
  if (previous + delta < 0) {
    throw InsufficientBalanceError(
        "insufficient balance on " + account_id + ": balance=" +
        std::to_string(previous) + " delta=" + std::to_string(delta));
  }

  domain::Account before = account;

  account.balance = previous + delta;
  account.last_reason = reason;
  account.last_ref_id = ref_id;
  account.updated_at_ms = uow.now_ms();

  uow.onRollback([this, before] { accounts_[before.id] = before; });

  BalanceUpdatedEvent event;
  event.account_id = account_id;
  event.delta = delta;
  event.new_balance = account.balance;
  event.reason = reason;
  event.ref_id = ref_id;
  event.updated_by = updated_by;
  event.via_capability = via_capability;
  event.timestamp = uow.timestamp();
  uow.stage(std::move(event));

  return account.balance;
}

// -----------------------------------------------------------------------------
// Capabilities and allowlist
// -----------------------------------------------------------------------------
LedgerWriteCapability AccountLedger::issueWriteCapability(
    const domain::Address& holder) {
  if (holder.empty()) {
    throw ValidationError("capability holder must not be empty");
  }

  UnitOfWork uow = tm_.begin();

  const std::uint64_t serial = next_capability_serial_++;
  auto previous = issued_serials_.find(holder);
  const bool had_previous = previous != issued_serials_.end();
  const std::uint64_t previous_serial = had_previous ? previous->second : 0;
  issued_serials_[holder] = serial;

  uow.onRollback([this, holder, had_previous, previous_serial] {
    --next_capability_serial_;
    if (had_previous) {
      issued_serials_[holder] = previous_serial;
    } else {
      issued_serials_.erase(holder);
    }
  });

  setUpdater(uow, holder, true, "engine");
  uow.commit();

  std::cout << "[AccountLedger] issued write capability to " << holder
            << " (serial " << serial << ")\n";
  return LedgerWriteCapability(holder, serial);
}

void AccountLedger::setBalanceUpdater(const domain::Address& caller,
                                      const domain::Address& holder,
                                      bool enabled) {
  if (!registry_.isInRole(caller, domain::Role::Platform)) {
    throw AuthorizationError("setBalanceUpdater requires the platform role");
  }

  UnitOfWork uow = tm_.begin();
  setUpdater(uow, holder, enabled, caller);
  uow.commit();
}

void AccountLedger::setUpdater(UnitOfWork& uow, const domain::Address& holder,
                               bool enabled, const domain::Address& set_by) {
  const bool was_enabled = updaters_.count(holder) != 0;
  if (enabled) {
    updaters_.insert(holder);
  } else {
    updaters_.erase(holder);
  }

  uow.onRollback([this, holder, was_enabled] {
    if (was_enabled) {
      updaters_.insert(holder);
    } else {
      updaters_.erase(holder);
    }
  });

  BalanceUpdaterSetEvent event;
  event.updater = holder;
  event.enabled = enabled;
  event.set_by = set_by;
  event.timestamp = uow.timestamp();
  uow.stage(std::move(event));
}

void AccountLedger::checkCapability(
    const LedgerWriteCapability& capability) const {
  if (updaters_.count(capability.holder()) == 0) {
    throw AuthorizationError("balance updater not allowed: " +
                             capability.holder());
  }
  auto it = issued_serials_.find(capability.holder());
  if (it == issued_serials_.end() || it->second != capability.serial()) {
    throw AuthorizationError("ledger write capability superseded for " +
                             capability.holder());
  }
}

bool AccountLedger::isBalanceUpdater(const domain::Address& holder) const {
  auto lock = tm_.readLock();
  return updaters_.count(holder) != 0;
}

// -----------------------------------------------------------------------------
// Reads
// -----------------------------------------------------------------------------
domain::Amount AccountLedger::getAccountBalance(
    const domain::AccountId& account_id) const {
  auto lock = tm_.readLock();
  return requireAccount(account_id).balance;
}

domain::Account AccountLedger::getAccount(
    const domain::AccountId& account_id) const {
  auto lock = tm_.readLock();
  return requireAccount(account_id);
}

std::vector<domain::AccountId> AccountLedger::accountsByMember(
    const domain::MemberId& member_id) const {
  auto lock = tm_.readLock();
  auto it = by_member_.find(member_id);
  if (it == by_member_.end()) {
    return {};
  }
  return it->second;
}

std::vector<domain::AccountId> AccountLedger::accountsByAddress(
    const domain::Address& address) const {
  auto lock = tm_.readLock();
  auto it = by_address_.find(address);
  if (it == by_address_.end()) {
    return {};
  }
  return it->second;
}

std::size_t AccountLedger::accountCount() const {
  auto lock = tm_.readLock();
  return accounts_.size();
}

const domain::Account* AccountLedger::findAccount(
    const domain::AccountId& account_id, const UnitOfWork& /*uow*/) const {
  auto it = accounts_.find(account_id);
  return it == accounts_.end() ? nullptr : &it->second;
}

const domain::Account& AccountLedger::requireAccount(
    const domain::AccountId& account_id) const {
  auto it = accounts_.find(account_id);
  if (it == accounts_.end()) {
    throw NotFoundError("account not found: " + account_id);
  }
  return it->second;
}

domain::AccountId AccountLedger::formatId(std::uint64_t sequence) const {
  return id_format_.prefix + std::to_string(sequence);
}

}  // namespace gold
