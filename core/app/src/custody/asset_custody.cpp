#include "gold/custody/asset_custody.hpp"
#include "gold/errors/ledger_error.hpp"

#include <iostream>
#include <limits>
#include <utility>

namespace gold {

namespace {

const domain::RoleSet kMintRoles{domain::Role::Refiner, domain::Role::Minter};

const domain::RoleSet kStatusOperatorRoles{
    domain::Role::Custodian, domain::Role::VaultOperator,
    domain::Role::LogisticsProvider, domain::Role::Platform};

std::string tokenRef(domain::TokenId token_id) {
  return std::to_string(token_id);
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
AssetCustody::AssetCustody(TransactionManager& tm,
                           const IAuthorizationRegistry& registry,
                           AccountLedger& ledger,
                           LedgerWriteCapability ledger_capability,
                           CustodyOptions options)
    : tm_(tm),
      registry_(registry),
      ledger_(ledger),
      ledger_capability_(std::move(ledger_capability)),
      options_(options) {}

// -----------------------------------------------------------------------------
// mint(): asset insert + ledger +1 under one unit of work
// -----------------------------------------------------------------------------
domain::TokenId AssetCustody::mint(const domain::Address& caller,
                                   const MintRequest& request) {
  if (!registry_.hasAnyRole(caller, kMintRoles)) {
    throw AuthorizationError("mint requires the refiner or minter role");
  }
  if (request.owner.empty() || request.account_id.empty() ||
      request.warrant_id.empty()) {
    throw ValidationError("mint requires owner, account id and warrant id");
  }
  if (request.weight <= 0) {
    throw ValidationError("weight must be positive");
  }
  if (request.weight >
      std::numeric_limits<domain::Amount>::max() / domain::kFinenessScale) {
    throw ValidationError("weight out of range: " +
                          std::to_string(request.weight));
  }
  if (request.fineness <= 0 || request.fineness > domain::kFinenessScale) {
    throw ValidationError("fineness must be within 1.." +
                          std::to_string(domain::kFinenessScale));
  }

  UnitOfWork uow = tm_.begin();

  if (by_warrant_.count(request.warrant_id) != 0) {
    throw DuplicateError("warrant already used: " + request.warrant_id);
  }

  const domain::TokenId token_id = next_token_id_;

  domain::Asset asset;
  asset.token_id = token_id;
  asset.serial_number = request.serial_number;
  asset.refiner = request.refiner;
  asset.weight = request.weight;
  asset.fineness = request.fineness;
  asset.fine_weight =
      request.weight * request.fineness / domain::kFinenessScale;
  asset.product_type = request.product_type;
  asset.certificate_hash = request.certificate_hash;
  asset.member_id = request.member_id;
  asset.certified = request.certified;
  asset.warrant_id = request.warrant_id;
  asset.owner = request.owner;
  asset.status = domain::AssetStatus::Registered;
  asset.mint_account_id = request.account_id;
  asset.minted_at_ms = uow.now_ms();
  asset.updated_at_ms = uow.now_ms();

  assets_.emplace(token_id, asset);
  by_warrant_.emplace(request.warrant_id, token_id);
  owned_[request.owner].insert(token_id);
  ++next_token_id_;

  uow.onRollback([this, token_id, warrant = request.warrant_id,
                  owner = request.owner] {
    assets_.erase(token_id);
    by_warrant_.erase(warrant);
    auto it = owned_.find(owner);
    if (it != owned_.end()) {
      it->second.erase(token_id);
      if (it->second.empty()) {
        owned_.erase(it);
      }
    }
    next_token_id_ = token_id;
  });

  AssetMintedEvent minted;
  minted.token_id = token_id;
  minted.serial_number = asset.serial_number;
  minted.refiner = asset.refiner;
  minted.weight = asset.weight;
  minted.fine_weight = asset.fine_weight;
  minted.owner = asset.owner;
  minted.account_id = asset.mint_account_id;
  minted.warrant_id = asset.warrant_id;
  minted.minted_by = caller;
  minted.timestamp = uow.timestamp();
  uow.stage(std::move(minted));

  WarrantLinkedEvent linked;
  linked.warrant_id = asset.warrant_id;
  linked.token_id = token_id;
  linked.owner = asset.owner;
  linked.timestamp = uow.timestamp();
  uow.stage(std::move(linked));

  ledger_.updateBalanceFromContract(ledger_capability_, request.account_id, 1,
                                    "MINT", tokenRef(token_id), uow);

  uow.commit();

  std::cout << "[AssetCustody] minted token_id=" << token_id
            << " warrant=" << request.warrant_id
            << " account=" << request.account_id << "\n";
  return token_id;
}

// -----------------------------------------------------------------------------
// updateStatus()
// -----------------------------------------------------------------------------
void AssetCustody::updateStatus(const domain::Address& caller,
                                domain::TokenId token_id,
                                domain::AssetStatus new_status,
                                const std::string& reason) {
  UnitOfWork uow = tm_.begin();

  domain::Asset& asset = requireAsset(token_id);

  const bool is_owner = asset.owner == caller;
  const bool is_operator = options_.allow_operator_status_updates &&
                           registry_.hasAnyRole(caller, kStatusOperatorRoles);
  if (!is_owner && !is_operator) {
    throw AuthorizationError("updateStatus: caller is neither owner of token " +
                             tokenRef(token_id) + " nor an asset operator");
  }

  requireNotBurned(asset);
  if (new_status == domain::AssetStatus::Burned) {
    throw InvalidStateError("BURNED is reachable only through burn()");
  }

  journal(uow, asset);
  setStatus(uow, asset, new_status, reason, caller);
  uow.commit();
}

// -----------------------------------------------------------------------------
// updateCustodyBatch()
// -----------------------------------------------------------------------------
void AssetCustody::updateCustodyBatch(
    const domain::Address& caller,
    const std::vector<domain::TokenId>& token_ids,
    const domain::Address& new_custodian, const std::string& method) {
  if (!registry_.isInRole(caller, domain::Role::Custodian)) {
    throw AuthorizationError("updateCustodyBatch requires the custodian role");
  }
  if (token_ids.empty()) {
    throw ValidationError("updateCustodyBatch requires at least one token");
  }
  if (new_custodian.empty()) {
    throw ValidationError("new custodian must not be empty");
  }

  UnitOfWork uow = tm_.begin();

  for (domain::TokenId token_id : token_ids) {
    domain::Asset& asset = requireAsset(token_id);
    requireNotBurned(asset);

    journal(uow, asset);

    CustodyChangedEvent event;
    event.token_id = token_id;
    event.from_custodian = asset.custodian;
    event.to_custodian = new_custodian;
    event.method = method;
    event.changed_by = caller;
    event.timestamp = uow.timestamp();

    asset.custodian = new_custodian;
    asset.status = domain::AssetStatus::InTransit;
    asset.status_reason = method;
    asset.updated_at_ms = uow.now_ms();

    uow.stage(std::move(event));
  }

  uow.commit();

  std::cout << "[AssetCustody] " << token_ids.size()
            << " token(s) in transit under custodian " << new_custodian
            << "\n";
}

// -----------------------------------------------------------------------------
// burn(): terminal status + ledger -1 against the mint-time account
// -----------------------------------------------------------------------------
void AssetCustody::burn(const domain::Address& caller, domain::TokenId token_id,
                        const domain::AccountId& account_id,
                        const std::string& reason) {
  if (!registry_.hasAnyRole(caller, kMintRoles)) {
    throw AuthorizationError("burn requires the refiner or minter role");
  }

  UnitOfWork uow = tm_.begin();

  domain::Asset& asset = requireAsset(token_id);
  requireNotBurned(asset);

  if (!account_id.empty() && account_id != asset.mint_account_id) {
    std::cerr << "[AssetCustody] burn of token " << token_id
              << " names account " << account_id << "; debiting mint account "
              << asset.mint_account_id << "\n";
  }

  journal(uow, asset);
  setStatus(uow, asset, domain::AssetStatus::Burned, reason, caller);

  const domain::Address holder = asset.owner;
  auto owned = owned_.find(holder);
  if (owned != owned_.end()) {
    owned->second.erase(token_id);
    if (owned->second.empty()) owned_.erase(owned);
  }
  uow.onRollback([this, holder, token_id] { owned_[holder].insert(token_id); });

  AssetBurnedEvent event;
  event.token_id = token_id;
  event.reason = reason;
  event.owner = asset.owner;
  event.account_id = asset.mint_account_id;
  event.burned_by = caller;
  event.timestamp = uow.timestamp();
  uow.stage(std::move(event));

  ledger_.updateBalanceFromContract(ledger_capability_, asset.mint_account_id,
                                    -1, reason, tokenRef(token_id), uow);

  uow.commit();

  std::cout << "[AssetCustody] burned token_id=" << token_id << "\n";
}

// -----------------------------------------------------------------------------
// transfer(): ordinary single-bar transfer
// -----------------------------------------------------------------------------
void AssetCustody::transfer(const domain::Address& caller,
                            const domain::Address& from,
                            const domain::Address& to,
                            domain::TokenId token_id, domain::Amount quantity) {
  if (to.empty()) {
    throw ValidationError("transfer recipient must not be empty");
  }
  if (quantity != 1) {
    throw ValidationError("a bar transfers with quantity 1, got " +
                          std::to_string(quantity));
  }

  UnitOfWork uow = tm_.begin();

  if (caller != from && approvals_.count({from, caller}) == 0) {
    throw AuthorizationError("caller is neither " + from +
                             " nor an approved operator");
  }

  domain::Asset& asset = requireAsset(token_id);
  requireNotBurned(asset);

  if (registry_.isBlacklisted(from) || registry_.isBlacklisted(to)) {
    throw ComplianceError("transfer of token " + tokenRef(token_id) +
                          " involves a blacklisted address");
  }
  if (domain::isLockedStatus(asset.status)) {
    throw InvalidStateError("token " + tokenRef(token_id) + " is locked (" +
                            domain::assetStatusToString(asset.status) + ")");
  }
  if (asset.owner != from) {
    throw InsufficientBalanceError(from + " does not hold token " +
                                   tokenRef(token_id));
  }

  journal(uow, asset);
  moveOwner(uow, asset, to, "TRANSFER");
  uow.commit();
}

// -----------------------------------------------------------------------------
// forceTransfer(): compliance override, custody lock still enforced
// -----------------------------------------------------------------------------
void AssetCustody::forceTransfer(const domain::Address& caller,
                                 domain::TokenId token_id,
                                 const domain::Address& from,
                                 const domain::Address& to,
                                 const std::string& reason) {
  if (!registry_.isInRole(caller, domain::Role::Platform)) {
    throw AuthorizationError("forceTransfer requires the platform role");
  }
  if (to.empty()) {
    throw ValidationError("forceTransfer recipient must not be empty");
  }

  UnitOfWork uow = tm_.begin();

  domain::Asset& asset = requireAsset(token_id);
  requireNotBurned(asset);

  if (domain::isLockedStatus(asset.status)) {
    throw InvalidStateError("token " + tokenRef(token_id) + " is locked (" +
                            domain::assetStatusToString(asset.status) + ")");
  }
  if (asset.owner != from) {
    throw InsufficientBalanceError(from + " does not hold token " +
                                   tokenRef(token_id));
  }

  journal(uow, asset);
  moveOwner(uow, asset, to, reason);
  uow.commit();

  std::cout << "[AssetCustody] force transfer token_id=" << token_id << " "
            << from << " -> " << to << " (" << reason << ")\n";
}

// -----------------------------------------------------------------------------
// Operator approvals
// -----------------------------------------------------------------------------
void AssetCustody::setApprovalForAll(const domain::Address& owner,
                                     const domain::Address& operator_address,
                                     bool approved) {
  if (owner.empty() || operator_address.empty() || owner == operator_address) {
    throw ValidationError("invalid approval pair");
  }

  UnitOfWork uow = tm_.begin();

  const auto key = std::make_pair(owner, operator_address);
  const bool was_approved = approvals_.count(key) != 0;
  if (approved) {
    approvals_.insert(key);
  } else {
    approvals_.erase(key);
  }
  uow.onRollback([this, key, was_approved] {
    if (was_approved) {
      approvals_.insert(key);
    } else {
      approvals_.erase(key);
    }
  });

  uow.commit();
}

bool AssetCustody::isApprovedForAll(
    const domain::Address& owner,
    const domain::Address& operator_address) const {
  auto lock = tm_.readLock();
  return approvals_.count({owner, operator_address}) != 0;
}

// -----------------------------------------------------------------------------
// Settlement path
// -----------------------------------------------------------------------------
SettlementCapability AssetCustody::issueSettlementCapability(
    const domain::Address& holder) {
  if (holder.empty()) {
    throw ValidationError("settlement capability holder must not be empty");
  }

  UnitOfWork uow = tm_.begin();
  if (settlement_holder_) {
    throw InvalidStateError("settlement capability already issued to " +
                            *settlement_holder_);
  }
  settlement_holder_ = holder;
  uow.onRollback([this] { settlement_holder_.reset(); });
  uow.commit();

  std::cout << "[AssetCustody] settlement capability issued to " << holder
            << "\n";
  return SettlementCapability(holder);
}

void AssetCustody::settleTransfer(const SettlementCapability& capability,
                                  domain::TokenId token_id,
                                  const domain::Address& to,
                                  const domain::TxRef& tx_ref,
                                  UnitOfWork& uow) {
  if (!settlement_holder_ || *settlement_holder_ != capability.holder()) {
    throw AuthorizationError("settlement capability not recognised");
  }
  if (to.empty()) {
    throw ValidationError("settlement recipient must not be empty");
  }

  domain::Asset& asset = requireAsset(token_id);
  requireNotBurned(asset);

  const std::string reason = "SETTLEMENT:" + tx_ref;

  journal(uow, asset);
  moveOwner(uow, asset, to, reason);
  setStatus(uow, asset, domain::AssetStatus::InVault, reason,
            capability.holder());
}

// -----------------------------------------------------------------------------
// Reads
// -----------------------------------------------------------------------------
bool AssetCustody::verifyCertificate(domain::TokenId token_id,
                                     const std::string& certificate_hash) const {
  auto lock = tm_.readLock();
  return requireAsset(token_id).certificate_hash == certificate_hash;
}

bool AssetCustody::isAssetLocked(domain::TokenId token_id) const {
  auto lock = tm_.readLock();
  return domain::isLockedStatus(requireAsset(token_id).status);
}

domain::Asset AssetCustody::getAsset(domain::TokenId token_id) const {
  auto lock = tm_.readLock();
  return requireAsset(token_id);
}

domain::Address AssetCustody::ownerOf(domain::TokenId token_id) const {
  auto lock = tm_.readLock();
  return requireAsset(token_id).owner;
}

std::vector<domain::TokenId> AssetCustody::tokensOfOwner(
    const domain::Address& owner) const {
  auto lock = tm_.readLock();
  auto it = owned_.find(owner);
  if (it == owned_.end()) {
    return {};
  }
  return {it->second.begin(), it->second.end()};
}

domain::Amount AssetCustody::balanceOf(const domain::Address& owner,
                                       domain::TokenId token_id) const {
  auto lock = tm_.readLock();
  auto it = assets_.find(token_id);
  if (it == assets_.end() || it->second.status == domain::AssetStatus::Burned) {
    return 0;
  }
  return it->second.owner == owner ? 1 : 0;
}

std::optional<domain::TokenId> AssetCustody::tokenByWarrant(
    const std::string& warrant_id) const {
  auto lock = tm_.readLock();
  auto it = by_warrant_.find(warrant_id);
  if (it == by_warrant_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t AssetCustody::totalMinted() const {
  auto lock = tm_.readLock();
  return assets_.size();
}

const domain::Asset* AssetCustody::findAsset(domain::TokenId token_id,
                                             const UnitOfWork& /*uow*/) const {
  auto it = assets_.find(token_id);
  return it == assets_.end() ? nullptr : &it->second;
}

// -----------------------------------------------------------------------------
// Internal helpers
// -----------------------------------------------------------------------------
domain::Asset& AssetCustody::requireAsset(domain::TokenId token_id) {
  auto it = assets_.find(token_id);
  if (it == assets_.end()) {
    throw NotFoundError("asset not found: " + tokenRef(token_id));
  }
  return it->second;
}

const domain::Asset& AssetCustody::requireAsset(domain::TokenId token_id) const {
  auto it = assets_.find(token_id);
  if (it == assets_.end()) {
    throw NotFoundError("asset not found: " + tokenRef(token_id));
  }
  return it->second;
}

void AssetCustody::requireNotBurned(const domain::Asset& asset) const {
  if (asset.status == domain::AssetStatus::Burned) {
    throw InvalidStateError("token " + tokenRef(asset.token_id) +
                            " is burned");
  }
}

void AssetCustody::journal(UnitOfWork& uow, const domain::Asset& asset) {
  uow.onRollback([this, before = asset] { assets_[before.token_id] = before; });
}

void AssetCustody::moveOwner(UnitOfWork& uow, domain::Asset& asset,
                             const domain::Address& to,
                             const std::string& reason) {
  const domain::Address from = asset.owner;
  const domain::TokenId token_id = asset.token_id;

  auto& from_set = owned_[from];
  from_set.erase(token_id);
  if (from_set.empty()) {
    owned_.erase(from);
  }
  owned_[to].insert(token_id);

  uow.onRollback([this, from, to, token_id] {
    auto it = owned_.find(to);
    if (it != owned_.end()) {
      it->second.erase(token_id);
      if (it->second.empty()) {
        owned_.erase(it);
      }
    }
    owned_[from].insert(token_id);
  });

  asset.owner = to;
  asset.updated_at_ms = uow.now_ms();

  OwnershipUpdatedEvent updated;
  updated.token_id = token_id;
  updated.from = from;
  updated.to = to;
  updated.reason = reason;
  updated.timestamp = uow.timestamp();
  uow.stage(std::move(updated));

  AssetTransferredEvent transferred;
  transferred.token_id = token_id;
  transferred.from = from;
  transferred.to = to;
  transferred.timestamp = uow.timestamp();
  uow.stage(std::move(transferred));
}

void AssetCustody::setStatus(UnitOfWork& uow, domain::Asset& asset,
                             domain::AssetStatus status,
                             const std::string& reason,
                             const domain::Address& changed_by) {
  StatusChangedEvent event;
  event.token_id = asset.token_id;
  event.old_status = asset.status;
  event.new_status = status;
  event.reason = reason;
  event.changed_by = changed_by;
  event.timestamp = uow.timestamp();

  asset.status = status;
  asset.status_reason = reason;
  asset.updated_at_ms = uow.now_ms();

  uow.stage(std::move(event));
}

}  // namespace gold
