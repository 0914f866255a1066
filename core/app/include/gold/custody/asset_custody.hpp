#pragma once

#include "gold/concurrent/unit_of_work.hpp"
#include "gold/custody/settlement_capability.hpp"
#include "gold/domain/asset.hpp"
#include "gold/domain/types.hpp"
#include "gold/ledger/account_ledger.hpp"
#include "gold/ledger/ledger_write_capability.hpp"
#include "gold/registry/i_authorization_registry.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace gold {

// Attributes supplied to AssetCustody::mint().
struct MintRequest {
  domain::Address owner;
  domain::AccountId account_id;  // Ledger anchor, credited +1
  std::string serial_number;
  std::string refiner;
  std::int64_t weight{0};
  std::int64_t fineness{0};
  std::string product_type;
  std::string certificate_hash;
  domain::MemberId member_id;
  bool certified{false};
  std::string warrant_id;
};

struct CustodyOptions {
  // When false, only the owner of record may call updateStatus().
  bool allow_operator_status_updates{true};
};

// -----------------------------------------------------------------------------
// AssetCustody: lifecycle, locking and ownership of tokenized bars
// -----------------------------------------------------------------------------
//
// @brief  Owns every Asset record and the owner -> token reverse index.
//
// @details
// Ownership changes through three paths with different guarantees:
//
//   transfer()         owner or approved operator; blacklist and lock checked
//   forceTransfer()    platform role; lock checked, blacklist skipped
//   settleTransfer()   SettlementCapability only; nothing but existence
//                      checked, lands the bar IN_VAULT
//
// mint() and burn() push a +1 / -1 into the AccountLedger through this
// component's LedgerWriteCapability, inside the same unit of work as the
// asset change. If the ledger refuses (unknown account, capability revoked,
// insufficient balance) the asset change rolls back with it.
//
// Thread model:
//   Same as AccountLedger: mutations inside a UnitOfWork, reads under
//   TransactionManager::readLock().
// -----------------------------------------------------------------------------
class AssetCustody {
 public:
  AssetCustody(TransactionManager& tm, const IAuthorizationRegistry& registry,
               AccountLedger& ledger, LedgerWriteCapability ledger_capability,
               CustodyOptions options = {});

  AssetCustody(const AssetCustody&) = delete;
  AssetCustody& operator=(const AssetCustody&) = delete;

  // -------------------------------------------------------------------------
  // mint(caller, request)
  // -------------------------------------------------------------------------
  // @brief  Registers a new bar and credits its account +1.
  //
  // @return The new token id (sequential from 1).
  //
  // @throws AuthorizationError  caller lacks Refiner and Minter
  //         DuplicateError      warrant id already used
  //         ValidationError     empty owner/account/warrant, weight <= 0,
  //                             fineness outside 1..10000
  //         NotFoundError       account unknown to the ledger
  //
  // Emits AssetMinted, WarrantLinked and (from the ledger) BalanceUpdated.
  // -------------------------------------------------------------------------
  domain::TokenId mint(const domain::Address& caller,
                       const MintRequest& request);

  // Owner of record, or (if enabled) an asset-operator role. BURNED is not
  // a valid target: use burn().
  void updateStatus(const domain::Address& caller, domain::TokenId token_id,
                    domain::AssetStatus new_status, const std::string& reason);

  // Custodian role. Every listed token goes IN_TRANSIT under the new
  // custodian; one CustodyChanged per token. All or nothing.
  void updateCustodyBatch(const domain::Address& caller,
                          const std::vector<domain::TokenId>& token_ids,
                          const domain::Address& new_custodian,
                          const std::string& method);

  // -------------------------------------------------------------------------
  // burn(caller, token_id, account_id, reason)
  // -------------------------------------------------------------------------
  // @brief  Terminates a bar and debits -1 from the account it was minted
  //         against.
  //
  // @details
  // `account_id` is accepted but never used to choose the debited account;
  // the mint-time anchor always is.
  //
  // @throws AuthorizationError        caller lacks Refiner and Minter
  //         NotFoundError             unknown token
  //         InvalidStateError         already burned
  //         InsufficientBalanceError  anchor balance is already 0
  // -------------------------------------------------------------------------
  void burn(const domain::Address& caller, domain::TokenId token_id,
            const domain::AccountId& account_id, const std::string& reason);

  // Single-bar balance transfer. `quantity` must be 1.
  void transfer(const domain::Address& caller, const domain::Address& from,
                const domain::Address& to, domain::TokenId token_id,
                domain::Amount quantity);

  void forceTransfer(const domain::Address& caller, domain::TokenId token_id,
                     const domain::Address& from, const domain::Address& to,
                     const std::string& reason);

  void setApprovalForAll(const domain::Address& owner,
                         const domain::Address& operator_address,
                         bool approved);
  bool isApprovedForAll(const domain::Address& owner,
                        const domain::Address& operator_address) const;

  // --- Settlement path -----------------------------------------------------

  // Issues the single SettlementCapability of this instance. A second call
  // throws InvalidStateError.
  SettlementCapability issueSettlementCapability(const domain::Address& holder);

  // -------------------------------------------------------------------------
  // settleTransfer(capability, token_id, to, tx_ref, uow)
  // -------------------------------------------------------------------------
  // @brief  Moves a bar to `to` as part of order execution, whatever its
  //         lock state, and sets it IN_VAULT.
  //
  // @throws AuthorizationError  capability not the one this instance issued
  //         NotFoundError       unknown token
  //         InvalidStateError   token burned
  //
  // Runs inside the caller's unit of work. Emits OwnershipUpdated
  // ("SETTLEMENT:<tx_ref>"), AssetTransferred and StatusChanged.
  // -------------------------------------------------------------------------
  void settleTransfer(const SettlementCapability& capability,
                      domain::TokenId token_id, const domain::Address& to,
                      const domain::TxRef& tx_ref, UnitOfWork& uow);

  // --- Reads ---------------------------------------------------------------

  // Throws NotFoundError for an unknown token.
  bool verifyCertificate(domain::TokenId token_id,
                         const std::string& certificate_hash) const;
  bool isAssetLocked(domain::TokenId token_id) const;
  domain::Asset getAsset(domain::TokenId token_id) const;
  domain::Address ownerOf(domain::TokenId token_id) const;

  std::vector<domain::TokenId> tokensOfOwner(
      const domain::Address& owner) const;
  domain::Amount balanceOf(const domain::Address& owner,
                           domain::TokenId token_id) const;
  std::optional<domain::TokenId> tokenByWarrant(
      const std::string& warrant_id) const;
  std::size_t totalMinted() const;

  const domain::Asset* findAsset(domain::TokenId token_id,
                                 const UnitOfWork& uow) const;

  const CustodyOptions& options() const { return options_; }

 private:
  domain::Asset& requireAsset(domain::TokenId token_id);
  const domain::Asset& requireAsset(domain::TokenId token_id) const;

  void requireNotBurned(const domain::Asset& asset) const;

  // Snapshots the asset into the undo journal before it is modified.
  void journal(UnitOfWork& uow, const domain::Asset& asset);

  // Reassigns owner and reverse index; stages OwnershipUpdated and
  // AssetTransferred.
  void moveOwner(UnitOfWork& uow, domain::Asset& asset,
                 const domain::Address& to, const std::string& reason);

  void setStatus(UnitOfWork& uow, domain::Asset& asset,
                 domain::AssetStatus status, const std::string& reason,
                 const domain::Address& changed_by);

  TransactionManager& tm_;
  const IAuthorizationRegistry& registry_;
  AccountLedger& ledger_;
  const LedgerWriteCapability ledger_capability_;
  const CustodyOptions options_;

  domain::TokenId next_token_id_{1};
  std::map<domain::TokenId, domain::Asset> assets_;
  std::unordered_map<std::string, domain::TokenId> by_warrant_;
  std::unordered_map<domain::Address, std::set<domain::TokenId>> owned_;
  std::set<std::pair<domain::Address, domain::Address>> approvals_;

  std::optional<domain::Address> settlement_holder_;
};

}  // namespace gold
