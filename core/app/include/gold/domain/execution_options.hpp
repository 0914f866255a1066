#pragma once

namespace gold {
namespace domain {

// -----------------------------------------------------------------------------
// ExecutionOptions: side effects performed by OrderSettlement::executeOrder
// -----------------------------------------------------------------------------
//
// @details
// Both flags default to true. Turning one off gives the hybrid mode: the
// order still advances to Executed, and the corresponding movement (token
// ownership or ledger balances) is reconciled outside the engine.
// -----------------------------------------------------------------------------
struct ExecutionOptions {
  /// Reassign every listed token to the destination account's address and
  /// set it IN_VAULT.
  bool enable_on_chain_transfer{true};

  /// Debit the source account and credit the destination account by the
  /// order quantity.
  bool enable_auto_ledger_update{true};
};

}  // namespace domain
}  // namespace gold
