// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstddef>
#include <cstdint>

namespace lightwallet {
namespace wallet {

// How the synchronizer unwinds local state when the ledger's canonical chain
// no longer contains the wallet's tip
enum class RollbackPolicy {
  UNDO_LOG,   // Pop undo records down to the fork point
  FULL_RESCAN // Drop all derived state and replay from genesis
};

/**
 * Wallet configuration
 */
struct WalletConfig {
  RollbackPolicy rollback_policy{RollbackPolicy::UNDO_LOG};

  // Undo records retained (0 = unlimited). Deeper rollbacks rescan.
  size_t max_undo_depth{0};

  // Rollbacks at least this deep are logged at warn level and announced
  // (0 disables). They are still performed.
  uint64_t suspicious_rollback_depth{100};

  // Rollback/rollforward rounds per Sync call when the ledger reorganizes
  // between queries
  int max_reconcile_rounds{8};
};

} // namespace wallet
} // namespace lightwallet
