// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/address.hpp"
#include "chain/block.hpp"
#include "ledger/ledger_source.hpp"
#include "wallet/notifications.hpp"
#include "wallet/undo_log.hpp"
#include "wallet/utxo_store.hpp"
#include "wallet/wallet_config.hpp"
#include <cstdint>
#include <set>
#include <vector>

namespace lightwallet {
namespace wallet {

// ChainCursor - The (height, block id) the wallet believes canonical
struct ChainCursor {
  uint64_t height{0};
  chain::BlockId block_id;

  static ChainCursor Genesis() { return ChainCursor{0, chain::GenesisBlockId()}; }

  friend bool operator==(const ChainCursor &, const ChainCursor &) = default;
};

// WalletState - Everything the synchronizer mutates
// Derived from the ledger: replaying from genesis reconstructs it.
struct WalletState {
  ChainCursor cursor{ChainCursor::Genesis()};
  UtxoStore utxos;
  UndoLog undo;
};

// Summary of one Sync call
struct SyncResult {
  uint64_t blocks_disconnected{0}; // Undone through the undo log
  uint64_t blocks_connected{0};
  bool rescanned{false}; // Derived state dropped and replayed from genesis
  bool halted{false};    // Stopped early on unavailable or shifting ledger data
  uint64_t final_height{0};
};

/**
 * Synchronizer - Fork-aware incremental sync of a WalletState
 *
 * Sync(ledger, state):
 *   1. Rollback: while the cursor is above genesis and the ledger's canonical
 *      block at the cursor height differs from the cursor, undo the newest
 *      block (or rescan from genesis when no undo record is available or the
 *      policy says so).
 *   2. Rollforward: for each next height with a canonical block, fetch it,
 *      check it extends the cursor, apply its transactions and record undo.
 *      A fetch failure stops the pass, keeping what was applied. A block that
 *      does not extend the cursor means the ledger reorganized between
 *      queries: go back to 1 (bounded by max_reconcile_rounds).
 *
 * Ledger query cost for growth from h to h+m without a reorg: 2m+2.
 *
 * Notifications are queued while state is mutated and dispatched once the
 * pass is over.
 */
class Synchronizer {
public:
  Synchronizer(const std::set<chain::Address> &tracked,
               const WalletConfig &config, WalletNotifications &notifications);

  SyncResult Sync(const ledger::LedgerSource &ledger, WalletState &state);

private:
  enum class NotifyType {
    BlockConnected,
    BlockDisconnected,
    ChainTip,
    Rescan,
    DeepRollback
  };
  struct PendingNotification {
    NotifyType type;
    chain::BlockId id;
    uint64_t height{0}; // Block height, rescan start, or rollback depth
    uint64_t threshold{0};
  };

  enum class ForwardResult { CAUGHT_UP, HALTED, REORGANIZED };

  void Rollback(const ledger::LedgerSource &ledger, WalletState &state,
                SyncResult &result, std::vector<PendingNotification> &events);
  ForwardResult Rollforward(const ledger::LedgerSource &ledger,
                            WalletState &state, SyncResult &result,
                            std::vector<PendingNotification> &events);
  void Rescan(WalletState &state, SyncResult &result,
              std::vector<PendingNotification> &events);

  // Apply one block on top of the cursor and record its undo entry
  void ConnectBlock(const chain::Block &block, const chain::BlockId &id,
                    WalletState &state,
                    std::vector<PendingNotification> &events);
  // Undo the newest block. False if no undo record matches the cursor.
  bool DisconnectTip(WalletState &state,
                     std::vector<PendingNotification> &events);

  void Dispatch(const std::vector<PendingNotification> &events);

  bool IsTracked(const chain::Address &address) const {
    return tracked_.count(address) > 0;
  }

  const std::set<chain::Address> &tracked_;
  const WalletConfig &config_;
  WalletNotifications &notifications_;
};

} // namespace wallet
} // namespace lightwallet
