// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/address.hpp"
#include "chain/block.hpp"
#include "chain/coin.hpp"
#include "chain/transaction.hpp"
#include "ledger/ledger_source.hpp"
#include "wallet/notifications.hpp"
#include "wallet/synchronizer.hpp"
#include "wallet/tx_builder.hpp"
#include "wallet/utxo_store.hpp"
#include "wallet/wallet_config.hpp"
#include "wallet/wallet_error.hpp"
#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace lightwallet {
namespace wallet {

/**
 * Wallet - Light client tracking the coins of a fixed set of addresses
 *
 * Owns the tracked addresses, the derived state (cursor, UTXO store, undo
 * log), the synchronizer and the transaction builder. Queries answer from
 * local state only; Sync() is the only call that talks to a ledger.
 *
 * Neither copyable nor movable: the synchronizer and builder hold references
 * into the wallet.
 *
 * THREAD SAFETY: none. Drive each wallet from a single thread.
 */
class Wallet {
public:
  explicit Wallet(const std::vector<chain::Address> &addresses,
                  WalletConfig config = {});

  Wallet(const Wallet &) = delete;
  Wallet &operator=(const Wallet &) = delete;
  Wallet(Wallet &&) = delete;
  Wallet &operator=(Wallet &&) = delete;

  // Cursor
  uint64_t BestHeight() const { return state_.cursor.height; }
  const chain::BlockId &BestHash() const { return state_.cursor.block_id; }

  // Balance queries (FOREIGN_ADDRESS for untracked addresses)
  WalletResult<uint64_t> TotalAssetsOf(const chain::Address &address) const;
  WalletResult<CoinValueSet> AllCoinsOf(const chain::Address &address) const;

  // Sum over every tracked address
  uint64_t NetWorth() const;

  // UNKNOWN_COIN if the id is not an unspent coin of this wallet
  WalletResult<chain::Coin> CoinDetails(const chain::CoinId &id) const;

  // See TransactionBuilder
  WalletResult<chain::Transaction>
  CreateManualTransaction(const std::vector<chain::CoinId> &input_ids,
                          const std::vector<chain::Coin> &outputs) const;
  WalletResult<chain::Transaction>
  CreateAutomaticTransaction(const chain::Address &recipient, uint64_t payment,
                             uint64_t tip) const;

  // Reconcile with the ledger's current canonical chain
  SyncResult Sync(const ledger::LedgerSource &ledger);

  /**
   * Snapshot of the derived state (cursor, coins, undo log) as JSON.
   * Save writes atomically; Load validates the whole file before replacing
   * anything, and leaves the wallet untouched on failure.
   * Both log and return false on error.
   */
  bool Save(const std::string &filepath) const;
  bool Load(const std::string &filepath);

  WalletNotifications &Notifications() { return notifications_; }
  const std::set<chain::Address> &Addresses() const { return addresses_; }
  bool Tracks(const chain::Address &address) const {
    return addresses_.count(address) > 0;
  }
  size_t UndoDepth() const { return state_.undo.Size(); }
  const UtxoStore &Utxos() const { return state_.utxos; }
  const WalletConfig &GetConfig() const { return config_; }

private:
  const WalletConfig config_;
  const std::set<chain::Address> addresses_;
  WalletNotifications notifications_;
  WalletState state_;
  Synchronizer synchronizer_;
  TransactionBuilder builder_;
};

} // namespace wallet
} // namespace lightwallet
