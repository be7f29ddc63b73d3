// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include <cstdint>
#include <functional>
#include <vector>

namespace lightwallet {
namespace wallet {

/**
 * Wallet event notifications
 *
 * Simple observer pattern with std::function and RAII subscriptions.
 * One instance per wallet; no global registry, no locking (a wallet is
 * driven from a single thread).
 *
 * Events are dispatched by the synchronizer after a sync pass has finished
 * mutating wallet state, so subscribers always observe a consistent wallet:
 * - BlockConnected: block applied at `height`
 * - BlockDisconnected: block at `height` undone during a rollback
 * - ChainTip: cursor moved (once per Sync call, with the final tip)
 * - Rescan: derived state dropped, replay restarted from `from_height`
 * - DeepRollback: rollback depth reached the configured threshold
 */
class WalletNotifications {
public:
  /**
   * Subscription handle - RAII wrapper
   * Automatically unsubscribes when destroyed. Must not outlive the
   * WalletNotifications it came from.
   */
  class Subscription {
  public:
    Subscription() = default;
    ~Subscription();

    // Movable but not copyable
    Subscription(Subscription &&other) noexcept;
    Subscription &operator=(Subscription &&other) noexcept;
    Subscription(const Subscription &) = delete;
    Subscription &operator=(const Subscription &) = delete;

    void Unsubscribe();

  private:
    friend class WalletNotifications;
    Subscription(WalletNotifications *owner, size_t id);

    WalletNotifications *owner_{nullptr};
    size_t id_{0};
    bool active_{false};
  };

  using BlockConnectedCallback =
      std::function<void(const chain::BlockId &id, uint64_t height)>;
  using BlockDisconnectedCallback =
      std::function<void(const chain::BlockId &id, uint64_t height)>;
  using ChainTipCallback =
      std::function<void(const chain::BlockId &tip, uint64_t height)>;
  using RescanCallback = std::function<void(uint64_t from_height)>;
  using DeepRollbackCallback =
      std::function<void(uint64_t depth, uint64_t threshold)>;

  WalletNotifications() = default;
  WalletNotifications(const WalletNotifications &) = delete;
  WalletNotifications &operator=(const WalletNotifications &) = delete;

  [[nodiscard]] Subscription
  SubscribeBlockConnected(BlockConnectedCallback callback);
  [[nodiscard]] Subscription
  SubscribeBlockDisconnected(BlockDisconnectedCallback callback);
  [[nodiscard]] Subscription SubscribeChainTip(ChainTipCallback callback);
  [[nodiscard]] Subscription SubscribeRescan(RescanCallback callback);
  [[nodiscard]] Subscription
  SubscribeDeepRollback(DeepRollbackCallback callback);

  void NotifyBlockConnected(const chain::BlockId &id, uint64_t height);
  void NotifyBlockDisconnected(const chain::BlockId &id, uint64_t height);
  void NotifyChainTip(const chain::BlockId &tip, uint64_t height);
  void NotifyRescan(uint64_t from_height);
  void NotifyDeepRollback(uint64_t depth, uint64_t threshold);

  size_t SubscriberCount() const { return callbacks_.size(); }

private:
  // Called by Subscription destructor
  void Unsubscribe(size_t id);

  struct CallbackEntry {
    size_t id;
    BlockConnectedCallback block_connected;
    BlockDisconnectedCallback block_disconnected;
    ChainTipCallback chain_tip;
    RescanCallback rescan;
    DeepRollbackCallback deep_rollback;
  };

  Subscription Add(CallbackEntry entry);
  std::vector<size_t> SnapshotIds() const;
  const CallbackEntry *Find(size_t id) const;

  std::vector<CallbackEntry> callbacks_;
  size_t next_id_{1}; // 0 reserved for invalid
};

} // namespace wallet
} // namespace lightwallet
