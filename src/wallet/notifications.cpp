// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "wallet/notifications.hpp"
#include <algorithm>

namespace lightwallet {
namespace wallet {

// ============================================================================
// WalletNotifications::Subscription
// ============================================================================

WalletNotifications::Subscription::Subscription(WalletNotifications *owner,
                                                size_t id)
    : owner_(owner), id_(id), active_(true) {}

WalletNotifications::Subscription::~Subscription() { Unsubscribe(); }

WalletNotifications::Subscription::Subscription(Subscription &&other) noexcept
    : owner_(other.owner_), id_(other.id_), active_(other.active_) {
  other.owner_ = nullptr;
  other.active_ = false;
}

WalletNotifications::Subscription &
WalletNotifications::Subscription::operator=(Subscription &&other) noexcept {
  if (this != &other) {
    Unsubscribe();
    owner_ = other.owner_;
    id_ = other.id_;
    active_ = other.active_;
    other.owner_ = nullptr;
    other.active_ = false;
  }
  return *this;
}

void WalletNotifications::Subscription::Unsubscribe() {
  if (active_ && owner_) {
    owner_->Unsubscribe(id_);
    active_ = false;
  }
}

// ============================================================================
// WalletNotifications
// ============================================================================

WalletNotifications::Subscription
WalletNotifications::Add(CallbackEntry entry) {
  entry.id = next_id_++;
  size_t id = entry.id;
  callbacks_.push_back(std::move(entry));
  return Subscription(this, id);
}

WalletNotifications::Subscription
WalletNotifications::SubscribeBlockConnected(BlockConnectedCallback callback) {
  CallbackEntry entry{};
  entry.block_connected = std::move(callback);
  return Add(std::move(entry));
}

WalletNotifications::Subscription
WalletNotifications::SubscribeBlockDisconnected(
    BlockDisconnectedCallback callback) {
  CallbackEntry entry{};
  entry.block_disconnected = std::move(callback);
  return Add(std::move(entry));
}

WalletNotifications::Subscription
WalletNotifications::SubscribeChainTip(ChainTipCallback callback) {
  CallbackEntry entry{};
  entry.chain_tip = std::move(callback);
  return Add(std::move(entry));
}

WalletNotifications::Subscription
WalletNotifications::SubscribeRescan(RescanCallback callback) {
  CallbackEntry entry{};
  entry.rescan = std::move(callback);
  return Add(std::move(entry));
}

WalletNotifications::Subscription
WalletNotifications::SubscribeDeepRollback(DeepRollbackCallback callback) {
  CallbackEntry entry{};
  entry.deep_rollback = std::move(callback);
  return Add(std::move(entry));
}

// Dispatch walks a snapshot of ids and re-resolves each one, so a callback
// may unsubscribe itself or others: removed entries are skipped. The callback
// is copied out before the call since it may erase its own entry.

std::vector<size_t> WalletNotifications::SnapshotIds() const {
  std::vector<size_t> ids;
  ids.reserve(callbacks_.size());
  for (const auto &entry : callbacks_) {
    ids.push_back(entry.id);
  }
  return ids;
}

const WalletNotifications::CallbackEntry *
WalletNotifications::Find(size_t id) const {
  auto it =
      std::find_if(callbacks_.begin(), callbacks_.end(),
                   [id](const CallbackEntry &entry) { return entry.id == id; });
  return it == callbacks_.end() ? nullptr : &*it;
}

void WalletNotifications::NotifyBlockConnected(const chain::BlockId &id,
                                               uint64_t height) {
  for (size_t entry_id : SnapshotIds()) {
    const CallbackEntry *entry = Find(entry_id);
    if (entry && entry->block_connected) {
      auto callback = entry->block_connected;
      callback(id, height);
    }
  }
}

void WalletNotifications::NotifyBlockDisconnected(const chain::BlockId &id,
                                                  uint64_t height) {
  for (size_t entry_id : SnapshotIds()) {
    const CallbackEntry *entry = Find(entry_id);
    if (entry && entry->block_disconnected) {
      auto callback = entry->block_disconnected;
      callback(id, height);
    }
  }
}

void WalletNotifications::NotifyChainTip(const chain::BlockId &tip,
                                         uint64_t height) {
  for (size_t entry_id : SnapshotIds()) {
    const CallbackEntry *entry = Find(entry_id);
    if (entry && entry->chain_tip) {
      auto callback = entry->chain_tip;
      callback(tip, height);
    }
  }
}

void WalletNotifications::NotifyRescan(uint64_t from_height) {
  for (size_t entry_id : SnapshotIds()) {
    const CallbackEntry *entry = Find(entry_id);
    if (entry && entry->rescan) {
      auto callback = entry->rescan;
      callback(from_height);
    }
  }
}

void WalletNotifications::NotifyDeepRollback(uint64_t depth,
                                             uint64_t threshold) {
  for (size_t entry_id : SnapshotIds()) {
    const CallbackEntry *entry = Find(entry_id);
    if (entry && entry->deep_rollback) {
      auto callback = entry->deep_rollback;
      callback(depth, threshold);
    }
  }
}

void WalletNotifications::Unsubscribe(size_t id) {
  auto it =
      std::find_if(callbacks_.begin(), callbacks_.end(),
                   [id](const CallbackEntry &entry) { return entry.id == id; });

  if (it != callbacks_.end()) {
    callbacks_.erase(it);
  }
}

} // namespace wallet
} // namespace lightwallet
