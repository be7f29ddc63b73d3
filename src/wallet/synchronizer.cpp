// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "wallet/synchronizer.hpp"
#include "chain/transaction.hpp"
#include "util/logging.hpp"
#include <algorithm>

namespace lightwallet {
namespace wallet {

namespace {

std::string ShortId(const uint256 &id) { return id.ToString().substr(0, 16); }

} // namespace

Synchronizer::Synchronizer(const std::set<chain::Address> &tracked,
                           const WalletConfig &config,
                           WalletNotifications &notifications)
    : tracked_(tracked), config_(config), notifications_(notifications) {}

SyncResult Synchronizer::Sync(const ledger::LedgerSource &ledger,
                              WalletState &state) {
  SyncResult result;
  std::vector<PendingNotification> pending_events;
  const ChainCursor start = state.cursor;

  LOG_SYNC_TRACE("Sync: starting at height={} hash={}", start.height,
                 ShortId(start.block_id));

  const int max_rounds = std::max(config_.max_reconcile_rounds, 1);
  for (int round = 1;; ++round) {
    Rollback(ledger, state, result, pending_events);

    ForwardResult res = Rollforward(ledger, state, result, pending_events);
    if (res == ForwardResult::CAUGHT_UP) {
      break;
    }
    if (res == ForwardResult::HALTED) {
      result.halted = true;
      break;
    }

    // REORGANIZED: the ledger moved under us between queries
    if (round >= max_rounds) {
      LOG_SYNC_WARN("Sync: ledger kept reorganizing, giving up after {} "
                    "rounds at height {}",
                    round, state.cursor.height);
      result.halted = true;
      break;
    }
    LOG_SYNC_DEBUG("Sync: ledger reorganized during rollforward at height {}, "
                   "reconciling (round {})",
                   state.cursor.height, round + 1);
  }

  result.final_height = state.cursor.height;

  if (!(state.cursor == start)) {
    pending_events.push_back(PendingNotification{
        NotifyType::ChainTip, state.cursor.block_id, state.cursor.height, 0});
  }

  if (result.blocks_disconnected > 0 || result.rescanned) {
    LOG_SYNC_INFO("Sync: disconnected {} blocks{}, connected {} blocks, "
                  "tip height={} hash={}",
                  result.blocks_disconnected,
                  result.rescanned ? " (rescanned from genesis)" : "",
                  result.blocks_connected, state.cursor.height,
                  ShortId(state.cursor.block_id));
  } else if (result.blocks_connected > 0) {
    LOG_SYNC_DEBUG("Sync: connected {} blocks, tip height={} hash={}",
                   result.blocks_connected, state.cursor.height,
                   ShortId(state.cursor.block_id));
  }

  Dispatch(pending_events);
  return result;
}

void Synchronizer::Rollback(const ledger::LedgerSource &ledger,
                            WalletState &state, SyncResult &result,
                            std::vector<PendingNotification> &events) {
  const ChainCursor old_tip = state.cursor;
  uint64_t depth = 0;

  while (state.cursor.height > 0) {
    std::optional<chain::BlockId> canonical =
        ledger.BestBlockAtHeight(state.cursor.height);
    if (canonical && *canonical == state.cursor.block_id) {
      break;
    }

    LOG_SYNC_TRACE("Rollback: height={} local={} canonical={}",
                   state.cursor.height, ShortId(state.cursor.block_id),
                   canonical ? ShortId(*canonical) : "none");

    if (config_.rollback_policy == RollbackPolicy::FULL_RESCAN) {
      Rescan(state, result, events);
      return;
    }

    if (!DisconnectTip(state, events)) {
      LOG_SYNC_INFO("Rollback: no undo record for height {}, rescanning "
                    "from genesis",
                    state.cursor.height);
      Rescan(state, result, events);
      return;
    }
    ++result.blocks_disconnected;
    ++depth;
  }

  if (depth == 0) {
    return;
  }

  LOG_SYNC_INFO("REORGANIZE: disconnected {} blocks; old tip height={} "
                "hash={}, fork point height={} hash={}",
                depth, old_tip.height, ShortId(old_tip.block_id),
                state.cursor.height, ShortId(state.cursor.block_id));

  const uint64_t threshold = config_.suspicious_rollback_depth;
  if (threshold > 0 && depth >= threshold) {
    LOG_SYNC_WARN("Deep rollback of {} blocks (threshold {}). The ledger "
                  "replaced a long stretch of history.",
                  depth, threshold);
    events.push_back(PendingNotification{NotifyType::DeepRollback,
                                         chain::BlockId{}, depth, threshold});
  }
}

Synchronizer::ForwardResult
Synchronizer::Rollforward(const ledger::LedgerSource &ledger,
                          WalletState &state, SyncResult &result,
                          std::vector<PendingNotification> &events) {
  for (;;) {
    const uint64_t height = state.cursor.height + 1;

    std::optional<chain::BlockId> id = ledger.BestBlockAtHeight(height);
    if (!id) {
      return ForwardResult::CAUGHT_UP;
    }

    std::optional<chain::Block> block = ledger.WholeBlock(*id);
    if (!block) {
      LOG_SYNC_DEBUG("Rollforward: block {} at height {} unavailable, "
                     "stopping",
                     ShortId(*id), height);
      return ForwardResult::HALTED;
    }

    if (block->parent != state.cursor.block_id || block->number != height) {
      LOG_SYNC_DEBUG("Rollforward: block {} (height {}) does not extend tip "
                     "{} (parent {})",
                     ShortId(*id), block->number, ShortId(state.cursor.block_id),
                     ShortId(block->parent));
      return ForwardResult::REORGANIZED;
    }

    ConnectBlock(*block, *id, state, events);
    ++result.blocks_connected;
  }
}

void Synchronizer::Rescan(WalletState &state, SyncResult &result,
                          std::vector<PendingNotification> &events) {
  LOG_SYNC_DEBUG("Rescan: dropping {} coins and {} undo records from height {}",
                 state.utxos.Size(), state.undo.Size(), state.cursor.height);
  state.utxos.Clear();
  state.undo.Clear();
  state.cursor = ChainCursor::Genesis();
  result.rescanned = true;
  events.push_back(
      PendingNotification{NotifyType::Rescan, chain::BlockId{}, 0, 0});
}

void Synchronizer::ConnectBlock(const chain::Block &block,
                                const chain::BlockId &id, WalletState &state,
                                std::vector<PendingNotification> &events) {
  const uint64_t height = block.number;

  BlockUndo undo;
  undo.height = height;
  undo.block_id = id;
  undo.parent_id = block.parent;

  auto find_inserted = [&undo](const chain::CoinId &coin_id) {
    return std::find_if(
        undo.inserted.begin(), undo.inserted.end(),
        [&coin_id](const auto &entry) { return entry.first == coin_id; });
  };

  for (const auto &tx : block.body) {
    for (const auto &input : tx.inputs) {
      std::optional<chain::Coin> spent = state.utxos.Remove(input.coin_id);
      if (!spent) {
        // Untracked owner, dummy input, or double spend: not ours to judge
        continue;
      }
      auto it = find_inserted(input.coin_id);
      if (it != undo.inserted.end()) {
        // Created and spent inside this block: no net change
        undo.inserted.erase(it);
      } else {
        undo.removed.emplace_back(input.coin_id, *spent);
      }
    }

    const chain::TransactionId txid = tx.GetId();
    for (uint64_t index = 0; index < tx.outputs.size(); ++index) {
      const chain::Coin &output = tx.outputs[index];
      if (!IsTracked(output.owner)) {
        continue;
      }
      const chain::CoinId coin_id = chain::MakeCoinId(txid, height, index);

      auto it = find_inserted(coin_id);
      if (it != undo.inserted.end()) {
        it->second = output;
      } else {
        if (std::optional<chain::Coin> previous = state.utxos.Get(coin_id)) {
          undo.removed.emplace_back(coin_id, *previous);
        }
        undo.inserted.emplace_back(coin_id, output);
      }
      state.utxos.Insert(coin_id, output);
    }
  }

  LOG_SYNC_TRACE("ConnectBlock: height={} hash={} txs={} +{} -{}", height,
                 ShortId(id), block.body.size(), undo.inserted.size(),
                 undo.removed.size());

  state.undo.Push(std::move(undo));
  state.cursor = ChainCursor{height, id};
  events.push_back(
      PendingNotification{NotifyType::BlockConnected, id, height, 0});
}

bool Synchronizer::DisconnectTip(WalletState &state,
                                 std::vector<PendingNotification> &events) {
  const BlockUndo *back = state.undo.Back();
  if (!back || back->height != state.cursor.height ||
      back->block_id != state.cursor.block_id) {
    return false;
  }

  BlockUndo undo = *state.undo.Pop();

  LOG_SYNC_TRACE("DisconnectTip: height={} hash={} -{} +{}", undo.height,
                 ShortId(undo.block_id), undo.inserted.size(),
                 undo.removed.size());

  for (auto it = undo.inserted.rbegin(); it != undo.inserted.rend(); ++it) {
    std::optional<chain::Coin> current = state.utxos.Get(it->first);
    if (current && *current == it->second) {
      state.utxos.Remove(it->first);
    }
  }
  for (auto it = undo.removed.rbegin(); it != undo.removed.rend(); ++it) {
    state.utxos.Insert(it->first, it->second);
  }

  state.cursor = ChainCursor{undo.height - 1, undo.parent_id};
  events.push_back(PendingNotification{NotifyType::BlockDisconnected,
                                       undo.block_id, undo.height, 0});
  return true;
}

void Synchronizer::Dispatch(const std::vector<PendingNotification> &events) {
  for (const auto &ev : events) {
    switch (ev.type) {
    case NotifyType::BlockConnected:
      notifications_.NotifyBlockConnected(ev.id, ev.height);
      break;
    case NotifyType::BlockDisconnected:
      notifications_.NotifyBlockDisconnected(ev.id, ev.height);
      break;
    case NotifyType::ChainTip:
      notifications_.NotifyChainTip(ev.id, ev.height);
      break;
    case NotifyType::Rescan:
      notifications_.NotifyRescan(ev.height);
      break;
    case NotifyType::DeepRollback:
      notifications_.NotifyDeepRollback(ev.height, ev.threshold);
      break;
    }
  }
}

} // namespace wallet
} // namespace lightwallet
