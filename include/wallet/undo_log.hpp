// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include "chain/coin.hpp"
#include <cstdint>
#include <deque>
#include <optional>
#include <utility>
#include <vector>

namespace lightwallet {
namespace wallet {

/**
 * BlockUndo - UTXO mutations caused by connecting one block
 *
 * `inserted` holds the coins the block left in the store (net of coins it
 * created and spent itself). `removed` holds the coins that existed before
 * the block and were erased or overwritten by it, with their old values.
 *
 * Undo: erase every inserted id whose current coin still matches, then
 * re-insert every removed coin.
 */
struct BlockUndo {
  uint64_t height{0};
  chain::BlockId block_id;
  chain::BlockId parent_id;
  std::vector<std::pair<chain::CoinId, chain::Coin>> inserted;
  std::vector<std::pair<chain::CoinId, chain::Coin>> removed;

  friend bool operator==(const BlockUndo &, const BlockUndo &) = default;
};

/**
 * UndoLog - Stack of BlockUndo records, one per connected height
 *
 * Heights are contiguous and end at the wallet's cursor. With a non-zero
 * max depth the oldest records are pruned on Push; a rollback that reaches
 * below the oldest record has to rescan from genesis.
 */
class UndoLog {
public:
  using Records = std::deque<BlockUndo>;

  // 0 = unlimited
  explicit UndoLog(size_t max_depth = 0) : max_depth_(max_depth) {}

  // Append the record for the next height. Throws std::invalid_argument if
  // `undo.height` does not directly follow the newest record.
  void Push(BlockUndo undo);

  // Remove and return the newest record, nullopt if empty
  std::optional<BlockUndo> Pop();

  // Newest record, nullptr if empty
  const BlockUndo *Back() const;

  size_t Size() const { return records_.size(); }
  bool Empty() const { return records_.empty(); }
  void Clear() { records_.clear(); }

  void SetMaxDepth(size_t max_depth);

  Records::const_iterator begin() const { return records_.begin(); }
  Records::const_iterator end() const { return records_.end(); }

private:
  void Prune();

  Records records_;
  size_t max_depth_;
};

} // namespace wallet
} // namespace lightwallet
