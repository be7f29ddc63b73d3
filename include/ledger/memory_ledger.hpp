// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include "ledger/ledger_source.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace lightwallet {
namespace ledger {

// QueryCounter - Per-kind query metrics, owned by whoever drives the ledger
// (typically a test harness) and handed to the ledger by pointer.
// Not part of any wallet's state.
struct QueryCounter {
  uint64_t best_block_queries{0};
  uint64_t whole_block_queries{0};

  uint64_t Total() const { return best_block_queries + whole_block_queries; }
  void Reset() {
    best_block_queries = 0;
    whole_block_queries = 0;
  }
};

// MemoryLedger - In-process ledger holding a whole fork tree
//
// Blocks live in a content-addressed map (BlockId -> Block); parents are
// lookup keys. Which block is best is set by hand: there is no fork-choice
// rule, so the canonical chain can become shorter.
//
// THREAD SAFETY: none. Single-threaded use, like the wallets that query it.
class MemoryLedger : public LedgerSource {
public:
  // Starts with only genesis, which is best
  explicit MemoryLedger(QueryCounter *counter = nullptr);

  // Build a child of `parent` with the given body (not made best).
  // Throws std::invalid_argument if `parent` is unknown.
  chain::BlockId AddBlock(const chain::BlockId &parent,
                          std::vector<chain::Transaction> body);

  // Make a known block the best. Throws std::invalid_argument if unknown.
  void SetBest(const chain::BlockId &id);

  // AddBlock + SetBest
  chain::BlockId AddBlockAsBest(const chain::BlockId &parent,
                                std::vector<chain::Transaction> body);

  const chain::BlockId &GetBestId() const { return best_; }
  uint64_t GetBestHeight() const;
  size_t GetBlockCount() const { return blocks_.size(); }
  bool Contains(const chain::BlockId &id) const {
    return blocks_.count(id) > 0;
  }

  void SetQueryCounter(QueryCounter *counter) { counter_ = counter; }

  // LedgerSource
  std::optional<chain::BlockId>
  BestBlockAtHeight(uint64_t height) const override;
  std::optional<chain::Block>
  WholeBlock(const chain::BlockId &id) const override;

private:
  std::map<chain::BlockId, chain::Block> blocks_;
  chain::BlockId best_;
  QueryCounter *counter_;
};

} // namespace ledger
} // namespace lightwallet
