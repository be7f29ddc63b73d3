// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "ledger/memory_ledger.hpp"
#include "util/logging.hpp"
#include <stdexcept>

namespace lightwallet {
namespace ledger {

MemoryLedger::MemoryLedger(QueryCounter *counter)
    : best_(chain::GenesisBlockId()), counter_(counter) {
  blocks_.emplace(chain::GenesisBlockId(), chain::GenesisBlock());
}

chain::BlockId MemoryLedger::AddBlock(const chain::BlockId &parent,
                                      std::vector<chain::Transaction> body) {
  auto parent_it = blocks_.find(parent);
  if (parent_it == blocks_.end()) {
    throw std::invalid_argument("MemoryLedger: unknown parent " +
                                parent.ToString());
  }

  chain::Block block;
  block.parent = parent;
  block.number = parent_it->second.number + 1;
  block.body = std::move(body);

  chain::BlockId id = block.GetId();
  LOG_LEDGER_TRACE("AddBlock: height={} id={} parent={} txs={}", block.number,
                   id.ToString().substr(0, 16), parent.ToString().substr(0, 16),
                   block.body.size());
  // Re-adding identical content is a no-op: same id, same block
  blocks_.emplace(id, std::move(block));
  return id;
}

void MemoryLedger::SetBest(const chain::BlockId &id) {
  if (blocks_.count(id) == 0) {
    throw std::invalid_argument("MemoryLedger: cannot set unknown block " +
                                id.ToString() + " as best");
  }
  best_ = id;
}

chain::BlockId
MemoryLedger::AddBlockAsBest(const chain::BlockId &parent,
                             std::vector<chain::Transaction> body) {
  chain::BlockId id = AddBlock(parent, std::move(body));
  SetBest(id);
  return id;
}

uint64_t MemoryLedger::GetBestHeight() const {
  return blocks_.at(best_).number;
}

std::optional<chain::BlockId>
MemoryLedger::BestBlockAtHeight(uint64_t height) const {
  if (counter_) {
    ++counter_->best_block_queries;
  }

  const chain::Block *block = &blocks_.at(best_);
  if (height > block->number) {
    return std::nullopt;
  }

  // Walk back from the best block. Every stored block's parent is stored
  // (AddBlock enforces it), so this terminates at genesis at the latest.
  chain::BlockId id = best_;
  while (block->number != height) {
    id = block->parent;
    block = &blocks_.at(id);
  }
  return id;
}

std::optional<chain::Block>
MemoryLedger::WholeBlock(const chain::BlockId &id) const {
  if (counter_) {
    ++counter_->whole_block_queries;
  }

  auto it = blocks_.find(id);
  if (it == blocks_.end()) {
    return std::nullopt;
  }
  return it->second;
}

} // namespace ledger
} // namespace lightwallet
