// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include <cstdint>
#include <optional>

namespace lightwallet {
namespace ledger {

// LedgerSource - Abstract read-only view of a ledger's canonical chain
// Allows dependency injection of different implementations:
// - MemoryLedger: in-process fork tree (tests, fuzzing)
// - networked sources: must apply their own timeout/retry policy and report
//   a timeout as "absent" (std::nullopt)
//
// No snapshot isolation: the canonical chain may change between two calls.
class LedgerSource {
public:
  virtual ~LedgerSource() = default;

  // Id of the block on the current canonical chain at `height`, or nullopt
  // if the canonical chain is shorter than `height`.
  virtual std::optional<chain::BlockId>
  BestBlockAtHeight(uint64_t height) const = 0;

  // Full content of a block by id, whether or not it is still canonical.
  // nullopt only if the id is unknown (or currently unavailable).
  virtual std::optional<chain::Block>
  WholeBlock(const chain::BlockId &id) const = 0;
};

} // namespace ledger
} // namespace lightwallet
