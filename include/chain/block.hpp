// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2022 The Bitcoin Core developers
// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#pragma once

#include "chain/transaction.hpp"
#include "util/uint.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace lightwallet {
namespace chain {

// BlockId - SHA256d of the block's canonical serialization
class BlockId : public uint256 {
public:
  constexpr BlockId() = default;
  constexpr explicit BlockId(const uint256 &hash) : uint256(hash) {}
};

// Block - Link to parent, height, and an ordered body of transactions
// There is no header/body split: the id commits to the whole body.
// Blocks form a tree through parent ids; a parent id is a lookup key into
// whatever store holds the blocks, never an owning reference.
struct Block {
  BlockId parent;     // Null for genesis
  uint64_t number{0}; // Height: parent height + 1, genesis is 0
  std::vector<Transaction> body;

  [[nodiscard]] BlockId GetId() const;

  [[nodiscard]] bool IsGenesis() const { return number == 0 && parent.IsNull(); }

  template <typename Stream> void Serialize(Stream &s) const {
    parent.Serialize(s);
    ser_writedata64(s, number);
    ser_writedata64(s, body.size());
    for (const auto &tx : body) {
      tx.Serialize(s);
    }
  }

  // Human-readable string
  std::string ToString() const;

  friend bool operator==(const Block &, const Block &) = default;
};

// The one genesis block: null parent, height 0, empty body.
// Every wallet knows it without fetching it.
const Block &GenesisBlock();
const BlockId &GenesisBlockId();

} // namespace chain
} // namespace lightwallet
