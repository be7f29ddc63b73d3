// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2022 The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chain/block.hpp"
#include "util/hash.hpp"
#include <sstream>

namespace lightwallet {
namespace chain {

BlockId Block::GetId() const { return BlockId(util::SerializeHash(*this)); }

std::string Block::ToString() const {
  std::stringstream s;
  s << "Block(\n";
  s << "  parent=" << parent.GetHex() << "\n";
  s << "  number=" << number << "\n";
  s << "  transactions=" << body.size() << "\n";
  s << "  id=" << GetId().GetHex() << "\n";
  s << ")\n";
  return s.str();
}

const Block &GenesisBlock() {
  static const Block genesis{};
  return genesis;
}

const BlockId &GenesisBlockId() {
  static const BlockId id = GenesisBlock().GetId();
  return id;
}

} // namespace chain
} // namespace lightwallet
