// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/address.hpp"
#include "chain/coin.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <utility>

namespace lightwallet {
namespace wallet {

// (coin id, value) pairs as reported by AllCoinsOf / ValuesOwnedBy
using CoinValueSet = std::set<std::pair<chain::CoinId, uint64_t>>;

// UtxoStore - Unspent coins owned by tracked addresses
// Derived state: reconstructible by replaying the chain from genesis.
// Iteration is in ascending CoinId order.
//
// THREAD SAFETY: NO internal synchronization - owned by one Wallet, which is
// used from a single thread.
class UtxoStore {
public:
  using Map = std::map<chain::CoinId, chain::Coin>;

  // Insert or overwrite
  void Insert(const chain::CoinId &id, const chain::Coin &coin);

  // Remove and return the coin, nullopt if absent
  std::optional<chain::Coin> Remove(const chain::CoinId &id);

  std::optional<chain::Coin> Get(const chain::CoinId &id) const;
  bool Contains(const chain::CoinId &id) const { return coins_.count(id) > 0; }

  CoinValueSet ValuesOwnedBy(const chain::Address &owner) const;
  uint64_t SumOwnedBy(const chain::Address &owner) const;
  uint64_t TotalValue() const;

  size_t Size() const { return coins_.size(); }
  bool Empty() const { return coins_.empty(); }
  void Clear() { coins_.clear(); }

  Map::const_iterator begin() const { return coins_.begin(); }
  Map::const_iterator end() const { return coins_.end(); }

  friend bool operator==(const UtxoStore &, const UtxoStore &) = default;

private:
  Map coins_;
};

} // namespace wallet
} // namespace lightwallet
