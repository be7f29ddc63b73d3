// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "wallet/utxo_store.hpp"

namespace lightwallet {
namespace wallet {

void UtxoStore::Insert(const chain::CoinId &id, const chain::Coin &coin) {
  coins_.insert_or_assign(id, coin);
}

std::optional<chain::Coin> UtxoStore::Remove(const chain::CoinId &id) {
  auto it = coins_.find(id);
  if (it == coins_.end()) {
    return std::nullopt;
  }
  chain::Coin coin = it->second;
  coins_.erase(it);
  return coin;
}

std::optional<chain::Coin> UtxoStore::Get(const chain::CoinId &id) const {
  auto it = coins_.find(id);
  if (it == coins_.end()) {
    return std::nullopt;
  }
  return it->second;
}

CoinValueSet UtxoStore::ValuesOwnedBy(const chain::Address &owner) const {
  CoinValueSet result;
  for (const auto &[id, coin] : coins_) {
    if (coin.owner == owner) {
      result.emplace(id, coin.value);
    }
  }
  return result;
}

uint64_t UtxoStore::SumOwnedBy(const chain::Address &owner) const {
  uint64_t total = 0;
  for (const auto &[id, coin] : coins_) {
    if (coin.owner == owner) {
      total = chain::AddCoinValues(total, coin.value);
    }
  }
  return total;
}

uint64_t UtxoStore::TotalValue() const {
  uint64_t total = 0;
  for (const auto &[id, coin] : coins_) {
    total = chain::AddCoinValues(total, coin.value);
  }
  return total;
}

} // namespace wallet
} // namespace lightwallet
