// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/address.hpp"
#include "chain/coin.hpp"
#include "chain/transaction.hpp"
#include "wallet/utxo_store.hpp"
#include "wallet/wallet_error.hpp"
#include <cstdint>
#include <set>
#include <vector>

namespace lightwallet {
namespace wallet {

/**
 * TransactionBuilder - Builds spend transactions from the wallet's coins
 *
 * Reads the UTXO store and the tracked address set; never mutates either.
 * A built transaction only becomes visible to the wallet once the ledger
 * includes it and the wallet syncs.
 */
class TransactionBuilder {
public:
  TransactionBuilder(const UtxoStore &utxos,
                     const std::set<chain::Address> &tracked);

  // Spend exactly `input_ids` into `outputs` (in the given order).
  // Errors, checked in this order: ZERO_INPUTS, UNKNOWN_COIN,
  // ZERO_COIN_VALUE. Each input is signed in the name of its coin's owner.
  // Value conservation is not checked: the difference is the tip.
  WalletResult<chain::Transaction>
  CreateManual(const std::vector<chain::CoinId> &input_ids,
               const std::vector<chain::Coin> &outputs) const;

  // Pay `payment` to `recipient`, leaving `tip` to whoever includes it.
  // Coins are selected in ascending CoinId order until they cover
  // payment + tip; any surplus goes back to the smallest tracked address.
  // Errors: ZERO_COIN_VALUE (payment 0), INSUFFICIENT_FUNDS (including
  // payment + tip overflow), NO_OWNED_ADDRESSES (change with no tracked
  // address).
  WalletResult<chain::Transaction>
  CreateAutomatic(const chain::Address &recipient, uint64_t payment,
                  uint64_t tip) const;

private:
  const UtxoStore &utxos_;
  const std::set<chain::Address> &tracked_;
};

} // namespace wallet
} // namespace lightwallet
