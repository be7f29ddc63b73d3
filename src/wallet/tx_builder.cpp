// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "wallet/tx_builder.hpp"
#include "util/logging.hpp"
#include <limits>

namespace lightwallet {
namespace wallet {

TransactionBuilder::TransactionBuilder(const UtxoStore &utxos,
                                       const std::set<chain::Address> &tracked)
    : utxos_(utxos), tracked_(tracked) {}

WalletResult<chain::Transaction>
TransactionBuilder::CreateManual(const std::vector<chain::CoinId> &input_ids,
                                 const std::vector<chain::Coin> &outputs) const {
  if (input_ids.empty()) {
    return WalletError::ZERO_INPUTS;
  }

  chain::Transaction tx;
  tx.inputs.reserve(input_ids.size());
  for (const auto &id : input_ids) {
    std::optional<chain::Coin> coin = utxos_.Get(id);
    if (!coin) {
      LOG_WALLET_DEBUG("CreateManual: unknown coin {}", id.ToString());
      return WalletError::UNKNOWN_COIN;
    }
    tx.inputs.emplace_back(id, chain::Signature::ValidBy(coin->owner));
  }

  for (const auto &output : outputs) {
    if (output.value == 0) {
      return WalletError::ZERO_COIN_VALUE;
    }
  }
  tx.outputs = outputs;

  LOG_WALLET_TRACE("CreateManual: {} inputs, {} outputs", tx.inputs.size(),
                   tx.outputs.size());
  return tx;
}

WalletResult<chain::Transaction>
TransactionBuilder::CreateAutomatic(const chain::Address &recipient,
                                    uint64_t payment, uint64_t tip) const {
  if (payment == 0) {
    return WalletError::ZERO_COIN_VALUE;
  }
  if (tip > std::numeric_limits<uint64_t>::max() - payment) {
    return WalletError::INSUFFICIENT_FUNDS;
  }
  const uint64_t required = payment + tip;

  // `selected` stays below `required` until the covering coin, whose surplus
  // becomes the change, so neither can overflow.
  chain::Transaction tx;
  uint64_t selected = 0;
  uint64_t change = 0;
  for (const auto &[id, coin] : utxos_) {
    if (selected >= required) {
      break;
    }
    tx.inputs.emplace_back(id, chain::Signature::ValidBy(coin.owner));
    const uint64_t missing = required - selected;
    if (coin.value >= missing) {
      change = coin.value - missing;
      selected = required;
    } else {
      selected += coin.value;
    }
  }

  if (selected < required) {
    LOG_WALLET_DEBUG("CreateAutomatic: have {}, need {}", selected, required);
    return WalletError::INSUFFICIENT_FUNDS;
  }

  tx.outputs.emplace_back(payment, recipient);

  if (change > 0) {
    if (tracked_.empty()) {
      return WalletError::NO_OWNED_ADDRESSES;
    }
    tx.outputs.emplace_back(change, *tracked_.begin());
  }

  LOG_WALLET_TRACE("CreateAutomatic: {} inputs, payment={} tip={} change={}",
                   tx.inputs.size(), payment, tip, change);
  return tx;
}

} // namespace wallet
} // namespace lightwallet
