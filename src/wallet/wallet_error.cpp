// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "wallet/wallet_error.hpp"

namespace lightwallet {
namespace wallet {

std::string WalletErrorString(WalletError error) {
  switch (error) {
  case WalletError::FOREIGN_ADDRESS:
    return "foreign-address";
  case WalletError::UNKNOWN_COIN:
    return "unknown-coin";
  case WalletError::NO_OWNED_ADDRESSES:
    return "no-owned-addresses";
  case WalletError::INSUFFICIENT_FUNDS:
    return "insufficient-funds";
  case WalletError::ZERO_COIN_VALUE:
    return "zero-coin-value";
  case WalletError::ZERO_INPUTS:
    return "zero-inputs";
  }
  return "unknown";
}

} // namespace wallet
} // namespace lightwallet
