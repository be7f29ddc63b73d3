// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace lightwallet {
namespace wallet {

// Failure reasons of wallet queries and transaction building.
// Returned, never thrown.
enum class WalletError {
  FOREIGN_ADDRESS,    // Queried address is not tracked by this wallet
  UNKNOWN_COIN,       // Coin id not in the local UTXO store
  NO_OWNED_ADDRESSES, // Operation needs a tracked address and there is none
  INSUFFICIENT_FUNDS, // Available/selected value below what is required
  ZERO_COIN_VALUE,    // Attempt to build a coin of value 0
  ZERO_INPUTS         // Attempt to build a transaction with no inputs
};

// Stable lowercase name ("foreign-address", ...)
std::string WalletErrorString(WalletError error);

/**
 * WalletResult - Value or WalletError
 *
 * Usage:
 *   auto result = wallet.TotalAssetsOf(address);
 *   if (!result) { LOG_WARN("{}", WalletErrorString(result.Error())); }
 *   else { use(result.Value()); }
 *
 * Value() on an error (or Error() on a value) is a programming error and
 * throws std::logic_error.
 */
template <typename T> class WalletResult {
public:
  WalletResult(T value) : result_(std::in_place_index<0>, std::move(value)) {}
  WalletResult(WalletError error) : result_(std::in_place_index<1>, error) {}

  bool IsOk() const { return result_.index() == 0; }
  explicit operator bool() const { return IsOk(); }

  const T &Value() const & {
    if (!IsOk()) {
      throw std::logic_error("WalletResult::Value() on error: " +
                             WalletErrorString(std::get<1>(result_)));
    }
    return std::get<0>(result_);
  }

  T &&Value() && {
    if (!IsOk()) {
      throw std::logic_error("WalletResult::Value() on error: " +
                             WalletErrorString(std::get<1>(result_)));
    }
    return std::get<0>(std::move(result_));
  }

  WalletError Error() const {
    if (IsOk()) {
      throw std::logic_error("WalletResult::Error() on success");
    }
    return std::get<1>(result_);
  }

  // True iff this result is the given error
  bool Is(WalletError error) const {
    return !IsOk() && std::get<1>(result_) == error;
  }

  friend bool operator==(const WalletResult &, const WalletResult &) = default;

private:
  std::variant<T, WalletError> result_;
};

} // namespace wallet
} // namespace lightwallet
