// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/address.hpp"
#include "util/uint.hpp"
#include <cstdint>
#include <limits>
#include <string>

namespace lightwallet {
namespace chain {

// Coin - A value owned by an address
// Value 0 is never produced by the wallet's own builders (ZERO_COIN_VALUE),
// but is tolerated when observed in ledger data.
struct Coin {
  uint64_t value;
  Address owner;

  Coin(uint64_t value_in, const Address &owner_in)
      : value(value_in), owner(owner_in) {}

  template <typename Stream> void Serialize(Stream &s) const {
    ser_writedata64(s, value);
    owner.Serialize(s);
  }

  std::string ToString() const;

  friend bool operator==(const Coin &, const Coin &) = default;
};

// Sum of two coin values, capped at the largest representable value.
// Ledger data is not bounded by any supply rule, so totals may exceed 64 bits.
inline uint64_t AddCoinValues(uint64_t a, uint64_t b) {
  return b > std::numeric_limits<uint64_t>::max() - a
             ? std::numeric_limits<uint64_t>::max()
             : a + b;
}

// CoinId - SHA256d(creating transaction id, inclusion height, output index)
// Only meaningful in the context of the block that included the transaction:
// the same transaction replayed at another height yields different ids.
class CoinId : public uint256 {
public:
  constexpr CoinId() = default;
  constexpr explicit CoinId(const uint256 &hash) : uint256(hash) {}
};

} // namespace chain
} // namespace lightwallet
