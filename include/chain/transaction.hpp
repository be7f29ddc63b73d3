// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/address.hpp"
#include "chain/coin.hpp"
#include "util/uint.hpp"
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace lightwallet {
namespace chain {

// TransactionId - SHA256d of the transaction's canonical serialization
// Independent of the block (or height) that includes the transaction.
class TransactionId : public uint256 {
public:
  constexpr TransactionId() = default;
  constexpr explicit TransactionId(const uint256 &hash) : uint256(hash) {}
};

// Derive the id of output `output_index` of transaction `txid` included at
// `block_height`.
CoinId MakeCoinId(const TransactionId &txid, uint64_t block_height,
                  uint64_t output_index);

// Input - Reference to the coin being spent plus its (mock) authorization
struct Input {
  CoinId coin_id;
  Signature signature;

  Input(const CoinId &coin_id_in, const Signature &signature_in)
      : coin_id(coin_id_in), signature(signature_in) {}

  // Placeholder input for minting in tests: spends a fixed coin id that no
  // transaction ever creates, with an invalid signature.
  static Input Dummy();

  template <typename Stream> void Serialize(Stream &s) const {
    coin_id.Serialize(s);
    signature.Serialize(s);
  }

  friend bool operator==(const Input &, const Input &) = default;
};

// Transaction - Consumes inputs, creates outputs
//
// Wire-level validity (at least one input, value conservation, signatures) is
// the ledger's business. The wallet observes whatever the ledger includes and
// only enforces rules on transactions it builds itself.
struct Transaction {
  std::vector<Input> inputs;
  std::vector<Coin> outputs;

  [[nodiscard]] TransactionId GetId() const;

  // Id of output `output_index` when this transaction is included at
  // `block_height`.
  [[nodiscard]] CoinId GetCoinId(uint64_t block_height,
                                 uint64_t output_index) const;

  // Outputs paired with their ids for inclusion at `block_height`
  [[nodiscard]] std::vector<std::pair<CoinId, Coin>>
  OutputsWithIds(uint64_t block_height) const;

  // Canonical encoding: count-prefixed inputs, then count-prefixed outputs
  template <typename Stream> void Serialize(Stream &s) const {
    ser_writedata64(s, inputs.size());
    for (const auto &in : inputs) {
      in.Serialize(s);
    }
    ser_writedata64(s, outputs.size());
    for (const auto &out : outputs) {
      out.Serialize(s);
    }
  }

  std::string ToString() const;

  friend bool operator==(const Transaction &, const Transaction &) = default;
};

} // namespace chain
} // namespace lightwallet
