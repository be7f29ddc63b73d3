// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/transaction.hpp"
#include "util/hash.hpp"
#include <sstream>

namespace lightwallet {
namespace chain {

namespace {

// Coin id referenced by Input::Dummy(). Not the output of any hash.
const CoinId kDummyCoinId(uint256S("2718281828459045"));

} // namespace

CoinId MakeCoinId(const TransactionId &txid, uint64_t block_height,
                  uint64_t output_index) {
  util::HashWriter writer;
  txid.Serialize(writer);
  ser_writedata64(writer, block_height);
  ser_writedata64(writer, output_index);
  return CoinId(writer.GetHash());
}

std::string Coin::ToString() const {
  return "Coin(value=" + std::to_string(value) + ", owner=" +
         owner.ToString() + ")";
}

Input Input::Dummy() { return Input(kDummyCoinId, Signature::Invalid()); }

TransactionId Transaction::GetId() const {
  return TransactionId(util::SerializeHash(*this));
}

CoinId Transaction::GetCoinId(uint64_t block_height,
                              uint64_t output_index) const {
  return MakeCoinId(GetId(), block_height, output_index);
}

std::vector<std::pair<CoinId, Coin>>
Transaction::OutputsWithIds(uint64_t block_height) const {
  const TransactionId txid = GetId();
  std::vector<std::pair<CoinId, Coin>> result;
  result.reserve(outputs.size());
  for (size_t index = 0; index < outputs.size(); ++index) {
    result.emplace_back(MakeCoinId(txid, block_height, index), outputs[index]);
  }
  return result;
}

std::string Transaction::ToString() const {
  std::stringstream s;
  s << "Transaction(id=" << GetId().ToString().substr(0, 16) << "\n";
  for (const auto &in : inputs) {
    s << "  in  " << in.coin_id.ToString().substr(0, 16) << " "
      << in.signature.ToString() << "\n";
  }
  for (const auto &out : outputs) {
    s << "  out " << out.ToString() << "\n";
  }
  s << ")";
  return s.str();
}

} // namespace chain
} // namespace lightwallet
