// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "util/endian.hpp"
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace lightwallet {
namespace chain {

// Address - Opaque account identifier that can own coins
// A handful of well-known names plus numbered custom accounts.
// Totally ordered by (kind, number) so selection and change output
// ordering are deterministic.
class Address {
public:
  enum class Kind : uint8_t {
    ALICE = 0,
    BOB = 1,
    CHARLIE = 2,
    DAVE = 3,
    EVE = 4,
    CUSTOM = 5
  };

  static constexpr Address Alice() { return Address(Kind::ALICE, 0); }
  static constexpr Address Bob() { return Address(Kind::BOB, 0); }
  static constexpr Address Charlie() { return Address(Kind::CHARLIE, 0); }
  static constexpr Address Dave() { return Address(Kind::DAVE, 0); }
  static constexpr Address Eve() { return Address(Kind::EVE, 0); }
  static constexpr Address Custom(uint64_t number) {
    return Address(Kind::CUSTOM, number);
  }

  Kind GetKind() const { return kind_; }
  uint64_t GetNumber() const { return number_; }

  // "alice", "bob", ... or "custom:<n>"
  std::string ToString() const;
  static std::optional<Address> FromString(std::string_view str);

  template <typename Stream> void Serialize(Stream &s) const {
    ser_writedata8(s, static_cast<uint8_t>(kind_));
    ser_writedata64(s, number_);
  }

  friend auto operator<=>(const Address &, const Address &) = default;

private:
  constexpr Address(Kind kind, uint64_t number)
      : kind_(kind), number_(number) {}

  Kind kind_;
  uint64_t number_;
};

// Signature - Mock authorization tag carried by an input
// Either "valid, by <address>" or "invalid". No cryptography; the wallet
// never verifies it, it only fills it in when building transactions.
class Signature {
public:
  static Signature ValidBy(const Address &signer) { return Signature(signer); }
  static Signature Invalid() { return Signature(std::nullopt); }

  bool IsValid() const { return signer_.has_value(); }
  const std::optional<Address> &Signer() const { return signer_; }

  std::string ToString() const;

  template <typename Stream> void Serialize(Stream &s) const {
    ser_writedata8(s, signer_ ? 1 : 0);
    if (signer_) {
      signer_->Serialize(s);
    }
  }

  friend bool operator==(const Signature &, const Signature &) = default;

private:
  explicit Signature(std::optional<Address> signer)
      : signer_(std::move(signer)) {}

  std::optional<Address> signer_;
};

} // namespace chain
} // namespace lightwallet
