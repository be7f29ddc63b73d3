// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/address.hpp"
#include <array>
#include <charconv>

namespace lightwallet {
namespace chain {

namespace {

constexpr std::array<std::string_view, 5> kNamed = {"alice", "bob", "charlie",
                                                    "dave", "eve"};
constexpr std::string_view kCustomPrefix = "custom:";

} // namespace

std::string Address::ToString() const {
  if (kind_ == Kind::CUSTOM) {
    return std::string(kCustomPrefix) + std::to_string(number_);
  }
  return std::string(kNamed[static_cast<size_t>(kind_)]);
}

std::optional<Address> Address::FromString(std::string_view str) {
  for (size_t i = 0; i < kNamed.size(); ++i) {
    if (str == kNamed[i]) {
      return Address(static_cast<Kind>(i), 0);
    }
  }

  if (str.substr(0, kCustomPrefix.size()) != kCustomPrefix) {
    return std::nullopt;
  }
  std::string_view digits = str.substr(kCustomPrefix.size());
  if (digits.empty()) {
    return std::nullopt;
  }

  uint64_t number = 0;
  auto [ptr, ec] =
      std::from_chars(digits.data(), digits.data() + digits.size(), number);
  if (ec != std::errc() || ptr != digits.data() + digits.size()) {
    return std::nullopt;
  }
  return Address::Custom(number);
}

std::string Signature::ToString() const {
  return signer_ ? "valid(" + signer_->ToString() + ")" : "invalid";
}

} // namespace chain
} // namespace lightwallet
