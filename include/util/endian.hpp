// Copyright (c) 2014-2022 The Bitcoin Core developers
// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.
#pragma once

#include <bit>
#include <cstdint>
#include <cstring>

namespace lightwallet {
namespace endian {

inline uint64_t byteswap64(uint64_t x) {
  return ((x >> 56) & 0x00000000000000FFULL) |
         ((x >> 40) & 0x000000000000FF00ULL) |
         ((x >> 24) & 0x0000000000FF0000ULL) |
         ((x >> 8) & 0x00000000FF000000ULL) |
         ((x << 8) & 0x000000FF00000000ULL) |
         ((x << 24) & 0x0000FF0000000000ULL) |
         ((x << 40) & 0x00FF000000000000ULL) |
         ((x << 56) & 0xFF00000000000000ULL);
}

inline void WriteLE64(uint8_t *ptr, uint64_t value) {
  if constexpr (std::endian::native == std::endian::big) {
    value = byteswap64(value);
  }
  std::memcpy(ptr, &value, sizeof(value));
}

} // namespace endian

// Canonical encoding helpers used by the ledger entities' Serialize()
template <typename Stream> void ser_writedata8(Stream &s, uint8_t v) {
  s.write(reinterpret_cast<const char *>(&v), 1);
}

template <typename Stream> void ser_writedata64(Stream &s, uint64_t v) {
  uint8_t buf[8];
  endian::WriteLE64(buf, v);
  s.write(reinterpret_cast<const char *>(buf), sizeof(buf));
}

} // namespace lightwallet
