// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-present The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <string_view>

namespace lightwallet {

/** Template base class for fixed-sized opaque blobs. */
template <unsigned int BITS> class base_blob {
protected:
  static constexpr int WIDTH = BITS / 8;
  static_assert(BITS % 8 == 0,
                "base_blob currently only supports whole bytes.");
  std::array<uint8_t, WIDTH> m_data;

public:
  /* construct 0 value by default */
  constexpr base_blob() : m_data() {}

  /* constructor for constants between 1 and 255 */
  constexpr explicit base_blob(uint8_t v) : m_data{v} {}

  constexpr bool IsNull() const {
    return std::all_of(m_data.begin(), m_data.end(),
                       [](uint8_t val) { return val == 0; });
  }

  constexpr void SetNull() { std::fill(m_data.begin(), m_data.end(), 0); }

  /** Lexicographic ordering over the raw bytes. */
  constexpr int Compare(const base_blob &other) const {
    return std::memcmp(m_data.data(), other.m_data.data(), WIDTH);
  }

  friend constexpr bool operator==(const base_blob &a, const base_blob &b) {
    return a.Compare(b) == 0;
  }
  friend constexpr bool operator!=(const base_blob &a, const base_blob &b) {
    return a.Compare(b) != 0;
  }
  friend constexpr bool operator<(const base_blob &a, const base_blob &b) {
    return a.Compare(b) < 0;
  }

  /** @name Hex representation
   *
   * Bytes are shown in reverse order (Bitcoin convention), so the last byte
   * of the blob is the first pair of hex digits.
   * @{*/
  std::string GetHex() const;
  std::string ToString() const;

  /** Set from hex string. Supports optional "0x" prefix. */
  void SetHex(std::string_view str);

  /** Strict parse: exactly WIDTH*2 hex digits (after an optional "0x"). */
  static std::optional<base_blob> FromHex(std::string_view str);
  /**@}*/

  constexpr const unsigned char *data() const { return m_data.data(); }
  constexpr unsigned char *data() { return m_data.data(); }

  constexpr unsigned char *begin() { return m_data.data(); }
  constexpr unsigned char *end() { return m_data.data() + WIDTH; }

  constexpr const unsigned char *begin() const { return m_data.data(); }
  constexpr const unsigned char *end() const { return m_data.data() + WIDTH; }

  static constexpr unsigned int size() { return WIDTH; }

  template <typename Stream> void Serialize(Stream &s) const {
    s.write(reinterpret_cast<const char *>(m_data.data()), WIDTH);
  }
};

/** 256-bit opaque blob.
 * @note No integer operations; all ledger identifiers are built on it.
 */
class uint256 : public base_blob<256> {
public:
  constexpr uint256() = default;
  constexpr explicit uint256(uint8_t v) : base_blob<256>(v) {}
  constexpr explicit uint256(const base_blob<256> &b) : base_blob<256>(b) {}

  static const uint256 ZERO;
  static const uint256 ONE;
};

/* uint256 from hex string (lenient, like SetHex). */
inline uint256 uint256S(std::string_view str) {
  uint256 rv;
  rv.SetHex(str);
  return rv;
}

} // namespace lightwallet
