// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2020 The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util/uint.hpp"

#include <iomanip>
#include <sstream>

namespace lightwallet {

static inline int HexDigit(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

static std::string_view StripHexPrefix(std::string_view str) {
  if (str.size() >= 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X')) {
    str.remove_prefix(2);
  }
  return str;
}

template <unsigned int BITS> std::string base_blob<BITS>::GetHex() const {
  std::stringstream ss;
  ss << std::hex << std::setfill('0');
  // Reverse byte order for display (little-endian to big-endian)
  for (int i = WIDTH - 1; i >= 0; --i) {
    ss << std::setw(2) << static_cast<unsigned int>(m_data[i]);
  }
  return ss.str();
}

template <unsigned int BITS>
void base_blob<BITS>::SetHex(std::string_view str) {
  SetNull();
  str = StripHexPrefix(str);

  // Only the leading run of hex digits is significant
  size_t digits = 0;
  while (digits < str.size() && HexDigit(str[digits]) != -1) {
    ++digits;
  }

  // Most significant digit first in the string, stored last in the blob
  unsigned char *p1 = begin();
  unsigned char *pend = end();
  size_t pos = digits;
  while (pos > 0 && p1 < pend) {
    *p1 = static_cast<unsigned char>(HexDigit(str[--pos]));
    if (pos > 0) {
      *p1 |= static_cast<unsigned char>(HexDigit(str[--pos]) << 4);
    }
    ++p1;
  }
}

template <unsigned int BITS>
std::optional<base_blob<BITS>> base_blob<BITS>::FromHex(std::string_view str) {
  str = StripHexPrefix(str);
  if (str.size() != static_cast<size_t>(WIDTH) * 2) {
    return std::nullopt;
  }
  for (char c : str) {
    if (HexDigit(c) == -1) {
      return std::nullopt;
    }
  }
  base_blob<BITS> out;
  out.SetHex(str);
  return out;
}

template <unsigned int BITS> std::string base_blob<BITS>::ToString() const {
  return GetHex();
}

template class base_blob<256>;

const uint256 uint256::ZERO(0);
const uint256 uint256::ONE(1);

} // namespace lightwallet
