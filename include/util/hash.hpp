// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "util/uint.hpp"
#include <cstddef>
#include <cstdint>

// Forward declaration (OpenSSL)
struct evp_md_ctx_st;

namespace lightwallet {
namespace util {

/**
 * HashWriter - Streaming SHA256d (double SHA-256) over OpenSSL EVP
 *
 * Acts as the Stream argument of the entities' Serialize() templates, so an
 * identifier is the hash of exactly the bytes the canonical serialization
 * produces. Not copyable; one writer yields one hash.
 */
class HashWriter {
public:
  HashWriter();
  ~HashWriter();

  HashWriter(const HashWriter &) = delete;
  HashWriter &operator=(const HashWriter &) = delete;

  // Stream interface expected by Serialize()
  void write(const char *data, size_t len);

  template <typename T> HashWriter &operator<<(const T &obj) {
    obj.Serialize(*this);
    return *this;
  }

  // SHA256(SHA256(written bytes)). Must be called at most once.
  [[nodiscard]] uint256 GetHash();

private:
  evp_md_ctx_st *ctx_;
  bool finalized_{false};
};

// Convenience: SHA256d of an object's canonical serialization
template <typename T> uint256 SerializeHash(const T &obj) {
  HashWriter writer;
  writer << obj;
  return writer.GetHash();
}

} // namespace util
} // namespace lightwallet
