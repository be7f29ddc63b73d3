// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/hash.hpp"
#include <openssl/evp.h>
#include <stdexcept>

namespace lightwallet {
namespace util {

HashWriter::HashWriter() : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_) {
    throw std::runtime_error("HashWriter: EVP_MD_CTX_new failed");
  }
  if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
    EVP_MD_CTX_free(ctx_);
    throw std::runtime_error("HashWriter: EVP_DigestInit_ex failed");
  }
}

HashWriter::~HashWriter() { EVP_MD_CTX_free(ctx_); }

void HashWriter::write(const char *data, size_t len) {
  if (finalized_) {
    throw std::logic_error("HashWriter: write after GetHash");
  }
  if (len == 0) {
    return;
  }
  if (EVP_DigestUpdate(ctx_, data, len) != 1) {
    throw std::runtime_error("HashWriter: EVP_DigestUpdate failed");
  }
}

uint256 HashWriter::GetHash() {
  if (finalized_) {
    throw std::logic_error("HashWriter: GetHash called twice");
  }
  finalized_ = true;

  unsigned char first[EVP_MAX_MD_SIZE];
  unsigned int first_len = 0;
  if (EVP_DigestFinal_ex(ctx_, first, &first_len) != 1) {
    throw std::runtime_error("HashWriter: EVP_DigestFinal_ex failed");
  }

  uint256 out;
  unsigned int out_len = 0;
  if (EVP_Digest(first, first_len, out.begin(), &out_len, EVP_sha256(),
                 nullptr) != 1 ||
      out_len != uint256::size()) {
    throw std::runtime_error("HashWriter: second SHA-256 round failed");
  }
  return out;
}

} // namespace util
} // namespace lightwallet
