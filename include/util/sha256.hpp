// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "util/uint.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// OpenSSL EVP_MD_CTX is only referenced through a pointer here
typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace weave {
namespace crypto {

/**
 * Incremental SHA-256 hasher backed by OpenSSL EVP.
 *
 *   uint256 h;
 *   CSHA256().Write(data, len).Finalize(h.begin());
 *
 * Throws std::runtime_error if OpenSSL cannot allocate or initialize the
 * digest context (out of memory / broken provider).
 */
class CSHA256 {
public:
  static constexpr size_t OUTPUT_SIZE = 32;

  CSHA256();
  ~CSHA256();

  CSHA256(const CSHA256 &) = delete;
  CSHA256 &operator=(const CSHA256 &) = delete;

  CSHA256 &Write(const unsigned char *data, size_t len);
  void Finalize(unsigned char hash[OUTPUT_SIZE]);

private:
  EVP_MD_CTX *ctx_{nullptr};
};

// Double SHA-256 of a byte buffer
uint256 Hash256(const std::vector<uint8_t> &data);

/**
 * Append-only byte writer for canonical serialization of hashed structures.
 * Scalars are little-endian; blobs are copied as stored; byte strings and
 * lists are length-prefixed (uint64 LE).
 */
class HashWriter {
public:
  HashWriter &WriteU32(uint32_t v);
  HashWriter &WriteI32(int32_t v) { return WriteU32(static_cast<uint32_t>(v)); }
  HashWriter &WriteU64(uint64_t v);
  HashWriter &WriteI64(int64_t v) { return WriteU64(static_cast<uint64_t>(v)); }
  HashWriter &WriteHash(const uint256 &h);
  HashWriter &WriteString(const std::string &s);

  const std::vector<uint8_t> &Bytes() const { return buf_; }

  // SHA-256d of everything written so far
  uint256 GetHash() const { return Hash256(buf_); }

private:
  std::vector<uint8_t> buf_;
};

} // namespace crypto
} // namespace weave
