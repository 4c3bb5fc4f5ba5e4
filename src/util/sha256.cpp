// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/sha256.hpp"
#include <openssl/evp.h>
#include <stdexcept>

namespace weave {
namespace crypto {

CSHA256::CSHA256() : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }
  if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
    EVP_MD_CTX_free(ctx_);
    ctx_ = nullptr;
    throw std::runtime_error("EVP_DigestInit_ex(sha256) failed");
  }
}

CSHA256::~CSHA256() {
  if (ctx_) {
    EVP_MD_CTX_free(ctx_);
  }
}

CSHA256 &CSHA256::Write(const unsigned char *data, size_t len) {
  if (len > 0 && EVP_DigestUpdate(ctx_, data, len) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }
  return *this;
}

void CSHA256::Finalize(unsigned char hash[OUTPUT_SIZE]) {
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx_, hash, &len) != 1 || len != OUTPUT_SIZE) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
}

uint256 Hash256(const std::vector<uint8_t> &data) {
  unsigned char tmp[CSHA256::OUTPUT_SIZE];
  CSHA256().Write(data.data(), data.size()).Finalize(tmp);

  uint256 out;
  CSHA256().Write(tmp, sizeof(tmp)).Finalize(out.begin());
  return out;
}

HashWriter &HashWriter::WriteU32(uint32_t v) {
  for (int i = 0; i < 4; ++i) {
    buf_.push_back(static_cast<uint8_t>(v >> (8 * i)));
  }
  return *this;
}

HashWriter &HashWriter::WriteU64(uint64_t v) {
  for (int i = 0; i < 8; ++i) {
    buf_.push_back(static_cast<uint8_t>(v >> (8 * i)));
  }
  return *this;
}

HashWriter &HashWriter::WriteHash(const uint256 &h) {
  buf_.insert(buf_.end(), h.begin(), h.end());
  return *this;
}

HashWriter &HashWriter::WriteString(const std::string &s) {
  WriteU64(s.size());
  buf_.insert(buf_.end(), s.begin(), s.end());
  return *this;
}

} // namespace crypto
} // namespace weave
