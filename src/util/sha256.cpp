// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/sha256.hpp"
#include <openssl/evp.h>
#include <stdexcept>

namespace replichain {
namespace util {

void CSHA256::CtxDeleter::operator()(evp_md_ctx_st *ctx) const noexcept {
  EVP_MD_CTX_free(ctx);
}

CSHA256::CSHA256() : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_) {
    throw std::runtime_error("Failed to create EVP_MD_CTX");
  }
  Reset();
}

CSHA256::~CSHA256() = default;

CSHA256 &CSHA256::Reset() {
  if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("EVP_DigestInit_ex failed");
  }
  return *this;
}

CSHA256 &CSHA256::Write(const unsigned char *data, size_t len) {
  if (len == 0) {
    return *this;
  }
  if (EVP_DigestUpdate(ctx_.get(), data, len) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }
  return *this;
}

void CSHA256::Finalize(unsigned char hash[OUTPUT_SIZE]) {
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx_.get(), hash, &len) != 1 || len != OUTPUT_SIZE) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  Reset();
}

std::string HexStr(const unsigned char *data, size_t len) {
  static constexpr char kHexDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(len * 2);
  for (size_t i = 0; i < len; ++i) {
    out.push_back(kHexDigits[data[i] >> 4]);
    out.push_back(kHexDigits[data[i] & 0x0f]);
  }
  return out;
}

std::string Sha256Hex(std::string_view payload) {
  unsigned char hash[CSHA256::OUTPUT_SIZE];
  CSHA256().Write(payload).Finalize(hash);
  return HexStr(hash, sizeof(hash));
}

} // namespace util
} // namespace replichain
