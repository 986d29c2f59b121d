// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

// Forward declaration (OpenSSL digest context)
struct evp_md_ctx_st;

namespace replichain {
namespace util {

// Length of a hex-encoded SHA-256 digest
static constexpr size_t DIGEST_HEX_LENGTH = 64;

/**
 * Streaming SHA-256 hasher backed by OpenSSL's EVP interface
 *
 * Usage:
 *   unsigned char out[CSHA256::OUTPUT_SIZE];
 *   CSHA256().Write(data, len).Finalize(out);
 *
 * Throws std::runtime_error if OpenSSL cannot allocate or drive the digest
 * context (environment failure, never a property of the input).
 */
class CSHA256 {
public:
  static constexpr size_t OUTPUT_SIZE = 32;

  CSHA256();
  ~CSHA256();

  CSHA256(const CSHA256 &) = delete;
  CSHA256 &operator=(const CSHA256 &) = delete;

  CSHA256 &Write(const unsigned char *data, size_t len);
  CSHA256 &Write(std::string_view data) {
    return Write(reinterpret_cast<const unsigned char *>(data.data()),
                 data.size());
  }

  // Writes OUTPUT_SIZE bytes to hash; the hasher is reset afterwards
  void Finalize(unsigned char hash[OUTPUT_SIZE]);

  CSHA256 &Reset();

private:
  struct CtxDeleter {
    void operator()(evp_md_ctx_st *ctx) const noexcept;
  };
  std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
};

// Lowercase hex encoding of a byte range
std::string HexStr(const unsigned char *data, size_t len);

// SHA-256 of payload as 64 lowercase hex characters
std::string Sha256Hex(std::string_view payload);

} // namespace util
} // namespace replichain
