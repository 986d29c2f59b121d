// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace replichain {
namespace chain {

// Predecessor link carried by every genesis block
inline constexpr const char *GENESIS_PREV_HASH = "0";

// Called once per attempted nonce with the number of digests computed so
// far; returning true aborts the search
using MiningInterrupt = std::function<bool(uint64_t attempts)>;

// CBlock - One ledger entry
//
// The cached `hash` commits to (nTime, payload, hashPrevBlock, nNonce) in that
// order. Fields are public so that tampering can be simulated; anything that
// writes a field without recomputing `hash` leaves a block that fails
// HasValidHash().
class CBlock
{
public:
  int64_t nTime{0};           // Unix timestamp (seconds)
  std::string payload;        // Opaque ledger entry
  std::string hashPrevBlock;  // Digest of predecessor, GENESIS_PREV_HASH for genesis
  uint64_t nNonce{0};         // Proof-of-work search variable
  std::string hash;           // Cached digest of the four fields above

  // Timestamp defaults to util::GetTime() when not given
  CBlock(std::string payload_in, std::string prev_hash,
         std::optional<int64_t> time = std::nullopt);

  // Digest of the current fields (does not touch `hash`)
  [[nodiscard]] std::string ComputeHash() const;

  // Increment nNonce from its current value until hash meets difficulty.
  // Unbounded unless `interrupt` is supplied; returns false only when
  // interrupted. out_hashes receives the number of digests computed.
  // @throws std::invalid_argument if difficulty is outside [0, MAX_DIFFICULTY]
  bool Mine(int difficulty, uint64_t *out_hashes = nullptr,
            const MiningInterrupt &interrupt = {});

  // Replace payload, reset nonce to 0 and recompute hash WITHOUT re-mining
  void UpdateData(std::string new_payload);

  [[nodiscard]] bool HasValidHash() const { return hash == ComputeHash(); }

  [[nodiscard]] bool IsGenesis() const {
    return hashPrevBlock == GENESIS_PREV_HASH;
  }

  // Human-readable string (digests truncated)
  [[nodiscard]] std::string ToString() const;

private:
  std::string HashPreimagePrefix() const;
};

} // namespace chain
} // namespace replichain
