// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/block.hpp"
#include "chain/pow.hpp"
#include "util/logging.hpp"
#include "util/sha256.hpp"
#include "util/time.hpp"
#include <sstream>
#include <stdexcept>

namespace replichain {
namespace chain {

CBlock::CBlock(std::string payload_in, std::string prev_hash,
               std::optional<int64_t> time)
    : nTime(time ? *time : util::GetTime()), payload(std::move(payload_in)),
      hashPrevBlock(std::move(prev_hash)) {
  hash = ComputeHash();
}

std::string CBlock::HashPreimagePrefix() const {
  // Everything but the nonce; mining re-hashes this prefix per attempt
  return std::to_string(nTime) + payload + hashPrevBlock;
}

std::string CBlock::ComputeHash() const {
  return util::Sha256Hex(HashPreimagePrefix() + std::to_string(nNonce));
}

bool CBlock::Mine(int difficulty, uint64_t *out_hashes,
                  const MiningInterrupt &interrupt) {
  if (!consensus::IsValidDifficulty(difficulty)) {
    throw std::invalid_argument("difficulty out of range: " +
                                std::to_string(difficulty));
  }

  const std::string prefix = HashPreimagePrefix();
  util::CSHA256 hasher;
  unsigned char digest[util::CSHA256::OUTPUT_SIZE];
  uint64_t attempts = 0;
  bool found = true;

  while (!consensus::CheckProofOfWork(hash, difficulty)) {
    if (interrupt && interrupt(attempts)) {
      found = false;
      break;
    }
    ++nNonce;
    hasher.Write(prefix).Write(std::to_string(nNonce)).Finalize(digest);
    hash = util::HexStr(digest, sizeof(digest));
    ++attempts;
  }

  if (out_hashes) {
    *out_hashes = attempts;
  }

  if (found) {
    LOG_CHAIN_TRACE("Mined block nonce={} attempts={} hash={}", nNonce,
                    attempts, hash);
  } else {
    LOG_CHAIN_DEBUG("Mining interrupted after {} attempts (difficulty {})",
                    attempts, difficulty);
  }
  return found;
}

void CBlock::UpdateData(std::string new_payload) {
  payload = std::move(new_payload);
  nNonce = 0;
  hash = ComputeHash();
}

std::string CBlock::ToString() const {
  std::ostringstream s;
  s << "CBlock(hash=" << hash.substr(0, 10)
    << "..., prev=" << hashPrevBlock.substr(0, 10) << "..., nonce=" << nNonce
    << ", payload=" << payload << ", time=" << nTime << ")";
  return s.str();
}

} // namespace chain
} // namespace replichain
