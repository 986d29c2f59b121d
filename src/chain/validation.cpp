// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/validation.hpp"
#include "chain/block.hpp"
#include "chain/pow.hpp"
#include "util/logging.hpp"

namespace replichain {
namespace validation {

std::string ValidationState::ToString() const {
  if (IsValid()) {
    return "valid";
  }
  std::string s = reject_reason_;
  if (invalid_index_) {
    s += " at block " + std::to_string(*invalid_index_);
  }
  if (!debug_message_.empty()) {
    s += " (" + debug_message_ + ")";
  }
  return s;
}

bool CheckBlockHash(const chain::CBlock &block, ValidationState &state) {
  const std::string recomputed = block.ComputeHash();
  if (block.hash != recomputed) {
    return state.Invalid("bad-hash", "stored " + block.hash.substr(0, 16) +
                                         " != computed " +
                                         recomputed.substr(0, 16));
  }
  return true;
}

bool CheckBlockLink(const chain::CBlock &block, const chain::CBlock &prev,
                    ValidationState &state) {
  if (block.hashPrevBlock != prev.hash) {
    return state.Invalid("bad-prevblk",
                         "previous hash " + block.hashPrevBlock.substr(0, 16) +
                             " does not match predecessor " +
                             prev.hash.substr(0, 16));
  }
  return true;
}

bool CheckBlockPoW(const chain::CBlock &block, int difficulty,
                   ValidationState &state) {
  if (!consensus::CheckProofOfWork(block.hash, difficulty)) {
    return state.Invalid("high-hash",
                         "proof of work failed: " +
                             std::to_string(consensus::CountLeadingZeroNibbles(
                                 block.hash)) +
                             " leading zeros < difficulty " +
                             std::to_string(difficulty));
  }
  return true;
}

bool CheckChain(const std::vector<chain::CBlock> &blocks, int difficulty,
                ValidationState &state) {
  for (size_t i = 1; i < blocks.size(); ++i) {
    const chain::CBlock &block = blocks[i];

    if (!CheckBlockHash(block, state) ||
        !CheckBlockLink(block, blocks[i - 1], state) ||
        !CheckBlockPoW(block, difficulty, state)) {
      state.SetInvalidIndex(i);
      LOG_CHAIN_DEBUG("Chain invalid: {}", state.ToString());
      return false;
    }
  }
  return true;
}

} // namespace validation
} // namespace replichain
