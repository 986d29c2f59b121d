// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/blockchain.hpp"
#include "chain/chainparams.hpp"
#include "chain/pow.hpp"
#include "util/logging.hpp"
#include <stdexcept>

namespace replichain {
namespace chain {

static int CheckedDifficulty(int difficulty) {
  if (!consensus::IsValidDifficulty(difficulty)) {
    throw std::invalid_argument("difficulty out of range: " +
                                std::to_string(difficulty));
  }
  return difficulty;
}

Blockchain::Blockchain(int difficulty, int64_t genesis_time)
    : nDifficulty(CheckedDifficulty(difficulty)) {
  vBlocks.push_back(CreateGenesisBlock(genesis_time, GENESIS_PAYLOAD));
}

Blockchain::Blockchain(const ChainParams &params)
    : nDifficulty(CheckedDifficulty(params.GetDifficulty())) {
  vBlocks.push_back(
      CreateGenesisBlock(params.GetGenesisTime(), params.GetGenesisPayload()));
}

CBlock Blockchain::CreateGenesisBlock(int64_t time, std::string payload) const {
  CBlock genesis(std::move(payload), GENESIS_PREV_HASH, time);
  genesis.Mine(nDifficulty);
  LOG_CHAIN_DEBUG("Genesis mined: {}", genesis.ToString());
  return genesis;
}

const CBlock &Blockchain::AddBlock(std::string payload,
                                   std::optional<int64_t> time) {
  CBlock block(std::move(payload), Tip().hash, time);
  block.Mine(nDifficulty);
  vBlocks.push_back(std::move(block));
  LOG_CHAIN_DEBUG("Block {} appended: {}", Height(), Tip().ToString());
  return Tip();
}

validation::ValidationState Blockchain::IsValid() const {
  validation::ValidationState state;
  validation::CheckChain(vBlocks, nDifficulty, state);
  return state;
}

std::vector<std::string> Blockchain::GetBlockHashes() const {
  std::vector<std::string> hashes;
  hashes.reserve(vBlocks.size());
  for (const auto &block : vBlocks) {
    hashes.push_back(block.hash);
  }
  return hashes;
}

CBlock &Blockchain::GetMutableBlock(size_t height) {
  if (height >= vBlocks.size()) {
    throw std::out_of_range("block height " + std::to_string(height) +
                            " beyond tip " + std::to_string(Height()));
  }
  return vBlocks[height];
}

void Blockchain::OverwriteFrom(const Blockchain &other) {
  if (this == &other) {
    return;
  }
  nDifficulty = other.nDifficulty;
  vBlocks = other.vBlocks;
  LOG_CHAIN_DEBUG("Replica overwritten: {} blocks, tip {}", vBlocks.size(),
                  Tip().hash.substr(0, 16));
}

void Blockchain::RemineFrom(size_t height) {
  if (height >= vBlocks.size()) {
    throw std::out_of_range("block height " + std::to_string(height) +
                            " beyond tip " + std::to_string(Height()));
  }

  for (size_t i = height; i < vBlocks.size(); ++i) {
    CBlock &block = vBlocks[i];
    if (i > 0) {
      block.hashPrevBlock = vBlocks[i - 1].hash;
    }
    block.nNonce = 0;
    block.hash = block.ComputeHash();
    block.Mine(nDifficulty);
  }
  LOG_CHAIN_DEBUG("Re-mined blocks {}..{}", height, Height());
}

} // namespace chain
} // namespace replichain
