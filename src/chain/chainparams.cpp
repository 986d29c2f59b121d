// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/chainparams.hpp"
#include "chain/pow.hpp"
#include <stdexcept>

namespace replichain {
namespace chain {

ChainParams::ChainParams(ChainType type, int difficulty, int64_t genesis_time,
                         std::string genesis_payload)
    : chainType(type), nDifficulty(0), nGenesisTime(genesis_time),
      genesisPayload(std::move(genesis_payload)) {
  SetDifficulty(difficulty);
}

void ChainParams::SetDifficulty(int difficulty) {
  if (!consensus::IsValidDifficulty(difficulty)) {
    throw std::invalid_argument("difficulty out of range: " +
                                std::to_string(difficulty));
  }
  nDifficulty = difficulty;
}

std::string ChainParams::GetChainTypeString() const {
  switch (chainType) {
  case ChainType::DEFAULT:
    return "default";
  case ChainType::REGTEST:
    return "regtest";
  }
  return "unknown";
}

std::unique_ptr<ChainParams> ChainParams::CreateDefault() {
  return std::make_unique<ChainParams>(ChainType::DEFAULT, 3, 1000,
                                       GENESIS_PAYLOAD);
}

std::unique_ptr<ChainParams> ChainParams::CreateRegTest() {
  return std::make_unique<ChainParams>(ChainType::REGTEST, 1, 1000,
                                       GENESIS_PAYLOAD);
}

} // namespace chain
} // namespace replichain
