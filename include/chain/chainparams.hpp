// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace replichain {
namespace chain {

/**
 * Chain type enumeration
 */
enum class ChainType {
  DEFAULT, // Reference parameters (difficulty 3)
  REGTEST  // Regression test (easy mining)
};

/**
 * ChainParams - parameters shared by every replica of a ledger
 *
 * Replicas built from the same params and the same block inputs are
 * bit-identical.
 */
class ChainParams {
public:
  ChainParams(ChainType type, int difficulty, int64_t genesis_time,
              std::string genesis_payload);

  int GetDifficulty() const { return nDifficulty; }
  int64_t GetGenesisTime() const { return nGenesisTime; }
  const std::string &GetGenesisPayload() const { return genesisPayload; }
  ChainType GetChainType() const { return chainType; }
  std::string GetChainTypeString() const;

  // Mutators (for CLI overrides)
  // @throws std::invalid_argument on an out-of-range difficulty
  void SetDifficulty(int difficulty);
  void SetGenesisTime(int64_t time) { nGenesisTime = time; }

  // Factory methods
  static std::unique_ptr<ChainParams> CreateDefault();
  static std::unique_ptr<ChainParams> CreateRegTest();

private:
  ChainType chainType;
  int nDifficulty;
  int64_t nGenesisTime;
  std::string genesisPayload;
};

// Payload of every genesis block
inline constexpr const char *GENESIS_PAYLOAD = "Genesis Block";

} // namespace chain
} // namespace replichain
