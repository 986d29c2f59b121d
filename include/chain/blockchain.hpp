// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include "chain/validation.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace replichain {
namespace chain {

class ChainParams;

// Blockchain - append-only, proof-of-work secured sequence of blocks
//
// Owns its blocks. Index 0 is always the mined genesis block. Blocks are
// only ever appended through AddBlock(); nothing is removed or reordered.
// Copying yields an independent replica.
class Blockchain {
public:
  // Mines the genesis block immediately
  // @throws std::invalid_argument if difficulty is outside [0, MAX_DIFFICULTY]
  Blockchain(int difficulty, int64_t genesis_time);
  explicit Blockchain(const ChainParams &params);

  // Build a link to the tip, mine it at the chain difficulty, and append it.
  // Timestamp defaults to util::GetTime().
  const CBlock &AddBlock(std::string payload,
                         std::optional<int64_t> time = std::nullopt);

  // Validate blocks 1..n-1; on failure the state names the first bad index
  [[nodiscard]] validation::ValidationState IsValid() const;

  const CBlock &Genesis() const { return vBlocks.front(); }
  const CBlock &Tip() const { return vBlocks.back(); }
  const CBlock &operator[](size_t height) const { return vBlocks.at(height); }

  // Height of the tip (genesis = 0)
  int Height() const { return static_cast<int>(vBlocks.size()) - 1; }
  size_t Size() const { return vBlocks.size(); }
  int GetDifficulty() const { return nDifficulty; }
  const std::vector<CBlock> &GetBlocks() const { return vBlocks; }

  // Ordered block digests (Merkle leaves)
  std::vector<std::string> GetBlockHashes() const;

  // === Tamper simulation ===
  // These bypass the append-only contract and exist for attack scenarios

  // @throws std::out_of_range
  CBlock &GetMutableBlock(size_t height);

  // Replace this replica's history with an independent copy of other's
  void OverwriteFrom(const Blockchain &other);

  // Re-link and re-mine every block from height to the tip
  // @throws std::out_of_range (height 0 re-mines from the genesis block)
  void RemineFrom(size_t height);

private:
  CBlock CreateGenesisBlock(int64_t time, std::string payload) const;

  int nDifficulty;
  std::vector<CBlock> vBlocks;
};

} // namespace chain
} // namespace replichain
