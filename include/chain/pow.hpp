// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <string_view>

namespace replichain {
namespace consensus {

// Proof-of-work: a digest meets difficulty D when its first D hex
// characters are all '0'. A 64-character digest bounds D at 64.
static constexpr int MAX_DIFFICULTY = 64;

inline bool IsValidDifficulty(int difficulty) {
  return difficulty >= 0 && difficulty <= MAX_DIFFICULTY;
}

// CONSENSUS-CRITICAL: true iff hash starts with `difficulty` '0' characters.
// Difficulty 0 accepts every digest; a digest shorter than the difficulty
// never passes.
bool CheckProofOfWork(std::string_view hash, int difficulty);

// Number of leading '0' hex characters in hash
int CountLeadingZeroNibbles(std::string_view hash);

} // namespace consensus
} // namespace replichain
