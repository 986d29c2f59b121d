// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/pow.hpp"

namespace replichain {
namespace consensus {

bool CheckProofOfWork(std::string_view hash, int difficulty) {
  if (difficulty <= 0) {
    return true;
  }
  if (hash.size() < static_cast<size_t>(difficulty)) {
    return false;
  }
  return CountLeadingZeroNibbles(hash) >= difficulty;
}

int CountLeadingZeroNibbles(std::string_view hash) {
  int count = 0;
  for (char c : hash) {
    if (c != '0') {
      break;
    }
    ++count;
  }
  return count;
}

} // namespace consensus
} // namespace replichain
