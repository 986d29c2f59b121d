// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/validation.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace replichain {

namespace chain {
class Blockchain;
} // namespace chain

namespace consensus {

/**
 * Cross-replica integrity check
 *
 * Each replica is summarized by the Merkle root over its ordered block
 * hashes. The majority root is the root held by the most replicas; ties go
 * to the root seen first in replica order. A replica is accepted iff its
 * chain validates AND its root equals the majority root.
 *
 * This is simple majority voting, not a consensus protocol: a tampered
 * majority holding identical histories outvotes an honest minority.
 */

struct ReplicaVerdict {
  size_t index{0};
  std::string merkle_root;
  validation::ValidationState validity;
  bool matches_majority{false};
  bool accepted{false};
};

struct ReplicaReport {
  std::vector<ReplicaVerdict> replicas;
  std::string majority_root;  // "" when no replicas were compared
  size_t majority_count{0};

  size_t AcceptedCount() const;
  std::vector<size_t> RejectedIndices() const;
};

// Pairwise comparison of two replicas
struct ChainComparison {
  std::string root_a;
  std::string root_b;
  bool identical{false};              // Merkle roots equal
  std::vector<size_t> differing;      // Heights whose hashes differ (shared prefix)
  bool length_mismatch{false};
  size_t size_a{0};
  size_t size_b{0};
};

ReplicaReport CompareRoots(const std::vector<chain::Blockchain> &chains);

// Majority root over an ordered list of roots (first-seen wins ties).
// Returns "" and count 0 for an empty list.
std::string SelectMajorityRoot(const std::vector<std::string> &roots,
                               size_t *out_count = nullptr);

// Heights in [0, min(a.Size(), b.Size())) whose block hashes differ. Blocks
// beyond the shorter chain are not reported; use CompareChains() to detect
// a length mismatch.
std::vector<size_t> DiffBlocks(const chain::Blockchain &a,
                               const chain::Blockchain &b);

// Merkle-root comparison with block-level diff and length check
ChainComparison CompareChains(const chain::Blockchain &a,
                              const chain::Blockchain &b);

} // namespace consensus
} // namespace replichain
