// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace replichain {
namespace chain {

// SHA-256 of the two hex digests concatenated (left then right, no separator)
std::string HashPair(const std::string &left, const std::string &right);

// MerkleTree - binary hash reduction over an ordered list of digests
//
// Level 0 holds the leaves. Each following level hashes adjacent pairs of
// the previous one; a level with an odd count first duplicates its last
// entry (the duplicate is kept in the stored level). The final level holds
// the root.
//
// The root commits to leaf ORDER: permuting leaves changes the root. The
// tree is immutable after construction; build a new one for new leaves.
class MerkleTree {
public:
  explicit MerkleTree(std::vector<std::string> leaves);

  // Root digest, or "" when there are no leaves
  const std::string &GetRoot() const;

  const std::vector<std::string> &GetLeaves() const { return leaves_; }
  const std::vector<std::vector<std::string>> &GetLevels() const {
    return levels_;
  }

  // Number of stored levels (0 for an empty tree, 1 for a single leaf)
  size_t GetDepth() const { return levels_.size(); }

  bool IsEmpty() const { return leaves_.empty(); }

  // Full tree, one level per block of lines
  std::string ToString() const;

private:
  void Build();

  std::vector<std::string> leaves_;
  std::vector<std::vector<std::string>> levels_;
};

// Root of the tree over leaves ("" when empty)
std::string ComputeMerkleRoot(const std::vector<std::string> &leaves);

} // namespace chain
} // namespace replichain
