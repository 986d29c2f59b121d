// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/merkle.hpp"
#include "util/logging.hpp"
#include "util/sha256.hpp"
#include <sstream>

namespace replichain {
namespace chain {

namespace {
const std::string kEmptyRoot;
} // namespace

std::string HashPair(const std::string &left, const std::string &right) {
  return util::Sha256Hex(left + right);
}

MerkleTree::MerkleTree(std::vector<std::string> leaves)
    : leaves_(std::move(leaves)) {
  if (!leaves_.empty()) {
    Build();
  }
}

void MerkleTree::Build() {
  std::vector<std::string> current = leaves_;
  levels_.push_back(current);

  while (current.size() > 1) {
    if (current.size() % 2 != 0) {
      current.push_back(current.back());
      // Record the padded level, matching what was actually hashed
      levels_.back().push_back(current.back());
    }

    std::vector<std::string> next;
    next.reserve(current.size() / 2);
    for (size_t i = 0; i < current.size(); i += 2) {
      next.push_back(HashPair(current[i], current[i + 1]));
    }

    levels_.push_back(next);
    current = std::move(next);
  }

  LOG_MERKLE_TRACE("Merkle tree built: {} leaves, {} levels, root {}",
                   leaves_.size(), levels_.size(), GetRoot());
}

const std::string &MerkleTree::GetRoot() const {
  if (levels_.empty()) {
    return kEmptyRoot;
  }
  return levels_.back().front();
}

std::string MerkleTree::ToString() const {
  std::ostringstream s;
  for (size_t i = 0; i < levels_.size(); ++i) {
    s << "Level " << i << " (" << levels_[i].size() << " nodes):\n";
    for (const auto &h : levels_[i]) {
      s << "  " << h << "\n";
    }
  }
  return s.str();
}

std::string ComputeMerkleRoot(const std::vector<std::string> &leaves) {
  return MerkleTree(leaves).GetRoot();
}

} // namespace chain
} // namespace replichain
