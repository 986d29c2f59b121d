// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/integrity.hpp"
#include "chain/blockchain.hpp"
#include "chain/merkle.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <unordered_map>

namespace replichain {
namespace consensus {

size_t ReplicaReport::AcceptedCount() const {
  return static_cast<size_t>(
      std::count_if(replicas.begin(), replicas.end(),
                    [](const ReplicaVerdict &v) { return v.accepted; }));
}

std::vector<size_t> ReplicaReport::RejectedIndices() const {
  std::vector<size_t> rejected;
  for (const auto &v : replicas) {
    if (!v.accepted) {
      rejected.push_back(v.index);
    }
  }
  return rejected;
}

std::string SelectMajorityRoot(const std::vector<std::string> &roots,
                               size_t *out_count) {
  std::unordered_map<std::string, size_t> counts;
  for (const auto &root : roots) {
    ++counts[root];
  }

  // Scan in replica order and only replace on a strictly higher count, so
  // the earliest root wins a tie
  std::string best;
  size_t best_count = 0;
  for (const auto &root : roots) {
    size_t count = counts[root];
    if (count > best_count) {
      best = root;
      best_count = count;
    }
  }

  if (out_count) {
    *out_count = best_count;
  }
  return best;
}

ReplicaReport CompareRoots(const std::vector<chain::Blockchain> &chains) {
  ReplicaReport report;
  report.replicas.reserve(chains.size());

  std::vector<std::string> roots;
  roots.reserve(chains.size());

  for (size_t i = 0; i < chains.size(); ++i) {
    ReplicaVerdict verdict;
    verdict.index = i;
    verdict.merkle_root = chain::ComputeMerkleRoot(chains[i].GetBlockHashes());
    verdict.validity = chains[i].IsValid();
    roots.push_back(verdict.merkle_root);
    report.replicas.push_back(std::move(verdict));
  }

  report.majority_root = SelectMajorityRoot(roots, &report.majority_count);

  for (auto &verdict : report.replicas) {
    verdict.matches_majority = verdict.merkle_root == report.majority_root;
    verdict.accepted = verdict.validity.IsValid() && verdict.matches_majority;
    if (!verdict.accepted) {
      LOG_CONSENSUS_WARN("Replica {} rejected: {}", verdict.index,
                         !verdict.validity.IsValid()
                             ? verdict.validity.ToString()
                             : "merkle root differs from majority");
    }
  }

  LOG_CONSENSUS_INFO("Majority root {} held by {}/{} replicas",
                     report.majority_root.substr(0, 16), report.majority_count,
                     chains.size());
  return report;
}

std::vector<size_t> DiffBlocks(const chain::Blockchain &a,
                               const chain::Blockchain &b) {
  std::vector<size_t> diffs;
  const size_t shared = std::min(a.Size(), b.Size());
  for (size_t i = 0; i < shared; ++i) {
    if (a[i].hash != b[i].hash) {
      diffs.push_back(i);
    }
  }
  return diffs;
}

ChainComparison CompareChains(const chain::Blockchain &a,
                              const chain::Blockchain &b) {
  ChainComparison cmp;
  cmp.root_a = chain::ComputeMerkleRoot(a.GetBlockHashes());
  cmp.root_b = chain::ComputeMerkleRoot(b.GetBlockHashes());
  cmp.size_a = a.Size();
  cmp.size_b = b.Size();
  cmp.length_mismatch = cmp.size_a != cmp.size_b;
  cmp.identical = !cmp.length_mismatch && cmp.root_a == cmp.root_b;

  if (!cmp.identical) {
    cmp.differing = DiffBlocks(a, b);
    LOG_CONSENSUS_DEBUG("Chains differ: {} differing blocks, sizes {} / {}",
                        cmp.differing.size(), cmp.size_a, cmp.size_b);
  }
  return cmp;
}

} // namespace consensus
} // namespace replichain
