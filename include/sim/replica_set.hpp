// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/blockchain.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace replichain {
namespace sim {

/**
 * Replica scenario builders
 *
 * Simulates a set of independently held ledgers built from identical inputs,
 * plus the attacks run against them. Every function takes its parameters
 * explicitly and returns or mutates owned chains; no replica ever aliases
 * another's blocks.
 */

struct ReplicaSetOptions {
  size_t replica_count{5};
  int difficulty{3};
  size_t block_count{4};   // Blocks appended after genesis
  int64_t genesis_time{1000};
  size_t threads{1};       // > 1 mines replicas concurrently, one per task
};

// Payload of the i-th simulated block: "Transaction i"
std::string TransactionPayload(size_t i);

// Timestamp of the i-th simulated block: genesis_time + i + 1
int64_t TransactionTime(int64_t genesis_time, size_t i);

// Build replica_count identical chains
// @throws std::invalid_argument on an out-of-range difficulty
std::vector<chain::Blockchain> BuildReplicas(const ReplicaSetOptions &options);

// Honestly mine one extra block onto a single replica (minority fork)
const chain::CBlock &ExtendReplica(chain::Blockchain &replica,
                                   std::string payload, int64_t time);

// Copy the history of replicas[source] into each of replicas[targets]
// @throws std::out_of_range on a bad index
void OverwriteReplicas(std::vector<chain::Blockchain> &replicas, size_t source,
                       const std::vector<size_t> &targets);

// Overwrite a block's payload and recompute its hash, leaving the nonce and
// every descendant untouched
// @throws std::out_of_range
void TamperBlock(chain::Blockchain &replica, size_t height,
                 std::string payload);

// Replace a block's payload and re-mine it and all descendants, producing a
// valid but different history
// @throws std::out_of_range
void RewriteBlock(chain::Blockchain &replica, size_t height,
                  std::string payload);

} // namespace sim
} // namespace replichain
