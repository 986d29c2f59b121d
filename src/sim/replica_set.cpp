// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "sim/replica_set.hpp"
#include "util/logging.hpp"
#include "util/threadpool.hpp"
#include <algorithm>
#include <future>
#include <stdexcept>

namespace replichain {
namespace sim {

std::string TransactionPayload(size_t i) {
  return "Transaction " + std::to_string(i);
}

int64_t TransactionTime(int64_t genesis_time, size_t i) {
  return genesis_time + static_cast<int64_t>(i) + 1;
}

static chain::Blockchain BuildReplica(const ReplicaSetOptions &options) {
  chain::Blockchain replica(options.difficulty, options.genesis_time);
  for (size_t i = 0; i < options.block_count; ++i) {
    replica.AddBlock(TransactionPayload(i),
                     TransactionTime(options.genesis_time, i));
  }
  return replica;
}

std::vector<chain::Blockchain> BuildReplicas(const ReplicaSetOptions &options) {
  std::vector<chain::Blockchain> replicas;
  replicas.reserve(options.replica_count);

  LOG_CHAIN_INFO("Building {} replicas: difficulty={} blocks={} threads={}",
                 options.replica_count, options.difficulty,
                 options.block_count, options.threads);

  if (options.threads <= 1 || options.replica_count <= 1) {
    for (size_t r = 0; r < options.replica_count; ++r) {
      replicas.push_back(BuildReplica(options));
    }
    return replicas;
  }

  // Each task owns the replica it mines until the future hands it back
  util::ThreadPool pool(std::min(options.threads, options.replica_count));
  std::vector<std::future<chain::Blockchain>> pending;
  pending.reserve(options.replica_count);
  for (size_t r = 0; r < options.replica_count; ++r) {
    pending.push_back(pool.enqueue(BuildReplica, options));
  }
  for (auto &future : pending) {
    replicas.push_back(future.get());
  }
  return replicas;
}

const chain::CBlock &ExtendReplica(chain::Blockchain &replica,
                                   std::string payload, int64_t time) {
  return replica.AddBlock(std::move(payload), time);
}

void OverwriteReplicas(std::vector<chain::Blockchain> &replicas, size_t source,
                       const std::vector<size_t> &targets) {
  if (source >= replicas.size()) {
    throw std::out_of_range("source replica " + std::to_string(source) +
                            " out of range");
  }
  for (size_t target : targets) {
    if (target >= replicas.size()) {
      throw std::out_of_range("target replica " + std::to_string(target) +
                              " out of range");
    }
    replicas[target].OverwriteFrom(replicas[source]);
    LOG_CHAIN_INFO("Replica {} overwritten with history of replica {}", target,
                   source);
  }
}

void TamperBlock(chain::Blockchain &replica, size_t height,
                 std::string payload) {
  chain::CBlock &block = replica.GetMutableBlock(height);
  block.payload = std::move(payload);
  block.hash = block.ComputeHash();
  LOG_CHAIN_INFO("Tampered block {}: {}", height, block.ToString());
}

void RewriteBlock(chain::Blockchain &replica, size_t height,
                  std::string payload) {
  replica.GetMutableBlock(height).UpdateData(std::move(payload));
  replica.RemineFrom(height);
  LOG_CHAIN_INFO("Rewrote history from block {} to {}", height,
                 replica.Height());
}

} // namespace sim
} // namespace replichain
