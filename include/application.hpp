// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/blockchain.hpp"
#include "chain/chainparams.hpp"
#include "chain/integrity.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace replichain {
namespace app {

// Scenarios the harness can run against a replica set
enum class Scenario {
  HONEST,   // N identical replicas, all accepted
  MINORITY, // One replica honestly extended by an extra block
  MAJORITY, // A corrupted history copied onto a majority of replicas
  TAMPER,   // One block silently overwritten in one replica
  REWRITE,  // One replica rewrites a block and re-mines its descendants
  POW,      // Mining cost per difficulty level
  MERKLE    // Full Merkle tree of one replica
};

std::optional<Scenario> ParseScenario(const std::string &name);
std::string ScenarioName(Scenario scenario);

// Application configuration (filled from the command line)
struct AppConfig {
  Scenario scenario = Scenario::HONEST;

  chain::ChainType chain_type = chain::ChainType::DEFAULT;

  // Overrides of the chain parameters
  std::optional<int> difficulty;
  std::optional<int64_t> genesis_time;

  size_t replicas = 5;
  size_t blocks = 4;
  size_t tamper_index = 2;
  size_t threads = 1;

  bool json_output = false;
  bool verbose = false; // Text report lists every block
};

// Outcome of one scenario run
struct ScenarioResult {
  Scenario scenario = Scenario::HONEST;
  std::string description;
  int difficulty = 0;

  // Replica vote (all scenarios except POW and MERKLE)
  std::vector<chain::Blockchain> replicas;
  std::optional<consensus::ReplicaReport> report;

  // REWRITE: replica 0 vs replica 1
  std::optional<consensus::ChainComparison> comparison;

  // POW: digests computed per difficulty level
  std::vector<std::pair<int, uint64_t>> pow_attempts;

  // MERKLE: rendered tree
  std::string merkle_tree;
  std::string merkle_root;
};

// Application - runs a scenario and renders its report
class Application {
public:
  explicit Application(const AppConfig &config = AppConfig{});

  // Validate configuration and build chain parameters
  // Returns false (and logs why) on an unusable configuration
  bool initialize();

  // Run the configured scenario
  // @throws std::logic_error if initialize() has not succeeded
  ScenarioResult run_scenario() const;

  // initialize() + run_scenario() + render; returns a process exit code
  int run(std::ostream &out);

  const chain::ChainParams &chain_params() const { return *chain_params_; }

private:
  ScenarioResult RunReplicaVote() const;
  ScenarioResult RunRewrite() const;
  ScenarioResult RunPow() const;
  ScenarioResult RunMerkle() const;

  AppConfig config_;
  std::unique_ptr<chain::ChainParams> chain_params_;
};

} // namespace app
} // namespace replichain
