// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "application.hpp"
#include "chain/merkle.hpp"
#include "report.hpp"
#include "sim/replica_set.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <stdexcept>

namespace replichain {
namespace app {

namespace {

struct ScenarioEntry {
  Scenario scenario;
  const char *name;
};

constexpr ScenarioEntry kScenarios[] = {
    {Scenario::HONEST, "honest"},     {Scenario::MINORITY, "minority"},
    {Scenario::MAJORITY, "majority"}, {Scenario::TAMPER, "tamper"},
    {Scenario::REWRITE, "rewrite"},   {Scenario::POW, "pow"},
    {Scenario::MERKLE, "merkle"},
};

// Payloads written by the attack scenarios
constexpr const char *kMinorityPayload = "Corruption mineure";
constexpr const char *kMajorityPayload = "Corruption majeure";
constexpr const char *kTamperPayload = "Corruption malveillante";
constexpr const char *kRewritePayload = "Transaction modifiee";

} // namespace

std::optional<Scenario> ParseScenario(const std::string &name) {
  for (const auto &entry : kScenarios) {
    if (name == entry.name) {
      return entry.scenario;
    }
  }
  return std::nullopt;
}

std::string ScenarioName(Scenario scenario) {
  for (const auto &entry : kScenarios) {
    if (entry.scenario == scenario) {
      return entry.name;
    }
  }
  return "unknown";
}

Application::Application(const AppConfig &config) : config_(config) {}

bool Application::initialize() {
  chain_params_ = config_.chain_type == chain::ChainType::REGTEST
                      ? chain::ChainParams::CreateRegTest()
                      : chain::ChainParams::CreateDefault();

  if (config_.difficulty) {
    try {
      chain_params_->SetDifficulty(*config_.difficulty);
    } catch (const std::invalid_argument &e) {
      LOG_APP_ERROR("Invalid configuration: {}", e.what());
      chain_params_.reset();
      return false;
    }
  }
  if (config_.genesis_time) {
    chain_params_->SetGenesisTime(*config_.genesis_time);
  }

  if (config_.replicas == 0) {
    LOG_APP_ERROR("Invalid configuration: at least one replica is required");
    chain_params_.reset();
    return false;
  }
  if ((config_.scenario == Scenario::TAMPER ||
       config_.scenario == Scenario::REWRITE) &&
      config_.tamper_index > config_.blocks) {
    LOG_APP_ERROR("Invalid configuration: tamper index {} beyond tip {}",
                  config_.tamper_index, config_.blocks);
    chain_params_.reset();
    return false;
  }

  LOG_APP_INFO("Scenario {} on {} chain (difficulty {}, genesis time {})",
               ScenarioName(config_.scenario),
               chain_params_->GetChainTypeString(),
               chain_params_->GetDifficulty(), chain_params_->GetGenesisTime());
  return true;
}

ScenarioResult Application::run_scenario() const {
  if (!chain_params_) {
    throw std::logic_error("Application::run_scenario before initialize");
  }

  switch (config_.scenario) {
  case Scenario::HONEST:
  case Scenario::MINORITY:
  case Scenario::MAJORITY:
  case Scenario::TAMPER:
    return RunReplicaVote();
  case Scenario::REWRITE:
    return RunRewrite();
  case Scenario::POW:
    return RunPow();
  case Scenario::MERKLE:
    return RunMerkle();
  }
  throw std::logic_error("unhandled scenario");
}

ScenarioResult Application::RunReplicaVote() const {
  ScenarioResult result;
  result.scenario = config_.scenario;
  result.difficulty = chain_params_->GetDifficulty();

  sim::ReplicaSetOptions options;
  options.replica_count = config_.replicas;
  options.difficulty = chain_params_->GetDifficulty();
  options.block_count = config_.blocks;
  options.genesis_time = chain_params_->GetGenesisTime();
  options.threads = config_.threads;
  result.replicas = sim::BuildReplicas(options);

  const int64_t genesis_time = chain_params_->GetGenesisTime();

  switch (config_.scenario) {
  case Scenario::HONEST:
    result.description = std::to_string(config_.replicas) +
                         " replicas built from identical inputs";
    break;
  case Scenario::MINORITY:
    sim::ExtendReplica(result.replicas[0], kMinorityPayload,
                       genesis_time + 1000);
    result.description = "replica 0 extended with one extra block";
    break;
  case Scenario::MAJORITY: {
    sim::ExtendReplica(result.replicas[0], kMajorityPayload,
                       genesis_time + 2000);
    const size_t corrupted = config_.replicas / 2 + 1;
    std::vector<size_t> targets;
    for (size_t i = 1; i < corrupted; ++i) {
      targets.push_back(i);
    }
    sim::OverwriteReplicas(result.replicas, 0, targets);
    result.description = "corrupted history of replica 0 copied onto " +
                         std::to_string(targets.size()) + " more replicas";
    break;
  }
  case Scenario::TAMPER:
    sim::TamperBlock(result.replicas[0], config_.tamper_index, kTamperPayload);
    result.description = "block " + std::to_string(config_.tamper_index) +
                         " of replica 0 overwritten without re-mining";
    break;
  default:
    break;
  }

  result.report = consensus::CompareRoots(result.replicas);
  return result;
}

ScenarioResult Application::RunRewrite() const {
  ScenarioResult result;
  result.scenario = Scenario::REWRITE;
  result.difficulty = chain_params_->GetDifficulty();

  sim::ReplicaSetOptions options;
  options.replica_count = std::max<size_t>(2, config_.replicas);
  options.difficulty = chain_params_->GetDifficulty();
  options.block_count = config_.blocks;
  options.genesis_time = chain_params_->GetGenesisTime();
  options.threads = config_.threads;
  result.replicas = sim::BuildReplicas(options);

  sim::RewriteBlock(result.replicas[1], config_.tamper_index, kRewritePayload);
  result.description = "replica 1 rewrote block " +
                       std::to_string(config_.tamper_index) +
                       " and re-mined every descendant";

  result.comparison =
      consensus::CompareChains(result.replicas[0], result.replicas[1]);
  result.report = consensus::CompareRoots(result.replicas);
  return result;
}

ScenarioResult Application::RunPow() const {
  ScenarioResult result;
  result.scenario = Scenario::POW;
  result.difficulty = chain_params_->GetDifficulty();
  result.description = "digests computed to mine the same block at each "
                       "difficulty up to " +
                       std::to_string(result.difficulty);

  for (int d = 0; d <= result.difficulty; ++d) {
    chain::CBlock block("Test PoW", chain::GENESIS_PREV_HASH,
                        chain_params_->GetGenesisTime());
    uint64_t attempts = 0;
    block.Mine(d, &attempts);
    result.pow_attempts.emplace_back(d, attempts);
  }
  return result;
}

ScenarioResult Application::RunMerkle() const {
  ScenarioResult result;
  result.scenario = Scenario::MERKLE;
  result.difficulty = chain_params_->GetDifficulty();

  chain::Blockchain replica(*chain_params_);
  for (size_t i = 0; i < config_.blocks; ++i) {
    replica.AddBlock(sim::TransactionPayload(i),
                     sim::TransactionTime(chain_params_->GetGenesisTime(), i));
  }

  chain::MerkleTree tree(replica.GetBlockHashes());
  result.merkle_tree = tree.ToString();
  result.merkle_root = tree.GetRoot();
  result.description = "Merkle tree over " + std::to_string(replica.Size()) +
                       " block hashes (" + std::to_string(tree.GetDepth()) +
                       " levels)";
  result.replicas.push_back(std::move(replica));
  return result;
}

int Application::run(std::ostream &out) {
  if (!initialize()) {
    return 1;
  }

  ScenarioResult result = run_scenario();
  if (config_.json_output) {
    out << ReportToJson(result).dump(2) << "\n";
  } else {
    out << RenderReport(result, config_.verbose);
  }
  return 0;
}

} // namespace app
} // namespace replichain
