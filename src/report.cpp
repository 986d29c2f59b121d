// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "report.hpp"
#include <iomanip>
#include <sstream>

namespace replichain {
namespace app {

using json = nlohmann::json;

static json VerdictToJson(const consensus::ReplicaVerdict &verdict) {
  json v;
  v["index"] = verdict.index;
  v["merkle_root"] = verdict.merkle_root;
  v["valid"] = verdict.validity.IsValid();
  if (const auto &bad = verdict.validity.GetInvalidIndex()) {
    v["first_invalid_block"] = *bad;
    v["reject_reason"] = verdict.validity.GetRejectReason();
  } else {
    v["first_invalid_block"] = nullptr;
  }
  v["matches_majority"] = verdict.matches_majority;
  v["accepted"] = verdict.accepted;
  return v;
}

json ReportToJson(const ScenarioResult &result) {
  json root;
  root["scenario"] = ScenarioName(result.scenario);
  root["description"] = result.description;
  root["difficulty"] = result.difficulty;

  if (result.report) {
    json replicas = json::array();
    for (const auto &verdict : result.report->replicas) {
      json v = VerdictToJson(verdict);
      v["blocks"] = result.replicas.at(verdict.index).Size();
      replicas.push_back(v);
    }
    root["replicas"] = replicas;
    root["majority_root"] = result.report->majority_root;
    root["majority_count"] = result.report->majority_count;
    root["accepted_count"] = result.report->AcceptedCount();
    root["rejected"] = result.report->RejectedIndices();
  }

  if (result.comparison) {
    const auto &cmp = *result.comparison;
    json c;
    c["root_a"] = cmp.root_a;
    c["root_b"] = cmp.root_b;
    c["identical"] = cmp.identical;
    c["differing_blocks"] = cmp.differing;
    c["length_mismatch"] = cmp.length_mismatch;
    c["size_a"] = cmp.size_a;
    c["size_b"] = cmp.size_b;
    root["comparison"] = c;
  }

  if (!result.pow_attempts.empty()) {
    json levels = json::array();
    for (const auto &[difficulty, attempts] : result.pow_attempts) {
      levels.push_back(json{{"difficulty", difficulty}, {"attempts", attempts}});
    }
    root["pow"] = levels;
  }

  if (result.scenario == Scenario::MERKLE && !result.replicas.empty()) {
    root["merkle_root"] = result.merkle_root;
    root["leaves"] = result.replicas.front().GetBlockHashes();
  }

  return root;
}

std::string RenderReport(const ScenarioResult &result, bool verbose) {
  std::ostringstream s;
  s << "=== Scenario: " << ScenarioName(result.scenario) << " ===\n";
  s << result.description << " (difficulty " << result.difficulty << ")\n\n";

  if (result.report) {
    const auto &report = *result.report;
    s << std::left << std::setw(8) << "Replica" << " | " << std::setw(64)
      << "Merkle root" << " | " << std::setw(22) << "Validity" << " | "
      << "Verdict\n";
    s << std::string(8 + 3 + 64 + 3 + 22 + 3 + 8, '-') << "\n";
    for (const auto &verdict : report.replicas) {
      s << std::left << std::setw(8) << verdict.index << " | "
        << std::setw(64) << verdict.merkle_root << " | " << std::setw(22)
        << verdict.validity.ToString().substr(0, 22) << " | "
        << (verdict.accepted ? "ACCEPTED" : "REJECTED") << "\n";
    }
    s << "\nMajority root: " << report.majority_root << " ("
      << report.majority_count << "/" << report.replicas.size()
      << " replicas)\n";
  }

  if (verbose) {
    for (size_t r = 0; r < result.replicas.size(); ++r) {
      s << "\nReplica " << r << ":\n";
      const auto &blocks = result.replicas[r].GetBlocks();
      for (size_t h = 0; h < blocks.size(); ++h) {
        s << "  [" << h << "] " << blocks[h].ToString() << "\n";
      }
    }
  }

  if (result.comparison) {
    const auto &cmp = *result.comparison;
    s << "\nReplica 0 vs replica 1: "
      << (cmp.identical ? "identical" : "different") << "\n";
    s << "  root 0: " << cmp.root_a << "\n";
    s << "  root 1: " << cmp.root_b << "\n";
    if (!cmp.differing.empty()) {
      s << "  differing blocks:";
      for (size_t i : cmp.differing) {
        s << " " << i;
      }
      s << "\n";
    }
    if (cmp.length_mismatch) {
      s << "  length mismatch: " << cmp.size_a << " vs " << cmp.size_b
        << " blocks\n";
    }
  }

  if (!result.pow_attempts.empty()) {
    s << std::left << std::setw(12) << "Difficulty" << " | " << "Attempts\n";
    s << std::string(12 + 3 + 12, '-') << "\n";
    for (const auto &[difficulty, attempts] : result.pow_attempts) {
      s << std::left << std::setw(12) << difficulty << " | " << attempts
        << "\n";
    }
  }

  if (!result.merkle_tree.empty()) {
    s << result.merkle_tree;
    s << "Merkle root: " << result.merkle_root << "\n";
  }

  return s.str();
}

} // namespace app
} // namespace replichain
