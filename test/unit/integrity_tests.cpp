// Copyright (c) 2025 The Unicity Foundation
// Test suite for cross-replica integrity checks

#include <catch2/catch_test_macros.hpp>
#include "chain/blockchain.hpp"
#include "chain/integrity.hpp"
#include "chain/merkle.hpp"
#include "sim/replica_set.hpp"
#include <vector>

using namespace replichain;
using namespace replichain::consensus;

namespace {

std::vector<chain::Blockchain> FiveReplicas() {
    sim::ReplicaSetOptions options;
    options.replica_count = 5;
    options.difficulty = 2;
    options.block_count = 4;
    options.genesis_time = 1000;
    return sim::BuildReplicas(options);
}

} // namespace

TEST_CASE("SelectMajorityRoot", "[integrity]") {
    SECTION("Most frequent root wins") {
        size_t count = 0;
        REQUIRE(SelectMajorityRoot({"a", "b", "b", "c", "b"}, &count) == "b");
        REQUIRE(count == 3);
    }

    SECTION("Ties go to the first-seen root") {
        size_t count = 0;
        REQUIRE(SelectMajorityRoot({"b", "a", "a", "b"}, &count) == "b");
        REQUIRE(count == 2);
        REQUIRE(SelectMajorityRoot({"x", "y", "z"}) == "x");
    }

    SECTION("Empty input") {
        size_t count = 42;
        REQUIRE(SelectMajorityRoot({}, &count).empty());
        REQUIRE(count == 0);
    }
}

TEST_CASE("CompareRoots with honest replicas", "[integrity]") {
    auto replicas = FiveReplicas();
    ReplicaReport report = CompareRoots(replicas);

    REQUIRE(report.replicas.size() == 5);
    REQUIRE(report.majority_count == 5);
    REQUIRE(report.AcceptedCount() == 5);
    REQUIRE(report.RejectedIndices().empty());
    REQUIRE(report.majority_root ==
            chain::ComputeMerkleRoot(replicas[0].GetBlockHashes()));

    for (size_t i = 0; i < report.replicas.size(); ++i) {
        const auto& verdict = report.replicas[i];
        REQUIRE(verdict.index == i);
        REQUIRE(verdict.validity.IsValid());
        REQUIRE(verdict.matches_majority);
        REQUIRE(verdict.accepted);
    }
}

TEST_CASE("CompareRoots rejects a divergent minority", "[integrity]") {
    auto replicas = FiveReplicas();
    sim::ExtendReplica(replicas[0], "Corruption mineure", 2000);

    ReplicaReport report = CompareRoots(replicas);

    REQUIRE(report.majority_count == 4);
    REQUIRE(report.majority_root ==
            chain::ComputeMerkleRoot(replicas[1].GetBlockHashes()));

    // Replica 0 is a valid chain, it just disagrees with the majority
    REQUIRE(report.replicas[0].validity.IsValid());
    REQUIRE_FALSE(report.replicas[0].matches_majority);
    REQUIRE_FALSE(report.replicas[0].accepted);
    REQUIRE(report.RejectedIndices() == std::vector<size_t>{0});
    REQUIRE(report.AcceptedCount() == 4);
}

TEST_CASE("CompareRoots follows a corrupted majority", "[integrity]") {
    auto replicas = FiveReplicas();
    sim::ExtendReplica(replicas[0], "Corruption majeure", 3000);
    sim::OverwriteReplicas(replicas, 0, {1, 2});

    ReplicaReport report = CompareRoots(replicas);

    REQUIRE(report.majority_count == 3);
    REQUIRE(report.majority_root ==
            chain::ComputeMerkleRoot(replicas[0].GetBlockHashes()));
    REQUIRE(report.RejectedIndices() == std::vector<size_t>{3, 4});

    // The honest replicas are valid chains yet still outvoted
    REQUIRE(report.replicas[3].validity.IsValid());
    REQUIRE(report.replicas[4].validity.IsValid());
}

TEST_CASE("CompareRoots rejects a tampered replica", "[integrity]") {
    auto replicas = FiveReplicas();
    sim::TamperBlock(replicas[0], 2, "Corruption malveillante");

    ReplicaReport report = CompareRoots(replicas);

    REQUIRE(report.majority_count == 4);
    REQUIRE(report.RejectedIndices() == std::vector<size_t>{0});

    const auto& verdict = report.replicas[0];
    REQUIRE(verdict.validity.IsInvalid());
    REQUIRE(verdict.validity.GetInvalidIndex() == 2u);
    REQUIRE_FALSE(verdict.matches_majority);
}

TEST_CASE("CompareRoots requires validity as well as agreement", "[integrity]") {
    // All replicas share the same broken history
    auto replicas = FiveReplicas();
    sim::TamperBlock(replicas[0], 1, "everyone agrees on this");
    sim::OverwriteReplicas(replicas, 0, {1, 2, 3, 4});

    ReplicaReport report = CompareRoots(replicas);

    REQUIRE(report.majority_count == 5);
    REQUIRE(report.AcceptedCount() == 0);
    for (const auto& verdict : report.replicas) {
        REQUIRE(verdict.matches_majority);
        REQUIRE_FALSE(verdict.accepted);
    }
}

TEST_CASE("CompareRoots on no replicas", "[integrity]") {
    ReplicaReport report = CompareRoots({});

    REQUIRE(report.replicas.empty());
    REQUIRE(report.majority_root.empty());
    REQUIRE(report.majority_count == 0);
    REQUIRE(report.AcceptedCount() == 0);
}

TEST_CASE("DiffBlocks and CompareChains", "[integrity]") {
    auto replicas = FiveReplicas();

    SECTION("Identical replicas") {
        ChainComparison cmp = CompareChains(replicas[0], replicas[1]);
        REQUIRE(cmp.identical);
        REQUIRE_FALSE(cmp.length_mismatch);
        REQUIRE(cmp.differing.empty());
        REQUIRE(cmp.root_a == cmp.root_b);
        REQUIRE(DiffBlocks(replicas[0], replicas[1]).empty());
    }

    SECTION("Rewritten history differs from the rewrite point on") {
        sim::RewriteBlock(replicas[1], 2, "Transaction modifiee");

        ChainComparison cmp = CompareChains(replicas[0], replicas[1]);
        REQUIRE_FALSE(cmp.identical);
        REQUIRE_FALSE(cmp.length_mismatch);
        REQUIRE(cmp.root_a != cmp.root_b);
        REQUIRE(cmp.differing == std::vector<size_t>{2, 3, 4});
    }

    SECTION("Extra block is a length mismatch, not a block diff") {
        sim::ExtendReplica(replicas[0], "extra", 5000);

        REQUIRE(DiffBlocks(replicas[0], replicas[1]).empty());

        ChainComparison cmp = CompareChains(replicas[0], replicas[1]);
        REQUIRE_FALSE(cmp.identical);
        REQUIRE(cmp.length_mismatch);
        REQUIRE(cmp.size_a == 6);
        REQUIRE(cmp.size_b == 5);
        REQUIRE(cmp.differing.empty());
    }
}
