// Copyright (c) 2025 The Unicity Foundation
// Test suite for Merkle tree construction

#include <catch2/catch_test_macros.hpp>
#include "chain/merkle.hpp"
#include "util/sha256.hpp"
#include "util/string_parsing.hpp"
#include <algorithm>
#include <string>
#include <vector>

using namespace replichain;
using namespace replichain::chain;

namespace {

std::vector<std::string> Leaves(size_t n) {
    std::vector<std::string> leaves;
    for (size_t i = 0; i < n; ++i) {
        leaves.push_back(util::Sha256Hex("leaf " + std::to_string(i)));
    }
    return leaves;
}

} // namespace

TEST_CASE("HashPair", "[merkle]") {
    const std::string a = util::Sha256Hex("a");
    const std::string b = util::Sha256Hex("b");

    REQUIRE(HashPair(a, b) == util::Sha256Hex(a + b));
    REQUIRE(HashPair(a, b) != HashPair(b, a));
    REQUIRE(util::IsValidDigest(HashPair(a, b)));
}

TEST_CASE("MerkleTree empty", "[merkle]") {
    MerkleTree tree(std::vector<std::string>{});

    REQUIRE(tree.IsEmpty());
    REQUIRE(tree.GetRoot().empty());
    REQUIRE(tree.GetDepth() == 0);
    REQUIRE(tree.ToString().empty());
    REQUIRE(ComputeMerkleRoot({}).empty());
}

TEST_CASE("MerkleTree single leaf", "[merkle]") {
    auto leaves = Leaves(1);
    MerkleTree tree(leaves);

    REQUIRE(tree.GetRoot() == leaves[0]);
    REQUIRE(tree.GetDepth() == 1);
}

TEST_CASE("MerkleTree even leaf count", "[merkle]") {
    auto l = Leaves(4);
    MerkleTree tree(l);

    const std::string expected =
        HashPair(HashPair(l[0], l[1]), HashPair(l[2], l[3]));
    REQUIRE(tree.GetRoot() == expected);
    REQUIRE(tree.GetDepth() == 3);
    REQUIRE(tree.GetLevels()[0] == l);
    REQUIRE(tree.GetLevels()[1].size() == 2);
    REQUIRE(tree.GetLevels()[2].size() == 1);
}

TEST_CASE("MerkleTree odd leaf count duplicates the last entry", "[merkle]") {
    SECTION("Two leaves vs. one duplicated") {
        auto l = Leaves(1);
        std::vector<std::string> doubled{l[0], l[0]};
        REQUIRE(ComputeMerkleRoot(doubled) == HashPair(l[0], l[0]));
    }

    SECTION("Three leaves equal four with the last repeated") {
        auto l = Leaves(3);
        std::vector<std::string> padded{l[0], l[1], l[2], l[2]};
        REQUIRE(ComputeMerkleRoot(l) == ComputeMerkleRoot(padded));
    }

    SECTION("Five leaves pad at two levels") {
        auto l = Leaves(5);
        const std::string left =
            HashPair(HashPair(l[0], l[1]), HashPair(l[2], l[3]));
        const std::string right =
            HashPair(HashPair(l[4], l[4]), HashPair(l[4], l[4]));
        REQUIRE(ComputeMerkleRoot(l) == HashPair(left, right));
    }

    SECTION("Stored level includes the duplicate") {
        auto l = Leaves(3);
        MerkleTree tree(l);
        REQUIRE(tree.GetLeaves().size() == 3);
        REQUIRE(tree.GetLevels()[0].size() == 4);
        REQUIRE(tree.GetLevels()[0][3] == l[2]);
    }
}

TEST_CASE("MerkleTree commits to leaf order", "[merkle]") {
    auto l = Leaves(4);
    auto swapped = l;
    std::swap(swapped[1], swapped[2]);

    REQUIRE(ComputeMerkleRoot(l) != ComputeMerkleRoot(swapped));

    auto changed = l;
    changed[3] = util::Sha256Hex("different");
    REQUIRE(ComputeMerkleRoot(l) != ComputeMerkleRoot(changed));
}

TEST_CASE("MerkleTree ToString", "[merkle]") {
    auto l = Leaves(2);
    MerkleTree tree(l);
    std::string s = tree.ToString();

    REQUIRE(s.find("Level 0 (2 nodes):") == 0);
    REQUIRE(s.find("Level 1 (1 nodes):") != std::string::npos);
    REQUIRE(s.find("  " + tree.GetRoot() + "\n") != std::string::npos);
}
