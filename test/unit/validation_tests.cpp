// Copyright (c) 2025 The Unicity Foundation
// Test suite for block and chain validation rules

#include <catch2/catch_test_macros.hpp>
#include "chain/block.hpp"
#include "chain/validation.hpp"
#include <string>
#include <vector>

using namespace replichain;
using namespace replichain::validation;
using replichain::chain::CBlock;

namespace {

std::vector<CBlock> MinedBlocks(int difficulty, size_t count) {
    std::vector<CBlock> blocks;
    blocks.emplace_back("Genesis Block", chain::GENESIS_PREV_HASH, 1000);
    blocks.back().Mine(difficulty);
    for (size_t i = 1; i < count; ++i) {
        std::string prev = blocks.back().hash;
        blocks.emplace_back("Transaction " + std::to_string(i - 1), prev,
                            1000 + static_cast<int64_t>(i));
        blocks.back().Mine(difficulty);
    }
    return blocks;
}

} // namespace

TEST_CASE("ValidationState basics", "[validation]") {
    ValidationState state;
    REQUIRE(state.IsValid());
    REQUIRE_FALSE(state.IsInvalid());
    REQUIRE(state.ToString() == "valid");

    SECTION("Invalid records reason and returns false") {
        REQUIRE_FALSE(state.Invalid("high-hash", "too easy"));
        REQUIRE(state.IsInvalid());
        REQUIRE(state.GetRejectReason() == "high-hash");
        REQUIRE(state.GetDebugMessage() == "too easy");
        REQUIRE(state.ToString() == "high-hash (too easy)");
    }

    SECTION("Index appears in the summary") {
        state.Invalid("bad-prevblk");
        state.SetInvalidIndex(7);
        REQUIRE(state.GetInvalidIndex() == 7u);
        REQUIRE(state.ToString() == "bad-prevblk at block 7");
    }
}

TEST_CASE("Per-block checks", "[validation]") {
    auto blocks = MinedBlocks(2, 2);
    ValidationState state;

    SECTION("Honest block passes every check") {
        REQUIRE(CheckBlockHash(blocks[1], state));
        REQUIRE(CheckBlockLink(blocks[1], blocks[0], state));
        REQUIRE(CheckBlockPoW(blocks[1], 2, state));
        REQUIRE(state.IsValid());
    }

    SECTION("Stale stored hash") {
        blocks[1].nTime += 1;
        REQUIRE_FALSE(CheckBlockHash(blocks[1], state));
        REQUIRE(state.GetRejectReason() == "bad-hash");
    }

    SECTION("Wrong predecessor") {
        blocks[1].hashPrevBlock = std::string(64, '0');
        REQUIRE_FALSE(CheckBlockLink(blocks[1], blocks[0], state));
        REQUIRE(state.GetRejectReason() == "bad-prevblk");
    }

    SECTION("Insufficient work") {
        CBlock easy("unmined", blocks[0].hash, 1);
        easy.Mine(0);
        // 64 leading zeros is unreachable
        REQUIRE_FALSE(CheckBlockPoW(easy, 64, state));
        REQUIRE(state.GetRejectReason() == "high-hash");
    }
}

TEST_CASE("CheckChain", "[validation]") {
    SECTION("Empty and genesis-only sequences are valid") {
        ValidationState state;
        REQUIRE(CheckChain({}, 3, state));
        REQUIRE(CheckChain(MinedBlocks(1, 1), 1, state));
        REQUIRE(state.IsValid());
    }

    SECTION("Reports the first failing index only") {
        auto blocks = MinedBlocks(1, 5);
        blocks[2].payload = "first edit";
        blocks[4].payload = "second edit";

        ValidationState state;
        REQUIRE_FALSE(CheckChain(blocks, 1, state));
        REQUIRE(state.GetInvalidIndex() == 2u);
        REQUIRE(state.GetRejectReason() == "bad-hash");
    }

    SECTION("Chain mined at a lower difficulty fails a stricter check") {
        auto blocks = MinedBlocks(0, 3);
        ValidationState state;
        // Probability of all digests having 8 leading zeros is negligible
        REQUIRE_FALSE(CheckChain(blocks, 8, state));
        REQUIRE(state.GetRejectReason() == "high-hash");
        REQUIRE(state.GetInvalidIndex() == 1u);
    }
}
