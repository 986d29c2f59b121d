// Copyright (c) 2025 The Unicity Foundation
// Test suite for chain parameters

#include <catch2/catch_test_macros.hpp>
#include "chain/chainparams.hpp"
#include "chain/pow.hpp"
#include <stdexcept>

using namespace replichain::chain;

TEST_CASE("ChainParams creation", "[chainparams]") {
    SECTION("Create Default") {
        auto params = ChainParams::CreateDefault();
        REQUIRE(params != nullptr);
        REQUIRE(params->GetChainType() == ChainType::DEFAULT);
        REQUIRE(params->GetChainTypeString() == "default");
        REQUIRE(params->GetDifficulty() == 3);
        REQUIRE(params->GetGenesisTime() == 1000);
        REQUIRE(params->GetGenesisPayload() == "Genesis Block");
    }

    SECTION("Create RegTest") {
        auto params = ChainParams::CreateRegTest();
        REQUIRE(params != nullptr);
        REQUIRE(params->GetChainType() == ChainType::REGTEST);
        REQUIRE(params->GetChainTypeString() == "regtest");
        // RegTest has easy difficulty for instant mining
        REQUIRE(params->GetDifficulty() == 1);
    }
}

TEST_CASE("ChainParams overrides", "[chainparams]") {
    auto params = ChainParams::CreateDefault();

    SECTION("Difficulty within range") {
        params->SetDifficulty(0);
        REQUIRE(params->GetDifficulty() == 0);
        params->SetDifficulty(replichain::consensus::MAX_DIFFICULTY);
        REQUIRE(params->GetDifficulty() == replichain::consensus::MAX_DIFFICULTY);
    }

    SECTION("Difficulty out of range keeps the old value") {
        REQUIRE_THROWS_AS(params->SetDifficulty(-1), std::invalid_argument);
        REQUIRE_THROWS_AS(params->SetDifficulty(65), std::invalid_argument);
        REQUIRE(params->GetDifficulty() == 3);
    }

    SECTION("Genesis time") {
        params->SetGenesisTime(1700000000);
        REQUIRE(params->GetGenesisTime() == 1700000000);
    }

    SECTION("Constructor validates difficulty") {
        REQUIRE_THROWS_AS(ChainParams(ChainType::DEFAULT, 100, 0, "x"),
                          std::invalid_argument);
    }
}
