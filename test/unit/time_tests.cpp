// Copyright (c) 2025 The Unicity Foundation
// Test suite for the mockable clock

#include <catch2/catch_test_macros.hpp>
#include "util/time.hpp"

using namespace replichain::util;

TEST_CASE("Mock time", "[util][time]") {
    SECTION("Real clock when not mocked") {
        REQUIRE(GetMockTime() == 0);
        REQUIRE(GetTime() > 1600000000);
    }

    SECTION("Scope pins and restores") {
        {
            MockTimeScope outer(5000);
            REQUIRE(GetTime() == 5000);
            {
                MockTimeScope inner(6000);
                REQUIRE(GetTime() == 6000);
            }
            REQUIRE(GetTime() == 5000);
        }
        REQUIRE(GetMockTime() == 0);
    }
}

TEST_CASE("FormatTime", "[util][time]") {
    REQUIRE(FormatTime(0) == "1970-01-01 00:00:00 UTC");
    REQUIRE(FormatTime(1000) == "1970-01-01 00:16:40 UTC");
}
