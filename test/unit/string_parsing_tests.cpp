// Unit tests for string parsing utilities
#include <catch2/catch_test_macros.hpp>
#include "util/string_parsing.hpp"
#include "util/sha256.hpp"
#include <cstdint>
#include <limits>

using namespace replichain::util;

TEST_CASE("SafeParseInt - valid inputs", "[util][string_parsing]") {
    SECTION("Parse valid positive integer") {
        auto result = SafeParseInt("42", 0, 100);
        REQUIRE(result.has_value());
        REQUIRE(*result == 42);
    }

    SECTION("Parse valid negative integer") {
        auto result = SafeParseInt("-50", -100, 100);
        REQUIRE(result.has_value());
        REQUIRE(*result == -50);
    }

    SECTION("Parse at bounds") {
        REQUIRE(*SafeParseInt("0", 0, 64) == 0);
        REQUIRE(*SafeParseInt("64", 0, 64) == 64);
    }
}

TEST_CASE("SafeParseInt - invalid inputs", "[util][string_parsing]") {
    SECTION("Empty string") {
        REQUIRE_FALSE(SafeParseInt("", 0, 100).has_value());
    }

    SECTION("Non-numeric string") {
        REQUIRE_FALSE(SafeParseInt("abc", 0, 100).has_value());
    }

    SECTION("Trailing characters") {
        REQUIRE_FALSE(SafeParseInt("42x", 0, 100).has_value());
    }

    SECTION("Leading whitespace") {
        REQUIRE_FALSE(SafeParseInt(" 42", 0, 100).has_value());
    }

    SECTION("Out of bounds") {
        REQUIRE_FALSE(SafeParseInt("-1", 0, 64).has_value());
        REQUIRE_FALSE(SafeParseInt("65", 0, 64).has_value());
    }

    SECTION("Overflow") {
        REQUIRE_FALSE(SafeParseInt("999999999999999999999", 0, 100).has_value());
    }

    SECTION("Floating point") {
        REQUIRE_FALSE(SafeParseInt("3.5", 0, 100).has_value());
    }
}

TEST_CASE("SafeParseInt64 - timestamps", "[util][string_parsing]") {
    SECTION("Large positive timestamp") {
        auto result = SafeParseInt64("1700000000", 0,
                                     std::numeric_limits<int64_t>::max());
        REQUIRE(result.has_value());
        REQUIRE(*result == 1700000000);
    }

    SECTION("Negative rejected when minimum is zero") {
        REQUIRE_FALSE(SafeParseInt64("-1", 0, 1000).has_value());
    }

    SECTION("Overflow") {
        REQUIRE_FALSE(SafeParseInt64("99999999999999999999999", 0,
                                     std::numeric_limits<int64_t>::max())
                          .has_value());
    }
}

TEST_CASE("IsValidHex", "[util][string_parsing]") {
    REQUIRE(IsValidHex("0123456789abcdef"));
    REQUIRE(IsValidHex("ABCDEF"));
    REQUIRE_FALSE(IsValidHex(""));
    REQUIRE_FALSE(IsValidHex("0x12"));
    REQUIRE_FALSE(IsValidHex("12 34"));
}

TEST_CASE("IsValidDigest", "[util][string_parsing]") {
    SECTION("SHA-256 output is a valid digest") {
        REQUIRE(IsValidDigest(Sha256Hex("")));
        REQUIRE(IsValidDigest(Sha256Hex("Genesis Block")));
    }

    SECTION("Wrong length") {
        REQUIRE_FALSE(IsValidDigest(""));
        REQUIRE_FALSE(IsValidDigest("0"));
        REQUIRE_FALSE(IsValidDigest(std::string(63, 'a')));
        REQUIRE_FALSE(IsValidDigest(std::string(65, 'a')));
    }

    SECTION("Uppercase is rejected") {
        REQUIRE_FALSE(IsValidDigest(std::string(64, 'A')));
    }

    SECTION("Non-hex is rejected") {
        REQUIRE_FALSE(IsValidDigest(std::string(63, '0') + "g"));
    }
}
