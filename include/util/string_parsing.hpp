// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 String Parsing Utilities

 Purpose:
 - Safe parsing of command-line values to numeric types with validation
 - Digest format checks for hex-encoded hashes

 All functions validate that the entire input is consumed and return
 std::nullopt / false on any error (no exceptions thrown).
*/

#include <cstdint>
#include <optional>
#include <string>

namespace replichain {
namespace util {

/**
 * Parse integer string with bounds checking
 *
 * Examples:
 *   SafeParseInt("42", 0, 100) -> 42
 *   SafeParseInt("999", 0, 100) -> std::nullopt (out of range)
 *   SafeParseInt("42x", 0, 100) -> std::nullopt (trailing chars)
 *   SafeParseInt("", 0, 100) -> std::nullopt (empty string)
 */
std::optional<int> SafeParseInt(const std::string &str, int min, int max);

/**
 * Parse int64_t string with bounds checking
 *
 * Examples:
 *   SafeParseInt64("86400", 0, 1000000) -> 86400
 *   SafeParseInt64("-1", 0, 1000000) -> std::nullopt (out of range)
 */
std::optional<int64_t> SafeParseInt64(const std::string &str, int64_t min,
                                      int64_t max);

// true if all characters are hex digits [0-9a-fA-F] (empty -> false)
bool IsValidHex(const std::string &str);

// true if str is a 64-character lowercase hex digest
bool IsValidDigest(const std::string &str);

} // namespace util
} // namespace replichain
