// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/string_parsing.hpp"
#include "util/sha256.hpp"
#include <cctype>
#include <stdexcept>

namespace replichain {
namespace util {

std::optional<int> SafeParseInt(const std::string &str, int min, int max) {
  auto value = SafeParseInt64(str, min, max);
  if (!value) {
    return std::nullopt;
  }
  return static_cast<int>(*value);
}

std::optional<int64_t> SafeParseInt64(const std::string &str, int64_t min,
                                      int64_t max) {
  // Reject empty or whitespace-leading strings
  if (str.empty() || std::isspace(static_cast<unsigned char>(str[0]))) {
    return std::nullopt;
  }

  size_t pos = 0;
  long long value = 0;
  try {
    value = std::stoll(str, &pos);
  } catch (const std::invalid_argument &) {
    return std::nullopt;
  } catch (const std::out_of_range &) {
    return std::nullopt;
  }

  // Check entire string was consumed
  if (pos != str.size()) {
    return std::nullopt;
  }

  if (value < min || value > max) {
    return std::nullopt;
  }

  return static_cast<int64_t>(value);
}

bool IsValidHex(const std::string &str) {
  if (str.empty()) {
    return false;
  }

  for (char c : str) {
    if (!std::isxdigit(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

bool IsValidDigest(const std::string &str) {
  if (str.size() != DIGEST_HEX_LENGTH) {
    return false;
  }
  for (char c : str) {
    bool is_digit = c >= '0' && c <= '9';
    bool is_lower_hex = c >= 'a' && c <= 'f';
    if (!is_digit && !is_lower_hex) {
      return false;
    }
  }
  return true;
}

} // namespace util
} // namespace replichain
