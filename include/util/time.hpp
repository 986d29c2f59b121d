// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <string>

namespace replichain {
namespace util {

/**
 * Mockable time source
 *
 * Blocks created without an explicit timestamp take GetTime(). Tests pin the
 * clock with SetMockTime()/MockTimeScope so that such blocks hash
 * deterministically.
 */

// Current Unix timestamp in seconds (mock time if set)
int64_t GetTime();

// Set mock time (0 disables mocking)
void SetMockTime(int64_t time);

// Current mock time setting (0 when real time is used)
int64_t GetMockTime();

/**
 * Format a Unix timestamp as "YYYY-MM-DD HH:MM:SS UTC"
 */
std::string FormatTime(int64_t unix_time);

/**
 * RAII helper to set mock time and restore it when scope exits
 */
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time) : previous_time_(GetMockTime()) {
    SetMockTime(time);
  }

  ~MockTimeScope() { SetMockTime(previous_time_); }

  MockTimeScope(const MockTimeScope &) = delete;
  MockTimeScope &operator=(const MockTimeScope &) = delete;
  MockTimeScope(MockTimeScope &&) = delete;
  MockTimeScope &operator=(MockTimeScope &&) = delete;

private:
  const int64_t previous_time_;
};

} // namespace util
} // namespace replichain
