// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace replichain {

namespace chain {
class CBlock;
} // namespace chain

namespace validation {

/**
 * ============================================================================
 * CHAIN VALIDATION
 * ============================================================================
 *
 * A chain is valid when every block at index i >= 1 passes, in order:
 *
 * 1. CheckBlockHash()  : stored hash equals a fresh recomputation ("bad-hash")
 * 2. CheckBlockLink()  : hashPrevBlock equals blocks[i-1].hash ("bad-prevblk")
 * 3. CheckBlockPoW()   : hash meets the chain difficulty        ("high-hash")
 *
 * CheckChain() stops at the first failing index. A broken chain is an
 * expected, queryable condition and is reported through ValidationState,
 * never thrown.
 * ============================================================================
 */

/**
 * Validation state - tracks why validation failed and where
 */
class ValidationState {
public:
  enum class Result {
    VALID,
    INVALID
  };

  ValidationState() : result_(Result::VALID) {}

  bool IsValid() const { return result_ == Result::VALID; }
  bool IsInvalid() const { return result_ == Result::INVALID; }

  bool Invalid(const std::string &reject_reason,
               const std::string &debug_message = "") {
    result_ = Result::INVALID;
    reject_reason_ = reject_reason;
    debug_message_ = debug_message;
    return false;
  }

  // Index of the first block that failed (set by CheckChain)
  void SetInvalidIndex(size_t index) { invalid_index_ = index; }
  const std::optional<size_t> &GetInvalidIndex() const { return invalid_index_; }

  const std::string &GetRejectReason() const { return reject_reason_; }
  const std::string &GetDebugMessage() const { return debug_message_; }

  std::string ToString() const;

private:
  Result result_;
  std::string reject_reason_;
  std::string debug_message_;
  std::optional<size_t> invalid_index_;
};

bool CheckBlockHash(const chain::CBlock &block, ValidationState &state);

bool CheckBlockLink(const chain::CBlock &block, const chain::CBlock &prev,
                    ValidationState &state);

bool CheckBlockPoW(const chain::CBlock &block, int difficulty,
                   ValidationState &state);

// Check blocks[1..n-1]; the genesis block at index 0 is taken as given
bool CheckChain(const std::vector<chain::CBlock> &blocks, int difficulty,
                ValidationState &state);

} // namespace validation
} // namespace replichain
