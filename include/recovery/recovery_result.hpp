// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "util/uint.hpp"
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace weave {
namespace recovery {

enum class RecoveryStatus {
  RECOVERED,      // Target chain verified and persisted
  ALREADY_SYNCED, // Local chain already contains the target
  ABORTED         // Nothing persisted; see AbortReason
};

enum class AbortReason {
  NONE,
  MISSING_BLOCK,       // A peer or the local store could not produce a block
  MALFORMED_BLOCK,     // A block's fields contradict each other
  VALIDATION_REJECTED, // Consensus rules rejected a block
  STORAGE_FAILURE,     // Verified blocks could not be persisted
  CANCELLED,           // Cancelled or superseded by a newer recovery
  PENDING_EXHAUSTED,   // Fetch list ran out without reaching the target
  INTERNAL_ERROR       // Unexpected exception from a collaborator
};

/**
 * RecoveryResult - terminal outcome of one recovery session
 *
 * Delivered exactly once per session. new_chain is only populated for
 * RECOVERED and is the new canonical hash list, newest-first:
 * [target.hashIndep] + target.vHashList.
 */
struct RecoveryResult {
  RecoveryStatus status{RecoveryStatus::ABORTED};
  AbortReason reason{AbortReason::NONE};
  std::string detail;

  std::vector<uint256> new_chain;

  uint256 target_hash{};
  int32_t target_height{0};

  // Blocks that passed validation, in verification (oldest-first) order.
  // For ABORTED results none of them were persisted.
  std::vector<uint256> verified;
  int steps_completed{0};

  std::chrono::milliseconds elapsed{0};

  bool IsRecovered() const { return status == RecoveryStatus::RECOVERED; }
  bool IsAborted() const { return status == RecoveryStatus::ABORTED; }

  std::string ToString() const;
};

std::string StatusToString(RecoveryStatus status);
std::string ReasonToString(AbortReason reason);

/**
 * RetryPolicy - how often a step may be re-attempted after a transient miss
 *
 * max_attempts counts the first attempt; 1 disables retries. The k-th retry
 * is preceded by a cancellable wait of backoff * k.
 */
struct RetryPolicy {
  int max_attempts{1};
  std::chrono::milliseconds backoff{std::chrono::milliseconds(500)};
};

} // namespace recovery
} // namespace weave
