// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include "recovery/recovery_result.hpp"
#include "storage/block_store.hpp"
#include "util/uint.hpp"
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace weave {
namespace chain {

// How an announced block relates to the active chain
enum class BlockRelation {
  KNOWN,       // Already on the active chain
  EXTENDS_TIP, // Child of the current tip
  FORK,        // Taller than the tip but not a direct child (needs recovery)
  STALE        // Not taller than the tip
};

std::string BlockRelationToString(BlockRelation relation);

/**
 * Chainstate - the node's active chain
 *
 * Holds the canonical hash list (newest-first, including the tip) and the tip
 * block, backed by a LocalBlockStore's blocks and best-chain record.
 *
 * Thread-safe: recovery completion handlers call AdoptRecoveredChain from the
 * RecoveryManager's worker thread.
 */
class Chainstate {
public:
  explicit Chainstate(storage::LocalBlockStore &store);

  // Fresh datadir: store genesis and make it the tip
  bool Initialize(const CBlock &genesis);

  // Restore the active chain from the best-chain record. Fails if there is
  // no record, the tip block is missing, or the record's genesis differs from
  // expected_genesis (wrong network).
  bool Load(const uint256 &expected_genesis);

  std::optional<CBlock> GetTip() const;
  std::vector<uint256> GetHashList() const;
  int32_t GetHeight() const;
  bool Contains(const uint256 &hash, int32_t height) const;

  BlockRelation ClassifyBlock(const CBlock &block) const;

  // Switch to the chain a successful recovery persisted. Returns false and
  // leaves state unchanged for any other result, or if the new tip cannot be
  // read back consistently from the store.
  bool AdoptRecoveredChain(const recovery::RecoveryResult &result);

  // Make an already-stored block the tip (tests, tooling)
  bool ActivateBestChain(const uint256 &tip_hash);

private:
  bool SetTipLocked(const CBlock &tip);

  storage::LocalBlockStore &store_;

  mutable std::mutex mutex_;
  std::optional<CBlock> tip_;
  std::vector<uint256> hash_list_;
};

} // namespace chain
} // namespace weave
