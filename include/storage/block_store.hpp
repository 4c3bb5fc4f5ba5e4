// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include "util/uint.hpp"
#include <cstddef>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace weave {
namespace storage {

/**
 * LocalBlockStore - the node's persistent block storage
 *
 * Blocks are keyed by independent hash. WriteBlocks is all-or-nothing from a
 * reader's point of view: on false, callers must assume none of the batch is
 * canonical (the best-chain record is what makes blocks canonical, and it is
 * only advanced after a successful write).
 *
 * The best-chain record is the node's canonical hash list, newest-first.
 */
class LocalBlockStore {
public:
  virtual ~LocalBlockStore() = default;

  virtual std::optional<CBlock> ReadBlock(const uint256 &hash) const = 0;
  virtual bool HasBlock(const uint256 &hash) const = 0;
  virtual bool WriteBlocks(const std::vector<CBlock> &blocks) = 0;

  virtual std::optional<std::vector<uint256>> ReadBestChain() const = 0;
  virtual bool WriteBestChain(const std::vector<uint256> &hash_list) = 0;
};

/**
 * MemoryBlockStore - in-process store (tests, in-memory peers)
 * Thread-safe.
 */
class MemoryBlockStore : public LocalBlockStore {
public:
  MemoryBlockStore() = default;

  std::optional<CBlock> ReadBlock(const uint256 &hash) const override;
  bool HasBlock(const uint256 &hash) const override;
  bool WriteBlocks(const std::vector<CBlock> &blocks) override;

  std::optional<std::vector<uint256>> ReadBestChain() const override;
  bool WriteBestChain(const std::vector<uint256> &hash_list) override;

  size_t Size() const;

private:
  mutable std::mutex mutex_;
  std::unordered_map<uint256, CBlock> blocks_;
  std::optional<std::vector<uint256>> best_chain_;
};

} // namespace storage
} // namespace weave
