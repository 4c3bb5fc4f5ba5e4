// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "storage/block_store.hpp"
#include "util/logging.hpp"

namespace weave {
namespace storage {

std::optional<CBlock> MemoryBlockStore::ReadBlock(const uint256 &hash) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = blocks_.find(hash);
  if (it == blocks_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool MemoryBlockStore::HasBlock(const uint256 &hash) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return blocks_.count(hash) > 0;
}

bool MemoryBlockStore::WriteBlocks(const std::vector<CBlock> &blocks) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &block : blocks) {
    blocks_[block.hashIndep] = block;
  }
  LOG_STORE_TRACE("MemoryBlockStore: wrote {} blocks (total {})", blocks.size(),
                  blocks_.size());
  return true;
}

std::optional<std::vector<uint256>> MemoryBlockStore::ReadBestChain() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return best_chain_;
}

bool MemoryBlockStore::WriteBestChain(const std::vector<uint256> &hash_list) {
  std::lock_guard<std::mutex> lock(mutex_);
  best_chain_ = hash_list;
  return true;
}

size_t MemoryBlockStore::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return blocks_.size();
}

} // namespace storage
} // namespace weave
