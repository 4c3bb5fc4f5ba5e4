// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/recall.hpp"

namespace weave {
namespace chain {

uint256 SelectRecallHash(const CBlock &block,
                         const std::vector<uint256> &hash_list) {
  if (block.IsGenesis() || hash_list.empty()) {
    return block.hashIndep;
  }

  const uint64_t n = hash_list.size();
  const uint64_t index = block.hashIndep.GetUint64(0) % n;

  // hash_list is newest-first; index counts from the oldest end
  return hash_list[n - 1 - index];
}

} // namespace chain
} // namespace weave
