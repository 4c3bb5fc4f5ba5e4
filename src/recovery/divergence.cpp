// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "recovery/divergence.hpp"
#include <algorithm>

namespace weave {
namespace recovery {

std::vector<uint256> ResolveDivergence(const std::vector<uint256> &local_chain,
                                       const std::vector<uint256> &target_chain) {
  auto split = std::mismatch(local_chain.begin(), local_chain.end(),
                             target_chain.begin(), target_chain.end());
  return std::vector<uint256>(split.second, target_chain.end());
}

std::vector<uint256> BuildFetchList(const std::vector<uint256> &local_chain,
                                    const CBlock &target) {
  std::vector<uint256> local_oldest_first(local_chain.rbegin(), local_chain.rend());
  std::vector<uint256> target_oldest_first(target.vHashList.rbegin(),
                                           target.vHashList.rend());

  std::vector<uint256> fetch =
      ResolveDivergence(local_oldest_first, target_oldest_first);
  fetch.push_back(target.hashIndep);
  return fetch;
}

} // namespace recovery
} // namespace weave
