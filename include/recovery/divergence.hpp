// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include "util/uint.hpp"
#include <vector>

namespace weave {
namespace recovery {

/**
 * Find where two chains part ways.
 *
 * Both inputs are OLDEST-FIRST. Walks them in lockstep from the oldest entry,
 * discarding equal positions, and returns the remainder of target_chain from
 * the first mismatch (or from the end of local_chain if that runs out first).
 *
 *   ResolveDivergence([a,b,c], [a,b,c])   == []
 *   ResolveDivergence([a,b],   [a,b,c,d]) == [c,d]
 *   ResolveDivergence([a,x],   [a,y,z])   == [y,z]
 */
std::vector<uint256> ResolveDivergence(const std::vector<uint256> &local_chain,
                                       const std::vector<uint256> &target_chain);

/**
 * Blocks a node holding local_chain (NEWEST-FIRST) must fetch to reach target,
 * oldest-first, ending with target itself.
 */
std::vector<uint256> BuildFetchList(const std::vector<uint256> &local_chain,
                                    const CBlock &target);

} // namespace recovery
} // namespace weave
