// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include "util/uint.hpp"
#include <vector>

namespace weave {
namespace chain {

/**
 * Recall block selection (proof of access)
 *
 * The block mined on top of `block` must commit to one historical block, the
 * recall block, chosen deterministically from block's ancestry:
 *
 *   genesis (or empty ancestry)  -> block.hashIndep
 *   otherwise                    -> oldest-first ancestry[seed mod n]
 *
 * where seed is the first 8 bytes of block.hashIndep (little-endian) and
 * hash_list is the newest-first ancestry (normally block.vHashList).
 */
uint256 SelectRecallHash(const CBlock &block,
                         const std::vector<uint256> &hash_list);

} // namespace chain
} // namespace weave
