// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/peer.hpp"
#include <optional>

namespace weave {
namespace network {

/**
 * PeerBlockSource - fetch one block by hash from a set of peers
 *
 * Returns std::nullopt if no peer produced the requested block.
 */
class PeerBlockSource {
public:
  virtual ~PeerBlockSource() = default;

  virtual std::optional<CBlock> GetBlock(const PeerSet &peers,
                                         const uint256 &hash) = 0;
};

/**
 * SequentialPeerBlockSource - asks peers one at a time, in PeerSet order,
 * until one returns the block.
 *
 * A response whose independent hash differs from the requested hash is
 * treated as a miss for that peer (and logged as misbehavior). A peer that
 * throws is treated as a miss.
 */
class SequentialPeerBlockSource : public PeerBlockSource {
public:
  std::optional<CBlock> GetBlock(const PeerSet &peers,
                                 const uint256 &hash) override;
};

} // namespace network
} // namespace weave
