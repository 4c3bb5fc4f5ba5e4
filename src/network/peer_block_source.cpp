// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/peer_block_source.hpp"
#include "util/logging.hpp"
#include <exception>

namespace weave {
namespace network {

std::optional<CBlock>
SequentialPeerBlockSource::GetBlock(const PeerSet &peers, const uint256 &hash) {
  for (const auto &peer : peers) {
    if (!peer) {
      continue;
    }

    std::optional<CBlock> block;
    try {
      block = peer->GetBlock(hash);
    } catch (const std::exception &e) {
      LOG_PEER_WARN("peer={} failed to serve block {}: {}", peer->GetName(),
                    hash.ToString().substr(0, 16), e.what());
      continue;
    }

    if (!block) {
      continue;
    }

    if (block->hashIndep != hash) {
      LOG_PEER_WARN("Misbehavior: peer={} answered request for {} with block {}",
                    peer->GetName(), hash.ToString().substr(0, 16),
                    block->hashIndep.ToString().substr(0, 16));
      continue;
    }

    LOG_PEER_TRACE("Fetched block {} (height {}) from peer={}",
                   hash.ToString().substr(0, 16), block->nHeight,
                   peer->GetName());
    return block;
  }

  LOG_PEER_DEBUG("No peer (of {}) has block {}", peers.size(),
                 hash.ToString().substr(0, 16));
  return std::nullopt;
}

} // namespace network
} // namespace weave
