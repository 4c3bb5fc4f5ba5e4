// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/peer.hpp"
#include "util/logging.hpp"
#include <utility>

namespace weave {
namespace network {

StoreBackedPeer::StoreBackedPeer(
    std::string name, std::shared_ptr<const storage::LocalBlockStore> store)
    : name_(std::move(name)), store_(std::move(store)) {}

std::optional<CBlock> StoreBackedPeer::GetBlock(const uint256 &hash) {
  if (!store_) {
    return std::nullopt;
  }
  auto block = store_->ReadBlock(hash);
  LOG_PEER_TRACE("peer={} GetBlock {} -> {}", name_,
                 hash.ToString().substr(0, 16), block ? "found" : "not found");
  return block;
}

} // namespace network
} // namespace weave
