// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include "storage/block_store.hpp"
#include "util/uint.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace weave {
namespace network {

/**
 * BlockPeer - a remote node we can request full blocks from
 *
 * GetBlock returns std::nullopt when the peer does not have the block or
 * could not be reached. Implementations may block; they must not assume any
 * particular calling thread.
 */
class BlockPeer {
public:
  virtual ~BlockPeer() = default;

  virtual std::optional<CBlock> GetBlock(const uint256 &hash) = 0;
  virtual std::string GetName() const = 0;
};

using PeerPtr = std::shared_ptr<BlockPeer>;

// Ordered peer list; the order is the request preference
using PeerSet = std::vector<PeerPtr>;

/**
 * StoreBackedPeer - serves blocks out of a LocalBlockStore
 *
 * Used for in-process nodes and for recovering from another node's data
 * directory (weave-recover --peerdir).
 */
class StoreBackedPeer : public BlockPeer {
public:
  StoreBackedPeer(std::string name,
                  std::shared_ptr<const storage::LocalBlockStore> store);

  std::optional<CBlock> GetBlock(const uint256 &hash) override;
  std::string GetName() const override { return name_; }

private:
  std::string name_;
  std::shared_ptr<const storage::LocalBlockStore> store_;
};

} // namespace network
} // namespace weave
