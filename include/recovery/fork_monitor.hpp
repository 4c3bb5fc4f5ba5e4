// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include "chain/chainstate.hpp"
#include "network/peer.hpp"
#include "recovery/recovery_manager.hpp"
#include <functional>
#include <optional>

namespace weave {
namespace recovery {

/**
 * ForkMonitor - decides when an announced block warrants a recovery
 *
 * FORK and EXTENDS_TIP blocks start a recovery onto the announced block's
 * chain (a direct extension is simply a one-step recovery); the recovered
 * chain is adopted by the Chainstate on completion. KNOWN and STALE blocks
 * are ignored.
 */
class ForkMonitor {
public:
  using ResultCallback = std::function<void(const RecoveryResult &, bool adopted)>;

  ForkMonitor(chain::Chainstate &chainstate, RecoveryManager &manager);

  // Returns the handle of the started recovery, or std::nullopt if the block
  // did not need one
  std::optional<RecoveryHandle> OnBlockAnnounced(const CBlock &block,
                                                 const network::PeerSet &peers,
                                                 ResultCallback on_result = {});

private:
  chain::Chainstate &chainstate_;
  RecoveryManager &manager_;
};

} // namespace recovery
} // namespace weave
