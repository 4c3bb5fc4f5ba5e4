// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "recovery/fork_monitor.hpp"
#include "util/logging.hpp"
#include <utility>

namespace weave {
namespace recovery {

ForkMonitor::ForkMonitor(chain::Chainstate &chainstate, RecoveryManager &manager)
    : chainstate_(chainstate), manager_(manager) {}

std::optional<RecoveryHandle>
ForkMonitor::OnBlockAnnounced(const CBlock &block, const network::PeerSet &peers,
                              ResultCallback on_result) {
  const chain::BlockRelation relation = chainstate_.ClassifyBlock(block);
  LOG_RECOVERY_DEBUG("Announced block {} at height {}: {}",
                     block.hashIndep.ToString().substr(0, 16), block.nHeight,
                     chain::BlockRelationToString(relation));

  if (relation == chain::BlockRelation::KNOWN ||
      relation == chain::BlockRelation::STALE) {
    return std::nullopt;
  }

  if (relation == chain::BlockRelation::FORK) {
    LOG_RECOVERY_INFO("Fork detected: block {} at height {} (local height {})",
                      block.hashIndep.ToString().substr(0, 16), block.nHeight,
                      chainstate_.GetHeight());
  }

  chain::Chainstate &chainstate = chainstate_;
  return manager_.StartRecovery(
      peers, block, chainstate_.GetHashList(),
      [&chainstate, on_result = std::move(on_result)](const RecoveryResult &result) {
        const bool adopted = chainstate.AdoptRecoveredChain(result);
        if (on_result) {
          on_result(result, adopted);
        }
      });
}

} // namespace recovery
} // namespace weave
