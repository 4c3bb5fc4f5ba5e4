// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include "chain/validation.hpp"
#include "network/peer.hpp"
#include "network/peer_block_source.hpp"
#include "recovery/cancellation.hpp"
#include "recovery/recovery_result.hpp"
#include "storage/block_store.hpp"
#include <chrono>
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace weave {
namespace recovery {

/*
 RecoverySession - moves a node from its local chain onto a target chain

 Created once per detected divergence, run to a terminal state, discarded.

   INITIALIZING --> STEPPING --> RECOVERED
        |              |    \--> ABORTED
        \--> ALREADY_SYNCED

 Initialization computes the fetch list (BuildFetchList). Each step then
 fetches the oldest pending block (NextB), pairs it with its predecessor B and
 with the recall block B selects, and asks the ChainValidator whether NextB
 may follow B. B comes from the local store for the first step (it is the
 last block both chains share) and from the accumulated blocks afterwards.

 Verified blocks accumulate in memory, newest-first. Nothing reaches the
 store until the newest accumulated block is the target; then the whole batch
 is written in one LocalBlockStore::WriteBlocks call. Any failure before that
 point aborts the session with nothing persisted.

 Threading: a session is a sequential task. It must be driven (Run/Step) by
 one thread at a time; only Cancel() on its token may come from elsewhere.
*/
class RecoverySession {
public:
  enum class State { INITIALIZING, STEPPING, RECOVERED, ALREADY_SYNCED, ABORTED };

  // Where a step takes the predecessor of the block it verifies
  enum class PredecessorSource { FROM_STORAGE, FROM_ACCUMULATED };

  using CompletionCallback = std::function<void(const RecoveryResult &)>;

  // local_chain is the node's canonical hash list, newest-first.
  // on_complete runs exactly once, on the driving thread, when the session
  // reaches a terminal state.
  RecoverySession(network::PeerSet peers, CBlock target,
                  std::vector<uint256> local_chain,
                  network::PeerBlockSource &block_source,
                  storage::LocalBlockStore &store,
                  const validation::ChainValidator &validator,
                  RetryPolicy retry = {},
                  CancellationToken cancel = {},
                  CompletionCallback on_complete = {});

  RecoverySession(const RecoverySession &) = delete;
  RecoverySession &operator=(const RecoverySession &) = delete;

  // Drive the session to a terminal state and return its result
  RecoveryResult Run();

  // Advance by one step (the first call also initializes). Returns true while
  // the session needs more steps.
  bool Step();

  State GetState() const { return state_; }
  bool IsFinished() const;

  // Verified blocks, newest-first
  const std::deque<CBlock> &GetAccumulated() const { return accumulated_; }
  // Hashes still to fetch, oldest-first
  const std::deque<uint256> &GetPending() const { return pending_; }

  PredecessorSource GetPredecessorSource() const {
    return accumulated_.empty() ? PredecessorSource::FROM_STORAGE
                                : PredecessorSource::FROM_ACCUMULATED;
  }

  // Valid once IsFinished()
  const RecoveryResult &GetResult() const { return result_; }

  CancellationToken GetCancellationToken() const { return cancel_; }

private:
  struct StepError {
    AbortReason reason{AbortReason::NONE};
    bool transient{false};
    std::string detail;

    bool IsError() const { return reason != AbortReason::NONE; }
  };

  void Initialize();

  // One fetch/validate attempt for pending_.front(). On success `verified`
  // holds the block to accumulate.
  StepError ExecuteStep(PredecessorSource source, std::optional<CBlock> &verified);

  StepError FetchFromPeers(const uint256 &hash, const char *role,
                           std::optional<CBlock> &out);

  bool ReachedTarget() const;
  bool LocalChainContainsTarget() const;

  void Commit();
  void Finish(RecoveryStatus status, AbortReason reason, std::string detail);
  void Abort(AbortReason reason, std::string detail) {
    Finish(RecoveryStatus::ABORTED, reason, std::move(detail));
  }

  const network::PeerSet peers_;
  const CBlock target_;
  const std::vector<uint256> local_chain_;

  network::PeerBlockSource &block_source_;
  storage::LocalBlockStore &store_;
  const validation::ChainValidator &validator_;

  const RetryPolicy retry_;
  CancellationToken cancel_;
  CompletionCallback on_complete_;

  State state_{State::INITIALIZING};
  std::deque<CBlock> accumulated_;
  std::deque<uint256> pending_;
  RecoveryResult result_;
  std::chrono::steady_clock::time_point start_time_;
};

std::string SessionStateToString(RecoverySession::State state);

} // namespace recovery
} // namespace weave
