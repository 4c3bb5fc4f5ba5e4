// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "recovery/recovery_session.hpp"
#include "chain/recall.hpp"
#include "recovery/divergence.hpp"
#include "util/logging.hpp"
#include <exception>

namespace weave {
namespace recovery {

std::string SessionStateToString(RecoverySession::State state) {
  switch (state) {
  case RecoverySession::State::INITIALIZING:
    return "initializing";
  case RecoverySession::State::STEPPING:
    return "stepping";
  case RecoverySession::State::RECOVERED:
    return "recovered";
  case RecoverySession::State::ALREADY_SYNCED:
    return "already-synced";
  case RecoverySession::State::ABORTED:
    return "aborted";
  }
  return "unknown";
}

RecoverySession::RecoverySession(network::PeerSet peers, CBlock target,
                                 std::vector<uint256> local_chain,
                                 network::PeerBlockSource &block_source,
                                 storage::LocalBlockStore &store,
                                 const validation::ChainValidator &validator,
                                 RetryPolicy retry, CancellationToken cancel,
                                 CompletionCallback on_complete)
    : peers_(std::move(peers)), target_(std::move(target)),
      local_chain_(std::move(local_chain)), block_source_(block_source),
      store_(store), validator_(validator), retry_(retry),
      cancel_(std::move(cancel)), on_complete_(std::move(on_complete)) {
  result_.target_hash = target_.hashIndep;
  result_.target_height = target_.nHeight;
}

bool RecoverySession::IsFinished() const {
  return state_ == State::RECOVERED || state_ == State::ALREADY_SYNCED ||
         state_ == State::ABORTED;
}

RecoveryResult RecoverySession::Run() {
  while (Step()) {
  }
  return result_;
}

void RecoverySession::Initialize() {
  start_time_ = std::chrono::steady_clock::now();

  validation::ValidationState state;
  if (!validation::CheckBlockStructure(target_, state)) {
    Abort(AbortReason::MALFORMED_BLOCK, "target block: " + state.ToString());
    return;
  }

  if (LocalChainContainsTarget()) {
    LOG_RECOVERY_INFO("Local chain already contains {} at height {}",
                      target_.hashIndep.ToString().substr(0, 16), target_.nHeight);
    Finish(RecoveryStatus::ALREADY_SYNCED, AbortReason::NONE, "");
    return;
  }

  std::vector<uint256> fetch = BuildFetchList(local_chain_, target_);
  pending_.assign(fetch.begin(), fetch.end());
  state_ = State::STEPPING;

  LOG_RECOVERY_INFO("Starting fork recovery to {} at height {} (local height {}, "
                    "{} peers, {} blocks to fetch)",
                    target_.hashIndep.ToString().substr(0, 16), target_.nHeight,
                    static_cast<int64_t>(local_chain_.size()) - 1, peers_.size(),
                    pending_.size());
}

bool RecoverySession::Step() {
  if (state_ == State::INITIALIZING) {
    Initialize();
  }
  if (IsFinished()) {
    return false;
  }

  if (cancel_.IsCancelled()) {
    Abort(AbortReason::CANCELLED, "cancelled before step");
    return false;
  }

  if (pending_.empty()) {
    Abort(AbortReason::PENDING_EXHAUSTED,
          "fetch list exhausted before reaching target");
    return false;
  }

  const PredecessorSource source = GetPredecessorSource();
  std::optional<CBlock> verified;
  StepError error;

  for (int attempt = 1;; ++attempt) {
    verified.reset();
    try {
      error = ExecuteStep(source, verified);
    } catch (const std::exception &e) {
      error = StepError{AbortReason::INTERNAL_ERROR, false, e.what()};
    }

    if (!error.IsError() || !error.transient || attempt >= retry_.max_attempts) {
      break;
    }

    LOG_RECOVERY_WARN("Step for {} failed (attempt {}/{}): {}; retrying",
                      pending_.front().ToString().substr(0, 16), attempt,
                      retry_.max_attempts, error.detail);
    if (cancel_.WaitFor(retry_.backoff * attempt)) {
      Abort(AbortReason::CANCELLED, "cancelled during retry backoff");
      return false;
    }
  }

  if (error.IsError()) {
    Abort(error.reason, std::move(error.detail));
    return false;
  }

  LOG_RECOVERY_DEBUG("Verified block {} at height {} ({} remaining)",
                     verified->hashIndep.ToString().substr(0, 16),
                     verified->nHeight, pending_.size() - 1);

  result_.verified.push_back(verified->hashIndep);
  ++result_.steps_completed;
  accumulated_.push_front(std::move(*verified));
  pending_.pop_front();

  // Termination is judged on the accumulated head before pending is consulted
  if (ReachedTarget()) {
    Commit();
    return false;
  }

  if (pending_.empty()) {
    Abort(AbortReason::PENDING_EXHAUSTED,
          "fetch list exhausted at height " +
              std::to_string(accumulated_.front().nHeight));
    return false;
  }

  return true;
}

RecoverySession::StepError
RecoverySession::FetchFromPeers(const uint256 &hash, const char *role,
                                std::optional<CBlock> &out) {
  if (cancel_.IsCancelled()) {
    return StepError{AbortReason::CANCELLED, false, "cancelled before fetch"};
  }
  out = block_source_.GetBlock(peers_, hash);
  if (!out) {
    return StepError{AbortReason::MISSING_BLOCK, true,
                     std::string(role) + " block " + hash.ToString() +
                         " unavailable from peers"};
  }
  return StepError{};
}

RecoverySession::StepError
RecoverySession::ExecuteStep(PredecessorSource source,
                             std::optional<CBlock> &verified) {
  const uint256 next_hash = pending_.front();

  std::optional<CBlock> next;
  StepError error = FetchFromPeers(next_hash, "next", next);
  if (error.IsError()) {
    return error;
  }

  // Predecessor
  std::optional<CBlock> stored_prev;
  const CBlock *prev = nullptr;
  if (source == PredecessorSource::FROM_STORAGE) {
    stored_prev = store_.ReadBlock(next->hashPrevBlock);
    if (!stored_prev) {
      return StepError{AbortReason::MISSING_BLOCK, false,
                       "predecessor " + next->hashPrevBlock.ToString() +
                           " not in local store"};
    }
    prev = &*stored_prev;
  } else {
    prev = &accumulated_.front();
  }

  // Recall block selected by the predecessor
  const uint256 recall_hash = chain::SelectRecallHash(*prev, prev->vHashList);
  std::optional<CBlock> recall;
  error = FetchFromPeers(recall_hash, "recall", recall);
  if (error.IsError()) {
    return error;
  }

  validation::ValidationState state;
  if (next->hashIndep != next_hash) {
    return StepError{AbortReason::MALFORMED_BLOCK, false,
                     "received " + next->hashIndep.ToString() +
                         " for requested " + next_hash.ToString()};
  }
  if (!validation::CheckBlockStructure(*next, state)) {
    return StepError{AbortReason::MALFORMED_BLOCK, false,
                     "block at height " + std::to_string(next->nHeight) + ": " +
                         state.ToString()};
  }
  if (!validation::CheckBlockStructure(*prev, state)) {
    return StepError{AbortReason::MALFORMED_BLOCK, false,
                     "predecessor: " + state.ToString()};
  }
  if (!validation::CheckBlockStructure(*recall, state)) {
    return StepError{AbortReason::MALFORMED_BLOCK, false,
                     "recall block: " + state.ToString()};
  }

  const WalletList wallets =
      validator_.ApplyTransactions(prev->vWalletList, next->vtx);
  if (!validator_.Validate(prev->GetHashChain(), wallets, *next, *prev,
                           *recall)) {
    return StepError{AbortReason::VALIDATION_REJECTED, false,
                     "block " + next_hash.ToString() + " at height " +
                         std::to_string(next->nHeight) + " rejected"};
  }

  verified = std::move(next);
  return StepError{};
}

bool RecoverySession::ReachedTarget() const {
  if (accumulated_.empty()) {
    return false;
  }
  const CBlock &head = accumulated_.front();
  return head.hashIndep == target_.hashIndep && head.nHeight == target_.nHeight;
}

bool RecoverySession::LocalChainContainsTarget() const {
  if (target_.nHeight < 0 ||
      local_chain_.size() <= static_cast<size_t>(target_.nHeight)) {
    return false;
  }
  // local_chain_ is newest-first; height h sits size-1-h from the front
  return local_chain_[local_chain_.size() - 1 - target_.nHeight] ==
         target_.hashIndep;
}

void RecoverySession::Commit() {
  if (cancel_.IsCancelled()) {
    Abort(AbortReason::CANCELLED, "cancelled before commit");
    return;
  }

  // Oldest-first so ancestors land before descendants
  std::vector<CBlock> batch(accumulated_.rbegin(), accumulated_.rend());

  bool written = false;
  std::string failure = "block store rejected write";
  try {
    written = store_.WriteBlocks(batch);
  } catch (const std::exception &e) {
    failure = e.what();
  }

  if (!written) {
    Abort(AbortReason::STORAGE_FAILURE,
          "persisting " + std::to_string(batch.size()) + " blocks: " + failure);
    return;
  }

  result_.new_chain = target_.GetHashChain();
  Finish(RecoveryStatus::RECOVERED, AbortReason::NONE, "");
}

void RecoverySession::Finish(RecoveryStatus status, AbortReason reason,
                             std::string detail) {
  if (IsFinished()) {
    return;
  }

  switch (status) {
  case RecoveryStatus::RECOVERED:
    state_ = State::RECOVERED;
    break;
  case RecoveryStatus::ALREADY_SYNCED:
    state_ = State::ALREADY_SYNCED;
    break;
  case RecoveryStatus::ABORTED:
    state_ = State::ABORTED;
    break;
  }

  result_.status = status;
  result_.reason = reason;
  result_.detail = std::move(detail);
  if (start_time_ != std::chrono::steady_clock::time_point{}) {
    result_.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time_);
  }

  if (status == RecoveryStatus::ABORTED) {
    LOG_RECOVERY_WARN("Fork recovery to {} aborted after {} steps: {} ({})",
                      target_.hashIndep.ToString().substr(0, 16),
                      result_.steps_completed, ReasonToString(reason),
                      result_.detail);
  } else if (status == RecoveryStatus::RECOVERED) {
    LOG_RECOVERY_INFO("Fork recovery complete: new tip {} at height {} "
                      "({} blocks in {}ms)",
                      target_.hashIndep.ToString().substr(0, 16),
                      target_.nHeight, result_.steps_completed,
                      result_.elapsed.count());
  }

  if (on_complete_) {
    // Moved out so it can never fire twice
    auto callback = std::move(on_complete_);
    on_complete_ = nullptr;
    try {
      callback(result_);
    } catch (const std::exception &e) {
      LOG_RECOVERY_ERROR("Recovery completion handler threw: {}", e.what());
    }
  }
}

} // namespace recovery
} // namespace weave
