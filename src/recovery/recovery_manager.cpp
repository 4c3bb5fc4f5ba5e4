// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "recovery/recovery_manager.hpp"
#include "recovery/recovery_session.hpp"
#include "util/logging.hpp"
#include <boost/asio/post.hpp>
#include <exception>
#include <stdexcept>

namespace weave {
namespace recovery {

// ============================================================================
// RecoveryHandle
// ============================================================================

void RecoveryHandle::Cancel() const {
  if (state_) {
    state_->cancel.Cancel();
  }
}

bool RecoveryHandle::IsDone() const {
  return state_ && state_->future.wait_for(std::chrono::seconds(0)) ==
                       std::future_status::ready;
}

void RecoveryHandle::Wait() const {
  if (state_) {
    state_->future.wait();
  }
}

bool RecoveryHandle::WaitFor(std::chrono::milliseconds timeout) const {
  if (!state_) {
    return false;
  }
  return state_->future.wait_for(timeout) == std::future_status::ready;
}

RecoveryResult RecoveryHandle::Get() const {
  if (!state_) {
    throw std::runtime_error("RecoveryHandle::Get on an invalid handle");
  }
  return state_->future.get();
}

// ============================================================================
// RecoveryManager
// ============================================================================

RecoveryManager::RecoveryManager(network::PeerBlockSource &block_source,
                                 storage::LocalBlockStore &store,
                                 const validation::ChainValidator &validator,
                                 const Config &config)
    : block_source_(block_source), store_(store), validator_(validator),
      config_(config),
      io_context_(std::make_shared<boost::asio::io_context>()) {
  if (config_.retry.max_attempts < 1) {
    config_.retry.max_attempts = 1;
  }
}

RecoveryManager::~RecoveryManager() { Stop(); }

bool RecoveryManager::Start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_.load(std::memory_order_acquire)) {
    return false;
  }

  io_context_->restart();
  work_guard_ = std::make_unique<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>(
      boost::asio::make_work_guard(*io_context_));

  // One worker: sessions are serialized by construction
  io_threads_.emplace_back([this]() { io_context_->run(); });

  running_.store(true, std::memory_order_release);
  LOG_RECOVERY_DEBUG("RecoveryManager started (max attempts {}, backoff {}ms)",
                     config_.retry.max_attempts, config_.retry.backoff.count());
  return true;
}

void RecoveryManager::Stop() {
  std::vector<std::thread> threads;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
      return;
    }

    active_.Cancel();
    active_ = RecoveryHandle();

    // Queued sessions still run (and resolve as cancelled); run() returns
    // once the queue is empty
    work_guard_.reset();
    threads.swap(io_threads_);
  }

  for (auto &thread : threads) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  LOG_RECOVERY_DEBUG("RecoveryManager stopped ({} sessions completed)",
                     completed_.load(std::memory_order_relaxed));
}

RecoveryHandle RecoveryManager::StartRecovery(network::PeerSet peers,
                                              CBlock target,
                                              std::vector<uint256> local_chain,
                                              CompletionCallback on_complete) {
  auto promise = std::make_shared<std::promise<RecoveryResult>>();
  auto shared = std::make_shared<RecoveryHandle::Shared>();
  shared->id = next_id_.fetch_add(1, std::memory_order_relaxed);
  shared->future = promise->get_future().share();
  RecoveryHandle handle(shared);

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_.load(std::memory_order_acquire)) {
      throw std::runtime_error("RecoveryManager is not running");
    }

    if (active_.IsValid() && !active_.IsDone()) {
      LOG_RECOVERY_INFO("Recovery {} superseded by recovery {} (target {})",
                        active_.GetId(), shared->id,
                        target.hashIndep.ToString().substr(0, 16));
      active_.Cancel();
    }
    active_ = handle;

    boost::asio::post(*io_context_,
                      [this, shared, promise, peers = std::move(peers),
                       target = std::move(target),
                       local_chain = std::move(local_chain),
                       on_complete = std::move(on_complete)]() mutable {
                        RunSession(shared, promise, std::move(peers),
                                   std::move(target), std::move(local_chain),
                                   std::move(on_complete));
                      });
  }

  return handle;
}

RecoveryHandle RecoveryManager::GetActiveRecovery() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (active_.IsValid() && !active_.IsDone()) {
    return active_;
  }
  return RecoveryHandle();
}

void RecoveryManager::RunSession(
    const std::shared_ptr<RecoveryHandle::Shared> &shared,
    const std::shared_ptr<std::promise<RecoveryResult>> &promise,
    network::PeerSet peers, CBlock target, std::vector<uint256> local_chain,
    CompletionCallback on_complete) {
  LOG_RECOVERY_DEBUG("Running recovery {}", shared->id);

  RecoverySession session(std::move(peers), std::move(target),
                          std::move(local_chain), block_source_, store_,
                          validator_, config_.retry, shared->cancel,
                          std::move(on_complete));

  RecoveryResult result;
  try {
    result = session.Run();
  } catch (const std::exception &e) {
    // Step() contains collaborator failures; this is a last resort so the
    // handle never waits forever
    LOG_RECOVERY_ERROR("Recovery {} failed unexpectedly: {}", shared->id, e.what());
    result = session.GetResult();
    result.status = RecoveryStatus::ABORTED;
    result.reason = AbortReason::INTERNAL_ERROR;
    result.detail = e.what();
  }

  completed_.fetch_add(1, std::memory_order_relaxed);
  promise->set_value(std::move(result));
}

} // namespace recovery
} // namespace weave
