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
#include <atomic>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace weave {
namespace recovery {

/**
 * RecoveryHandle - caller's view of one asynchronous recovery
 *
 * Copyable; all copies refer to the same session. The result becomes
 * available exactly once, when the session reaches a terminal state
 * (including cancellation and manager shutdown).
 */
class RecoveryHandle {
public:
  RecoveryHandle() = default;

  bool IsValid() const { return state_ != nullptr; }
  uint64_t GetId() const { return state_ ? state_->id : 0; }

  // Request cancellation; the session aborts with CANCELLED at its next
  // checkpoint unless it has already finished
  void Cancel() const;

  bool IsDone() const;
  void Wait() const;
  bool WaitFor(std::chrono::milliseconds timeout) const;

  // Blocks until done. Throws std::runtime_error on an invalid handle.
  RecoveryResult Get() const;

private:
  friend class RecoveryManager;

  struct Shared {
    uint64_t id{0};
    CancellationToken cancel;
    std::shared_future<RecoveryResult> future;
  };

  explicit RecoveryHandle(std::shared_ptr<const Shared> state)
      : state_(std::move(state)) {}

  std::shared_ptr<const Shared> state_;
};

/**
 * RecoveryManager - runs recovery sessions in the background
 *
 * Owns a boost::asio io_context and a single worker thread; each session is
 * one posted task, so sessions run one after another and never write to the
 * block store concurrently.
 *
 * At most one session is active: StartRecovery() cancels the previous one
 * (it finishes as ABORTED/CANCELLED) before queueing the new one.
 *
 * Completion: the optional callback runs on the worker thread, then the
 * handle's result becomes ready. Both happen exactly once per session.
 */
class RecoveryManager {
public:
  struct Config {
    RetryPolicy retry;
  };

  using CompletionCallback = std::function<void(const RecoveryResult &)>;

  RecoveryManager(network::PeerBlockSource &block_source,
                  storage::LocalBlockStore &store,
                  const validation::ChainValidator &validator,
                  const Config &config = Config{});
  ~RecoveryManager();

  RecoveryManager(const RecoveryManager &) = delete;
  RecoveryManager &operator=(const RecoveryManager &) = delete;

  bool Start();

  // Cancels the active session, lets queued sessions resolve, joins the worker
  void Stop();

  bool IsRunning() const { return running_.load(std::memory_order_acquire); }

  // local_chain is newest-first. Throws std::runtime_error if not running.
  RecoveryHandle StartRecovery(network::PeerSet peers, CBlock target,
                               std::vector<uint256> local_chain,
                               CompletionCallback on_complete = {});

  // Handle of the most recently started session if it has not finished
  RecoveryHandle GetActiveRecovery() const;

  uint64_t GetCompletedCount() const {
    return completed_.load(std::memory_order_relaxed);
  }

private:
  void RunSession(const std::shared_ptr<RecoveryHandle::Shared> &shared,
                  const std::shared_ptr<std::promise<RecoveryResult>> &promise,
                  network::PeerSet peers, CBlock target,
                  std::vector<uint256> local_chain,
                  CompletionCallback on_complete);

  network::PeerBlockSource &block_source_;
  storage::LocalBlockStore &store_;
  const validation::ChainValidator &validator_;
  Config config_;

  std::shared_ptr<boost::asio::io_context> io_context_;
  std::unique_ptr<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::vector<std::thread> io_threads_;

  std::atomic<bool> running_{false};
  std::atomic<uint64_t> next_id_{1};
  std::atomic<uint64_t> completed_{0};

  mutable std::mutex mutex_; // guards active_ and start/stop
  RecoveryHandle active_;
};

} // namespace recovery
} // namespace weave
