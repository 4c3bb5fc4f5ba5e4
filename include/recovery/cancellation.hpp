// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace weave {
namespace recovery {

/**
 * CancellationToken - shared, one-way cancellation flag
 *
 * Copies share state: cancelling any copy cancels all of them. Once
 * cancelled a token stays cancelled.
 */
class CancellationToken {
public:
  CancellationToken() : state_(std::make_shared<State>()) {}

  void Cancel() const {
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      state_->cancelled = true;
    }
    state_->cv.notify_all();
  }

  bool IsCancelled() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
  }

  // Sleep up to `timeout`; returns true if cancelled (before or during)
  bool WaitFor(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->cv.wait_for(lock, timeout,
                               [this] { return state_->cancelled; });
  }

private:
  struct State {
    std::mutex mutex;
    std::condition_variable cv;
    bool cancelled{false};
  };

  std::shared_ptr<State> state_;
};

} // namespace recovery
} // namespace weave
