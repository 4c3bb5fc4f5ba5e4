// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "util/uint.hpp"
#include <cstdint>
#include <memory>
#include <randomx.h>
#include <vector>

namespace weave {
namespace crypto {

// RandomX Proof-of-Work Implementation
// VMs are expensive to create (~1s light mode), cached per epoch

// POW verification modes
enum class POWVerifyMode {
  FULL = 0, // Recompute the RandomX hash and compare with the committed one
  MINING    // Compute the hash for a candidate (returned through outHash)
};

struct RandomXCacheWrapper;

// RandomX VM Wrapper - Manages VM lifecycle
// Each thread gets its own VM instance (thread-local storage)
struct RandomXVMWrapper {
  randomx_vm *vm = nullptr;
  std::shared_ptr<RandomXCacheWrapper> cache;

  RandomXVMWrapper(randomx_vm *v, std::shared_ptr<RandomXCacheWrapper> c)
      : vm(v), cache(c) {}

  ~RandomXVMWrapper() {
    if (vm) {
      randomx_destroy_vm(vm);
      cache = nullptr;
    }
  }
};

// Number of epochs to cache (one VM per epoch, minimum 1)
static constexpr int DEFAULT_RANDOMX_VM_CACHE_SIZE = 2;

// Calculate epoch from timestamp: epoch = timestamp / duration (seconds)
uint32_t GetEpoch(uint32_t nTime, uint32_t nDuration);

// Calculate RandomX key (seed hash) for epoch:
// SHA256d("Weave/RandomX/Epoch/N")
uint256 GetSeedHash(uint32_t nEpoch);

// Initialize RandomX subsystem (call once at startup)
void InitRandomX();

// Shutdown RandomX subsystem (releases this thread's VMs and caches)
void ShutdownRandomX();

bool IsRandomXInitialized();

// Get cached RandomX VM for epoch (thread-local storage, JIT enabled)
// Each thread gets its own VM instance - no locking required
// Throws std::runtime_error if RandomX is not initialized or allocation fails
std::shared_ptr<RandomXVMWrapper> GetCachedVM(uint32_t nEpoch);

// RandomX hash of an arbitrary preimage under the given epoch key
uint256 ComputeRandomXHash(uint32_t nEpoch, const std::vector<uint8_t> &input);

} // namespace crypto
} // namespace weave
