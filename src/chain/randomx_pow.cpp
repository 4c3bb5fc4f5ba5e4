// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/randomx_pow.hpp"
#include "util/logging.hpp"
#include "util/sha256.hpp"
#include <cstdio>
#include <iterator>
#include <mutex>
#include <stdexcept>
#include <string>

namespace weave {
namespace crypto {

static const char *RANDOMX_EPOCH_SEED_STRING = "Weave/RandomX/Epoch/%u";

// Mutex for init/shutdown
static std::mutex g_randomx_mutex;

// RAII wrappers for RandomX objects
struct RandomXCacheWrapper {
  randomx_cache *cache = nullptr;

  explicit RandomXCacheWrapper(randomx_cache *c) : cache(c) {}
  ~RandomXCacheWrapper() {
    if (cache)
      randomx_release_cache(cache);
  }
};

// Simple LRU cache for RandomX VMs and caches (per-thread, bounded)
// Keeps only the most recent N epochs to prevent unbounded memory growth
template <typename Key, typename Value>
class SimpleLRUCache {
private:
  struct Entry {
    Key key;
    Value value;
  };

  std::vector<Entry> entries_;
  size_t max_size_;

public:
  explicit SimpleLRUCache(size_t max_size) : max_size_(max_size) {}

  // Get value if exists, returns nullptr if not found
  Value *get(const Key &key) {
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
      if (it->key == key) {
        // Move to end (most recent)
        Entry entry = *it;
        entries_.erase(std::prev(it.base()));
        entries_.push_back(entry);
        return &entries_.back().value;
      }
    }
    return nullptr;
  }

  void insert(const Key &key, const Value &value) {
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
      if (it->key == key) {
        entries_.erase(it);
        break;
      }
    }

    // If at capacity, remove oldest (first) entry
    if (entries_.size() >= max_size_) {
      entries_.erase(entries_.begin());
    }

    entries_.push_back({key, value});
  }

  void clear() { entries_.clear(); }

  size_t size() const { return entries_.size(); }
};

static thread_local SimpleLRUCache<uint32_t, std::shared_ptr<RandomXCacheWrapper>>
    t_cache_storage(DEFAULT_RANDOMX_VM_CACHE_SIZE);

static thread_local SimpleLRUCache<uint32_t, std::shared_ptr<RandomXVMWrapper>>
    t_vm_cache(DEFAULT_RANDOMX_VM_CACHE_SIZE);

static bool g_randomx_initialized = false;

uint32_t GetEpoch(uint32_t nTime, uint32_t nDuration) {
  if (nDuration == 0) {
    return 0;
  }
  return nTime / nDuration;
}

uint256 GetSeedHash(uint32_t nEpoch) {
  char buffer[128];
  snprintf(buffer, sizeof(buffer), RANDOMX_EPOCH_SEED_STRING, nEpoch);
  std::string s(buffer);
  return Hash256(std::vector<uint8_t>(s.begin(), s.end()));
}

bool IsRandomXInitialized() {
  std::lock_guard<std::mutex> lock(g_randomx_mutex);
  return g_randomx_initialized;
}

// Get or create thread-local VM for an epoch
std::shared_ptr<RandomXVMWrapper> GetCachedVM(uint32_t nEpoch) {
  if (!IsRandomXInitialized()) {
    throw std::runtime_error("RandomX not initialized");
  }

  auto vmPtr = t_vm_cache.get(nEpoch);
  if (vmPtr) {
    return *vmPtr;
  }

  uint256 seedHash = GetSeedHash(nEpoch);
  randomx_flags flags = randomx_get_flags();

  std::shared_ptr<RandomXCacheWrapper> myCache;
  auto cachePtr = t_cache_storage.get(nEpoch);
  if (cachePtr) {
    myCache = *cachePtr;
  } else {
    LOG_CRYPTO_INFO("Creating thread-local RandomX cache for epoch {} (this may take a moment)...", nEpoch);

    randomx_cache *pCache = randomx_alloc_cache(flags);
    if (!pCache) {
      throw std::runtime_error("Failed to allocate RandomX cache");
    }
    randomx_init_cache(pCache, seedHash.data(), seedHash.size());
    myCache = std::make_shared<RandomXCacheWrapper>(pCache);
    t_cache_storage.insert(nEpoch, myCache);
  }

  randomx_vm *myVM = randomx_create_vm(flags, myCache->cache, nullptr);
  if (!myVM) {
    throw std::runtime_error("Failed to create RandomX VM");
  }

  auto vmWrapper = std::make_shared<RandomXVMWrapper>(myVM, myCache);
  t_vm_cache.insert(nEpoch, vmWrapper);

  LOG_CRYPTO_INFO("Created thread-local RandomX VM for epoch {} (LRU cache size: {})", nEpoch, t_vm_cache.size());

  return vmWrapper;
}

uint256 ComputeRandomXHash(uint32_t nEpoch, const std::vector<uint8_t> &input) {
  auto vm = GetCachedVM(nEpoch);

  uint256 out;
  randomx_calculate_hash(vm->vm, input.data(), input.size(), out.data());
  return out;
}

void InitRandomX() {
  std::lock_guard<std::mutex> lock(g_randomx_mutex);

  if (g_randomx_initialized) {
    return;
  }

  g_randomx_initialized = true;

  LOG_CRYPTO_INFO("RandomX initialized with LRU-bounded thread-local caches and VMs "
                  "(cache size: {})", DEFAULT_RANDOMX_VM_CACHE_SIZE);
}

void ShutdownRandomX() {
  std::lock_guard<std::mutex> lock(g_randomx_mutex);

  if (!g_randomx_initialized) {
    return;
  }

  g_randomx_initialized = false;

  // Clear this thread's caches so a later re-init (tests) starts clean
  t_vm_cache.clear();
  t_cache_storage.clear();

  LOG_CRYPTO_INFO("RandomX shutdown complete");
}

} // namespace crypto
} // namespace weave
