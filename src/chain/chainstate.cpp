// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/chainstate.hpp"
#include "util/logging.hpp"
#include <utility>

namespace weave {
namespace chain {

std::string BlockRelationToString(BlockRelation relation) {
  switch (relation) {
  case BlockRelation::KNOWN:
    return "known";
  case BlockRelation::EXTENDS_TIP:
    return "extends-tip";
  case BlockRelation::FORK:
    return "fork";
  case BlockRelation::STALE:
    return "stale";
  }
  return "unknown";
}

Chainstate::Chainstate(storage::LocalBlockStore &store) : store_(store) {}

bool Chainstate::Initialize(const CBlock &genesis) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!genesis.IsGenesis()) {
    LOG_CHAIN_ERROR("Initialize: block at height {} is not a genesis block",
                    genesis.nHeight);
    return false;
  }

  if (!store_.WriteBlocks({genesis})) {
    LOG_CHAIN_ERROR("Initialize: failed to store genesis block");
    return false;
  }

  if (!SetTipLocked(genesis)) {
    return false;
  }

  LOG_CHAIN_INFO("Initialized chainstate with genesis {}",
                 genesis.hashIndep.ToString().substr(0, 16));
  return true;
}

bool Chainstate::Load(const uint256 &expected_genesis) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto record = store_.ReadBestChain();
  if (!record || record->empty()) {
    LOG_CHAIN_DEBUG("No best chain record (fresh datadir)");
    return false;
  }

  if (record->back() != expected_genesis) {
    LOG_CHAIN_ERROR("GENESIS MISMATCH: stored chain starts at {}, expected {}",
                    record->back().ToString().substr(0, 16),
                    expected_genesis.ToString().substr(0, 16));
    LOG_CHAIN_ERROR("This datadir contains blocks from a different network!");
    return false;
  }

  auto tip = store_.ReadBlock(record->front());
  if (!tip) {
    LOG_CHAIN_ERROR("Best chain tip {} missing from block store",
                    record->front().ToString().substr(0, 16));
    return false;
  }

  if (tip->GetHashChain() != *record) {
    LOG_CHAIN_ERROR("Best chain record disagrees with tip block {} ancestry",
                    tip->hashIndep.ToString().substr(0, 16));
    return false;
  }

  tip_ = std::move(*tip);
  hash_list_ = std::move(*record);
  LOG_CHAIN_INFO("Loaded chainstate: tip {} at height {}",
                 tip_->hashIndep.ToString().substr(0, 16), tip_->nHeight);
  return true;
}

std::optional<CBlock> Chainstate::GetTip() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tip_;
}

std::vector<uint256> Chainstate::GetHashList() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return hash_list_;
}

int32_t Chainstate::GetHeight() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tip_ ? tip_->nHeight : -1;
}

bool Chainstate::Contains(const uint256 &hash, int32_t height) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (height < 0 || static_cast<size_t>(height) >= hash_list_.size()) {
    return false;
  }
  return hash_list_[hash_list_.size() - 1 - height] == hash;
}

BlockRelation Chainstate::ClassifyBlock(const CBlock &block) const {
  if (Contains(block.hashIndep, block.nHeight)) {
    return BlockRelation::KNOWN;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  const int32_t tip_height = tip_ ? tip_->nHeight : -1;

  if (block.nHeight <= tip_height) {
    return BlockRelation::STALE;
  }
  if (tip_ && block.nHeight == tip_height + 1 &&
      block.hashPrevBlock == tip_->hashIndep) {
    return BlockRelation::EXTENDS_TIP;
  }
  return BlockRelation::FORK;
}

bool Chainstate::AdoptRecoveredChain(const recovery::RecoveryResult &result) {
  if (result.status != recovery::RecoveryStatus::RECOVERED ||
      result.new_chain.empty()) {
    return false;
  }

  auto tip = store_.ReadBlock(result.new_chain.front());
  if (!tip) {
    LOG_CHAIN_ERROR("Recovered tip {} not found in block store",
                    result.new_chain.front().ToString().substr(0, 16));
    return false;
  }
  if (tip->GetHashChain() != result.new_chain) {
    LOG_CHAIN_ERROR("Recovered chain does not match stored tip {}",
                    tip->hashIndep.ToString().substr(0, 16));
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  const int32_t old_height = tip_ ? tip_->nHeight : -1;
  if (!SetTipLocked(*tip)) {
    return false;
  }

  LOG_CHAIN_INFO("Switched to recovered chain: tip {} height {} -> {}",
                 tip_->hashIndep.ToString().substr(0, 16), old_height,
                 tip_->nHeight);
  return true;
}

bool Chainstate::ActivateBestChain(const uint256 &tip_hash) {
  auto tip = store_.ReadBlock(tip_hash);
  if (!tip) {
    LOG_CHAIN_ERROR("ActivateBestChain: block {} not in store",
                    tip_hash.ToString().substr(0, 16));
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  return SetTipLocked(*tip);
}

bool Chainstate::SetTipLocked(const CBlock &tip) {
  std::vector<uint256> hash_list = tip.GetHashChain();

  // In-memory state only follows a durable record
  if (!store_.WriteBestChain(hash_list)) {
    LOG_CHAIN_ERROR("Failed to persist best chain at height {}", tip.nHeight);
    return false;
  }

  tip_ = tip;
  hash_list_ = std::move(hash_list);
  return true;
}

} // namespace chain
} // namespace weave
