// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/validation.hpp"
#include "chain/chainparams.hpp"
#include "chain/pow.hpp"
#include "chain/randomx_pow.hpp"
#include "chain/recall.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <unordered_set>

namespace weave {
namespace validation {

bool CheckBlockStructure(const CBlock &block, ValidationState &state) {
  if (block.nHeight < 0) {
    return state.Invalid("bad-height-negative",
                         "height " + std::to_string(block.nHeight));
  }

  if (block.vHashList.size() != static_cast<size_t>(block.nHeight)) {
    return state.Invalid("bad-hashlist-length",
                         "hash list has " + std::to_string(block.vHashList.size()) +
                             " entries at height " + std::to_string(block.nHeight));
  }

  if (block.IsGenesis()) {
    if (!block.hashPrevBlock.IsNull()) {
      return state.Invalid("bad-genesis-prevblk", "genesis references a parent");
    }
  } else if (block.vHashList.front() != block.hashPrevBlock) {
    return state.Invalid("bad-hashlist-head",
                         "hash list does not start with the previous block");
  }

  for (const auto &tx : block.vtx) {
    if (!tx.IsWellFormed()) {
      return state.Invalid("bad-txns-malformed", tx.ToString());
    }
  }

  if (block.hashIndep != block.ComputeIndepHash()) {
    return state.Invalid("bad-indep-hash",
                         "independent hash does not commit to block contents");
  }

  return true;
}

int64_t GetAdjustedTime() {
  return util::GetTime();
}

// ============================================================================
// ConsensusValidator
// ============================================================================

ConsensusValidator::ConsensusValidator(const chain::ChainParams &params)
    : params_(params) {}

WalletList ConsensusValidator::ApplyTransactions(
    const WalletList &wallets, const std::vector<CTransaction> &txs) const {
  return ::ApplyTransactions(wallets, txs);
}

bool ConsensusValidator::Validate(const std::vector<uint256> &hash_list,
                                  const WalletList &wallets,
                                  const CBlock &candidate,
                                  const CBlock &predecessor,
                                  const CBlock &recall) const {
  ValidationState state;
  if (!ValidateBlock(hash_list, wallets, candidate, predecessor, recall, state)) {
    LOG_CHAIN_DEBUG("Block {} at height {} rejected: {}",
                    candidate.hashIndep.ToString().substr(0, 16),
                    candidate.nHeight, state.ToString());
    return false;
  }
  return true;
}

bool ConsensusValidator::ValidateBlock(const std::vector<uint256> &hash_list,
                                       const WalletList &wallets,
                                       const CBlock &candidate,
                                       const CBlock &predecessor,
                                       const CBlock &recall,
                                       ValidationState &state) const {
  // Linkage to the predecessor
  if (candidate.nHeight != predecessor.nHeight + 1) {
    return state.Invalid("bad-height",
                         "expected height " + std::to_string(predecessor.nHeight + 1) +
                             ", got " + std::to_string(candidate.nHeight));
  }

  if (candidate.hashPrevBlock != predecessor.hashIndep) {
    return state.Invalid("bad-prevblk", "previous block hash mismatch");
  }

  if (candidate.vHashList != hash_list) {
    return state.Invalid("bad-hashlist",
                         "hash list does not match predecessor's chain");
  }

  // Proof of access: the recall block must be the one predecessor selects
  const uint256 expected_recall =
      chain::SelectRecallHash(predecessor, predecessor.vHashList);
  if (recall.hashIndep != expected_recall) {
    return state.Invalid("bad-recall",
                         "expected recall block " + expected_recall.ToString() +
                             ", got " + recall.hashIndep.ToString());
  }

  // Difficulty
  const uint32_t expected_diff =
      consensus::GetNextDifficulty(predecessor, candidate.nTime, params_);
  if (candidate.nDiff != expected_diff) {
    return state.Invalid("bad-diff", "incorrect difficulty: expected " +
                                         std::to_string(expected_diff) +
                                         ", got " +
                                         std::to_string(candidate.nDiff));
  }

  const uint32_t expected_retarget =
      consensus::GetNextRetargetTime(predecessor, candidate.nTime, params_);
  if (candidate.nLastRetarget != expected_retarget) {
    return state.Invalid("bad-retarget", "incorrect last retarget: expected " +
                                             std::to_string(expected_retarget) +
                                             ", got " +
                                             std::to_string(candidate.nLastRetarget));
  }

  // Timestamps
  if (candidate.nTime < predecessor.nTime) {
    return state.Invalid(
        "time-too-old",
        "block's timestamp is too early: " + std::to_string(candidate.nTime) +
            " < " + std::to_string(predecessor.nTime));
  }

  const int64_t max_time =
      GetAdjustedTime() + params_.GetConsensus().nMaxFutureBlockTime;
  if (candidate.GetBlockTime() > max_time) {
    return state.Invalid(
        "time-too-new",
        "block timestamp too far in future: " + std::to_string(candidate.nTime) +
            " > " + std::to_string(max_time));
  }

  // Version validation (for now, just accept version 1)
  if (candidate.nVersion < 1) {
    return state.Invalid("bad-version", "block version too old: " +
                                            std::to_string(candidate.nVersion));
  }

  if (!CheckProofOfWork(candidate, recall.hashIndep)) {
    return state.Invalid("high-hash", "proof of work failed");
  }

  // Transactions and resulting wallet state
  if (!CheckTransactions(predecessor.vWalletList, candidate.vtx, state)) {
    return false;
  }

  for (const auto &[addr, entry] : wallets) {
    if (!MoneyRange(entry.nBalance)) {
      return state.Invalid("bad-wallet-balance",
                           "wallet " + addr.ToString() + " balance " +
                               std::to_string(entry.nBalance) + " out of range");
    }
  }

  if (candidate.vWalletList != wallets) {
    return state.Invalid("bad-wallet-list",
                         "wallet list does not match applied transactions");
  }

  return true;
}

bool ConsensusValidator::CheckProofOfWork(const CBlock &candidate,
                                          const uint256 &recall_hash) const {
  return consensus::CheckProofOfWork(candidate, recall_hash, params_,
                                     crypto::POWVerifyMode::FULL);
}

int64_t ConsensusValidator::GetAdjustedTime() const {
  return validation::GetAdjustedTime();
}

bool ConsensusValidator::CheckTransactions(const WalletList &prev_wallets,
                                           const std::vector<CTransaction> &txs,
                                           ValidationState &state) const {
  // Replay each tx against a running state so hashLastTx chaining within a
  // block is checked too
  WalletList running = prev_wallets;
  std::unordered_set<uint256> seen;

  for (const auto &tx : txs) {
    if (!tx.IsWellFormed()) {
      return state.Invalid("bad-txns-malformed", tx.ToString());
    }
    if (!seen.insert(tx.id).second) {
      return state.Invalid("bad-txns-duplicate", tx.ToString());
    }

    auto it = running.find(tx.owner);
    if (it == running.end()) {
      return state.Invalid("bad-txns-unknown-owner", tx.ToString());
    }
    if (it->second.hashLastTx != tx.hashLastTx) {
      return state.Invalid("bad-txns-last-tx", tx.ToString());
    }

    ::ApplyTransaction(running, tx);
  }
  return true;
}

} // namespace validation
} // namespace weave
