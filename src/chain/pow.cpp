// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/pow.hpp"
#include "chain/chainparams.hpp"
#include "chain/randomx_pow.hpp"
#include "util/logging.hpp"
#include <stdexcept>

namespace weave {
namespace consensus {

bool IsRetargetHeight(int32_t nHeight, const chain::ChainParams &params) {
  const int32_t interval = params.GetConsensus().nRetargetBlocks;
  return nHeight > 0 && interval > 0 && nHeight % interval == 0;
}

uint32_t GetNextDifficulty(const CBlock &prev, uint32_t nTime,
                           const chain::ChainParams &params) {
  const auto &consensus = params.GetConsensus();

  if (!IsRetargetHeight(prev.nHeight + 1, params)) {
    return prev.nDiff;
  }

  const int64_t nScheduled =
      static_cast<int64_t>(consensus.nRetargetBlocks) * consensus.nPowTargetSpacing;
  const int64_t nElapsed =
      static_cast<int64_t>(nTime) - static_cast<int64_t>(prev.nLastRetarget);

  uint32_t nDiff = prev.nDiff;
  if (nElapsed < nScheduled / 2) {
    if (nDiff < consensus.nMaxDiff) {
      ++nDiff;
    }
  } else if (nElapsed > nScheduled * 2) {
    if (nDiff > consensus.nMinDiff) {
      --nDiff;
    }
  }

  // Out-of-range inherited values are pulled back into bounds
  if (nDiff < consensus.nMinDiff) {
    nDiff = consensus.nMinDiff;
  }
  if (nDiff > consensus.nMaxDiff) {
    nDiff = consensus.nMaxDiff;
  }

  LOG_CHAIN_TRACE("GetNextDifficulty: retarget at height {} elapsed={}s scheduled={}s diff {} -> {}",
                  prev.nHeight + 1, nElapsed, nScheduled, prev.nDiff, nDiff);
  return nDiff;
}

uint32_t GetNextRetargetTime(const CBlock &prev, uint32_t nTime,
                             const chain::ChainParams &params) {
  if (IsRetargetHeight(prev.nHeight + 1, params)) {
    return nTime;
  }
  return prev.nLastRetarget;
}

unsigned int CountLeadingZeroBits(const uint256 &hash) {
  unsigned int bits = 0;
  for (unsigned char byte : hash) {
    if (byte == 0) {
      bits += 8;
      continue;
    }
    for (int i = 7; i >= 0; --i) {
      if (byte & (1u << i)) {
        return bits;
      }
      ++bits;
    }
  }
  return bits;
}

bool HashMeetsDifficulty(const uint256 &hash, uint32_t nDiff) {
  return CountLeadingZeroBits(hash) >= nDiff;
}

bool CheckProofOfWork(const CBlock &block, const uint256 &recall_hash,
                      const chain::ChainParams &params,
                      crypto::POWVerifyMode mode, uint256 *outHash) {
  const auto &consensus = params.GetConsensus();

  LOG_CHAIN_TRACE("CheckProofOfWork: block_hash={} nDiff={} mode={}",
                  block.hashIndep.ToString().substr(0, 16), block.nDiff,
                  mode == crypto::POWVerifyMode::FULL ? "FULL" : "MINING");

  if (outHash == nullptr && mode == crypto::POWVerifyMode::MINING) {
    throw std::runtime_error("MINING mode requires outHash parameter");
  }

  if (mode == crypto::POWVerifyMode::FULL && block.hashPoW.IsNull()) {
    LOG_CHAIN_TRACE("CheckProofOfWork: FAILED - hashPoW is null");
    return false;
  }

  const uint32_t nEpoch = crypto::GetEpoch(
      block.nTime, static_cast<uint32_t>(consensus.nRandomXEpochDuration));
  const uint256 hashPoW =
      crypto::ComputeRandomXHash(nEpoch, block.SerializePoWInput(recall_hash));

  if (mode == crypto::POWVerifyMode::FULL && hashPoW != block.hashPoW) {
    LOG_CHAIN_TRACE("CheckProofOfWork: FAILED - RandomX hash mismatch");
    return false;
  }

  if (outHash != nullptr) {
    *outHash = hashPoW;
  }

  if (!HashMeetsDifficulty(hashPoW, block.nDiff)) {
    LOG_CHAIN_TRACE("CheckProofOfWork: FAILED - {} leading zero bits < nDiff {}",
                    CountLeadingZeroBits(hashPoW), block.nDiff);
    return false;
  }

  LOG_CHAIN_TRACE("CheckProofOfWork: SUCCESS");
  return true;
}

} // namespace consensus
} // namespace weave
