// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include <cstdint>

namespace weave {

namespace chain {
class ChainParams;
} // namespace chain

namespace crypto {
enum class POWVerifyMode;
}

namespace consensus {

// Step retargeting:
// Every nRetargetBlocks blocks the time elapsed since the last retarget is
// compared with the scheduled time (nRetargetBlocks * nPowTargetSpacing).
// Less than half the schedule raises nDiff by one bit, more than twice the
// schedule lowers it by one bit, clamped to [nMinDiff, nMaxDiff].
// Between retargets difficulty and retarget time carry over unchanged.

bool IsRetargetHeight(int32_t nHeight, const chain::ChainParams &params);

// Difficulty required of the block following prev, timestamped nTime
uint32_t GetNextDifficulty(const CBlock &prev, uint32_t nTime,
                           const chain::ChainParams &params);

// nLastRetarget value required of the block following prev
uint32_t GetNextRetargetTime(const CBlock &prev, uint32_t nTime,
                             const chain::ChainParams &params);

// Number of leading zero bits (hash read in storage order, MSB first)
unsigned int CountLeadingZeroBits(const uint256 &hash);

bool HashMeetsDifficulty(const uint256 &hash, uint32_t nDiff);

// CONSENSUS-CRITICAL: Validates proof-of-work for a block whose predecessor
// selected recall_hash as its recall block.
// FULL: recompute the RandomX hash, require it equal block.hashPoW and meet
// block.nDiff. MINING: compute the hash into outHash (required) and report
// whether it meets block.nDiff.
// Throws std::runtime_error if RandomX is unavailable.
bool CheckProofOfWork(const CBlock &block, const uint256 &recall_hash,
                      const chain::ChainParams &params,
                      crypto::POWVerifyMode mode, uint256 *outHash = nullptr);

} // namespace consensus
} // namespace weave
