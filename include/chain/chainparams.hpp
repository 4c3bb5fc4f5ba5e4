// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include "util/uint.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace weave {
namespace chain {

/**
 * Chain type enumeration
 */
enum class ChainType {
  MAIN,    // Production network
  TESTNET, // Public test network
  REGTEST  // Regression test (local testing, trivial difficulty)
};

/**
 * Consensus parameters
 */
struct ConsensusParams {
  // Proof of Work
  int64_t nPowTargetSpacing;      // Target time between blocks (in seconds)
  int32_t nRetargetBlocks;        // Difficulty is re-evaluated every N blocks
  uint32_t nMinDiff;              // Lower bound on leading zero bits
  uint32_t nMaxDiff;              // Upper bound on leading zero bits
  int64_t nRandomXEpochDuration;  // RandomX epoch duration (in seconds)

  // Blocks may not be timestamped further than this ahead of local time
  int64_t nMaxFutureBlockTime;

  // Hash of genesis block
  uint256 hashGenesisBlock;
};

/**
 * ChainParams - Chain-specific parameters
 */
class ChainParams {
public:
  ChainParams() = default;
  virtual ~ChainParams() = default;

  const ConsensusParams &GetConsensus() const { return consensus; }
  const CBlock &GenesisBlock() const { return genesis; }
  ChainType GetChainType() const { return chainType; }
  std::string GetChainTypeString() const;

  static std::unique_ptr<ChainParams> CreateMainNet();
  static std::unique_ptr<ChainParams> CreateTestNet();
  static std::unique_ptr<ChainParams> CreateRegTest();
  static std::unique_ptr<ChainParams> Create(ChainType type);

protected:
  ConsensusParams consensus{};
  ChainType chainType{ChainType::MAIN};
  CBlock genesis;
};

class CMainParams : public ChainParams {
public:
  CMainParams();
};

class CTestNetParams : public ChainParams {
public:
  CTestNetParams();
};

class CRegTestParams : public ChainParams {
public:
  CRegTestParams();
};

// Address holding the genesis allocation on every network
uint256 GetGenesisWalletAddress();

} // namespace chain
} // namespace weave
