// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/chainparams.hpp"
#include "util/sha256.hpp"

namespace weave {
namespace chain {

namespace {

constexpr int64_t GENESIS_ALLOCATION = MAX_MONEY;

WalletList GenesisWallets() {
  WalletList wallets;
  wallets[GetGenesisWalletAddress()].nBalance = GENESIS_ALLOCATION;
  return wallets;
}

} // namespace

uint256 GetGenesisWalletAddress() {
  crypto::HashWriter w;
  w.WriteString("weave/genesis-allocation");
  return w.GetHash();
}

std::string ChainParams::GetChainTypeString() const {
  switch (chainType) {
  case ChainType::MAIN:
    return "main";
  case ChainType::TESTNET:
    return "test";
  case ChainType::REGTEST:
    return "regtest";
  }
  return "unknown";
}

std::unique_ptr<ChainParams> ChainParams::CreateMainNet() {
  return std::make_unique<CMainParams>();
}

std::unique_ptr<ChainParams> ChainParams::CreateTestNet() {
  return std::make_unique<CTestNetParams>();
}

std::unique_ptr<ChainParams> ChainParams::CreateRegTest() {
  return std::make_unique<CRegTestParams>();
}

std::unique_ptr<ChainParams> ChainParams::Create(ChainType type) {
  switch (type) {
  case ChainType::MAIN:
    return CreateMainNet();
  case ChainType::TESTNET:
    return CreateTestNet();
  case ChainType::REGTEST:
    return CreateRegTest();
  }
  return CreateMainNet();
}

// ============================================================================
// MainNet Parameters
// ============================================================================

CMainParams::CMainParams() {
  chainType = ChainType::MAIN;

  consensus.nPowTargetSpacing = 2 * 60;               // 2 minutes
  consensus.nRetargetBlocks = 10;
  consensus.nMinDiff = 8;
  consensus.nMaxDiff = 255;
  consensus.nRandomXEpochDuration = 7 * 24 * 60 * 60; // 1 week
  consensus.nMaxFutureBlockTime = 2 * 60 * 60;        // 2 hours

  // Genesis: 2025-10-24 19:20:12 UTC
  genesis = CreateGenesisBlock(1761330012, consensus.nMinDiff, GenesisWallets());
  consensus.hashGenesisBlock = genesis.hashIndep;
}

// ============================================================================
// TestNet Parameters
// ============================================================================

CTestNetParams::CTestNetParams() {
  chainType = ChainType::TESTNET;

  consensus.nPowTargetSpacing = 2 * 60;
  consensus.nRetargetBlocks = 10;
  consensus.nMinDiff = 4;
  consensus.nMaxDiff = 255;
  consensus.nRandomXEpochDuration = 7 * 24 * 60 * 60;
  consensus.nMaxFutureBlockTime = 2 * 60 * 60;

  genesis = CreateGenesisBlock(1761330012, consensus.nMinDiff, GenesisWallets());
  consensus.hashGenesisBlock = genesis.hashIndep;
}

// ============================================================================
// RegTest Parameters
// ============================================================================

CRegTestParams::CRegTestParams() {
  chainType = ChainType::REGTEST;

  // Zero difficulty: any RandomX hash satisfies the target
  consensus.nPowTargetSpacing = 2 * 60;
  consensus.nRetargetBlocks = 10;
  consensus.nMinDiff = 0;
  consensus.nMaxDiff = 255;
  consensus.nRandomXEpochDuration = 365ULL * 24 * 60 * 60 * 100; // 100 years
  consensus.nMaxFutureBlockTime = 2 * 60 * 60;

  genesis = CreateGenesisBlock(1296688602, consensus.nMinDiff, GenesisWallets());
  consensus.hashGenesisBlock = genesis.hashIndep;
}

} // namespace chain
} // namespace weave
