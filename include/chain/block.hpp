// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/transaction.hpp"
#include "util/uint.hpp"
#include <cstdint>
#include <string>
#include <vector>

// CBlock - Full block: header fields, complete ancestry, wallet state and txs
//
// Each block carries the hashes of all of its ancestors (vHashList,
// newest-first: vHashList[0] == hashPrevBlock, vHashList.back() == genesis),
// so vHashList.size() == nHeight. The wallet list is the state AFTER this
// block's transactions were applied.
//
// hashIndep (the "independent hash") commits to every other field and is the
// block's identity everywhere: storage keys, peer requests, hash lists.
class CBlock
{
public:
    int32_t nVersion{1};
    int32_t nHeight{0};
    uint256 hashIndep{};
    uint256 hashPrevBlock{};        // Null for genesis
    std::vector<uint256> vHashList; // Ancestor hashes, newest-first
    uint32_t nTime{0};              // Unix timestamp
    uint32_t nDiff{0};              // Required leading zero bits of hashPoW
    uint32_t nLastRetarget{0};      // Timestamp of the most recent retarget
    uint32_t nNonce{0};             // Nonce for proof-of-work
    uint256 hashPoW{};              // RandomX hash over the PoW preimage
    WalletList vWalletList;         // Wallet state after vtx
    std::vector<CTransaction> vtx;

    [[nodiscard]] bool IsGenesis() const noexcept { return nHeight == 0; }

    // Hash over all fields except hashIndep itself
    [[nodiscard]] uint256 ComputeIndepHash() const;
    void UpdateIndepHash() { hashIndep = ComputeIndepHash(); }

    // Hash list of the chain ending at this block: [hashIndep] + vHashList
    [[nodiscard]] std::vector<uint256> GetHashChain() const;

    // RandomX input. Binds the header to the recall block so a miner must
    // hold (or fetch) that historical block to produce hashPoW.
    [[nodiscard]] std::vector<uint8_t> SerializePoWInput(const uint256& recall_hash) const;

    [[nodiscard]] int64_t GetBlockTime() const noexcept
    {
        return static_cast<int64_t>(nTime);
    }

    [[nodiscard]] std::string ToString() const;
};

// Genesis: height 0, empty ancestry, no transactions
CBlock CreateGenesisBlock(uint32_t nTime, uint32_t nDiff, const WalletList& wallets);
