// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Difficulty schedule and proof-of-work checks (no RandomX evaluation)

#include <catch2/catch_all.hpp>
#include "chain/pow.hpp"
#include "chain/randomx_pow.hpp"
#include "chain/chainparams.hpp"
#include "test_chain_builder.hpp"

using namespace weave;

TEST_CASE("CountLeadingZeroBits", "[pow]") {
    SECTION("Null hash is all zero bits") {
        REQUIRE(consensus::CountLeadingZeroBits(uint256()) == 256);
    }

    SECTION("Bits counted from the first byte's high bit") {
        uint256 h;
        h.data()[0] = 0x80;
        REQUIRE(consensus::CountLeadingZeroBits(h) == 0);
        h.data()[0] = 0x01;
        REQUIRE(consensus::CountLeadingZeroBits(h) == 7);
        h.data()[0] = 0x00;
        h.data()[1] = 0x10;
        REQUIRE(consensus::CountLeadingZeroBits(h) == 11);
    }

    SECTION("HashMeetsDifficulty compares against the count") {
        uint256 h;
        h.data()[1] = 0x10; // 11 leading zeros
        REQUIRE(consensus::HashMeetsDifficulty(h, 0));
        REQUIRE(consensus::HashMeetsDifficulty(h, 11));
        REQUIRE_FALSE(consensus::HashMeetsDifficulty(h, 12));
    }
}

TEST_CASE("Difficulty retargeting", "[pow]") {
    auto params = chain::ChainParams::CreateTestNet();
    const auto& consensus = params->GetConsensus();
    const int64_t scheduled = consensus.nRetargetBlocks * consensus.nPowTargetSpacing;

    CBlock prev;
    prev.nHeight = consensus.nRetargetBlocks - 1; // next block retargets
    prev.nDiff = 10;
    prev.nLastRetarget = 100000;
    prev.nTime = 100000 + static_cast<uint32_t>(scheduled) - 120;

    SECTION("Retarget heights") {
        REQUIRE_FALSE(consensus::IsRetargetHeight(0, *params));
        REQUIRE_FALSE(consensus::IsRetargetHeight(1, *params));
        REQUIRE(consensus::IsRetargetHeight(consensus.nRetargetBlocks, *params));
        REQUIRE(consensus::IsRetargetHeight(consensus.nRetargetBlocks * 3, *params));
    }

    SECTION("On schedule keeps difficulty") {
        uint32_t t = prev.nLastRetarget + static_cast<uint32_t>(scheduled);
        REQUIRE(consensus::GetNextDifficulty(prev, t, *params) == 10);
        REQUIRE(consensus::GetNextRetargetTime(prev, t, *params) == t);
    }

    SECTION("Fast blocks raise difficulty") {
        uint32_t t = prev.nLastRetarget + static_cast<uint32_t>(scheduled / 2) - 1;
        REQUIRE(consensus::GetNextDifficulty(prev, t, *params) == 11);
    }

    SECTION("Slow blocks lower difficulty") {
        uint32_t t = prev.nLastRetarget + static_cast<uint32_t>(scheduled * 2) + 1;
        REQUIRE(consensus::GetNextDifficulty(prev, t, *params) == 9);
    }

    SECTION("Difficulty clamped to minimum") {
        prev.nDiff = consensus.nMinDiff;
        uint32_t t = prev.nLastRetarget + static_cast<uint32_t>(scheduled * 10);
        REQUIRE(consensus::GetNextDifficulty(prev, t, *params) == consensus.nMinDiff);
    }

    SECTION("Off-interval heights inherit") {
        prev.nHeight = 3;
        uint32_t t = prev.nLastRetarget + 1;
        REQUIRE(consensus::GetNextDifficulty(prev, t, *params) == 10);
        REQUIRE(consensus::GetNextRetargetTime(prev, t, *params) == prev.nLastRetarget);
    }

    SECTION("Out-of-range inherited difficulty pulled into bounds") {
        prev.nDiff = 0; // below testnet minimum
        uint32_t t = prev.nLastRetarget + static_cast<uint32_t>(scheduled);
        REQUIRE(consensus::GetNextDifficulty(prev, t, *params) == consensus.nMinDiff);
    }
}

TEST_CASE("CheckProofOfWork - argument handling", "[pow]") {
    auto params = chain::ChainParams::CreateRegTest();
    CBlock block = params->GenesisBlock();

    SECTION("MINING mode requires an output hash") {
        REQUIRE_THROWS_AS(consensus::CheckProofOfWork(block, block.hashIndep, *params,
                                                      crypto::POWVerifyMode::MINING),
                          std::runtime_error);
    }

    SECTION("FULL mode rejects a block without a committed hash") {
        block.hashPoW.SetNull();
        REQUIRE_FALSE(consensus::CheckProofOfWork(block, block.hashIndep, *params,
                                                  crypto::POWVerifyMode::FULL));
    }
}
