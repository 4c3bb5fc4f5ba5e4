// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// RandomX-backed tests (allocate a light-mode cache; slower than the rest)

#include <catch2/catch_all.hpp>
#include "chain/randomx_pow.hpp"
#include "chain/pow.hpp"
#include "chain/chainparams.hpp"
#include "chain/recall.hpp"
#include "chain/validation.hpp"

using namespace weave;

TEST_CASE("RandomX epoch helpers", "[randomx]") {
    SECTION("Epoch is time over duration") {
        REQUIRE(crypto::GetEpoch(0, 100) == 0);
        REQUIRE(crypto::GetEpoch(99, 100) == 0);
        REQUIRE(crypto::GetEpoch(100, 100) == 1);
        REQUIRE(crypto::GetEpoch(12345, 0) == 0);
    }

    SECTION("Seed hash differs per epoch") {
        REQUIRE(crypto::GetSeedHash(0) != crypto::GetSeedHash(1));
        REQUIRE(crypto::GetSeedHash(7) == crypto::GetSeedHash(7));
    }
}

TEST_CASE("RandomX hashing and PoW verification", "[randomx]") {
    crypto::InitRandomX();
    REQUIRE(crypto::IsRandomXInitialized());

    auto params = chain::ChainParams::CreateRegTest();
    const CBlock& genesis = params->GenesisBlock();

    SECTION("Hash is deterministic and input sensitive") {
        std::vector<uint8_t> a = {1, 2, 3};
        std::vector<uint8_t> b = {1, 2, 4};
        REQUIRE(crypto::ComputeRandomXHash(0, a) == crypto::ComputeRandomXHash(0, a));
        REQUIRE(crypto::ComputeRandomXHash(0, a) != crypto::ComputeRandomXHash(0, b));
        REQUIRE(crypto::ComputeRandomXHash(0, a) != crypto::ComputeRandomXHash(1, a));
    }

    SECTION("Mined hash verifies in FULL mode") {
        CBlock block = genesis;
        const uint256 recall = chain::SelectRecallHash(genesis, genesis.vHashList);

        uint256 pow_hash;
        // Regtest minimum difficulty is zero, so any nonce is a solution
        REQUIRE(consensus::CheckProofOfWork(block, recall, *params,
                                            crypto::POWVerifyMode::MINING, &pow_hash));
        block.hashPoW = pow_hash;
        REQUIRE(consensus::CheckProofOfWork(block, recall, *params,
                                            crypto::POWVerifyMode::FULL));

        SECTION("Wrong recall block fails") {
            REQUIRE_FALSE(consensus::CheckProofOfWork(block, uint256(1), *params,
                                                      crypto::POWVerifyMode::FULL));
        }

        SECTION("Tampered commitment fails") {
            block.hashPoW.data()[0] ^= 0x01;
            REQUIRE_FALSE(consensus::CheckProofOfWork(block, recall, *params,
                                                      crypto::POWVerifyMode::FULL));
        }
    }

    SECTION("Difficulty above the hash's zero bits fails") {
        CBlock block = genesis;
        uint256 pow_hash;
        REQUIRE(consensus::CheckProofOfWork(block, block.hashIndep, *params,
                                            crypto::POWVerifyMode::MINING, &pow_hash));
        block.hashPoW = pow_hash;
        block.nDiff = consensus::CountLeadingZeroBits(pow_hash) + 1;
        REQUIRE_FALSE(consensus::CheckProofOfWork(block, block.hashIndep, *params,
                                                  crypto::POWVerifyMode::FULL));
    }
}
