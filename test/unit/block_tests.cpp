// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_all.hpp>
#include "chain/block.hpp"
#include "chain/chainparams.hpp"
#include "test_chain_builder.hpp"

using namespace weave;

static CBlock MakeTestBlock() {
    auto params = chain::ChainParams::CreateRegTest();
    test::TestChainBuilder builder(*params);
    auto blocks = builder.BuildChain(3);
    return blocks.back();
}

TEST_CASE("CBlock - independent hash", "[block]") {
    CBlock block = MakeTestBlock();
    const uint256 original = block.hashIndep;

    SECTION("Stored hash matches recomputation") {
        REQUIRE(block.ComputeIndepHash() == original);
    }

    SECTION("Every committed field changes the hash") {
        auto changed = [&](auto mutate) {
            CBlock copy = block;
            mutate(copy);
            return copy.ComputeIndepHash() != original;
        };

        REQUIRE(changed([](CBlock& b) { b.nVersion = 2; }));
        REQUIRE(changed([](CBlock& b) { b.nHeight += 1; }));
        REQUIRE(changed([](CBlock& b) { b.hashPrevBlock = uint256(9); }));
        REQUIRE(changed([](CBlock& b) { b.vHashList.back() = uint256(9); }));
        REQUIRE(changed([](CBlock& b) { b.nTime += 1; }));
        REQUIRE(changed([](CBlock& b) { b.nDiff += 1; }));
        REQUIRE(changed([](CBlock& b) { b.nLastRetarget += 1; }));
        REQUIRE(changed([](CBlock& b) { b.nNonce += 1; }));
        REQUIRE(changed([](CBlock& b) { b.hashPoW = uint256(9); }));
        REQUIRE(changed([](CBlock& b) { b.vWalletList[test::TestAddress(1)].nBalance = 1; }));
        REQUIRE(changed([](CBlock& b) {
            b.vtx.push_back(test::MakeTransaction(test::TestAddress(1), test::TestAddress(2), 1, 0));
        }));
    }

    SECTION("hashIndep itself is not committed") {
        CBlock copy = block;
        copy.hashIndep = uint256(42);
        REQUIRE(copy.ComputeIndepHash() == original);
        copy.UpdateIndepHash();
        REQUIRE(copy.hashIndep == original);
    }
}

TEST_CASE("CBlock - hash chain", "[block]") {
    CBlock block = MakeTestBlock();

    auto chain = block.GetHashChain();
    REQUIRE(chain.size() == block.vHashList.size() + 1);
    REQUIRE(chain.front() == block.hashIndep);
    REQUIRE(chain[1] == block.hashPrevBlock);
    REQUIRE(std::equal(block.vHashList.begin(), block.vHashList.end(), chain.begin() + 1));
}

TEST_CASE("CBlock - PoW input", "[block]") {
    CBlock block = MakeTestBlock();
    const uint256 recall_a(1);
    const uint256 recall_b(2);

    SECTION("Recall block is bound into the input") {
        REQUIRE(block.SerializePoWInput(recall_a) != block.SerializePoWInput(recall_b));
    }

    SECTION("Input does not depend on the PoW result") {
        auto before = block.SerializePoWInput(recall_a);
        block.hashPoW = uint256(77);
        REQUIRE(block.SerializePoWInput(recall_a) == before);
    }

    SECTION("Nonce changes the input") {
        auto before = block.SerializePoWInput(recall_a);
        block.nNonce += 1;
        REQUIRE(block.SerializePoWInput(recall_a) != before);
    }
}

TEST_CASE("CBlock - genesis", "[block]") {
    WalletList wallets;
    wallets[test::TestAddress(1)].nBalance = 100;
    CBlock genesis = CreateGenesisBlock(1000, 4, wallets);

    REQUIRE(genesis.IsGenesis());
    REQUIRE(genesis.nHeight == 0);
    REQUIRE(genesis.hashPrevBlock.IsNull());
    REQUIRE(genesis.vHashList.empty());
    REQUIRE(genesis.nLastRetarget == 1000);
    REQUIRE(genesis.nDiff == 4);
    REQUIRE(genesis.vWalletList == wallets);
    REQUIRE(genesis.hashIndep == genesis.ComputeIndepHash());
    REQUIRE(genesis.GetHashChain() == std::vector<uint256>{genesis.hashIndep});
    REQUIRE(genesis.GetBlockTime() == 1000);
}

TEST_CASE("CBlock - ToString", "[block]") {
    CBlock block = MakeTestBlock();
    auto s = block.ToString();
    REQUIRE(s.find("height=3") != std::string::npos);
    REQUIRE(s.find(block.hashIndep.ToString().substr(0, 16)) != std::string::npos);
}
