// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_all.hpp>
#include "storage/block_json.hpp"
#include "chain/chainparams.hpp"
#include "test_chain_builder.hpp"

using namespace weave;
using namespace weave::storage;

namespace {

CBlock MakeBlockWithTransactions() {
    auto params = chain::ChainParams::CreateRegTest();
    test::TestChainBuilder builder(*params);
    auto tx = test::MakeTransaction(chain::GetGenesisWalletAddress(), test::TestAddress(1),
                                    250, 3);
    CBlock block = builder.Extend(builder.Genesis(), 7, {tx});
    block.hashPoW = uint256(0x42);
    block.UpdateIndepHash();
    return block;
}

} // namespace

TEST_CASE("Block JSON - encoding preserves every field", "[storage][json]") {
    const CBlock block = MakeBlockWithTransactions();
    const std::string text = EncodeBlockJson(block);

    std::string error;
    auto decoded = DecodeBlockJson(text, &error);
    REQUIRE(decoded.has_value());
    REQUIRE(error.empty());

    // The independent hash covers all fields, so equality proves fidelity
    REQUIRE(decoded->ComputeIndepHash() == block.hashIndep);
    REQUIRE(decoded->hashIndep == block.hashIndep);
    REQUIRE(decoded->vtx.size() == 1);
    REQUIRE(decoded->vtx[0].id == block.vtx[0].id);
    REQUIRE(decoded->vWalletList == block.vWalletList);
    REQUIRE(decoded->hashPoW == block.hashPoW);
}

TEST_CASE("Block JSON - documented layout", "[storage][json]") {
    const CBlock block = MakeBlockWithTransactions();
    const std::string text = EncodeBlockJson(block);

    for (const char* key : {"\"version\"", "\"indep_hash\"", "\"height\"", "\"prev_block\"",
                            "\"hash_list\"", "\"time\"", "\"diff\"", "\"last_retarget\"",
                            "\"nonce\"", "\"pow_hash\"", "\"wallets\"", "\"txs\""}) {
        INFO(key);
        REQUIRE(text.find(key) != std::string::npos);
    }
    REQUIRE(text.find(block.hashIndep.GetHex()) != std::string::npos);
}

TEST_CASE("Block JSON - malformed input", "[storage][json]") {
    const CBlock block = MakeBlockWithTransactions();
    std::string error;

    SECTION("Not JSON") {
        REQUIRE_FALSE(DecodeBlockJson("not json", &error).has_value());
        REQUIRE_FALSE(error.empty());
    }

    SECTION("Unsupported format version") {
        std::string text = EncodeBlockJson(block);
        auto pos = text.find("\"version\": 1");
        REQUIRE(pos != std::string::npos);
        text.replace(pos, 12, "\"version\": 9");
        REQUIRE_FALSE(DecodeBlockJson(text, &error).has_value());
        REQUIRE(error.find("version") != std::string::npos);
    }

    SECTION("Missing field") {
        REQUIRE_FALSE(DecodeBlockJson("{\"version\": 1}", &error).has_value());
    }

    SECTION("Bad hash") {
        std::string text = EncodeBlockJson(block);
        auto pos = text.find(block.hashIndep.GetHex());
        text.replace(pos, 4, "zzzz");
        REQUIRE_FALSE(DecodeBlockJson(text, &error).has_value());
        REQUIRE(error.find("indep_hash") != std::string::npos);
    }

    SECTION("Error pointer is optional") {
        REQUIRE_FALSE(DecodeBlockJson("[]").has_value());
    }
}

TEST_CASE("Hash list JSON", "[storage][json]") {
    std::vector<uint256> list = {uint256(3), uint256(2), uint256(1)};

    auto decoded = DecodeHashListJson(EncodeHashListJson(list));
    REQUIRE(decoded.has_value());
    REQUIRE(*decoded == list);

    REQUIRE(DecodeHashListJson(EncodeHashListJson({}))->empty());
    REQUIRE_FALSE(DecodeHashListJson("{\"version\": 1, \"hash_list\": [\"xx\"]}").has_value());
}
