// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_all.hpp>
#include "chain/validation.hpp"
#include "chain/chainparams.hpp"
#include "chain/recall.hpp"
#include "util/time.hpp"
#include "test_chain_builder.hpp"
#include <memory>
#include <stdexcept>

using namespace weave;
using namespace weave::validation;

namespace {

struct ValidationFixture {
    std::unique_ptr<chain::ChainParams> params = chain::ChainParams::CreateRegTest();
    test::TestChainBuilder builder{*params};
    test::TestConsensusValidator validator{*params};
    std::vector<CBlock> chain = builder.BuildChain(5);

    const CBlock& Prev() const { return chain.back(); }

    const CBlock& Find(const uint256& hash) const {
        for (const auto& b : chain) {
            if (b.hashIndep == hash) {
                return b;
            }
        }
        throw std::out_of_range("block not in fixture chain");
    }

    const CBlock& Recall() const {
        return Find(chain::SelectRecallHash(Prev(), Prev().vHashList));
    }

    CBlock Candidate(const std::vector<CTransaction>& txs = {}) const {
        return builder.Extend(Prev(), 0, txs);
    }

    bool Check(const CBlock& candidate, ValidationState& state) const {
        return Check(candidate, Recall(), state);
    }

    bool Check(const CBlock& candidate, const CBlock& recall, ValidationState& state) const {
        auto wallets = validator.ApplyTransactions(Prev().vWalletList, candidate.vtx);
        return validator.ValidateBlock(Prev().GetHashChain(), wallets, candidate, Prev(),
                                       recall, state);
    }
};

} // namespace

TEST_CASE("ValidationState - basic functionality", "[validation]") {
    SECTION("Default state is valid") {
        ValidationState state;
        REQUIRE(state.IsValid());
        REQUIRE_FALSE(state.IsInvalid());
        REQUIRE_FALSE(state.IsError());
        REQUIRE(state.ToString() == "valid");
    }

    SECTION("Invalid() marks state as invalid and returns false") {
        ValidationState state;
        bool result = state.Invalid("bad-diff", "expected 3, got 4");

        REQUIRE_FALSE(result);
        REQUIRE(state.IsInvalid());
        REQUIRE(state.GetRejectReason() == "bad-diff");
        REQUIRE(state.GetDebugMessage() == "expected 3, got 4");
        REQUIRE(state.ToString() == "bad-diff (expected 3, got 4)");
    }

    SECTION("Error() marks state as error and returns false") {
        ValidationState state;
        REQUIRE_FALSE(state.Error("disk-failure"));
        REQUIRE(state.IsError());
        REQUIRE(state.ToString() == "disk-failure");
    }
}

TEST_CASE("CheckBlockStructure - context-free checks", "[validation]") {
    ValidationFixture f;
    CBlock block = f.Prev();
    ValidationState state;

    SECTION("Valid block and genesis pass") {
        REQUIRE(CheckBlockStructure(block, state));
        REQUIRE(CheckBlockStructure(f.chain.front(), state));
    }

    SECTION("Negative height") {
        block.nHeight = -1;
        block.UpdateIndepHash();
        REQUIRE_FALSE(CheckBlockStructure(block, state));
        REQUIRE(state.GetRejectReason() == "bad-height-negative");
    }

    SECTION("Hash list length must equal height") {
        block.vHashList.pop_back();
        block.UpdateIndepHash();
        REQUIRE_FALSE(CheckBlockStructure(block, state));
        REQUIRE(state.GetRejectReason() == "bad-hashlist-length");
    }

    SECTION("Genesis must not reference a parent") {
        CBlock genesis = f.chain.front();
        genesis.hashPrevBlock = uint256(1);
        genesis.UpdateIndepHash();
        REQUIRE_FALSE(CheckBlockStructure(genesis, state));
        REQUIRE(state.GetRejectReason() == "bad-genesis-prevblk");
    }

    SECTION("Hash list must start with the previous block") {
        block.hashPrevBlock = uint256(1);
        block.UpdateIndepHash();
        REQUIRE_FALSE(CheckBlockStructure(block, state));
        REQUIRE(state.GetRejectReason() == "bad-hashlist-head");
    }

    SECTION("Malformed transaction") {
        auto tx = test::MakeTransaction(test::TestAddress(1), test::TestAddress(2), 5, 0);
        tx.nReward = 1; // id no longer matches
        block.vtx.push_back(tx);
        block.UpdateIndepHash();
        REQUIRE_FALSE(CheckBlockStructure(block, state));
        REQUIRE(state.GetRejectReason() == "bad-txns-malformed");
    }

    SECTION("Independent hash must commit to contents") {
        block.nNonce += 1;
        REQUIRE_FALSE(CheckBlockStructure(block, state));
        REQUIRE(state.GetRejectReason() == "bad-indep-hash");
    }
}

TEST_CASE("ConsensusValidator - linkage and history", "[validation]") {
    ValidationFixture f;
    ValidationState state;

    SECTION("Well-formed child accepted") {
        REQUIRE(f.Check(f.Candidate(), state));
        REQUIRE(state.IsValid());
        REQUIRE(f.validator.Validate(f.Prev().GetHashChain(), f.Prev().vWalletList,
                                     f.Candidate(), f.Prev(), f.Recall()));
    }

    SECTION("bad-height") {
        CBlock c = f.Candidate();
        c.nHeight += 1;
        REQUIRE_FALSE(f.Check(c, state));
        REQUIRE(state.GetRejectReason() == "bad-height");
    }

    SECTION("bad-prevblk") {
        CBlock c = f.Candidate();
        c.hashPrevBlock = f.chain[2].hashIndep;
        REQUIRE_FALSE(f.Check(c, state));
        REQUIRE(state.GetRejectReason() == "bad-prevblk");
    }

    SECTION("bad-hashlist") {
        CBlock c = f.Candidate();
        c.vHashList[2] = uint256(9);
        REQUIRE_FALSE(f.Check(c, state));
        REQUIRE(state.GetRejectReason() == "bad-hashlist");
    }

    SECTION("bad-recall") {
        const uint256 expected = chain::SelectRecallHash(f.Prev(), f.Prev().vHashList);
        const CBlock& wrong = expected == f.chain[1].hashIndep ? f.chain[2] : f.chain[1];
        REQUIRE_FALSE(f.Check(f.Candidate(), wrong, state));
        REQUIRE(state.GetRejectReason() == "bad-recall");
    }
}

TEST_CASE("ConsensusValidator - difficulty and time", "[validation]") {
    ValidationFixture f;
    ValidationState state;

    SECTION("bad-diff") {
        CBlock c = f.Candidate();
        c.nDiff += 1;
        REQUIRE_FALSE(f.Check(c, state));
        REQUIRE(state.GetRejectReason() == "bad-diff");
    }

    SECTION("bad-retarget") {
        CBlock c = f.Candidate();
        c.nLastRetarget += 1;
        REQUIRE_FALSE(f.Check(c, state));
        REQUIRE(state.GetRejectReason() == "bad-retarget");
    }

    SECTION("time-too-old") {
        CBlock c = f.Candidate();
        c.nTime = f.Prev().nTime - 1;
        REQUIRE_FALSE(f.Check(c, state));
        REQUIRE(state.GetRejectReason() == "time-too-old");
    }

    SECTION("Equal timestamp allowed") {
        CBlock c = f.Candidate();
        c.nTime = f.Prev().nTime;
        REQUIRE(f.Check(c, state));
    }

    SECTION("time-too-new") {
        CBlock c = f.Candidate();
        c.nTime = static_cast<uint32_t>(util::GetTime() +
                                        f.params->GetConsensus().nMaxFutureBlockTime + 600);
        REQUIRE_FALSE(f.Check(c, state));
        REQUIRE(state.GetRejectReason() == "time-too-new");
    }

    SECTION("bad-version") {
        CBlock c = f.Candidate();
        c.nVersion = 0;
        REQUIRE_FALSE(f.Check(c, state));
        REQUIRE(state.GetRejectReason() == "bad-version");
    }

    SECTION("high-hash when PoW is checked") {
        f.validator.SetBypassPOWValidation(false);
        CBlock c = f.Candidate(); // no committed RandomX hash
        REQUIRE_FALSE(f.Check(c, state));
        REQUIRE(state.GetRejectReason() == "high-hash");
    }
}

TEST_CASE("ConsensusValidator - transactions and wallets", "[validation]") {
    ValidationFixture f;
    ValidationState state;
    const uint256 genesis_wallet = chain::GetGenesisWalletAddress();
    const uint256 alice = test::TestAddress(1);

    SECTION("Valid transfer accepted") {
        auto tx = test::MakeTransaction(genesis_wallet, alice, 1000, 10);
        REQUIRE(f.Check(f.Candidate({tx}), state));
    }

    SECTION("Owner's transactions may chain within a block") {
        auto tx1 = test::MakeTransaction(genesis_wallet, alice, 1000, 10);
        auto tx2 = test::MakeTransaction(genesis_wallet, alice, 500, 10, tx1.id);
        REQUIRE(f.Check(f.Candidate({tx1, tx2}), state));
    }

    SECTION("bad-txns-duplicate") {
        auto tx = test::MakeTransaction(genesis_wallet, alice, 1000, 10);
        REQUIRE_FALSE(f.Check(f.Candidate({tx, tx}), state));
        REQUIRE(state.GetRejectReason() == "bad-txns-duplicate");
    }

    SECTION("bad-txns-malformed") {
        auto tx = test::MakeTransaction(genesis_wallet, alice, 1000, 10);
        tx.nQuantity = 2000;
        REQUIRE_FALSE(f.Check(f.Candidate({tx}), state));
        REQUIRE(state.GetRejectReason() == "bad-txns-malformed");
    }

    SECTION("bad-txns-unknown-owner") {
        auto tx = test::MakeTransaction(test::TestAddress(9), alice, 1, 0);
        REQUIRE_FALSE(f.Check(f.Candidate({tx}), state));
        REQUIRE(state.GetRejectReason() == "bad-txns-unknown-owner");
    }

    SECTION("bad-txns-last-tx") {
        auto tx = test::MakeTransaction(genesis_wallet, alice, 1, 0, uint256(5));
        REQUIRE_FALSE(f.Check(f.Candidate({tx}), state));
        REQUIRE(state.GetRejectReason() == "bad-txns-last-tx");
    }

    SECTION("bad-wallet-balance") {
        auto fund = test::MakeTransaction(genesis_wallet, alice, 1000, 0);
        auto overspend = test::MakeTransaction(alice, test::TestAddress(2), 1000, 1);
        REQUIRE_FALSE(f.Check(f.Candidate({fund, overspend}), state));
        REQUIRE(state.GetRejectReason() == "bad-wallet-balance");
    }

    SECTION("Amount above the money supply is malformed") {
        auto tx = test::MakeTransaction(genesis_wallet, alice, MAX_MONEY, 1);
        REQUIRE_FALSE(f.Check(f.Candidate({tx}), state));
        REQUIRE(state.GetRejectReason() == "bad-txns-malformed");
    }

    SECTION("Entire supply may move in one transfer") {
        auto tx = test::MakeTransaction(genesis_wallet, alice, MAX_MONEY, 0);
        REQUIRE(f.Check(f.Candidate({tx}), state));
    }

    SECTION("bad-wallet-list") {
        CBlock c = f.Candidate();
        c.vWalletList[alice].nBalance = 1; // minted from nothing
        c.UpdateIndepHash();
        REQUIRE_FALSE(f.Check(c, state));
        REQUIRE(state.GetRejectReason() == "bad-wallet-list");
    }
}

TEST_CASE("GetAdjustedTime - time source", "[validation]") {
    SECTION("Follows mock time") {
        util::MockTimeScope mock(1700000000);
        REQUIRE(GetAdjustedTime() == 1700000000);
    }

    SECTION("Mock time restored when the scope ends") {
        {
            util::MockTimeScope mock(1700000000);
        }
        REQUIRE(util::GetMockTime() == 0);
    }

    SECTION("Mocked clock moves the time-too-new boundary") {
        ValidationFixture f;
        ValidationState state;
        CBlock c = f.Candidate();
        util::MockTimeScope mock(static_cast<int64_t>(c.nTime) -
                                 f.params->GetConsensus().nMaxFutureBlockTime - 1);
        REQUIRE_FALSE(f.Check(c, state));
        REQUIRE(state.GetRejectReason() == "time-too-new");
    }

    SECTION("Returns current time when not mocked") {
        int64_t year_2024 = 1704067200; // 2024-01-01
        REQUIRE(GetAdjustedTime() > year_2024);
    }
}
