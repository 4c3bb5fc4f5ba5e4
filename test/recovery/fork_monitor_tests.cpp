// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// ForkMonitor: announced blocks drive recovery and chain adoption

#include <catch2/catch_all.hpp>
#include "chain/chainstate.hpp"
#include "recovery/fork_monitor.hpp"
#include "recovery/recovery_test_helpers.hpp"
#include <atomic>

using namespace weave;
using namespace weave::recovery;
using weave::test::RecoveryFixture;

namespace {

constexpr auto kWait = std::chrono::seconds(10);

struct MonitorFixture : RecoveryFixture {
    chain::Chainstate chainstate{store};
    RecoveryManager manager{source, store, validator};
    ForkMonitor monitor{chainstate, manager};

    MonitorFixture() {
        REQUIRE(chainstate.Initialize(params->GenesisBlock()));
        REQUIRE(chainstate.ActivateBestChain(Tip().hashIndep));
        REQUIRE(manager.Start());
        store.ResetCounters();
    }
};

} // namespace

TEST_CASE("ForkMonitor - adopts recovered forks", "[recovery][monitor]") {
    MonitorFixture f;
    std::atomic<bool> adopted{false};
    auto on_result = [&](const RecoveryResult&, bool was_adopted) { adopted = was_adopted; };

    SECTION("Taller fork") {
        auto fork = f.MakeFork(2, 4);
        auto handle = f.monitor.OnBlockAnnounced(fork.back(), f.peers, on_result);
        REQUIRE(handle.has_value());
        REQUIRE(handle->Get().IsRecovered());

        REQUIRE(adopted.load());
        REQUIRE(f.chainstate.GetHeight() == 6);
        REQUIRE(f.chainstate.GetTip()->hashIndep == fork.back().hashIndep);
        REQUIRE(f.chainstate.GetHashList() == fork.back().GetHashChain());
        REQUIRE(f.store.ReadBestChain() == fork.back().GetHashChain());
    }

    SECTION("Direct extension of the tip") {
        CBlock next = f.builder.Extend(f.Tip());
        f.peer->Add(next);
        REQUIRE(f.chainstate.ClassifyBlock(next) == chain::BlockRelation::EXTENDS_TIP);

        auto handle = f.monitor.OnBlockAnnounced(next, f.peers, on_result);
        REQUIRE(handle.has_value());
        RecoveryResult result = handle->Get();
        REQUIRE(result.steps_completed == 1);
        REQUIRE(adopted.load());
        REQUIRE(f.chainstate.GetTip()->hashIndep == next.hashIndep);
    }
}

TEST_CASE("ForkMonitor - ignores blocks that need no recovery", "[recovery][monitor]") {
    MonitorFixture f;

    SECTION("Known block") {
        REQUIRE_FALSE(f.monitor.OnBlockAnnounced(f.local[3], f.peers).has_value());
    }

    SECTION("Stale fork block") {
        auto fork = f.MakeFork(2, 2); // height 4 < tip height 5
        REQUIRE_FALSE(f.monitor.OnBlockAnnounced(fork.back(), f.peers).has_value());
    }

    REQUIRE(f.peer->GetTotalRequests() == 0);
    REQUIRE(f.manager.GetCompletedCount() == 0);
}

TEST_CASE("ForkMonitor - failed recovery keeps the active chain", "[recovery][monitor]") {
    MonitorFixture f;
    auto fork = f.MakeFork(2, 4);
    f.peer->Remove(fork[1].hashIndep);

    std::atomic<bool> called{false};
    std::atomic<bool> adopted{true};
    auto handle = f.monitor.OnBlockAnnounced(
        fork.back(), f.peers, [&](const RecoveryResult&, bool was_adopted) {
            adopted = was_adopted;
            called = true;
        });
    REQUIRE(handle.has_value());
    REQUIRE(handle->WaitFor(kWait));

    REQUIRE(handle->Get().reason == AbortReason::MISSING_BLOCK);
    REQUIRE(called.load());
    REQUIRE_FALSE(adopted.load());
    REQUIRE(f.chainstate.GetTip()->hashIndep == f.Tip().hashIndep);
    REQUIRE(f.chainstate.GetHashList() == f.LocalChain());
}
