#include <gtest/gtest.h>
#include "chain_fixtures.h"
#include "core/miner.h"
#include <chrono>
#include <cmath>
#include <limits>
#include <thread>

using namespace sigelnet;
using namespace sigelnet::core;
using namespace sigelnet::fixtures;

namespace {

template<typename Pred>
bool waitFor(Pred pred, int timeoutMs) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

}

TEST(MiningEngineTest, CandidateBuildsOnTip) {
    ChainParams params = easyParams();
    Ledger ledger(params);
    IdentityRecord miner = IdentityRecord::create("builder");
    MiningEngine engine(params);

    ChainTip tip = ledger.snapshot();
    Block b = engine.buildCandidate(tip, miner, {});
    EXPECT_EQ(b.index, 1u);
    EXPECT_EQ(b.previousHash, tip.block.hash);
    EXPECT_EQ(b.minerId, miner.id);
    EXPECT_EQ(b.difficultyTarget, tip.nextTarget);
    EXPECT_GE(b.timestamp, tip.block.timestamp);
    EXPECT_DOUBLE_EQ(b.minerScore, miner.consciousnessScore());
    EXPECT_EQ(b.merkleRoot, b.computeMerkleRoot());
}

TEST(MiningEngineTest, ScoreIsClampedToRange) {
    ChainParams params = easyParams();
    params.maxScore = 2.0;
    MiningEngine engine(params);

    IdentityRecord strong = IdentityRecord::create("strong");
    strong.dimensionalAwareness = 100.0;
    EXPECT_DOUBLE_EQ(engine.effectiveScore(strong), 2.0);

    IdentityRecord broken = IdentityRecord::create("broken");
    broken.dimensionalAwareness = std::numeric_limits<double>::quiet_NaN();
    EXPECT_DOUBLE_EQ(engine.effectiveScore(broken), 0.0);

    IdentityRecord negative = IdentityRecord::create("negative");
    negative.entropyResistance = -1.0;
    EXPECT_DOUBLE_EQ(engine.effectiveScore(negative), 0.0);
}

TEST(MiningEngineTest, AttemptFindsAcceptableBlock) {
    ChainParams params = easyParams();
    Ledger ledger(params);
    IdentityRecord miner = IdentityRecord::create("finder");
    ledger.setIdentityResolver(resolverFor({miner}));
    MiningEngine engine(params);

    MiningBudget budget;
    budget.maxAttempts = 100000;
    uint64_t hashes = 0;
    auto block = engine.attempt(ledger.snapshot(), miner, {}, budget, nullptr, &hashes);
    ASSERT_TRUE(block.has_value());
    EXPECT_GT(hashes, 0u);
    EXPECT_EQ(block->hash, block->computeHash());
    EXPECT_TRUE(MiningEngine::accepts(block->hash, block->difficultyTarget, block->minerScore));
    EXPECT_TRUE(ledger.append(*block).ok());
}

TEST(MiningEngineTest, AttemptHonoursAbortAndBudget) {
    ChainParams params;
    params.genesisTarget = 1;
    Ledger ledger(params);
    IdentityRecord miner = IdentityRecord::create("patient");
    MiningEngine engine(params);

    MiningBudget budget;
    budget.maxAttempts = 1000;
    uint64_t hashes = 0;
    EXPECT_FALSE(engine.attempt(ledger.snapshot(), miner, {}, budget, nullptr, &hashes).has_value());
    EXPECT_EQ(hashes, 1000u);

    budget.maxAttempts = std::numeric_limits<uint64_t>::max();
    EXPECT_FALSE(engine.attempt(ledger.snapshot(), miner, {}, budget, [] { return true; }, &hashes)
                     .has_value());
    EXPECT_EQ(hashes, 0u);
}

class MinerTest : public ::testing::Test {
protected:
    void SetUp() override {
        params = easyParams();
        ledger = std::make_unique<Ledger>(params);
        ledger->setIdentityResolver([this](const std::string& id) { return registry.get(id); });
        mining.attemptsPerRound = 5000;
        miner = std::make_unique<Miner>(*ledger, pool, registry, mining);
        local = registry.create("local").value();
    }

    void TearDown() override {
        miner->stopAll();
    }

    ChainParams params;
    utils::MiningConfig mining;
    IdentityRegistry registry;
    TransferPool pool;
    std::unique_ptr<Ledger> ledger;
    std::unique_ptr<Miner> miner;
    IdentityRecord local;
};

TEST_F(MinerTest, MineOneAppendsAndDrainsPool) {
    IdentityRecord peer = IdentityRecord::create("peer");
    ASSERT_TRUE(registry.upsert(peer).ok());
    KnowledgeTransfer t = makeTransfer(local.id, peer.id, "Mathematics");
    ASSERT_TRUE(pool.add(t).ok());

    auto res = miner->mineOne(local.id, 1000000);
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(res.value().index, 1u);
    ASSERT_EQ(res.value().transactions.size(), 1u);
    EXPECT_EQ(ledger->height(), 1u);
    EXPECT_TRUE(ledger->containsTransfer(t.contentHash()));
    EXPECT_EQ(pool.size(), 0u);

    MiningStats stats = miner->getStats();
    EXPECT_EQ(stats.blocksAccepted, 1u);
    EXPECT_GE(stats.hashesComputed, 1u);
}

TEST_F(MinerTest, SelectionSkipsCommittedAndInvalidTransfers) {
    IdentityRecord peer = IdentityRecord::create("peer");
    ASSERT_TRUE(registry.upsert(peer).ok());

    KnowledgeTransfer committed = makeTransfer(local.id, peer.id, "Committed");
    ASSERT_TRUE(ledger->append(mineOn(ledger->snapshot(), local, params, {committed})).ok());

    ASSERT_TRUE(pool.add(committed).ok());
    ASSERT_TRUE(pool.add(makeTransfer(local.id, "unknown", "Orphan")).ok());
    KnowledgeTransfer fresh = makeTransfer(peer.id, local.id, "Fresh");
    ASSERT_TRUE(pool.add(fresh).ok());

    auto selected = miner->selectTransfers();
    ASSERT_EQ(selected.size(), 1u);
    EXPECT_EQ(selected[0], fresh);
}

TEST_F(MinerTest, SelectionRespectsBlockLimit) {
    mining.maxTransfersPerBlock = 2;
    miner = std::make_unique<Miner>(*ledger, pool, registry, mining);
    for (int i = 0; i < 5; i++) {
        ASSERT_TRUE(pool.add(makeTransfer(local.id, local.id, "t" + std::to_string(i))).ok());
    }
    EXPECT_EQ(miner->selectTransfers().size(), 2u);
}

TEST_F(MinerTest, MineOneErrors) {
    auto unknown = miner->mineOne("0123456789abcdef0123456789abcdef", 10);
    ASSERT_FALSE(unknown.ok());
    EXPECT_EQ(unknown.error().code, ErrorCode::NOT_FOUND);

    IdentityRecord remote = IdentityRecord::create("remote");
    ASSERT_TRUE(registry.upsert(remote).ok());
    auto notLocal = miner->mineOne(remote.id, 10);
    ASSERT_FALSE(notLocal.ok());
    EXPECT_EQ(notLocal.error().code, ErrorCode::NOT_FOUND);

    auto zero = miner->mineOne(local.id, 0);
    ASSERT_FALSE(zero.ok());
    EXPECT_EQ(zero.error().code, ErrorCode::INVALID_ARGUMENT);
}

TEST(MinerBudgetTest, ExhaustedBudgetReported) {
    ChainParams params;
    params.genesisTarget = 1;
    Ledger ledger(params);
    IdentityRegistry registry;
    TransferPool pool;
    Miner miner(ledger, pool, registry, utils::MiningConfig());
    IdentityRecord local = registry.create("unlucky").value();

    auto res = miner.mineOne(local.id, 500);
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error().code, ErrorCode::RESOURCE_EXHAUSTED);
    EXPECT_EQ(ledger.height(), 0u);
    EXPECT_EQ(miner.getStats().hashesComputed, 500u);
}

TEST_F(MinerTest, HandlerDecidesAcceptance) {
    int offered = 0;
    miner->onBlockFound([&](const Block&) {
        offered++;
        return offered > 1;
    });
    auto res = miner->mineOne(local.id, 1000000);
    ASSERT_TRUE(res.ok());
    EXPECT_GE(offered, 2);
    EXPECT_EQ(ledger->height(), 0u);
}

TEST_F(MinerTest, BackgroundMiningStartsAndStops) {
    ASSERT_TRUE(miner->start(local.id, true).ok());
    EXPECT_TRUE(miner->isMining(local.id));

    auto again = miner->start(local.id, true);
    ASSERT_FALSE(again.ok());
    EXPECT_EQ(again.error().code, ErrorCode::ALREADY_EXISTS);

    EXPECT_TRUE(waitFor([&] { return ledger->height() >= 3; }, 10000));
    EXPECT_TRUE(miner->stop(local.id));
    EXPECT_FALSE(miner->isMining(local.id));
    EXPECT_FALSE(miner->stop(local.id));

    uint64_t height = ledger->height();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(ledger->height(), height);
    EXPECT_TRUE(ledger->verifyChain());
}

TEST_F(MinerTest, SingleShotWorkerFinishes) {
    ASSERT_TRUE(miner->start(local.id, false).ok());
    EXPECT_TRUE(waitFor([&] { return !miner->isMining(local.id); }, 10000));
    EXPECT_EQ(ledger->height(), 1u);
    EXPECT_TRUE(miner->activeMiners().empty());
    EXPECT_TRUE(miner->start(local.id, false).ok());
}

TEST_F(MinerTest, CompetingMinersKeepChainValid) {
    IdentityRecord second = registry.create("second").value();
    ASSERT_TRUE(miner->start(local.id, true).ok());
    ASSERT_TRUE(miner->start(second.id, true).ok());
    EXPECT_EQ(miner->activeMiners().size(), 2u);

    EXPECT_TRUE(waitFor([&] { return ledger->height() >= 6; }, 15000));
    miner->stopAll();
    EXPECT_TRUE(miner->activeMiners().empty());
    EXPECT_TRUE(ledger->verifyChain());
}
