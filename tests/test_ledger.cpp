#include <gtest/gtest.h>
#include "chain_fixtures.h"
#include "core/ledger.h"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <thread>

using namespace sigelnet;
using namespace sigelnet::core;
using namespace sigelnet::fixtures;

namespace {

uint64_t nowSeconds() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

}

class LedgerTest : public ::testing::Test {
protected:
    void SetUp() override {
        params = easyParams();
        ledger = std::make_unique<Ledger>(params);
        alice = IdentityRecord::create("alice");
        bob = IdentityRecord::create("bob");
        for (int i = 0; i < 8; i++) miners.push_back(IdentityRecord::create("m" + std::to_string(i)));
        resolveKnown();
    }

    void resolveKnown() {
        std::vector<IdentityRecord> known = miners;
        known.push_back(alice);
        known.push_back(bob);
        ledger->setIdentityResolver(resolverFor(known));
    }

    // Re-grinds the nonce after a header field was changed.
    static void regrind(Block& b) {
        for (uint64_t nonce = 0;; nonce++) {
            b.nonce = nonce;
            b.hash = b.computeHash();
            if (meetsTarget(b.hash, b.difficultyTarget, b.minerScore)) return;
        }
    }

    Block next(const std::vector<KnowledgeTransfer>& txs = {}) {
        return mineOn(ledger->snapshot(), alice, params, txs);
    }

    ChainParams params;
    std::unique_ptr<Ledger> ledger;
    IdentityRecord alice;
    IdentityRecord bob;
    std::vector<IdentityRecord> miners;
};

TEST_F(LedgerTest, GenesisIsDeterministic) {
    Ledger other(params);
    EXPECT_EQ(ledger->height(), 0u);
    EXPECT_EQ(ledger->tipHash(), other.tipHash());
    EXPECT_TRUE(crypto::isZero(ledger->tip().previousHash));

    ChainParams different = params;
    different.genesisTarget >>= 1;
    EXPECT_NE(Ledger::createGenesisBlock(different).hash, ledger->tipHash());
}

TEST_F(LedgerTest, AppendExtendsChain) {
    long double workBefore = ledger->cumulativeWork();
    uint64_t revisionBefore = ledger->revision();
    int appended = 0;
    ledger->onBlockAppended([&](const Block&) { appended++; });

    Block b = next();
    auto res = ledger->append(b);
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(ledger->height(), 1u);
    EXPECT_EQ(ledger->tipHash(), b.hash);
    EXPECT_EQ(ledger->tip().previousHash, Ledger::createGenesisBlock(params).hash);
    EXPECT_GT(ledger->cumulativeWork(), workBefore);
    EXPECT_GT(ledger->revision(), revisionBefore);
    EXPECT_EQ(appended, 1);
    EXPECT_TRUE(ledger->verifyChain());
}

TEST_F(LedgerTest, SameBlockTwiceIsStale) {
    Block b = next();
    ASSERT_TRUE(ledger->append(b).ok());
    auto again = ledger->append(b);
    ASSERT_FALSE(again.ok());
    EXPECT_EQ(again.error(), RejectReason::STALE_INDEX);
    EXPECT_EQ(ledger->height(), 1u);
}

TEST_F(LedgerTest, WrongPreviousHashRejected) {
    Block b = next();
    b.previousHash[0] ^= 0xff;
    b.hash = b.computeHash();
    auto res = ledger->append(b);
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error(), RejectReason::HASH_MISMATCH);
}

TEST_F(LedgerTest, ClaimedHashMustMatchHeader) {
    Block b = next();
    b.nonce++;
    auto res = ledger->append(b);
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error(), RejectReason::HASH_MISMATCH);
}

TEST_F(LedgerTest, MerkleRootMustCoverTransfers) {
    Block b = next();
    b.transactions.push_back(makeTransfer(alice.id, bob.id, "Physics"));
    b.hash = b.computeHash();
    auto res = ledger->append(b);
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error(), RejectReason::HASH_MISMATCH);
}

TEST_F(LedgerTest, WrongTargetRejected) {
    Block b = next();
    b.difficultyTarget = params.genesisTarget - 1;
    b.hash = b.computeHash();
    auto res = ledger->append(b);
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error(), RejectReason::DIFFICULTY_NOT_MET);
}

TEST_F(LedgerTest, HashAboveEffectiveTargetRejected) {
    Block b = next();
    for (uint64_t nonce = 0;; nonce++) {
        b.nonce = nonce;
        b.hash = b.computeHash();
        if (!meetsTarget(b.hash, b.difficultyTarget, b.minerScore)) break;
    }
    auto res = ledger->append(b);
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error(), RejectReason::DIFFICULTY_NOT_MET);
}

TEST_F(LedgerTest, ScoreAboveCapRejected) {
    Block b = next();
    b.minerScore = params.maxScore + 1.0;
    b.hash = b.computeHash();
    auto res = ledger->append(b);
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error(), RejectReason::DIFFICULTY_NOT_MET);
}

TEST_F(LedgerTest, UnknownMinerRejected) {
    IdentityRecord stranger = IdentityRecord::create("stranger");
    stranger.dimensionalAwareness = 1000.0;
    Block b = mineOn(ledger->snapshot(), stranger, params);
    ASSERT_DOUBLE_EQ(b.minerScore, params.maxScore);
    ASSERT_TRUE(meetsTarget(b.hash, b.difficultyTarget, b.minerScore));

    auto res = ledger->append(b);
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error(), RejectReason::DIFFICULTY_NOT_MET);
    EXPECT_EQ(ledger->height(), 0u);
}

TEST_F(LedgerTest, ScoreAboveMinerRecordRejected) {
    ASSERT_LT(alice.consciousnessScore(), params.maxScore);
    Block b = next();
    b.minerScore = params.maxScore;
    regrind(b);

    auto res = ledger->append(b);
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error(), RejectReason::DIFFICULTY_NOT_MET);
    EXPECT_EQ(ledger->height(), 0u);
}

TEST_F(LedgerTest, ScoreBelowMinerRecordAccepted) {
    Block b = next();
    b.minerScore = 1.0;
    regrind(b);
    EXPECT_TRUE(ledger->append(b).ok());
}

TEST_F(LedgerTest, NoResolverRejectsEveryBlock) {
    ledger = std::make_unique<Ledger>(params);
    auto res = ledger->append(next());
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error(), RejectReason::DIFFICULTY_NOT_MET);
}

TEST_F(LedgerTest, TimestampBeforePredecessorRejected) {
    Block b = mineOn(ledger->snapshot(), alice, params, {}, params.genesisTimestamp - 1);
    auto res = ledger->append(b);
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error(), RejectReason::NON_MONOTONIC_TIMESTAMP);
}

TEST_F(LedgerTest, TimestampFarInFutureRejected) {
    Block b = mineOn(ledger->snapshot(), alice, params, {}, nowSeconds() + 3 * 60 * 60);
    auto res = ledger->append(b);
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error(), RejectReason::NON_MONOTONIC_TIMESTAMP);
}

TEST_F(LedgerTest, EqualTimestampAccepted) {
    Block b = mineOn(ledger->snapshot(), alice, params, {}, params.genesisTimestamp);
    EXPECT_TRUE(ledger->append(b).ok());
}

TEST_F(LedgerTest, TransferFromUnknownIdentityRejected) {
    IdentityRecord stranger = IdentityRecord::create("stranger");
    Block b = next({makeTransfer(stranger.id, bob.id, "History")});
    auto res = ledger->append(b);
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error(), RejectReason::INVALID_TRANSACTION);
}

TEST_F(LedgerTest, DuplicateTransferAcrossBlocksRejected) {
    KnowledgeTransfer t = makeTransfer(alice.id, bob.id, "Mathematics");
    ASSERT_TRUE(ledger->append(next({t})).ok());
    EXPECT_TRUE(ledger->containsTransfer(t.contentHash()));

    auto res = ledger->append(next({t}));
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error(), RejectReason::INVALID_TRANSACTION);
    EXPECT_EQ(ledger->height(), 1u);
}

TEST_F(LedgerTest, DuplicateTransferWithinBlockRejected) {
    KnowledgeTransfer t = makeTransfer(alice.id, bob.id, "Mathematics");
    auto res = ledger->append(next({t, t}));
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error(), RejectReason::INVALID_TRANSACTION);
}

TEST_F(LedgerTest, ConcurrentAppendsAtSameIndexAdmitOne) {
    constexpr int kMiners = 8;
    std::vector<Block> candidates;
    for (int i = 0; i < kMiners; i++) {
        candidates.push_back(mineOn(ledger->snapshot(), miners[i], params));
    }

    std::atomic<int> accepted{0};
    std::atomic<int> stale{0};
    std::atomic<bool> go{false};
    std::vector<std::thread> threads;
    for (int i = 0; i < kMiners; i++) {
        threads.emplace_back([&, i] {
            while (!go) std::this_thread::yield();
            auto res = ledger->append(candidates[i]);
            if (res.ok()) accepted++;
            else if (res.error() == RejectReason::STALE_INDEX) stale++;
        });
    }
    go = true;
    for (auto& t : threads) t.join();

    EXPECT_EQ(accepted.load(), 1);
    EXPECT_EQ(stale.load(), kMiners - 1);
    EXPECT_EQ(ledger->height(), 1u);
    EXPECT_TRUE(ledger->verifyChain());
}

TEST_F(LedgerTest, LongerChainReplacesShorter) {
    ASSERT_TRUE(ledger->append(next()).ok());

    std::vector<Block> rival = extend({Ledger::createGenesisBlock(params)}, 3, bob, params);
    uint64_t fork = 99;
    size_t removed = 0;
    size_t added = 0;
    ledger->onChainReplaced([&](uint64_t f, const std::vector<Block>& r, const std::vector<Block>& a) {
        fork = f;
        removed = r.size();
        added = a.size();
    });

    EXPECT_TRUE(ledger->replaceIfBetter(rival));
    EXPECT_EQ(ledger->height(), 3u);
    EXPECT_EQ(ledger->tipHash(), rival.back().hash);
    EXPECT_EQ(fork, 1u);
    EXPECT_EQ(removed, 1u);
    EXPECT_EQ(added, 3u);
}

TEST_F(LedgerTest, EqualWorkKeepsExistingChain) {
    Block mine = next();
    ASSERT_TRUE(ledger->append(mine).ok());

    std::vector<Block> rival = extend({Ledger::createGenesisBlock(params)}, 1, bob, params);
    EXPECT_FALSE(ledger->replaceIfBetter(rival));
    EXPECT_EQ(ledger->tipHash(), mine.hash);
}

TEST_F(LedgerTest, HigherWorkWinsAtEqualHeight) {
    params.retargetInterval = 2;
    ledger = std::make_unique<Ledger>(params);
    resolveKnown();

    uint64_t base = nowSeconds() - 5000;
    std::vector<Block> shared = {Ledger::createGenesisBlock(params)};
    shared.push_back(mineOn(tipOf(shared, params), alice, params, {}, base));
    shared.push_back(mineOn(tipOf(shared, params), alice, params, {}, base));

    // A slow window keeps the target loose; a fast one tightens it.
    std::vector<Block> loose = shared;
    loose.push_back(mineOn(tipOf(loose, params), alice, params, {}, base + 1000));
    loose.push_back(mineOn(tipOf(loose, params), alice, params));

    std::vector<Block> tight = shared;
    tight.push_back(mineOn(tipOf(tight, params), bob, params, {}, base));
    tight.push_back(mineOn(tipOf(tight, params), bob, params));

    ASSERT_LT(tight.back().difficultyTarget, loose.back().difficultyTarget);
    ASSERT_EQ(tight.size(), loose.size());

    ASSERT_TRUE(ledger->replaceIfBetter(loose));
    EXPECT_EQ(ledger->tipHash(), loose.back().hash);

    EXPECT_TRUE(ledger->replaceIfBetter(tight));
    EXPECT_EQ(ledger->tipHash(), tight.back().hash);

    EXPECT_FALSE(ledger->replaceIfBetter(loose));
    EXPECT_EQ(ledger->tipHash(), tight.back().hash);
}

TEST_F(LedgerTest, SuffixExtendsActiveChain) {
    std::vector<Block> chain = extend(ledger->chain(), 1, alice, params);
    ASSERT_TRUE(ledger->append(chain.back()).ok());

    chain = extend(chain, 2, alice, params);
    std::vector<Block> suffix(chain.begin() + 2, chain.end());

    uint64_t fork = 0;
    size_t removed = 99;
    ledger->onChainReplaced([&](uint64_t f, const std::vector<Block>& r, const std::vector<Block>&) {
        fork = f;
        removed = r.size();
    });
    EXPECT_TRUE(ledger->replaceIfBetter(suffix));
    EXPECT_EQ(ledger->height(), 3u);
    EXPECT_EQ(fork, 2u);
    EXPECT_EQ(removed, 0u);
}

TEST_F(LedgerTest, InvalidCandidateLeavesChainUntouched) {
    std::vector<Block> rival = extend({Ledger::createGenesisBlock(params)}, 3, bob, params);
    rival[2].minerId = "forged";
    EXPECT_FALSE(ledger->replaceIfBetter(rival));
    EXPECT_EQ(ledger->height(), 0u);
}

TEST_F(LedgerTest, ForeignGenesisRejected) {
    ChainParams other = params;
    other.genesisTimestamp += 1;
    std::vector<Block> foreign = extend({Ledger::createGenesisBlock(other)}, 3, bob, other);
    EXPECT_FALSE(ledger->replaceIfBetter(foreign));
    EXPECT_FALSE(Ledger::validateChain(foreign, params, resolverFor({bob})).ok());
}

TEST_F(LedgerTest, ValidateChainReportsFirstFailure) {
    std::vector<Block> chain = extend({Ledger::createGenesisBlock(params)}, 2, alice, params);
    EXPECT_TRUE(Ledger::validateChain(chain, params, resolverFor({alice})).ok());
    EXPECT_FALSE(Ledger::validateChain(chain, params, resolverFor({bob})).ok());

    chain[2].timestamp = chain[1].timestamp - 1;
    chain[2].hash = chain[2].computeHash();
    auto res = Ledger::validateChain(chain, params, resolverFor({alice}));
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error(), RejectReason::NON_MONOTONIC_TIMESTAMP);
}

TEST_F(LedgerTest, GetBlocksReturnsRange) {
    for (int i = 0; i < 3; i++) ASSERT_TRUE(ledger->append(next()).ok());
    auto blocks = ledger->getBlocks(1, 2);
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(blocks[0].index, 1u);
    EXPECT_EQ(blocks[1].index, 2u);
    EXPECT_TRUE(ledger->getBlocks(10, 5).empty());
    EXPECT_FALSE(ledger->getBlock(4).has_value());

    ChainTip tip = ledger->snapshot();
    EXPECT_EQ(tip.block.index, 3u);
    EXPECT_EQ(tip.nextTarget, ledger->nextTarget());
}

TEST(LedgerPersistenceTest, ReloadsStoredChain) {
    auto dir = std::filesystem::temp_directory_path() / "sigelnet_test_ledger";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    std::string path = (dir / "ledger.db").string();
    ChainParams params = easyParams();
    IdentityRecord miner = IdentityRecord::create("persistent");

    crypto::Hash256 tipHash{};
    {
        Ledger ledger(params);
        ledger.setIdentityResolver(resolverFor({miner}));
        ASSERT_TRUE(ledger.open(path));
        for (int i = 0; i < 2; i++) {
            ASSERT_TRUE(ledger.append(mineOn(ledger.snapshot(), miner, params)).ok());
        }
        tipHash = ledger.tipHash();
    }
    {
        Ledger ledger(params);
        ledger.setIdentityResolver(resolverFor({miner}));
        ASSERT_TRUE(ledger.open(path));
        EXPECT_EQ(ledger.height(), 2u);
        EXPECT_EQ(ledger.tipHash(), tipHash);
        EXPECT_TRUE(ledger.verifyChain());
    }
    {
        ChainParams other = params;
        other.genesisTimestamp += 1;
        Ledger ledger(other);
        ledger.setIdentityResolver(resolverFor({miner}));
        EXPECT_FALSE(ledger.open(path));
    }
    std::filesystem::remove_all(dir);
}
