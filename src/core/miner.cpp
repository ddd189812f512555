#include "core/miner.h"
#include "crypto/crypto.h"
#include "utils/logger.h"
#include <map>
#include <mutex>
#include <thread>
#include <atomic>
#include <chrono>
#include <cmath>
#include <unordered_set>
#include <algorithm>

namespace sigelnet {
namespace core {

static const char* LOG_CAT_MINER = "miner";
static constexpr uint64_t ABORT_POLL_INTERVAL = 128;

static uint64_t nowSeconds() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

MiningEngine::MiningEngine(const ChainParams& params) : params_(params) {}

double MiningEngine::effectiveScore(const IdentityRecord& miner) const {
    return clampScore(miner.consciousnessScore(), params_.maxScore);
}

Block MiningEngine::buildCandidate(const ChainTip& tip, const IdentityRecord& miner,
                                   const std::vector<KnowledgeTransfer>& transactions) const {
    Block b;
    b.index = tip.block.index + 1;
    b.previousHash = tip.block.hash;
    b.timestamp = std::max(nowSeconds(), tip.block.timestamp);
    b.minerId = miner.id;
    b.difficultyTarget = tip.nextTarget;
    b.minerScore = effectiveScore(miner);
    b.transactions = transactions;
    b.merkleRoot = b.computeMerkleRoot();
    return b;
}

bool MiningEngine::accepts(const crypto::Hash256& hash, uint64_t target, double score) {
    return meetsTarget(hash, target, score);
}

std::optional<Block> MiningEngine::attempt(const ChainTip& tip, const IdentityRecord& miner,
                                           const std::vector<KnowledgeTransfer>& transactions,
                                           const MiningBudget& budget,
                                           const std::function<bool()>& shouldAbort,
                                           uint64_t* hashesDone) const {
    Block candidate = buildCandidate(tip, miner, transactions);
    uint64_t threshold = effectiveTarget(candidate.difficultyTarget, candidate.minerScore);
    std::vector<uint8_t> prefix = candidate.headerPrefix();

    uint64_t done = 0;
    std::optional<Block> found;
    for (uint64_t i = 0; i < budget.maxAttempts; i++) {
        if (shouldAbort && i % ABORT_POLL_INTERVAL == 0 && shouldAbort()) break;
        uint64_t nonce = budget.startNonce + i;
        crypto::Hash256 h = Block::hashHeader(prefix, nonce);
        done++;
        if (hashValue(h) < threshold) {
            candidate.nonce = nonce;
            candidate.hash = h;
            found = candidate;
            break;
        }
    }

    if (hashesDone) *hashesDone = done;
    return found;
}

struct Worker {
    std::thread thread;
    std::atomic<bool> stopRequested{false};
    std::atomic<bool> finished{false};
    bool continuous = false;
};

struct Miner::Impl {
    Ledger& ledger;
    TransferPool& pool;
    const IdentityRegistry& identities;
    utils::MiningConfig config;
    MiningEngine engine;
    BlockHandler handler;
    std::map<std::string, std::unique_ptr<Worker>> workers;
    mutable std::mutex mtx;

    std::atomic<uint64_t> hashesComputed{0};
    std::atomic<uint64_t> blocksFound{0};
    std::atomic<uint64_t> blocksAccepted{0};
    std::atomic<uint64_t> staleAborts{0};
    std::atomic<uint64_t> roundsExhausted{0};

    Impl(Ledger& l, TransferPool& p, const IdentityRegistry& r, const utils::MiningConfig& c)
        : ledger(l), pool(p), identities(r), config(c), engine(l.params()) {}

    std::vector<KnowledgeTransfer> selectTransfers() const;
    bool submit(const Block& block);
    // One round against a fresh snapshot. Returns the accepted block, if any.
    std::optional<Block> round(const std::string& identityId, uint64_t attempts,
                               const std::atomic<bool>* stopFlag, uint64_t* hashesDone);
    void run(const std::string& identityId, Worker* worker);
    void reapFinished();
};

std::vector<KnowledgeTransfer> Miner::Impl::selectTransfers() const {
    IdentityLookup lookup = [this](const std::string& id) { return ledger.identityKnown(id); };
    std::vector<KnowledgeTransfer> result;
    std::unordered_set<std::string> seen;
    for (auto& t : pool.select(pool.size())) {
        if (result.size() >= config.maxTransfersPerBlock) break;
        crypto::Hash256 h = t.contentHash();
        if (ledger.containsTransfer(h)) continue;
        if (!validateTransferFields(t, lookup)) continue;
        if (!seen.insert(crypto::toHex(h)).second) continue;
        result.push_back(std::move(t));
    }
    return result;
}

bool Miner::Impl::submit(const Block& block) {
    BlockHandler h;
    {
        std::lock_guard<std::mutex> lock(mtx);
        h = handler;
    }
    if (h) return h(block);
    auto res = ledger.append(block);
    if (res.ok()) pool.removeIncluded(block.transactions);
    return res.ok();
}

std::optional<Block> Miner::Impl::round(const std::string& identityId, uint64_t attempts,
                                        const std::atomic<bool>* stopFlag, uint64_t* hashesDone) {
    auto identity = identities.get(identityId);
    if (!identity) return std::nullopt;

    ChainTip tip = ledger.snapshot();
    std::vector<KnowledgeTransfer> txs = selectTransfers();

    MiningBudget budget;
    budget.maxAttempts = attempts;
    budget.startNonce = crypto::randomUint64();

    bool stale = false;
    auto shouldAbort = [&]() {
        if (stopFlag && stopFlag->load()) return true;
        if (ledger.revision() != tip.revision) {
            stale = true;
            return true;
        }
        return false;
    };

    uint64_t hashes = 0;
    auto block = engine.attempt(tip, *identity, txs, budget, shouldAbort, &hashes);
    hashesComputed += hashes;
    if (hashesDone) *hashesDone = hashes;

    if (!block) {
        if (stale) staleAborts++;
        else roundsExhausted++;
        return std::nullopt;
    }

    blocksFound++;
    if (!submit(*block)) {
        LOG_CAT(DEBUG, LOG_CAT_MINER, "Block " + std::to_string(block->index) + " lost the race");
        return std::nullopt;
    }

    blocksAccepted++;
    LOG_CAT(INFO, LOG_CAT_MINER, "Mined block " + std::to_string(block->index) + " " +
            block->hashHex().substr(0, 16) + " by " + identity->name);
    return block;
}

void Miner::Impl::run(const std::string& identityId, Worker* worker) {
    LOG_CAT(INFO, LOG_CAT_MINER, "Mining started for " + identityId);
    while (!worker->stopRequested) {
        if (!identities.contains(identityId)) {
            LOG_CAT(WARN, LOG_CAT_MINER, "Identity " + identityId + " vanished, stopping miner");
            break;
        }
        auto block = round(identityId, config.attemptsPerRound, &worker->stopRequested, nullptr);
        if (block && !worker->continuous) break;
    }
    worker->finished = true;
    LOG_CAT(INFO, LOG_CAT_MINER, "Mining stopped for " + identityId);
}

void Miner::Impl::reapFinished() {
    for (auto it = workers.begin(); it != workers.end();) {
        if (it->second->finished) {
            if (it->second->thread.joinable()) it->second->thread.join();
            it = workers.erase(it);
        } else {
            ++it;
        }
    }
}

Miner::Miner(Ledger& ledger, TransferPool& pool, const IdentityRegistry& identities,
             const utils::MiningConfig& config)
    : impl_(std::make_unique<Impl>(ledger, pool, identities, config)) {}

Miner::~Miner() {
    stopAll();
}

void Miner::onBlockFound(BlockHandler handler) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->handler = std::move(handler);
}

Result<void> Miner::start(const std::string& identityId, bool continuous) {
    if (!impl_->identities.isLocal(identityId)) {
        return makeError(ErrorCode::NOT_FOUND, "no local identity " + identityId);
    }

    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->reapFinished();
    if (impl_->workers.count(identityId)) {
        return makeError(ErrorCode::ALREADY_EXISTS, "already mining for " + identityId);
    }

    auto worker = std::make_unique<Worker>();
    worker->continuous = continuous;
    Worker* raw = worker.get();
    worker->thread = std::thread(&Impl::run, impl_.get(), identityId, raw);
    impl_->workers[identityId] = std::move(worker);
    return Result<void>();
}

bool Miner::stop(const std::string& identityId) {
    std::unique_ptr<Worker> worker;
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        auto it = impl_->workers.find(identityId);
        if (it == impl_->workers.end()) return false;
        worker = std::move(it->second);
        impl_->workers.erase(it);
    }
    worker->stopRequested = true;
    if (worker->thread.joinable()) worker->thread.join();
    return true;
}

void Miner::stopAll() {
    std::map<std::string, std::unique_ptr<Worker>> workers;
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        workers.swap(impl_->workers);
    }
    for (auto& [id, worker] : workers) worker->stopRequested = true;
    for (auto& [id, worker] : workers) {
        if (worker->thread.joinable()) worker->thread.join();
    }
}

bool Miner::isMining(const std::string& identityId) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->workers.find(identityId);
    return it != impl_->workers.end() && !it->second->finished;
}

std::vector<std::string> Miner::activeMiners() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::vector<std::string> result;
    for (const auto& [id, worker] : impl_->workers) {
        if (!worker->finished) result.push_back(id);
    }
    return result;
}

Result<Block> Miner::mineOne(const std::string& identityId, uint64_t maxAttempts) {
    if (!impl_->identities.isLocal(identityId)) {
        return makeError(ErrorCode::NOT_FOUND, "no local identity " + identityId);
    }
    if (maxAttempts == 0) {
        return makeError(ErrorCode::INVALID_ARGUMENT, "attempt budget must be positive");
    }

    uint64_t remaining = maxAttempts;
    while (remaining > 0) {
        uint64_t spent = 0;
        auto block = impl_->round(identityId, remaining, nullptr, &spent);
        if (block) return *block;
        spent = std::max<uint64_t>(spent, 1);
        remaining = spent >= remaining ? 0 : remaining - spent;
    }
    return makeError(ErrorCode::RESOURCE_EXHAUSTED,
                     "no block found in " + std::to_string(maxAttempts) + " attempts");
}

std::vector<KnowledgeTransfer> Miner::selectTransfers() const {
    return impl_->selectTransfers();
}

MiningStats Miner::getStats() const {
    MiningStats s;
    s.hashesComputed = impl_->hashesComputed;
    s.blocksFound = impl_->blocksFound;
    s.blocksAccepted = impl_->blocksAccepted;
    s.staleAborts = impl_->staleAborts;
    s.roundsExhausted = impl_->roundsExhausted;
    return s;
}

}
}
