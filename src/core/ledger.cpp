#include "core/ledger.h"
#include "database/database.h"
#include "utils/logger.h"
#include "utils/serialize.h"
#include <shared_mutex>
#include <mutex>
#include <atomic>
#include <unordered_set>
#include <chrono>
#include <cmath>
#include <stdexcept>

namespace sigelnet {
namespace core {

static constexpr uint64_t MAX_FUTURE_DRIFT = 2 * 60 * 60;
static const char* LOG_CAT_LEDGER = "ledger";

using TransferSet = std::unordered_set<std::string>;
using RejectResult = Result<void, RejectReason>;

const char* rejectReasonToString(RejectReason reason) {
    switch (reason) {
        case RejectReason::NONE: return "none";
        case RejectReason::STALE_INDEX: return "stale index";
        case RejectReason::HASH_MISMATCH: return "hash mismatch";
        case RejectReason::DIFFICULTY_NOT_MET: return "difficulty not met";
        case RejectReason::INVALID_TRANSACTION: return "invalid transaction";
        case RejectReason::NON_MONOTONIC_TIMESTAMP: return "non-monotonic timestamp";
    }
    return "unknown";
}

static uint64_t nowSeconds() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

static std::string blockKey(uint64_t index) {
    return "block:" + std::to_string(index);
}

static std::vector<uint8_t> encodeHeight(uint64_t height) {
    utils::ByteBuffer buf;
    buf.writeUint64(height);
    return buf.release();
}

static void collectTransfers(const Block& block, TransferSet& seen) {
    for (const auto& t : block.transactions) seen.insert(t.contentId());
}

static RejectReason checkBlock(const Block& b, const Block& prev, uint64_t target,
                               const ChainParams& params, const IdentityResolver& resolver,
                               const TransferSet& seen) {
    if (b.index != prev.index + 1) return RejectReason::STALE_INDEX;
    if (b.previousHash != prev.hash) return RejectReason::HASH_MISMATCH;
    if (b.computeMerkleRoot() != b.merkleRoot) return RejectReason::HASH_MISMATCH;
    if (b.computeHash() != b.hash) return RejectReason::HASH_MISMATCH;

    if (b.timestamp < prev.timestamp) return RejectReason::NON_MONOTONIC_TIMESTAMP;
    if (b.timestamp > nowSeconds() + MAX_FUTURE_DRIFT) return RejectReason::NON_MONOTONIC_TIMESTAMP;

    if (b.difficultyTarget != target) return RejectReason::DIFFICULTY_NOT_MET;
    if (!std::isfinite(b.minerScore) || b.minerScore < 0.0 || b.minerScore > params.maxScore) {
        return RejectReason::DIFFICULTY_NOT_MET;
    }
    // The declared score can't exceed what the miner's record earns.
    std::optional<IdentityRecord> miner = resolver ? resolver(b.minerId) : std::nullopt;
    if (!miner) return RejectReason::DIFFICULTY_NOT_MET;
    if (b.minerScore > clampScore(miner->consciousnessScore(), params.maxScore)) {
        return RejectReason::DIFFICULTY_NOT_MET;
    }
    if (!meetsTarget(b.hash, b.difficultyTarget, b.minerScore)) return RejectReason::DIFFICULTY_NOT_MET;

    if (b.transactions.size() > MAX_BLOCK_TRANSFERS) return RejectReason::INVALID_TRANSACTION;
    IdentityLookup lookup = [&resolver](const std::string& id) { return resolver(id).has_value(); };
    TransferSet inBlock;
    for (const auto& t : b.transactions) {
        if (!validateTransferFields(t, lookup)) return RejectReason::INVALID_TRANSACTION;
        std::string id = t.contentId();
        if (seen.count(id) || !inBlock.insert(id).second) return RejectReason::INVALID_TRANSACTION;
    }
    return RejectReason::NONE;
}

static bool isGenesis(const Block& b, const Block& genesis) {
    return b.hash == genesis.hash && b.serialize() == genesis.serialize();
}

// Validates chain[from..] assuming chain[0..from-1] is already valid.
static RejectResult validateFrom(const std::vector<Block>& chain, size_t from,
                                 const ChainParams& params, const IdentityResolver& resolver) {
    if (chain.empty()) return RejectReason::STALE_INDEX;
    if (from == 0) {
        if (!isGenesis(chain[0], Ledger::createGenesisBlock(params))) return RejectReason::HASH_MISMATCH;
        from = 1;
    }

    TransferSet seen;
    for (size_t i = 0; i < from && i < chain.size(); i++) collectTransfers(chain[i], seen);

    for (size_t i = from; i < chain.size(); i++) {
        uint64_t target = expectedTarget(chain, i, params);
        RejectReason r = checkBlock(chain[i], chain[i - 1], target, params, resolver, seen);
        if (r != RejectReason::NONE) return r;
        collectTransfers(chain[i], seen);
    }
    return RejectResult();
}

struct Ledger::Impl {
    ChainParams params;
    database::Database db;
    std::vector<Block> blocks;
    TransferSet transfers;
    long double work = 0.0L;
    uint64_t nextTarget = 0;
    std::atomic<uint64_t> revision{0};
    IdentityResolver resolver;
    std::function<void(const Block&)> appendedCallback;
    std::function<void(uint64_t, const std::vector<Block>&, const std::vector<Block>&)> replacedCallback;
    mutable std::shared_mutex mtx;

    void refreshDerived();
    void persistAppend(const Block& block);
    void persistReplace(size_t forkIndex, const std::vector<Block>& next, size_t oldSize);
};

void Ledger::Impl::refreshDerived() {
    transfers.clear();
    for (const auto& b : blocks) collectTransfers(b, transfers);
    work = chainWork(blocks);
    nextTarget = expectedTarget(blocks, blocks.size(), params);
}

void Ledger::Impl::persistAppend(const Block& block) {
    if (!db.isOpen()) return;
    database::WriteBatch batch;
    batch.put(blockKey(block.index), block.serialize());
    batch.put("meta:height", encodeHeight(block.index));
    if (!db.write(batch)) {
        throw StorageError("ledger write failed at block " + std::to_string(block.index) + ": " + db.lastError());
    }
}

void Ledger::Impl::persistReplace(size_t forkIndex, const std::vector<Block>& next, size_t oldSize) {
    if (!db.isOpen()) return;
    database::WriteBatch batch;
    for (size_t i = forkIndex; i < next.size(); i++) {
        batch.put(blockKey(i), next[i].serialize());
    }
    for (size_t i = next.size(); i < oldSize; i++) {
        batch.del(blockKey(i));
    }
    batch.put("meta:height", encodeHeight(next.back().index));
    if (!db.write(batch)) {
        throw StorageError("ledger reorganisation write failed: " + db.lastError());
    }
}

Ledger::Ledger(const ChainParams& params) : impl_(std::make_unique<Impl>()) {
    impl_->params = params;
    impl_->blocks.push_back(createGenesisBlock(params));
    impl_->refreshDerived();
}

Ledger::~Ledger() {
    close();
}

bool Ledger::open(const std::string& dbPath) {
    std::unique_lock<std::shared_mutex> lock(impl_->mtx);

    std::string reason;
    if (!impl_->params.validate(&reason)) {
        utils::Logger::log(utils::LogLevel::ERROR, LOG_CAT_LEDGER, "Invalid chain parameters: " + reason);
        return false;
    }

    if (!impl_->db.open(dbPath)) {
        utils::Logger::log(utils::LogLevel::ERROR, LOG_CAT_LEDGER,
                           "Cannot open ledger store " + dbPath + ": " + impl_->db.lastError());
        return false;
    }

    Block genesis = createGenesisBlock(impl_->params);
    std::vector<uint8_t> heightData;
    if (!impl_->db.get("meta:height", heightData)) {
        if (impl_->db.count("block:") > 0) {
            utils::Logger::log(utils::LogLevel::ERROR, LOG_CAT_LEDGER, "Ledger store has blocks but no height");
            impl_->db.close();
            return false;
        }
        database::WriteBatch batch;
        batch.put(blockKey(0), genesis.serialize());
        batch.put("meta:height", encodeHeight(0));
        if (!impl_->db.write(batch)) {
            utils::Logger::log(utils::LogLevel::ERROR, LOG_CAT_LEDGER,
                               "Cannot initialise ledger store: " + impl_->db.lastError());
            impl_->db.close();
            return false;
        }
        impl_->blocks.assign(1, genesis);
        impl_->refreshDerived();
        impl_->revision++;
        utils::Logger::log(utils::LogLevel::INFO, LOG_CAT_LEDGER,
                           "Initialised ledger with genesis " + genesis.hashHex());
        return true;
    }

    uint64_t storedHeight = 0;
    try {
        utils::ByteBuffer buf(heightData);
        storedHeight = buf.readUint64();
    } catch (const std::runtime_error& e) {
        utils::Logger::log(utils::LogLevel::ERROR, LOG_CAT_LEDGER, std::string("Corrupt ledger height: ") + e.what());
        impl_->db.close();
        return false;
    }

    if (storedHeight >= impl_->db.count("block:")) {
        utils::Logger::log(utils::LogLevel::ERROR, LOG_CAT_LEDGER,
                           "Ledger height " + std::to_string(storedHeight) + " exceeds stored blocks");
        impl_->db.close();
        return false;
    }

    std::vector<Block> loaded;
    loaded.reserve(static_cast<size_t>(storedHeight + 1));
    for (uint64_t i = 0; i <= storedHeight; i++) {
        std::vector<uint8_t> data;
        if (!impl_->db.get(blockKey(i), data)) {
            utils::Logger::log(utils::LogLevel::ERROR, LOG_CAT_LEDGER, "Missing block " + std::to_string(i));
            impl_->db.close();
            return false;
        }
        auto block = Block::deserialize(data);
        if (!block || block->index != i) {
            utils::Logger::log(utils::LogLevel::ERROR, LOG_CAT_LEDGER, "Corrupt block " + std::to_string(i));
            impl_->db.close();
            return false;
        }
        loaded.push_back(std::move(*block));
    }

    if (!isGenesis(loaded[0], genesis)) {
        utils::Logger::log(utils::LogLevel::ERROR, LOG_CAT_LEDGER,
                           "Stored genesis " + loaded[0].hashHex() + " does not match " + genesis.hashHex());
        impl_->db.close();
        return false;
    }

    auto valid = validateFrom(loaded, 1, impl_->params, impl_->resolver);
    if (!valid.ok()) {
        utils::Logger::log(utils::LogLevel::ERROR, LOG_CAT_LEDGER,
                           std::string("Stored chain failed validation: ") + rejectReasonToString(valid.error()));
        impl_->db.close();
        return false;
    }

    impl_->blocks = std::move(loaded);
    impl_->refreshDerived();
    impl_->revision++;
    utils::Logger::log(utils::LogLevel::INFO, LOG_CAT_LEDGER,
                       "Loaded chain at height " + std::to_string(storedHeight) + " tip " +
                       impl_->blocks.back().hashHex());
    return true;
}

void Ledger::close() {
    std::unique_lock<std::shared_mutex> lock(impl_->mtx);
    impl_->db.close();
}

Result<void, RejectReason> Ledger::append(const Block& candidate) {
    std::function<void(const Block&)> cb;
    {
        std::unique_lock<std::shared_mutex> lock(impl_->mtx);
        const Block& prev = impl_->blocks.back();
        RejectReason r = checkBlock(candidate, prev, impl_->nextTarget, impl_->params,
                                    impl_->resolver, impl_->transfers);
        if (r != RejectReason::NONE) {
            utils::Logger::log(utils::LogLevel::DEBUG, LOG_CAT_LEDGER,
                               "Rejected block " + std::to_string(candidate.index) + ": " + rejectReasonToString(r));
            return r;
        }

        impl_->persistAppend(candidate);

        impl_->blocks.push_back(candidate);
        collectTransfers(candidate, impl_->transfers);
        impl_->work += blockWork(candidate.difficultyTarget);
        impl_->nextTarget = expectedTarget(impl_->blocks, impl_->blocks.size(), impl_->params);
        impl_->revision++;
        cb = impl_->appendedCallback;
    }

    utils::Logger::log(utils::LogLevel::INFO, LOG_CAT_LEDGER,
                       "Appended block " + std::to_string(candidate.index) + " " + candidate.hashHex() +
                       " by " + candidate.minerId + " (" + std::to_string(candidate.transactions.size()) + " transfers)");
    if (cb) cb(candidate);
    return RejectResult();
}

bool Ledger::replaceIfBetter(const std::vector<Block>& candidate) {
    if (candidate.empty()) return false;

    std::function<void(uint64_t, const std::vector<Block>&, const std::vector<Block>&)> cb;
    uint64_t forkIndex = 0;
    std::vector<Block> removed;
    std::vector<Block> added;
    {
        std::unique_lock<std::shared_mutex> lock(impl_->mtx);
        const auto& local = impl_->blocks;

        uint64_t first = candidate.front().index;
        if (first > local.size()) return false;
        for (size_t i = 1; i < candidate.size(); i++) {
            if (candidate[i].index != first + i) return false;
        }

        std::vector<Block> combined;
        if (first == 0) {
            combined = candidate;
        } else {
            if (candidate.front().previousHash != local[static_cast<size_t>(first - 1)].hash) return false;
            combined.reserve(static_cast<size_t>(first) + candidate.size());
            combined.assign(local.begin(), local.begin() + static_cast<std::ptrdiff_t>(first));
            combined.insert(combined.end(), candidate.begin(), candidate.end());
        }

        size_t fork = 0;
        while (fork < combined.size() && fork < local.size() && combined[fork].hash == local[fork].hash) {
            combined[fork] = local[fork];
            fork++;
        }
        if (fork == combined.size()) return false;
        if (fork == 0) {
            // Genesis differs: not our network.
            return false;
        }

        auto valid = validateFrom(combined, fork, impl_->params, impl_->resolver);
        if (!valid.ok()) {
            utils::Logger::log(utils::LogLevel::WARN, LOG_CAT_LEDGER,
                               "Candidate chain invalid at or after " + std::to_string(fork) + ": " +
                               rejectReasonToString(valid.error()));
            return false;
        }

        long double candidateWork = chainWork(combined, fork);
        long double localWork = chainWork(local, fork);
        if (!(candidateWork > localWork)) {
            utils::Logger::log(utils::LogLevel::DEBUG, LOG_CAT_LEDGER,
                               "Candidate chain of height " + std::to_string(combined.back().index) +
                               " does not exceed local work");
            return false;
        }

        impl_->persistReplace(fork, combined, local.size());

        removed.assign(local.begin() + static_cast<std::ptrdiff_t>(fork), local.end());
        added.assign(combined.begin() + static_cast<std::ptrdiff_t>(fork), combined.end());
        forkIndex = fork;

        impl_->blocks = std::move(combined);
        impl_->refreshDerived();
        impl_->revision++;
        cb = impl_->replacedCallback;
    }

    utils::Logger::log(utils::LogLevel::INFO, LOG_CAT_LEDGER,
                       "Switched to chain of height " + std::to_string(added.back().index) +
                       " forking at " + std::to_string(forkIndex) + " (" + std::to_string(removed.size()) +
                       " blocks replaced)");
    if (cb) cb(forkIndex, removed, added);
    return true;
}

Block Ledger::tip() const {
    std::shared_lock<std::shared_mutex> lock(impl_->mtx);
    return impl_->blocks.back();
}

uint64_t Ledger::height() const {
    std::shared_lock<std::shared_mutex> lock(impl_->mtx);
    return impl_->blocks.back().index;
}

crypto::Hash256 Ledger::tipHash() const {
    std::shared_lock<std::shared_mutex> lock(impl_->mtx);
    return impl_->blocks.back().hash;
}

std::optional<Block> Ledger::getBlock(uint64_t index) const {
    std::shared_lock<std::shared_mutex> lock(impl_->mtx);
    if (index >= impl_->blocks.size()) return std::nullopt;
    return impl_->blocks[static_cast<size_t>(index)];
}

std::vector<Block> Ledger::getBlocks(uint64_t fromIndex, size_t maxCount) const {
    std::shared_lock<std::shared_mutex> lock(impl_->mtx);
    std::vector<Block> result;
    for (uint64_t i = fromIndex; i < impl_->blocks.size() && result.size() < maxCount; i++) {
        result.push_back(impl_->blocks[static_cast<size_t>(i)]);
    }
    return result;
}

std::vector<Block> Ledger::chain() const {
    std::shared_lock<std::shared_mutex> lock(impl_->mtx);
    return impl_->blocks;
}

long double Ledger::cumulativeWork() const {
    std::shared_lock<std::shared_mutex> lock(impl_->mtx);
    return impl_->work;
}

uint64_t Ledger::nextTarget() const {
    std::shared_lock<std::shared_mutex> lock(impl_->mtx);
    return impl_->nextTarget;
}

ChainTip Ledger::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(impl_->mtx);
    ChainTip t;
    t.block = impl_->blocks.back();
    t.nextTarget = impl_->nextTarget;
    t.revision = impl_->revision.load();
    return t;
}

uint64_t Ledger::revision() const {
    return impl_->revision.load();
}

bool Ledger::containsTransfer(const crypto::Hash256& contentHash) const {
    std::shared_lock<std::shared_mutex> lock(impl_->mtx);
    return impl_->transfers.count(crypto::toHex(contentHash)) > 0;
}

bool Ledger::identityKnown(const std::string& id) const {
    IdentityResolver resolver;
    {
        std::shared_lock<std::shared_mutex> lock(impl_->mtx);
        resolver = impl_->resolver;
    }
    return resolver && resolver(id).has_value();
}

void Ledger::setIdentityResolver(IdentityResolver resolver) {
    std::unique_lock<std::shared_mutex> lock(impl_->mtx);
    impl_->resolver = std::move(resolver);
}

bool Ledger::verifyChain() const {
    std::shared_lock<std::shared_mutex> lock(impl_->mtx);
    return validateFrom(impl_->blocks, 0, impl_->params, impl_->resolver).ok();
}

const ChainParams& Ledger::params() const {
    return impl_->params;
}

void Ledger::onBlockAppended(std::function<void(const Block&)> callback) {
    std::unique_lock<std::shared_mutex> lock(impl_->mtx);
    impl_->appendedCallback = std::move(callback);
}

void Ledger::onChainReplaced(std::function<void(uint64_t, const std::vector<Block>&,
                                                const std::vector<Block>&)> callback) {
    std::unique_lock<std::shared_mutex> lock(impl_->mtx);
    impl_->replacedCallback = std::move(callback);
}

Block Ledger::createGenesisBlock(const ChainParams& params) {
    Block genesis;
    genesis.index = 0;
    genesis.previousHash = crypto::Hash256{};
    genesis.timestamp = params.genesisTimestamp;
    genesis.minerId = "genesis";
    genesis.nonce = 0;
    genesis.difficultyTarget = params.genesisTarget;
    genesis.minerScore = 0.0;
    genesis.merkleRoot = genesis.computeMerkleRoot();
    genesis.hash = genesis.computeHash();
    return genesis;
}

Result<void, RejectReason> Ledger::validateChain(const std::vector<Block>& chain,
                                                 const ChainParams& params,
                                                 const IdentityResolver& resolver) {
    return validateFrom(chain, 0, params, resolver);
}

}
}
