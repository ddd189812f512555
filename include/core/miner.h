#pragma once

#include "core/block.h"
#include "core/difficulty.h"
#include "core/identity.h"
#include "core/ledger.h"
#include "core/transfer.h"
#include "infrastructure/error_handling.h"
#include "utils/config.h"
#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <memory>
#include <cstdint>

namespace sigelnet {
namespace core {

struct MiningBudget {
    uint64_t maxAttempts = 0;
    uint64_t startNonce = 0;
};

struct MiningStats {
    uint64_t hashesComputed = 0;
    uint64_t blocksFound = 0;
    uint64_t blocksAccepted = 0;
    uint64_t staleAborts = 0;
    uint64_t roundsExhausted = 0;
};

class MiningEngine {
public:
    explicit MiningEngine(const ChainParams& params);

    // Header over the tip with the score snapshot taken once here. Timestamp
    // is the wall clock, never earlier than the tip's.
    Block buildCandidate(const ChainTip& tip, const IdentityRecord& miner,
                         const std::vector<KnowledgeTransfer>& transactions) const;

    // Tries budget.maxAttempts nonces. nullopt means the budget ran out or
    // shouldAbort fired; both are normal outcomes.
    std::optional<Block> attempt(const ChainTip& tip, const IdentityRecord& miner,
                                 const std::vector<KnowledgeTransfer>& transactions,
                                 const MiningBudget& budget,
                                 const std::function<bool()>& shouldAbort = nullptr,
                                 uint64_t* hashesDone = nullptr) const;

    double effectiveScore(const IdentityRecord& miner) const;
    static bool accepts(const crypto::Hash256& hash, uint64_t target, double score);

    const ChainParams& params() const { return params_; }

private:
    ChainParams params_;
};

// Runs one background mining loop per local identity. Found blocks go to the
// block handler, which falls back to Ledger::append when unset.
class Miner {
public:
    using BlockHandler = std::function<bool(const Block&)>;

    Miner(Ledger& ledger, TransferPool& pool, const IdentityRegistry& identities,
          const utils::MiningConfig& config);
    ~Miner();

    void onBlockFound(BlockHandler handler);

    Result<void> start(const std::string& identityId, bool continuous);
    bool stop(const std::string& identityId);
    void stopAll();
    bool isMining(const std::string& identityId) const;
    std::vector<std::string> activeMiners() const;

    // Mines on the calling thread until a block is accepted or maxAttempts
    // nonces are spent.
    Result<Block> mineOne(const std::string& identityId, uint64_t maxAttempts);

    // Pending transfers that would still be valid on top of the current tip.
    std::vector<KnowledgeTransfer> selectTransfers() const;

    MiningStats getStats() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
