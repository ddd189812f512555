#pragma once

#include "crypto/crypto.h"
#include "utils/config.h"
#include <string>
#include <vector>
#include <cstdint>

namespace sigelnet {
namespace core {

struct Block;

struct ChainParams {
    uint64_t genesisTarget = 0x0000FFFFFFFFFFFFULL;
    uint32_t retargetInterval = 10;
    uint32_t targetBlockTime = 60;
    double maxAdjustment = 4.0;
    double maxScore = 64.0;
    uint64_t genesisTimestamp = 1735000000;

    static ChainParams fromConfig(const utils::ChainConfig& cfg);
    bool validate(std::string* reason = nullptr) const;
};

uint64_t hashValue(const crypto::Hash256& hash);

// Score a miner may declare: NaN and negatives become 0, the rest is capped
// at maxScore.
double clampScore(double score, double maxScore);

// target * (1 + score), saturating at UINT64_MAX. Negative or NaN scores
// count as zero.
uint64_t effectiveTarget(uint64_t target, double score);
bool meetsTarget(const crypto::Hash256& hash, uint64_t target, double score);

// Expected hashes needed to hit the base target: 2^64 / (target + 1).
long double blockWork(uint64_t target);
long double chainWork(const std::vector<Block>& blocks, size_t from = 0);

// Target required for the block at `index`, given chain[0 .. index-1].
// Adjusts every retargetInterval blocks from the timestamps of the
// preceding window.
uint64_t expectedTarget(const std::vector<Block>& chain, uint64_t index, const ChainParams& params);

}
}
