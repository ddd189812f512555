#include "core/difficulty.h"
#include "core/block.h"
#include <cmath>
#include <limits>
#include <algorithm>

namespace sigelnet {
namespace core {

static constexpr long double TWO_POW_64 = 18446744073709551616.0L;

ChainParams ChainParams::fromConfig(const utils::ChainConfig& cfg) {
    ChainParams p;
    p.genesisTarget = cfg.genesisTarget;
    p.retargetInterval = cfg.retargetInterval;
    p.targetBlockTime = cfg.targetBlockTime;
    p.maxAdjustment = cfg.maxAdjustment;
    p.maxScore = cfg.maxScore;
    return p;
}

bool ChainParams::validate(std::string* reason) const {
    auto fail = [reason](const char* why) {
        if (reason) *reason = why;
        return false;
    };
    if (genesisTarget == 0) return fail("genesis target must be non-zero");
    if (retargetInterval < 2) return fail("retarget interval must be at least 2");
    if (targetBlockTime == 0) return fail("target block time must be non-zero");
    if (!std::isfinite(maxAdjustment) || maxAdjustment < 1.0) return fail("max adjustment must be >= 1");
    if (!std::isfinite(maxScore) || maxScore < 0.0) return fail("max score must be >= 0");
    return true;
}

uint64_t hashValue(const crypto::Hash256& hash) {
    uint64_t v = 0;
    for (int i = 0; i < 8; i++) {
        v = (v << 8) | hash[i];
    }
    return v;
}

double clampScore(double score, double maxScore) {
    if (!std::isfinite(score) || score < 0.0) return 0.0;
    return std::min(score, maxScore);
}

uint64_t effectiveTarget(uint64_t target, double score) {
    if (!(score > 0.0)) return target;
    long double extended = static_cast<long double>(target) * (1.0L + static_cast<long double>(score));
    if (!std::isfinite(static_cast<double>(extended)) || extended >= TWO_POW_64) {
        return std::numeric_limits<uint64_t>::max();
    }
    uint64_t result = static_cast<uint64_t>(extended);
    return std::max(result, target);
}

bool meetsTarget(const crypto::Hash256& hash, uint64_t target, double score) {
    return hashValue(hash) < effectiveTarget(target, score);
}

long double blockWork(uint64_t target) {
    return TWO_POW_64 / (static_cast<long double>(target) + 1.0L);
}

long double chainWork(const std::vector<Block>& blocks, size_t from) {
    long double work = 0.0L;
    for (size_t i = from; i < blocks.size(); i++) {
        work += blockWork(blocks[i].difficultyTarget);
    }
    return work;
}

uint64_t expectedTarget(const std::vector<Block>& chain, uint64_t index, const ChainParams& params) {
    if (index == 0 || chain.empty()) return params.genesisTarget;

    uint64_t prev = chain[static_cast<size_t>(index - 1)].difficultyTarget;
    uint64_t interval = params.retargetInterval;
    if (interval < 2 || index < interval || index % interval != 0) return prev;

    const Block& first = chain[static_cast<size_t>(index - interval)];
    const Block& last = chain[static_cast<size_t>(index - 1)];
    uint64_t actual = last.timestamp > first.timestamp ? last.timestamp - first.timestamp : 0;
    if (actual == 0) actual = 1;
    uint64_t expected = static_cast<uint64_t>(params.targetBlockTime) * (interval - 1);

    // Integer arithmetic so every node derives the same target.
    using u128 = unsigned __int128;
    uint64_t adjMilli = static_cast<uint64_t>(std::llround(params.maxAdjustment * 1000.0));
    if (adjMilli < 1000) adjMilli = 1000;

    u128 next = static_cast<u128>(prev) * actual / expected;
    u128 lower = static_cast<u128>(prev) * 1000 / adjMilli;
    u128 upper = static_cast<u128>(prev) * adjMilli / 1000;
    if (next < lower) next = lower;
    if (next > upper) next = upper;
    if (next > params.genesisTarget) next = params.genesisTarget;
    if (next < 1) next = 1;
    return static_cast<uint64_t>(next);
}

}
}
