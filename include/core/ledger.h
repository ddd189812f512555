#pragma once

#include "crypto/crypto.h"
#include "core/block.h"
#include "core/difficulty.h"
#include "core/validation.h"
#include "infrastructure/error_handling.h"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <memory>
#include <functional>

namespace sigelnet {
namespace core {

// Everything a miner needs to build on the current tip, read atomically.
struct ChainTip {
    Block block;
    uint64_t nextTarget = 0;
    uint64_t revision = 0;
};

class Ledger {
public:
    explicit Ledger(const ChainParams& params = ChainParams());
    ~Ledger();

    // Loads and re-validates the stored chain, writing genesis into an empty
    // store. Fails if the stored chain is invalid or has a different genesis.
    bool open(const std::string& dbPath);
    void close();

    Result<void, RejectReason> append(const Block& candidate);
    // Accepts a full chain or a suffix linking to a block of the active
    // chain. Swaps only if the result has strictly more cumulative work.
    bool replaceIfBetter(const std::vector<Block>& candidate);

    Block tip() const;
    uint64_t height() const;
    crypto::Hash256 tipHash() const;
    std::optional<Block> getBlock(uint64_t index) const;
    std::vector<Block> getBlocks(uint64_t fromIndex, size_t maxCount) const;
    std::vector<Block> chain() const;
    long double cumulativeWork() const;
    uint64_t nextTarget() const;
    ChainTip snapshot() const;
    uint64_t revision() const;

    bool containsTransfer(const crypto::Hash256& contentHash) const;
    bool identityKnown(const std::string& id) const;
    // Source of miner and transfer identities. Without one, every block
    // after genesis is rejected.
    void setIdentityResolver(IdentityResolver resolver);

    bool verifyChain() const;
    const ChainParams& params() const;

    void onBlockAppended(std::function<void(const Block&)> callback);
    // forkIndex is the first replaced index; removed holds the blocks that
    // left the active chain, added the ones that joined it.
    void onChainReplaced(std::function<void(uint64_t forkIndex, const std::vector<Block>& removed,
                                            const std::vector<Block>& added)> callback);

    static Block createGenesisBlock(const ChainParams& params);
    static Result<void, RejectReason> validateChain(const std::vector<Block>& chain,
                                                    const ChainParams& params,
                                                    const IdentityResolver& resolver);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
