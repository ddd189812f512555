#pragma once

#include "core/block.h"
#include "network/protocol.h"
#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <memory>
#include <cstdint>

namespace sigelnet {
namespace network {

constexpr size_t MAX_SYNC_BLOCKS = 100000;

enum class SyncAction {
    REQUEST_MORE,
    STEP_BACK,
    COMPLETE,
    ABANDON
};

struct SyncRequest {
    std::string peerId;
    uint64_t fromIndex = 0;
    uint32_t maxBlocks = 0;
};

struct SyncStep {
    SyncAction action = SyncAction::ABANDON;
    SyncRequest next;
    std::vector<core::Block> blocks;
};

struct SyncStats {
    uint64_t localHeight = 0;
    uint64_t networkHeight = 0;
    size_t activeSyncs = 0;
    uint64_t completed = 0;
    uint64_t abandoned = 0;
};

// Tracks peer heights and the chain download in flight per peer. A download
// starts just above our height; when the first batch does not attach to our
// chain the start steps back 1, 2, 4, ... blocks until it does or reaches
// genesis. Batches accumulate until the peer's height is reached or the
// peer returns an empty batch.
class ChainSync {
public:
    // Returns true when the block's predecessor is on our active chain.
    using LinkCheck = std::function<bool(const core::Block&)>;

    explicit ChainSync(uint32_t maxBlocksPerRequest = 500, uint64_t requestTimeoutMs = 30000);
    ~ChainSync();

    void setLocalHeight(uint64_t height);
    void updatePeerHeight(const std::string& peerId, uint64_t height);
    void removePeer(const std::string& peerId);

    // A request when the peer is ahead of us and no download from it is running.
    std::optional<SyncRequest> begin(const std::string& peerId, uint64_t localHeight);
    SyncStep processResponse(const std::string& peerId, const ChainResponse& response,
                             const LinkCheck& links);
    bool isSyncing(const std::string& peerId) const;
    // Drops downloads whose last request is older than the timeout.
    std::vector<std::string> expire();

    uint64_t getNetworkHeight() const;
    uint64_t getPeerHeight(const std::string& peerId) const;
    SyncStats getStats() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
