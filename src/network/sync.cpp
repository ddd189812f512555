#include "network/sync.h"
#include "utils/logger.h"
#include <mutex>
#include <map>
#include <chrono>

namespace sigelnet {
namespace network {

static const char* LOG_CAT_SYNC = "sync";

static uint64_t nowMillis() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count());
}

struct PeerDownload {
    uint64_t fromIndex = 0;
    uint64_t stepBack = 1;
    uint64_t requestTime = 0;
    std::vector<core::Block> blocks;
};

struct ChainSync::Impl {
    uint64_t localHeight = 0;
    std::map<std::string, uint64_t> peerHeights;
    std::map<std::string, PeerDownload> downloads;
    uint32_t maxBlocksPerRequest;
    uint64_t requestTimeoutMs;
    uint64_t completed = 0;
    uint64_t abandoned = 0;
    mutable std::mutex mtx;

    SyncRequest request(const std::string& peerId, PeerDownload& d, uint64_t from) {
        d.fromIndex = from;
        d.requestTime = nowMillis();
        SyncRequest req;
        req.peerId = peerId;
        req.fromIndex = from;
        req.maxBlocks = maxBlocksPerRequest;
        return req;
    }

    SyncStep abandon(const std::string& peerId, const std::string& why) {
        LOG_CAT(DEBUG, LOG_CAT_SYNC, "Abandoning sync with " + peerId + ": " + why);
        downloads.erase(peerId);
        abandoned++;
        return SyncStep{};
    }
};

ChainSync::ChainSync(uint32_t maxBlocksPerRequest, uint64_t requestTimeoutMs)
    : impl_(std::make_unique<Impl>()) {
    impl_->maxBlocksPerRequest = maxBlocksPerRequest == 0 ? 1 : maxBlocksPerRequest;
    impl_->requestTimeoutMs = requestTimeoutMs;
}

ChainSync::~ChainSync() = default;

void ChainSync::setLocalHeight(uint64_t height) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->localHeight = height;
}

void ChainSync::updatePeerHeight(const std::string& peerId, uint64_t height) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->peerHeights[peerId] = height;
}

void ChainSync::removePeer(const std::string& peerId) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->peerHeights.erase(peerId);
    impl_->downloads.erase(peerId);
}

std::optional<SyncRequest> ChainSync::begin(const std::string& peerId, uint64_t localHeight) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto hit = impl_->peerHeights.find(peerId);
    if (hit == impl_->peerHeights.end() || hit->second <= localHeight) return std::nullopt;
    if (impl_->downloads.count(peerId)) return std::nullopt;

    PeerDownload& d = impl_->downloads[peerId];
    LOG_CAT(DEBUG, LOG_CAT_SYNC, "Syncing from " + peerId + " (height " +
            std::to_string(hit->second) + ", ours " + std::to_string(localHeight) + ")");
    return impl_->request(peerId, d, localHeight + 1);
}

SyncStep ChainSync::processResponse(const std::string& peerId, const ChainResponse& response,
                                    const LinkCheck& links) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->downloads.find(peerId);
    if (it == impl_->downloads.end()) return SyncStep{};
    PeerDownload& d = it->second;

    if (response.peerHeight > impl_->peerHeights[peerId]) {
        impl_->peerHeights[peerId] = response.peerHeight;
    }

    if (response.blocks.empty()) {
        if (d.blocks.empty()) return impl_->abandon(peerId, "empty response");
        SyncStep step;
        step.action = SyncAction::COMPLETE;
        step.blocks = std::move(d.blocks);
        impl_->downloads.erase(it);
        impl_->completed++;
        return step;
    }

    const core::Block& first = response.blocks.front();
    if (first.index != d.fromIndex) return impl_->abandon(peerId, "response starts at wrong index");
    for (size_t i = 1; i < response.blocks.size(); i++) {
        if (response.blocks[i].index != response.blocks[i - 1].index + 1 ||
            response.blocks[i].previousHash != response.blocks[i - 1].hash) {
            return impl_->abandon(peerId, "response is not a contiguous chain");
        }
    }

    if (d.blocks.empty()) {
        if (first.index != 0 && !links(first)) {
            if (d.fromIndex == 0) return impl_->abandon(peerId, "no common ancestor");
            uint64_t back = d.stepBack;
            d.stepBack *= 2;
            uint64_t from = d.fromIndex > back ? d.fromIndex - back : 0;
            SyncStep step;
            step.action = SyncAction::STEP_BACK;
            step.next = impl_->request(peerId, d, from);
            return step;
        }
    } else {
        const core::Block& last = d.blocks.back();
        if (first.index != last.index + 1 || first.previousHash != last.hash) {
            return impl_->abandon(peerId, "batch does not continue download");
        }
    }

    if (d.blocks.size() + response.blocks.size() > MAX_SYNC_BLOCKS) {
        return impl_->abandon(peerId, "download too large");
    }
    d.blocks.insert(d.blocks.end(), response.blocks.begin(), response.blocks.end());

    uint64_t lastIndex = d.blocks.back().index;
    if (lastIndex < impl_->peerHeights[peerId]) {
        SyncStep step;
        step.action = SyncAction::REQUEST_MORE;
        step.next = impl_->request(peerId, d, lastIndex + 1);
        return step;
    }

    SyncStep step;
    step.action = SyncAction::COMPLETE;
    step.blocks = std::move(d.blocks);
    impl_->downloads.erase(it);
    impl_->completed++;
    return step;
}

bool ChainSync::isSyncing(const std::string& peerId) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->downloads.count(peerId) > 0;
}

std::vector<std::string> ChainSync::expire() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::vector<std::string> expired;
    uint64_t now = nowMillis();
    for (auto it = impl_->downloads.begin(); it != impl_->downloads.end();) {
        if (now - it->second.requestTime > impl_->requestTimeoutMs) {
            expired.push_back(it->first);
            it = impl_->downloads.erase(it);
            impl_->abandoned++;
        } else {
            ++it;
        }
    }
    return expired;
}

uint64_t ChainSync::getNetworkHeight() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    uint64_t best = impl_->localHeight;
    for (const auto& [peer, height] : impl_->peerHeights) {
        if (height > best) best = height;
    }
    return best;
}

uint64_t ChainSync::getPeerHeight(const std::string& peerId) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->peerHeights.find(peerId);
    return it == impl_->peerHeights.end() ? 0 : it->second;
}

SyncStats ChainSync::getStats() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    SyncStats stats;
    stats.localHeight = impl_->localHeight;
    stats.networkHeight = impl_->localHeight;
    for (const auto& [peer, height] : impl_->peerHeights) {
        if (height > stats.networkHeight) stats.networkHeight = height;
    }
    stats.activeSyncs = impl_->downloads.size();
    stats.completed = impl_->completed;
    stats.abandoned = impl_->abandoned;
    return stats;
}

}
}
