#include "node/seen_cache.h"

namespace sigelnet {
namespace node {

SeenCache::SeenCache(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

SeenCache::Entry& SeenCache::touchLocked(const std::string& key, bool* inserted) {
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        order_.splice(order_.begin(), order_, it->second.pos);
        if (inserted) *inserted = false;
        return it->second;
    }

    while (entries_.size() >= capacity_ && !order_.empty()) {
        entries_.erase(order_.back());
        order_.pop_back();
    }
    order_.push_front(key);
    Entry& e = entries_[key];
    e.pos = order_.begin();
    if (inserted) *inserted = true;
    return e;
}

bool SeenCache::insert(const std::string& key) {
    std::lock_guard<std::mutex> lock(mtx_);
    bool inserted = false;
    touchLocked(key, &inserted);
    return inserted;
}

bool SeenCache::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return entries_.count(key) > 0;
}

void SeenCache::markPeer(const std::string& key, const std::string& peerId) {
    std::lock_guard<std::mutex> lock(mtx_);
    touchLocked(key, nullptr).peers.insert(peerId);
}

std::set<std::string> SeenCache::peers(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = entries_.find(key);
    if (it == entries_.end()) return {};
    return it->second.peers;
}

void SeenCache::forgetPeer(const std::string& peerId) {
    std::lock_guard<std::mutex> lock(mtx_);
    for (auto& [key, entry] : entries_) entry.peers.erase(peerId);
}

size_t SeenCache::size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return entries_.size();
}

}
}
