#pragma once

#include <string>
#include <set>
#include <list>
#include <unordered_map>
#include <mutex>

namespace sigelnet {
namespace node {

// Bounded record of recently relayed items and the peers known to have each.
// The least recently touched item is evicted first.
class SeenCache {
public:
    explicit SeenCache(size_t capacity = 1024);

    // True if the key was not present.
    bool insert(const std::string& key);
    bool contains(const std::string& key) const;
    void markPeer(const std::string& key, const std::string& peerId);
    std::set<std::string> peers(const std::string& key) const;
    void forgetPeer(const std::string& peerId);
    size_t size() const;
    size_t capacity() const { return capacity_; }

private:
    struct Entry {
        std::set<std::string> peers;
        std::list<std::string>::iterator pos;
    };

    Entry& touchLocked(const std::string& key, bool* inserted);

    size_t capacity_;
    std::list<std::string> order_;
    std::unordered_map<std::string, Entry> entries_;
    mutable std::mutex mtx_;
};

}
}
