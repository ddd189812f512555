#include "core/knowledge.h"
#include "database/database.h"
#include "infrastructure/error_handling.h"
#include "utils/logger.h"
#include "utils/serialize.h"
#include <mutex>
#include <map>
#include <set>
#include <unordered_map>
#include <algorithm>
#include <stdexcept>

namespace sigelnet {
namespace core {

static constexpr uint8_t ENTRY_FORMAT = 1;

static std::string entryKey(const std::string& toId, const std::string& hashHex) {
    return "knowledge:" + toId + ":" + hashHex;
}

KnowledgeEntry KnowledgeEntry::fromTransfer(const KnowledgeTransfer& transfer, uint64_t blockIndex) {
    KnowledgeEntry e;
    e.transferHash = transfer.contentHash();
    e.fromId = transfer.fromId;
    e.toId = transfer.toId;
    e.topic = transfer.topic;
    e.payload = transfer.payload;
    e.createdAt = transfer.createdAt;
    e.blockIndex = blockIndex;
    return e;
}

std::vector<uint8_t> KnowledgeEntry::serialize() const {
    utils::ByteBuffer buf;
    buf.writeUint8(ENTRY_FORMAT);
    buf.writeFixedBytes(transferHash.data(), transferHash.size());
    buf.writeString(fromId);
    buf.writeString(toId);
    buf.writeString(topic);
    buf.writeBytes(payload);
    buf.writeUint64(createdAt);
    buf.writeUint64(blockIndex);
    return buf.release();
}

std::optional<KnowledgeEntry> KnowledgeEntry::deserialize(const std::vector<uint8_t>& data) {
    try {
        utils::ByteBuffer buf(data);
        if (buf.readUint8() != ENTRY_FORMAT) return std::nullopt;
        KnowledgeEntry e;
        buf.readFixedBytes(e.transferHash.data(), e.transferHash.size());
        e.fromId = buf.readString();
        e.toId = buf.readString();
        e.topic = buf.readString();
        e.payload = buf.readBytes();
        e.createdAt = buf.readUint64();
        e.blockIndex = buf.readUint64();
        return e;
    } catch (const std::runtime_error&) {
        return std::nullopt;
    }
}

struct KnowledgeStore::Impl {
    database::Database db;
    std::unordered_map<std::string, KnowledgeEntry> entries;
    std::map<std::string, std::vector<std::string>> byIdentity;
    std::map<std::string, std::vector<std::string>> byTopic;
    std::function<void(const KnowledgeEntry&)> newEntryCallback;
    mutable std::mutex mtx;

    void index(const std::string& id, const KnowledgeEntry& e) {
        byIdentity[e.toId].push_back(id);
        byTopic[e.topic].push_back(id);
    }

    void unindex(const std::string& id, const KnowledgeEntry& e) {
        auto drop = [&id](std::map<std::string, std::vector<std::string>>& m, const std::string& key) {
            auto it = m.find(key);
            if (it == m.end()) return;
            auto& v = it->second;
            v.erase(std::remove(v.begin(), v.end(), id), v.end());
            if (v.empty()) m.erase(it);
        };
        drop(byIdentity, e.toId);
        drop(byTopic, e.topic);
    }

    std::vector<KnowledgeEntry> collect(const std::map<std::string, std::vector<std::string>>& m,
                                        const std::string& key, size_t limit) const {
        std::vector<KnowledgeEntry> result;
        auto it = m.find(key);
        if (it == m.end()) return result;
        for (const auto& id : it->second) {
            if (result.size() >= limit) break;
            auto e = entries.find(id);
            if (e != entries.end()) result.push_back(e->second);
        }
        return result;
    }
};

KnowledgeStore::KnowledgeStore() : impl_(std::make_unique<Impl>()) {}
KnowledgeStore::~KnowledgeStore() { close(); }

bool KnowledgeStore::open(const std::string& dbPath) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db.open(dbPath)) {
        utils::Logger::error("Failed to open knowledge store " + dbPath + ": " + impl_->db.lastError());
        return false;
    }

    std::vector<KnowledgeEntry> loaded;
    impl_->db.forEach("knowledge:", [&loaded](const std::string&, const std::vector<uint8_t>& value) {
        auto e = KnowledgeEntry::deserialize(value);
        if (e) loaded.push_back(std::move(*e));
        return true;
    });
    std::sort(loaded.begin(), loaded.end(), [](const KnowledgeEntry& a, const KnowledgeEntry& b) {
        if (a.blockIndex != b.blockIndex) return a.blockIndex < b.blockIndex;
        return a.createdAt < b.createdAt;
    });
    for (auto& e : loaded) {
        std::string id = crypto::toHex(e.transferHash);
        impl_->index(id, e);
        impl_->entries[id] = std::move(e);
    }
    return true;
}

void KnowledgeStore::close() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->db.close();
}

bool KnowledgeStore::apply(const KnowledgeTransfer& transfer, uint64_t blockIndex) {
    KnowledgeEntry entry = KnowledgeEntry::fromTransfer(transfer, blockIndex);
    std::string id = crypto::toHex(entry.transferHash);

    std::function<void(const KnowledgeEntry&)> cb;
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        if (impl_->entries.count(id)) return false;

        if (impl_->db.isOpen() && !impl_->db.put(entryKey(entry.toId, id), entry.serialize())) {
            throw StorageError("knowledge store write failed: " + impl_->db.lastError());
        }
        impl_->index(id, entry);
        impl_->entries[id] = entry;
        cb = impl_->newEntryCallback;
    }

    if (cb) cb(entry);
    return true;
}

bool KnowledgeStore::revoke(const KnowledgeTransfer& transfer) {
    std::string id = transfer.contentId();
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->entries.find(id);
    if (it == impl_->entries.end()) return false;

    if (impl_->db.isOpen() && !impl_->db.del(entryKey(it->second.toId, id))) {
        throw StorageError("knowledge store delete failed: " + impl_->db.lastError());
    }
    impl_->unindex(id, it->second);
    impl_->entries.erase(it);
    return true;
}

bool KnowledgeStore::contains(const crypto::Hash256& transferHash) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->entries.count(crypto::toHex(transferHash)) > 0;
}

std::vector<KnowledgeEntry> KnowledgeStore::getByIdentity(const std::string& toId, size_t limit) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->collect(impl_->byIdentity, toId, limit);
}

std::vector<KnowledgeEntry> KnowledgeStore::getByTopic(const std::string& topic, size_t limit) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->collect(impl_->byTopic, topic, limit);
}

std::vector<std::string> KnowledgeStore::getTopics(const std::string& toId) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::set<std::string> topics;
    auto it = impl_->byIdentity.find(toId);
    if (it != impl_->byIdentity.end()) {
        for (const auto& id : it->second) {
            auto e = impl_->entries.find(id);
            if (e != impl_->entries.end()) topics.insert(e->second.topic);
        }
    }
    return std::vector<std::string>(topics.begin(), topics.end());
}

uint64_t KnowledgeStore::count() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->entries.size();
}

KnowledgeStats KnowledgeStore::getStats() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    KnowledgeStats stats;
    stats.totalEntries = impl_->entries.size();
    stats.recipients = impl_->byIdentity.size();
    stats.topics = impl_->byTopic.size();
    return stats;
}

void KnowledgeStore::onNewEntry(std::function<void(const KnowledgeEntry&)> callback) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->newEntryCallback = std::move(callback);
}

}
}
