#pragma once

#include "crypto/crypto.h"
#include "core/transfer.h"
#include <string>
#include <vector>
#include <cstdint>
#include <memory>
#include <functional>
#include <optional>

namespace sigelnet {
namespace core {

struct KnowledgeEntry {
    crypto::Hash256 transferHash{};
    std::string fromId;
    std::string toId;
    std::string topic;
    std::vector<uint8_t> payload;
    uint64_t createdAt = 0;
    uint64_t blockIndex = 0;

    static KnowledgeEntry fromTransfer(const KnowledgeTransfer& transfer, uint64_t blockIndex);
    std::vector<uint8_t> serialize() const;
    static std::optional<KnowledgeEntry> deserialize(const std::vector<uint8_t>& data);
};

struct KnowledgeStats {
    uint64_t totalEntries = 0;
    uint64_t recipients = 0;
    uint64_t topics = 0;
};

// Knowledge received by identities, fed from committed transfers.
// Applying the same transfer twice leaves the store unchanged.
class KnowledgeStore {
public:
    KnowledgeStore();
    ~KnowledgeStore();

    bool open(const std::string& dbPath);
    void close();

    // Returns false when the transfer was already applied.
    bool apply(const KnowledgeTransfer& transfer, uint64_t blockIndex);
    // Drops a transfer whose block left the active chain.
    bool revoke(const KnowledgeTransfer& transfer);

    bool contains(const crypto::Hash256& transferHash) const;
    std::vector<KnowledgeEntry> getByIdentity(const std::string& toId, size_t limit = 100) const;
    std::vector<KnowledgeEntry> getByTopic(const std::string& topic, size_t limit = 100) const;
    std::vector<std::string> getTopics(const std::string& toId) const;
    uint64_t count() const;
    KnowledgeStats getStats() const;

    void onNewEntry(std::function<void(const KnowledgeEntry&)> callback);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
