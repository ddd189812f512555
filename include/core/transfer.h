#pragma once

#include "crypto/crypto.h"
#include "core/validation.h"
#include "infrastructure/error_handling.h"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <memory>

namespace sigelnet {
namespace utils { class ByteBuffer; }
namespace core {

struct Block;
class Ledger;

constexpr size_t MAX_TOPIC_BYTES = 64;
constexpr size_t MAX_PAYLOAD_BYTES = 64 * 1024;

struct KnowledgeTransfer {
    std::string fromId;
    std::string toId;
    std::string topic;
    std::vector<uint8_t> payload;
    uint64_t createdAt = 0;

    // SHA-256 over the canonical encoding of all five fields.
    crypto::Hash256 contentHash() const;
    std::string contentId() const;

    std::vector<uint8_t> serialize() const;
    static std::optional<KnowledgeTransfer> deserialize(const std::vector<uint8_t>& data);
    void writeTo(utils::ByteBuffer& buf) const;
    static KnowledgeTransfer readFrom(utils::ByteBuffer& buf);

    bool operator==(const KnowledgeTransfer& other) const;
};

// Field and identity checks that do not depend on chain contents.
bool validateTransferFields(const KnowledgeTransfer& transfer, const IdentityLookup& lookup,
                            std::string* reason = nullptr);

class TransferProtocol {
public:
    explicit TransferProtocol(const Ledger& ledger);

    Result<KnowledgeTransfer> prepare(const std::string& fromId, const std::string& toId,
                                      const std::string& topic,
                                      const std::vector<uint8_t>& payload) const;
    Result<void, RejectReason> validate(const KnowledgeTransfer& transfer) const;

    static Result<void, RejectReason> validate(const KnowledgeTransfer& transfer,
                                               const std::vector<Block>& chain,
                                               const IdentityLookup& lookup);

private:
    const Ledger& ledger_;
};

// Transfers waiting to be embedded in a block, keyed by content id.
class TransferPool {
public:
    explicit TransferPool(size_t capacity = 5000, uint64_t expirySeconds = 86400);
    ~TransferPool();

    Result<void> add(const KnowledgeTransfer& transfer);
    bool contains(const crypto::Hash256& contentHash) const;
    // Oldest first.
    std::vector<KnowledgeTransfer> select(size_t maxCount) const;
    void removeIncluded(const std::vector<KnowledgeTransfer>& included);
    size_t pruneExpired();
    size_t size() const;
    size_t capacity() const;
    void clear();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
