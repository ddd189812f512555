#include "core/transfer.h"
#include "core/block.h"
#include "core/ledger.h"
#include "utils/serialize.h"
#include <mutex>
#include <deque>
#include <unordered_map>
#include <chrono>
#include <stdexcept>

namespace sigelnet {
namespace core {

static constexpr uint8_t TRANSFER_FORMAT = 1;

static uint64_t nowMillis() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

static uint64_t nowSeconds() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

void KnowledgeTransfer::writeTo(utils::ByteBuffer& buf) const {
    buf.writeString(fromId);
    buf.writeString(toId);
    buf.writeString(topic);
    buf.writeBytes(payload);
    buf.writeUint64(createdAt);
}

KnowledgeTransfer KnowledgeTransfer::readFrom(utils::ByteBuffer& buf) {
    KnowledgeTransfer t;
    t.fromId = buf.readString();
    t.toId = buf.readString();
    t.topic = buf.readString();
    if (t.topic.size() > MAX_TOPIC_BYTES) throw std::runtime_error("topic too long");
    t.payload = buf.readBytes();
    if (t.payload.size() > MAX_PAYLOAD_BYTES) throw std::runtime_error("payload too large");
    t.createdAt = buf.readUint64();
    return t;
}

crypto::Hash256 KnowledgeTransfer::contentHash() const {
    utils::ByteBuffer buf;
    writeTo(buf);
    return crypto::sha256(buf.data());
}

std::string KnowledgeTransfer::contentId() const {
    return crypto::toHex(contentHash());
}

std::vector<uint8_t> KnowledgeTransfer::serialize() const {
    utils::ByteBuffer buf;
    buf.writeUint8(TRANSFER_FORMAT);
    writeTo(buf);
    return buf.release();
}

std::optional<KnowledgeTransfer> KnowledgeTransfer::deserialize(const std::vector<uint8_t>& data) {
    try {
        utils::ByteBuffer buf(data);
        if (buf.readUint8() != TRANSFER_FORMAT) return std::nullopt;
        KnowledgeTransfer t = readFrom(buf);
        if (!buf.atEnd()) return std::nullopt;
        return t;
    } catch (const std::runtime_error&) {
        return std::nullopt;
    }
}

bool KnowledgeTransfer::operator==(const KnowledgeTransfer& other) const {
    return fromId == other.fromId && toId == other.toId && topic == other.topic &&
           payload == other.payload && createdAt == other.createdAt;
}

bool validateTransferFields(const KnowledgeTransfer& transfer, const IdentityLookup& lookup,
                            std::string* reason) {
    auto fail = [reason](const std::string& why) {
        if (reason) *reason = why;
        return false;
    };

    if (transfer.topic.empty()) return fail("empty topic");
    if (transfer.topic.size() > MAX_TOPIC_BYTES) return fail("topic longer than 64 bytes");
    if (transfer.payload.empty()) return fail("empty payload");
    if (transfer.payload.size() > MAX_PAYLOAD_BYTES) return fail("payload too large");
    if (transfer.createdAt == 0) return fail("missing creation time");
    if (!lookup) return fail("no identity lookup");
    if (!lookup(transfer.fromId)) return fail("unknown sender " + transfer.fromId);
    if (!lookup(transfer.toId)) return fail("unknown recipient " + transfer.toId);
    return true;
}

TransferProtocol::TransferProtocol(const Ledger& ledger) : ledger_(ledger) {}

Result<KnowledgeTransfer> TransferProtocol::prepare(const std::string& fromId, const std::string& toId,
                                                    const std::string& topic,
                                                    const std::vector<uint8_t>& payload) const {
    KnowledgeTransfer t;
    t.fromId = fromId;
    t.toId = toId;
    t.topic = topic;
    t.payload = payload;
    t.createdAt = nowMillis();

    std::string reason;
    IdentityLookup lookup = [this](const std::string& id) { return ledger_.identityKnown(id); };
    if (!validateTransferFields(t, lookup, &reason)) {
        return makeError(ErrorCode::VALIDATION_ERROR, reason);
    }
    return t;
}

Result<void, RejectReason> TransferProtocol::validate(const KnowledgeTransfer& transfer) const {
    IdentityLookup lookup = [this](const std::string& id) { return ledger_.identityKnown(id); };
    if (!validateTransferFields(transfer, lookup)) return RejectReason::INVALID_TRANSACTION;
    if (ledger_.containsTransfer(transfer.contentHash())) return RejectReason::INVALID_TRANSACTION;
    return Result<void, RejectReason>();
}

Result<void, RejectReason> TransferProtocol::validate(const KnowledgeTransfer& transfer,
                                                      const std::vector<Block>& chain,
                                                      const IdentityLookup& lookup) {
    if (!validateTransferFields(transfer, lookup)) return RejectReason::INVALID_TRANSACTION;
    crypto::Hash256 h = transfer.contentHash();
    for (const auto& block : chain) {
        for (const auto& t : block.transactions) {
            if (t.contentHash() == h) return RejectReason::INVALID_TRANSACTION;
        }
    }
    return Result<void, RejectReason>();
}

struct PoolEntry {
    KnowledgeTransfer transfer;
    uint64_t addedAt;
};

struct TransferPool::Impl {
    std::unordered_map<std::string, PoolEntry> entries;
    std::deque<std::string> order;
    size_t capacity;
    uint64_t expirySeconds;
    mutable std::mutex mtx;

    void compactOrder() {
        std::deque<std::string> kept;
        for (const auto& id : order) {
            if (entries.count(id)) kept.push_back(id);
        }
        order.swap(kept);
    }
};

TransferPool::TransferPool(size_t capacity, uint64_t expirySeconds) : impl_(std::make_unique<Impl>()) {
    impl_->capacity = capacity;
    impl_->expirySeconds = expirySeconds;
}

TransferPool::~TransferPool() = default;

Result<void> TransferPool::add(const KnowledgeTransfer& transfer) {
    std::string id = transfer.contentId();
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (impl_->entries.count(id)) {
        return makeError(ErrorCode::ALREADY_EXISTS, "transfer already pending");
    }
    if (impl_->entries.size() >= impl_->capacity) {
        return makeError(ErrorCode::RESOURCE_EXHAUSTED, "transfer pool full");
    }
    impl_->entries[id] = PoolEntry{transfer, nowSeconds()};
    impl_->order.push_back(id);
    return Result<void>();
}

bool TransferPool::contains(const crypto::Hash256& contentHash) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->entries.count(crypto::toHex(contentHash)) > 0;
}

std::vector<KnowledgeTransfer> TransferPool::select(size_t maxCount) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::vector<KnowledgeTransfer> result;
    for (const auto& id : impl_->order) {
        if (result.size() >= maxCount) break;
        auto it = impl_->entries.find(id);
        if (it != impl_->entries.end()) result.push_back(it->second.transfer);
    }
    return result;
}

void TransferPool::removeIncluded(const std::vector<KnowledgeTransfer>& included) {
    if (included.empty()) return;
    std::lock_guard<std::mutex> lock(impl_->mtx);
    size_t removed = 0;
    for (const auto& t : included) {
        removed += impl_->entries.erase(t.contentId());
    }
    if (removed > 0) impl_->compactOrder();
}

size_t TransferPool::pruneExpired() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    uint64_t now = nowSeconds();
    size_t removed = 0;
    for (auto it = impl_->entries.begin(); it != impl_->entries.end();) {
        if (now > it->second.addedAt && now - it->second.addedAt > impl_->expirySeconds) {
            it = impl_->entries.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    if (removed > 0) impl_->compactOrder();
    return removed;
}

size_t TransferPool::size() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->entries.size();
}

size_t TransferPool::capacity() const {
    return impl_->capacity;
}

void TransferPool::clear() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->entries.clear();
    impl_->order.clear();
}

}
}
