#include "core/block.h"
#include "core/difficulty.h"
#include "utils/serialize.h"
#include <stdexcept>

namespace sigelnet {
namespace core {

static constexpr uint8_t BLOCK_FORMAT = 1;

std::vector<uint8_t> Block::headerPrefix() const {
    utils::ByteBuffer buf;
    buf.writeUint8(BLOCK_FORMAT);
    buf.writeUint64(index);
    buf.writeFixedBytes(previousHash.data(), previousHash.size());
    buf.writeUint64(timestamp);
    buf.writeString(minerId);
    buf.writeUint64(difficultyTarget);
    buf.writeDouble(minerScore);
    buf.writeFixedBytes(merkleRoot.data(), merkleRoot.size());
    return buf.release();
}

crypto::Hash256 Block::hashHeader(std::vector<uint8_t>& prefix, uint64_t nonce) {
    size_t base = prefix.size();
    for (int i = 7; i >= 0; i--) {
        prefix.push_back(static_cast<uint8_t>((nonce >> (i * 8)) & 0xFF));
    }
    crypto::Hash256 h = crypto::doubleSha256(prefix.data(), prefix.size());
    prefix.resize(base);
    return h;
}

crypto::Hash256 Block::computeHash() const {
    auto prefix = headerPrefix();
    return hashHeader(prefix, nonce);
}

crypto::Hash256 Block::computeMerkleRoot() const {
    if (transactions.empty()) return crypto::Hash256{};
    std::vector<crypto::Hash256> hashes;
    hashes.reserve(transactions.size());
    for (const auto& t : transactions) hashes.push_back(t.contentHash());
    while (hashes.size() > 1) {
        std::vector<crypto::Hash256> next;
        for (size_t i = 0; i < hashes.size(); i += 2) {
            std::vector<uint8_t> combined;
            combined.insert(combined.end(), hashes[i].begin(), hashes[i].end());
            size_t j = (i + 1 < hashes.size()) ? i + 1 : i;
            combined.insert(combined.end(), hashes[j].begin(), hashes[j].end());
            next.push_back(crypto::doubleSha256(combined.data(), combined.size()));
        }
        hashes = std::move(next);
    }
    return hashes[0];
}

uint64_t Block::hashValue() const {
    return core::hashValue(hash);
}

void Block::writeTo(utils::ByteBuffer& buf) const {
    buf.writeUint64(index);
    buf.writeFixedBytes(previousHash.data(), previousHash.size());
    buf.writeUint64(timestamp);
    buf.writeString(minerId);
    buf.writeUint64(nonce);
    buf.writeUint64(difficultyTarget);
    buf.writeDouble(minerScore);
    buf.writeFixedBytes(merkleRoot.data(), merkleRoot.size());
    buf.writeVarInt(transactions.size());
    for (const auto& t : transactions) t.writeTo(buf);
    buf.writeFixedBytes(hash.data(), hash.size());
}

Block Block::readFrom(utils::ByteBuffer& buf) {
    Block b;
    b.index = buf.readUint64();
    buf.readFixedBytes(b.previousHash.data(), b.previousHash.size());
    b.timestamp = buf.readUint64();
    b.minerId = buf.readString();
    if (b.minerId.size() > MAX_MINER_ID) throw std::runtime_error("miner id too long");
    b.nonce = buf.readUint64();
    b.difficultyTarget = buf.readUint64();
    b.minerScore = buf.readDouble();
    buf.readFixedBytes(b.merkleRoot.data(), b.merkleRoot.size());
    uint64_t count = buf.readVarInt();
    if (count > MAX_BLOCK_TRANSFERS) throw std::runtime_error("too many transfers in block");
    b.transactions.reserve(static_cast<size_t>(count));
    for (uint64_t i = 0; i < count; i++) {
        b.transactions.push_back(KnowledgeTransfer::readFrom(buf));
    }
    crypto::Hash256 claimed;
    buf.readFixedBytes(claimed.data(), claimed.size());
    b.hash = claimed;
    return b;
}

std::vector<uint8_t> Block::serialize() const {
    utils::ByteBuffer buf;
    buf.writeUint8(BLOCK_FORMAT);
    writeTo(buf);
    return buf.release();
}

std::optional<Block> Block::deserialize(const std::vector<uint8_t>& data) {
    try {
        utils::ByteBuffer buf(data);
        if (buf.readUint8() != BLOCK_FORMAT) return std::nullopt;
        Block b = readFrom(buf);
        if (!buf.atEnd()) return std::nullopt;
        return b;
    } catch (const std::runtime_error&) {
        return std::nullopt;
    }
}

}
}
