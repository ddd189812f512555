#include "network/protocol.h"
#include "utils/serialize.h"
#include <stdexcept>

namespace sigelnet {
namespace network {

static constexpr uint8_t PAYLOAD_FORMAT = 1;

struct CommandEntry {
    MessageType type;
    const char* name;
};

static const CommandEntry COMMANDS[] = {
    {MessageType::HELLO, "hello"},
    {MessageType::GET_STATUS, "getstatus"},
    {MessageType::STATUS, "status"},
    {MessageType::GET_CHAIN, "getchain"},
    {MessageType::CHAIN, "chain"},
    {MessageType::BLOCK, "block"},
    {MessageType::TRANSFER, "transfer"},
    {MessageType::IDENTITY, "identity"},
    {MessageType::PING, "ping"},
    {MessageType::PONG, "pong"},
};

const char* commandName(MessageType type) {
    for (const auto& c : COMMANDS) {
        if (c.type == type) return c.name;
    }
    return "unknown";
}

MessageType commandType(const std::string& command) {
    for (const auto& c : COMMANDS) {
        if (command == c.name) return c.type;
    }
    return MessageType::UNKNOWN;
}

bool allowedBeforeHandshake(MessageType type) {
    return type == MessageType::HELLO || type == MessageType::PING || type == MessageType::PONG;
}

namespace {

utils::ByteBuffer beginPayload() {
    utils::ByteBuffer buf;
    buf.writeUint8(PAYLOAD_FORMAT);
    return buf;
}

// Runs fn over a payload after checking the format byte. Any decode error,
// unknown format or trailing bytes yield nullopt.
template<typename T, typename Fn>
std::optional<T> decodePayload(const std::vector<uint8_t>& data, Fn fn) {
    try {
        utils::ByteBuffer buf(data);
        if (buf.readUint8() != PAYLOAD_FORMAT) return std::nullopt;
        T msg = fn(buf);
        if (!buf.atEnd()) return std::nullopt;
        return msg;
    } catch (const std::runtime_error&) {
        return std::nullopt;
    }
}

}

std::vector<uint8_t> HelloMessage::serialize() const {
    auto buf = beginPayload();
    buf.writeUint32(version);
    buf.writeUint64(chainHeight);
    buf.writeUint64(nonce);
    buf.writeString(userAgent);
    return buf.release();
}

std::optional<HelloMessage> HelloMessage::deserialize(const std::vector<uint8_t>& data) {
    return decodePayload<HelloMessage>(data, [](utils::ByteBuffer& buf) {
        HelloMessage m;
        m.version = buf.readUint32();
        m.chainHeight = buf.readUint64();
        m.nonce = buf.readUint64();
        m.userAgent = buf.readString();
        if (m.userAgent.size() > MAX_USER_AGENT) throw std::runtime_error("user agent too long");
        return m;
    });
}

std::vector<uint8_t> StatusRequest::serialize() const {
    return beginPayload().release();
}

std::optional<StatusRequest> StatusRequest::deserialize(const std::vector<uint8_t>& data) {
    return decodePayload<StatusRequest>(data, [](utils::ByteBuffer&) { return StatusRequest{}; });
}

std::vector<uint8_t> StatusResponse::serialize() const {
    auto buf = beginPayload();
    buf.writeUint64(chainHeight);
    buf.writeFixedBytes(tipHash.data(), tipHash.size());
    return buf.release();
}

std::optional<StatusResponse> StatusResponse::deserialize(const std::vector<uint8_t>& data) {
    return decodePayload<StatusResponse>(data, [](utils::ByteBuffer& buf) {
        StatusResponse m;
        m.chainHeight = buf.readUint64();
        buf.readFixedBytes(m.tipHash.data(), m.tipHash.size());
        return m;
    });
}

std::vector<uint8_t> ChainRequest::serialize() const {
    auto buf = beginPayload();
    buf.writeUint64(fromIndex);
    buf.writeUint32(maxBlocks);
    return buf.release();
}

std::optional<ChainRequest> ChainRequest::deserialize(const std::vector<uint8_t>& data) {
    return decodePayload<ChainRequest>(data, [](utils::ByteBuffer& buf) {
        ChainRequest m;
        m.fromIndex = buf.readUint64();
        m.maxBlocks = buf.readUint32();
        return m;
    });
}

std::vector<uint8_t> ChainResponse::serialize() const {
    auto buf = beginPayload();
    buf.writeUint64(peerHeight);
    buf.writeVarInt(blocks.size());
    for (const auto& b : blocks) b.writeTo(buf);
    return buf.release();
}

std::optional<ChainResponse> ChainResponse::deserialize(const std::vector<uint8_t>& data) {
    return decodePayload<ChainResponse>(data, [](utils::ByteBuffer& buf) {
        ChainResponse m;
        m.peerHeight = buf.readUint64();
        uint64_t count = buf.readVarInt();
        if (count > MAX_CHAIN_RESPONSE_BLOCKS) throw std::runtime_error("too many blocks");
        m.blocks.reserve(static_cast<size_t>(count));
        for (uint64_t i = 0; i < count; i++) m.blocks.push_back(core::Block::readFrom(buf));
        return m;
    });
}

std::vector<uint8_t> BlockAnnounce::serialize() const {
    auto buf = beginPayload();
    block.writeTo(buf);
    return buf.release();
}

std::optional<BlockAnnounce> BlockAnnounce::deserialize(const std::vector<uint8_t>& data) {
    return decodePayload<BlockAnnounce>(data, [](utils::ByteBuffer& buf) {
        BlockAnnounce m;
        m.block = core::Block::readFrom(buf);
        return m;
    });
}

std::vector<uint8_t> TransferAnnounce::serialize() const {
    auto buf = beginPayload();
    transfer.writeTo(buf);
    return buf.release();
}

std::optional<TransferAnnounce> TransferAnnounce::deserialize(const std::vector<uint8_t>& data) {
    return decodePayload<TransferAnnounce>(data, [](utils::ByteBuffer& buf) {
        TransferAnnounce m;
        m.transfer = core::KnowledgeTransfer::readFrom(buf);
        return m;
    });
}

std::vector<uint8_t> IdentityAnnounce::serialize() const {
    auto buf = beginPayload();
    buf.writeBytes(identity.serialize());
    return buf.release();
}

std::optional<IdentityAnnounce> IdentityAnnounce::deserialize(const std::vector<uint8_t>& data) {
    return decodePayload<IdentityAnnounce>(data, [](utils::ByteBuffer& buf) {
        auto record = core::IdentityRecord::deserialize(buf.readBytes());
        if (!record) throw std::runtime_error("malformed identity record");
        IdentityAnnounce m;
        m.identity = *record;
        return m;
    });
}

std::vector<uint8_t> PingMessage::serialize() const {
    auto buf = beginPayload();
    buf.writeUint64(nonce);
    return buf.release();
}

std::optional<PingMessage> PingMessage::deserialize(const std::vector<uint8_t>& data) {
    return decodePayload<PingMessage>(data, [](utils::ByteBuffer& buf) {
        PingMessage m;
        m.nonce = buf.readUint64();
        return m;
    });
}

}
}
