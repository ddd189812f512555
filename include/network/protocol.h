#pragma once

#include "crypto/crypto.h"
#include "core/block.h"
#include "core/identity.h"
#include "core/transfer.h"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace sigelnet {
namespace network {

constexpr uint32_t PROTOCOL_VERSION = 1;
constexpr uint32_t MIN_PROTOCOL_VERSION = 1;
constexpr size_t MAX_CHAIN_RESPONSE_BLOCKS = 2000;
constexpr size_t MAX_USER_AGENT = 256;

enum class MessageType : uint8_t {
    HELLO,
    GET_STATUS,
    STATUS,
    GET_CHAIN,
    CHAIN,
    BLOCK,
    TRANSFER,
    IDENTITY,
    PING,
    PONG,
    UNKNOWN
};

const char* commandName(MessageType type);
MessageType commandType(const std::string& command);
// Messages a session may exchange before the handshake completes.
bool allowedBeforeHandshake(MessageType type);

struct HelloMessage {
    uint32_t version = PROTOCOL_VERSION;
    uint64_t chainHeight = 0;
    uint64_t nonce = 0;
    std::string userAgent;

    std::vector<uint8_t> serialize() const;
    static std::optional<HelloMessage> deserialize(const std::vector<uint8_t>& data);
};

struct StatusRequest {
    std::vector<uint8_t> serialize() const;
    static std::optional<StatusRequest> deserialize(const std::vector<uint8_t>& data);
};

struct StatusResponse {
    uint64_t chainHeight = 0;
    crypto::Hash256 tipHash{};

    std::vector<uint8_t> serialize() const;
    static std::optional<StatusResponse> deserialize(const std::vector<uint8_t>& data);
};

struct ChainRequest {
    uint64_t fromIndex = 0;
    uint32_t maxBlocks = 0;

    std::vector<uint8_t> serialize() const;
    static std::optional<ChainRequest> deserialize(const std::vector<uint8_t>& data);
};

struct ChainResponse {
    uint64_t peerHeight = 0;
    std::vector<core::Block> blocks;

    std::vector<uint8_t> serialize() const;
    static std::optional<ChainResponse> deserialize(const std::vector<uint8_t>& data);
};

struct BlockAnnounce {
    core::Block block;

    std::vector<uint8_t> serialize() const;
    static std::optional<BlockAnnounce> deserialize(const std::vector<uint8_t>& data);
};

struct TransferAnnounce {
    core::KnowledgeTransfer transfer;

    std::vector<uint8_t> serialize() const;
    static std::optional<TransferAnnounce> deserialize(const std::vector<uint8_t>& data);
};

struct IdentityAnnounce {
    core::IdentityRecord identity;

    std::vector<uint8_t> serialize() const;
    static std::optional<IdentityAnnounce> deserialize(const std::vector<uint8_t>& data);
};

// Ping and pong share a body.
struct PingMessage {
    uint64_t nonce = 0;

    std::vector<uint8_t> serialize() const;
    static std::optional<PingMessage> deserialize(const std::vector<uint8_t>& data);
};

}
}
