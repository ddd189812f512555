#pragma once

#include "crypto/crypto.h"
#include "infrastructure/error_handling.h"
#include "utils/config.h"
#include <string>
#include <vector>
#include <set>
#include <optional>
#include <functional>
#include <memory>
#include <cstdint>

namespace sigelnet {
namespace network {

constexpr uint32_t PROTOCOL_MAGIC = 0x5347454C;
constexpr size_t MAX_MESSAGE_SIZE = 8 * 1024 * 1024;
constexpr size_t FRAME_HEADER_SIZE = 24;
constexpr size_t COMMAND_SIZE = 12;

enum class SessionState {
    DISCONNECTED,
    CONNECTING,
    HANDSHAKING,
    SYNCED,
    RELAYING
};

const char* sessionStateName(SessionState state);

struct Session {
    std::string id;
    std::string address;
    uint16_t port = 0;
    uint32_t version = 0;
    uint64_t chainHeight = 0;
    std::string userAgent;
    bool isOutbound = false;
    SessionState state = SessionState::DISCONNECTED;
    uint64_t connectedAt = 0;
    uint64_t lastSeen = 0;
    uint64_t bytesRecv = 0;
    uint64_t bytesSent = 0;
    int socket = -1;

    bool handshaked() const {
        return state == SessionState::SYNCED || state == SessionState::RELAYING;
    }
};

struct MessageHeader {
    uint32_t magic = PROTOCOL_MAGIC;
    char command[COMMAND_SIZE] = {};
    uint32_t length = 0;
    uint32_t checksum = 0;

    std::vector<uint8_t> encode() const;
    static MessageHeader decode(const uint8_t* data);
};

struct Message {
    std::string command;
    std::vector<uint8_t> payload;
    std::string from;
    uint64_t timestamp = 0;

    Message() = default;
    Message(const std::string& cmd, std::vector<uint8_t> body)
        : command(cmd), payload(std::move(body)) {}

    // magic | command | length | checksum | payload
    std::vector<uint8_t> serialize() const;
    // Empty command when the frame is truncated or fails its checks.
    static Message deserialize(const std::vector<uint8_t>& data);
};

uint32_t payloadChecksum(const std::vector<uint8_t>& payload);

struct NetworkStats {
    uint64_t totalPeers = 0;
    uint64_t inboundPeers = 0;
    uint64_t outboundPeers = 0;
    uint64_t bytesSent = 0;
    uint64_t bytesReceived = 0;
    uint64_t messagesSent = 0;
    uint64_t messagesReceived = 0;
    uint64_t uptime = 0;
};

// TCP transport. Owns the sessions; the node drives their state through
// setState and receives traffic through the handlers.
class Network {
public:
    Network();
    ~Network();

    // Port 0 binds an ephemeral port; getPort() reports the one chosen.
    bool start(const utils::NetworkConfig& config);
    void stop();
    bool isRunning() const;

    Result<Session> connect(const std::string& address, uint16_t port);
    void disconnect(const std::string& peerId, const std::string& reason = "");

    // Sends to every handshaked session not listed in exclude. Returns the
    // number of sessions written to.
    size_t broadcast(const Message& msg, const std::set<std::string>& exclude = {});
    bool send(const std::string& peerId, const Message& msg);

    bool setState(const std::string& peerId, SessionState state);
    bool setPeerInfo(const std::string& peerId, uint32_t version, uint64_t chainHeight,
                     const std::string& userAgent);
    bool setChainHeight(const std::string& peerId, uint64_t chainHeight);

    std::vector<Session> getPeers() const;
    std::optional<Session> getPeer(const std::string& peerId) const;
    size_t peerCount() const;
    size_t outboundCount() const;

    void onMessage(std::function<void(const std::string&, const Message&)> handler);
    void onPeerConnected(std::function<void(const Session&)> handler);
    void onPeerDisconnected(std::function<void(const Session&)> handler);

    uint16_t getPort() const;
    NetworkStats getStats() const;
    utils::NetworkConfig getConfig() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
