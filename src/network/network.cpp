#include "network/network.h"
#include "utils/logger.h"
#include "utils/serialize.h"
#include <unordered_map>
#include <memory>
#include <mutex>
#include <thread>
#include <atomic>
#include <chrono>
#include <array>
#include <cstring>
#include <sys/socket.h>
#include <netdb.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>

namespace sigelnet {
namespace network {

static const char* LOG_CAT_NET = "network";

namespace {

struct PeerRxState {
    std::vector<uint8_t> buffer;
};

// Write side of a session. Writers hold mtx for a whole frame so frames
// never interleave; the socket is only closed under mtx.
struct PeerTx {
    std::mutex mtx;
    int socket = -1;
    bool closed = false;

    explicit PeerTx(int fd) : socket(fd) {}
};

static constexpr size_t RX_BUFFER_LIMIT = MAX_MESSAGE_SIZE + FRAME_HEADER_SIZE + 64 * 1024;
static constexpr int POLL_INTERVAL_MS = 100;

static uint64_t nowMillis() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count());
}

static bool setNonBlocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) return false;
    if (fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) return false;
    return true;
}

static bool isValidCommand(const char command[COMMAND_SIZE]) {
    for (size_t i = 0; i < COMMAND_SIZE; ++i) {
        unsigned char c = static_cast<unsigned char>(command[i]);
        if (c == 0) return i > 0;
        if (c < 32 || c > 126) return false;
    }
    return true;
}

static bool resolveIPv4(const std::string& address, struct in_addr& out) {
    if (inet_pton(AF_INET, address.c_str(), &out) == 1) return true;
    struct addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;
    struct addrinfo* res = nullptr;
    if (getaddrinfo(address.c_str(), nullptr, &hints, &res) != 0 || !res) return false;
    out = reinterpret_cast<struct sockaddr_in*>(res->ai_addr)->sin_addr;
    freeaddrinfo(res);
    return true;
}

}

const char* sessionStateName(SessionState state) {
    switch (state) {
        case SessionState::DISCONNECTED: return "disconnected";
        case SessionState::CONNECTING: return "connecting";
        case SessionState::HANDSHAKING: return "handshaking";
        case SessionState::SYNCED: return "synced";
        case SessionState::RELAYING: return "relaying";
    }
    return "unknown";
}

uint32_t payloadChecksum(const std::vector<uint8_t>& payload) {
    crypto::Hash256 hash = crypto::doubleSha256(payload.data(), payload.size());
    return (static_cast<uint32_t>(hash[0]) << 24) | (static_cast<uint32_t>(hash[1]) << 16) |
           (static_cast<uint32_t>(hash[2]) << 8) | static_cast<uint32_t>(hash[3]);
}

std::vector<uint8_t> MessageHeader::encode() const {
    utils::ByteBuffer buf;
    buf.writeUint32(magic);
    buf.writeFixedBytes(reinterpret_cast<const uint8_t*>(command), COMMAND_SIZE);
    buf.writeUint32(length);
    buf.writeUint32(checksum);
    return buf.release();
}

MessageHeader MessageHeader::decode(const uint8_t* data) {
    utils::ByteBuffer buf(data, FRAME_HEADER_SIZE);
    MessageHeader hdr;
    hdr.magic = buf.readUint32();
    buf.readFixedBytes(reinterpret_cast<uint8_t*>(hdr.command), COMMAND_SIZE);
    hdr.length = buf.readUint32();
    hdr.checksum = buf.readUint32();
    return hdr;
}

std::vector<uint8_t> Message::serialize() const {
    MessageHeader hdr;
    std::strncpy(hdr.command, command.c_str(), COMMAND_SIZE);
    hdr.length = static_cast<uint32_t>(payload.size());
    hdr.checksum = payloadChecksum(payload);

    std::vector<uint8_t> out = hdr.encode();
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

Message Message::deserialize(const std::vector<uint8_t>& data) {
    Message msg;
    if (data.size() < FRAME_HEADER_SIZE) return msg;

    MessageHeader hdr = MessageHeader::decode(data.data());
    if (hdr.magic != PROTOCOL_MAGIC) return msg;
    if (!isValidCommand(hdr.command)) return msg;
    if (hdr.length > MAX_MESSAGE_SIZE) return msg;
    if (data.size() < FRAME_HEADER_SIZE + hdr.length) return msg;

    std::vector<uint8_t> payload(data.begin() + FRAME_HEADER_SIZE,
                                 data.begin() + FRAME_HEADER_SIZE + hdr.length);
    if (payloadChecksum(payload) != hdr.checksum) return msg;

    msg.command = std::string(hdr.command, strnlen(hdr.command, COMMAND_SIZE));
    msg.payload = std::move(payload);
    return msg;
}

struct Network::Impl {
    std::unordered_map<std::string, Session> peers;
    std::unordered_map<std::string, PeerRxState> rx;
    std::unordered_map<std::string, std::shared_ptr<PeerTx>> tx;
    std::vector<std::pair<Session, std::string>> failedSends;
    mutable std::mutex mtx;
    std::atomic<bool> running{false};
    uint16_t port = 0;
    int listenSocket = -1;
    std::thread acceptThread;
    std::thread recvThread;
    utils::NetworkConfig config;
    uint64_t startTime = 0;
    uint64_t bytesSent = 0;
    uint64_t bytesReceived = 0;
    uint64_t messagesSent = 0;
    uint64_t messagesReceived = 0;

    std::function<void(const std::string&, const Message&)> messageHandler;
    std::function<void(const Session&)> connectHandler;
    std::function<void(const Session&)> disconnectHandler;

    void acceptLoop();
    void recvLoop();
    void expireSessions();
    bool sendRaw(int sock, const std::vector<uint8_t>& data);
    // Called without mtx. A failed write drops the session at once and queues
    // the disconnect notification for the receive thread.
    bool deliver(const std::string& peerId, const std::shared_ptr<PeerTx>& out,
                 const std::vector<uint8_t>& data, const std::string& command);
    // Caller holds mtx. Closes the socket and detaches the session.
    Session removeLocked(std::unordered_map<std::string, Session>::iterator it);
    void notifyDisconnected(const Session& session, const std::string& reason);
};

static void closePeerSocket(int sock, const std::shared_ptr<PeerTx>& out) {
    if (sock < 0) return;
    // Wakes any writer blocked on this socket before we wait for it.
    shutdown(sock, SHUT_RDWR);
    if (out) {
        std::lock_guard<std::mutex> lock(out->mtx);
        out->closed = true;
    }
    close(sock);
}

Session Network::Impl::removeLocked(std::unordered_map<std::string, Session>::iterator it) {
    Session gone = it->second;
    std::shared_ptr<PeerTx> out;
    auto t = tx.find(gone.id);
    if (t != tx.end()) {
        out = t->second;
        tx.erase(t);
    }
    closePeerSocket(gone.socket, out);
    gone.socket = -1;
    gone.state = SessionState::DISCONNECTED;
    rx.erase(gone.id);
    peers.erase(it);
    return gone;
}

void Network::Impl::notifyDisconnected(const Session& session, const std::string& reason) {
    LOG_CAT(INFO, LOG_CAT_NET, "Peer " + session.id + " disconnected" +
            (reason.empty() ? "" : " (" + reason + ")"));
    std::function<void(const Session&)> handler;
    {
        std::lock_guard<std::mutex> lock(mtx);
        handler = disconnectHandler;
    }
    if (handler) handler(session);
}

void Network::Impl::acceptLoop() {
    while (running) {
        struct pollfd pfd;
        pfd.fd = listenSocket;
        pfd.events = POLLIN;

        if (poll(&pfd, 1, POLL_INTERVAL_MS) <= 0) continue;

        struct sockaddr_in clientAddr;
        socklen_t addrLen = sizeof(clientAddr);
        int clientSock = accept(listenSocket, (struct sockaddr*)&clientAddr, &addrLen);

        if (clientSock < 0) continue;

        if (!setNonBlocking(clientSock)) {
            close(clientSock);
            continue;
        }

        char addrBuf[INET_ADDRSTRLEN] = {};
        inet_ntop(AF_INET, &clientAddr.sin_addr, addrBuf, sizeof(addrBuf));
        std::string addr = addrBuf;
        uint16_t clientPort = ntohs(clientAddr.sin_port);
        std::string peerId = addr + ":" + std::to_string(clientPort);

        Session session;
        std::function<void(const Session&)> handler;
        {
            std::lock_guard<std::mutex> lock(mtx);

            size_t inboundCount = 0;
            for (const auto& kv : peers) {
                if (!kv.second.isOutbound) inboundCount++;
            }
            if (peers.size() >= config.maxPeers || inboundCount >= config.maxInbound) {
                LOG_CAT(DEBUG, LOG_CAT_NET, "Refusing inbound " + peerId + ": peer limit");
                close(clientSock);
                continue;
            }

            session.id = peerId;
            session.address = addr;
            session.port = clientPort;
            session.connectedAt = nowMillis();
            session.lastSeen = session.connectedAt;
            session.isOutbound = false;
            session.state = SessionState::HANDSHAKING;
            session.socket = clientSock;

            peers[peerId] = session;
            rx[peerId] = PeerRxState{};
            tx[peerId] = std::make_shared<PeerTx>(clientSock);
            handler = connectHandler;
        }
        LOG_CAT(INFO, LOG_CAT_NET, "Accepted peer " + peerId);
        if (handler) handler(session);
    }
}

void Network::Impl::expireSessions() {
    std::vector<std::pair<Session, std::string>> expired;
    uint64_t now = nowMillis();
    {
        std::lock_guard<std::mutex> lock(mtx);
        expired.swap(failedSends);
        for (auto it = peers.begin(); it != peers.end();) {
            const Session& s = it->second;
            std::string reason;
            if (s.state == SessionState::HANDSHAKING && now - s.connectedAt > config.handshakeTimeoutMs) {
                reason = "handshake timeout";
            } else if (s.socket >= 0 && now - s.lastSeen > config.readTimeoutMs) {
                reason = "read timeout";
            }
            if (reason.empty()) {
                ++it;
                continue;
            }
            auto victim = it++;
            expired.emplace_back(removeLocked(victim), reason);
        }
    }
    for (const auto& [session, reason] : expired) notifyDisconnected(session, reason);
}

void Network::Impl::recvLoop() {
    while (running) {
        expireSessions();

        std::vector<struct pollfd> fds;
        std::vector<std::string> peerIds;

        {
            std::lock_guard<std::mutex> lock(mtx);
            for (auto& [id, peer] : peers) {
                if (peer.socket >= 0 && peer.state != SessionState::CONNECTING) {
                    struct pollfd pfd;
                    pfd.fd = peer.socket;
                    pfd.events = POLLIN;
                    pfd.revents = 0;
                    fds.push_back(pfd);
                    peerIds.push_back(id);
                }
            }
        }

        if (fds.empty()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            continue;
        }

        int ret = poll(fds.data(), fds.size(), POLL_INTERVAL_MS);
        if (ret <= 0) continue;

        for (size_t i = 0; i < fds.size(); i++) {
            if (fds[i].revents == 0) continue;

            std::vector<Message> decoded;
            std::string dropReason;
            std::optional<Session> dropped;
            bool closed = false;
            uint64_t now = nowMillis();

            {
                std::lock_guard<std::mutex> lock(mtx);
                auto pit = peers.find(peerIds[i]);
                if (pit == peers.end() || pit->second.socket != fds[i].fd) continue;

                auto& peer = pit->second;
                auto& st = rx[peerIds[i]];

                std::array<uint8_t, 64 * 1024> tmp{};
                for (;;) {
                    ssize_t n = ::recv(peer.socket, tmp.data(), tmp.size(), 0);
                    if (n > 0) {
                        peer.lastSeen = now;
                        peer.bytesRecv += static_cast<uint64_t>(n);
                        bytesReceived += static_cast<uint64_t>(n);
                        if (st.buffer.size() + static_cast<size_t>(n) > RX_BUFFER_LIMIT) {
                            dropReason = "receive buffer overflow";
                            break;
                        }
                        st.buffer.insert(st.buffer.end(), tmp.data(), tmp.data() + n);
                        continue;
                    }
                    if (n == 0) {
                        closed = true;
                        break;
                    }
                    if (errno == EINTR) continue;
                    if (errno == EAGAIN || errno == EWOULDBLOCK) break;
                    dropReason = std::string("recv error: ") + std::strerror(errno);
                    break;
                }

                if (dropReason.empty()) {
                    size_t consumed = 0;
                    while (st.buffer.size() - consumed >= FRAME_HEADER_SIZE) {
                        MessageHeader hdr = MessageHeader::decode(st.buffer.data() + consumed);
                        if (hdr.magic != PROTOCOL_MAGIC) {
                            dropReason = "bad magic";
                            break;
                        }
                        if (!isValidCommand(hdr.command)) {
                            dropReason = "bad command";
                            break;
                        }
                        if (hdr.length > MAX_MESSAGE_SIZE) {
                            dropReason = "frame too large";
                            break;
                        }
                        const size_t total = FRAME_HEADER_SIZE + static_cast<size_t>(hdr.length);
                        if (st.buffer.size() - consumed < total) break;

                        std::vector<uint8_t> frame(
                            st.buffer.begin() + static_cast<std::ptrdiff_t>(consumed),
                            st.buffer.begin() + static_cast<std::ptrdiff_t>(consumed + total));
                        consumed += total;

                        Message msg = Message::deserialize(frame);
                        if (msg.command.empty()) {
                            dropReason = "bad checksum";
                            break;
                        }
                        msg.from = peer.id;
                        msg.timestamp = now;
                        decoded.push_back(std::move(msg));
                        messagesReceived += 1;
                    }
                    if (consumed > 0 && dropReason.empty()) {
                        st.buffer.erase(st.buffer.begin(), st.buffer.begin() + static_cast<std::ptrdiff_t>(consumed));
                    }
                }

                if (dropReason.empty() && closed) dropReason = "closed by peer";
                if (dropReason.empty() && (fds[i].revents & (POLLHUP | POLLERR | POLLNVAL)) &&
                    !(fds[i].revents & POLLIN)) {
                    dropReason = "socket error";
                }

                if (!dropReason.empty()) dropped = removeLocked(pit);
            }

            std::function<void(const std::string&, const Message&)> handler;
            {
                std::lock_guard<std::mutex> lock(mtx);
                handler = messageHandler;
            }
            if (handler) {
                for (const auto& msg : decoded) handler(peerIds[i], msg);
            }
            if (dropped) notifyDisconnected(*dropped, dropReason);
        }
    }
}

bool Network::Impl::sendRaw(int sock, const std::vector<uint8_t>& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(sock, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n > 0) {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            struct pollfd pfd;
            pfd.fd = sock;
            pfd.events = POLLOUT;
            int pr = poll(&pfd, 1, 250);
            if (pr <= 0) return false;
            continue;
        }
        return false;
    }
    return true;
}

bool Network::Impl::deliver(const std::string& peerId, const std::shared_ptr<PeerTx>& out,
                            const std::vector<uint8_t>& data, const std::string& command) {
    bool written = false;
    {
        std::lock_guard<std::mutex> lock(out->mtx);
        written = !out->closed && sendRaw(out->socket, data);
    }

    std::lock_guard<std::mutex> lock(mtx);
    auto t = tx.find(peerId);
    auto it = peers.find(peerId);
    if (t == tx.end() || t->second != out || it == peers.end()) return false;
    if (written) {
        it->second.bytesSent += data.size();
        bytesSent += data.size();
        messagesSent++;
        return true;
    }
    // Reported by the receive thread.
    failedSends.emplace_back(removeLocked(it), "send of " + command + " failed");
    return false;
}

Network::Network() : impl_(std::make_unique<Impl>()) {}

Network::~Network() { stop(); }

bool Network::start(const utils::NetworkConfig& config) {
    if (impl_->running) return false;

    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        impl_->config = config;
    }

    int sock = socket(AF_INET, SOCK_STREAM, 0);
    if (sock < 0) {
        LOG_CAT(ERROR, LOG_CAT_NET, std::string("socket() failed: ") + std::strerror(errno));
        return false;
    }

    int opt = 1;
    setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
    setNonBlocking(sock);

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(config.port);
    if (config.bindAddress.empty() || config.bindAddress == "0.0.0.0") {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, config.bindAddress.c_str(), &addr.sin_addr) != 1) {
        LOG_CAT(ERROR, LOG_CAT_NET, "Invalid bind address " + config.bindAddress);
        close(sock);
        return false;
    }

    if (bind(sock, (struct sockaddr*)&addr, sizeof(addr)) != 0 || listen(sock, 16) != 0) {
        LOG_CAT(ERROR, LOG_CAT_NET, "Failed to listen on " + config.bindAddress + ":" +
                std::to_string(config.port) + ": " + std::strerror(errno));
        close(sock);
        return false;
    }

    struct sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (getsockname(sock, (struct sockaddr*)&bound, &len) != 0) {
        LOG_CAT(ERROR, LOG_CAT_NET, std::string("getsockname() failed: ") + std::strerror(errno));
        close(sock);
        return false;
    }

    impl_->listenSocket = sock;
    impl_->port = ntohs(bound.sin_port);
    impl_->running = true;
    impl_->startTime = nowMillis();
    impl_->acceptThread = std::thread(&Impl::acceptLoop, impl_.get());
    impl_->recvThread = std::thread(&Impl::recvLoop, impl_.get());
    LOG_CAT(INFO, LOG_CAT_NET, "Listening on port " + std::to_string(impl_->port));
    return true;
}

void Network::stop() {
    if (!impl_->running) return;

    impl_->running = false;

    if (impl_->acceptThread.joinable()) impl_->acceptThread.join();
    if (impl_->recvThread.joinable()) impl_->recvThread.join();

    if (impl_->listenSocket >= 0) {
        close(impl_->listenSocket);
        impl_->listenSocket = -1;
    }

    std::lock_guard<std::mutex> lock(impl_->mtx);
    for (auto& [id, peer] : impl_->peers) {
        auto t = impl_->tx.find(id);
        closePeerSocket(peer.socket, t != impl_->tx.end() ? t->second : nullptr);
        peer.socket = -1;
    }
    impl_->peers.clear();
    impl_->rx.clear();
    impl_->tx.clear();
    impl_->failedSends.clear();
    impl_->port = 0;
}

bool Network::isRunning() const {
    return impl_->running;
}

Result<Session> Network::connect(const std::string& address, uint16_t port) {
    if (!impl_->running) {
        return makeError(ErrorCode::INVALID_STATE, "network not started");
    }

    std::string peerId = address + ":" + std::to_string(port);
    uint32_t connectTimeoutMs = 0;
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        if (impl_->peers.count(peerId)) {
            return makeError(ErrorCode::ALREADY_EXISTS, "already connected to " + peerId);
        }
        size_t outbound = 0;
        for (const auto& kv : impl_->peers) {
            if (kv.second.isOutbound) outbound++;
        }
        if (outbound >= impl_->config.maxOutbound || impl_->peers.size() >= impl_->config.maxPeers) {
            return makeError(ErrorCode::RESOURCE_EXHAUSTED, "outbound peer limit reached");
        }

        Session pending;
        pending.id = peerId;
        pending.address = address;
        pending.port = port;
        pending.isOutbound = true;
        pending.state = SessionState::CONNECTING;
        pending.connectedAt = nowMillis();
        pending.lastSeen = pending.connectedAt;
        impl_->peers[peerId] = pending;
        connectTimeoutMs = impl_->config.connectTimeoutMs;
    }

    auto fail = [this, &peerId](const std::string& why) -> Result<Session> {
        {
            std::lock_guard<std::mutex> lock(impl_->mtx);
            auto it = impl_->peers.find(peerId);
            if (it != impl_->peers.end() && it->second.state == SessionState::CONNECTING) {
                impl_->peers.erase(it);
            }
        }
        LOG_CAT(WARN, LOG_CAT_NET, "Connect to " + peerId + " failed: " + why);
        return makeError(ErrorCode::TRANSPORT_ERROR, "connect to " + peerId + " failed: " + why);
    };

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (!resolveIPv4(address, addr.sin_addr)) return fail("cannot resolve host");

    int sock = socket(AF_INET, SOCK_STREAM, 0);
    if (sock < 0) return fail(std::strerror(errno));
    if (!setNonBlocking(sock)) {
        close(sock);
        return fail("cannot set non-blocking");
    }

    if (::connect(sock, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        if (errno != EINPROGRESS) {
            std::string err = std::strerror(errno);
            close(sock);
            return fail(err);
        }
        struct pollfd pfd;
        pfd.fd = sock;
        pfd.events = POLLOUT;
        int pr = poll(&pfd, 1, static_cast<int>(connectTimeoutMs));
        if (pr <= 0) {
            close(sock);
            return fail("timed out");
        }
        int soError = 0;
        socklen_t len = sizeof(soError);
        if (getsockopt(sock, SOL_SOCKET, SO_ERROR, &soError, &len) != 0 || soError != 0) {
            close(sock);
            return fail(std::strerror(soError != 0 ? soError : errno));
        }
    }

    Session session;
    std::function<void(const Session&)> handler;
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        auto it = impl_->peers.find(peerId);
        if (it == impl_->peers.end() || !impl_->running) {
            close(sock);
            return makeError(ErrorCode::TRANSPORT_ERROR, "connection to " + peerId + " abandoned");
        }
        it->second.socket = sock;
        impl_->tx[peerId] = std::make_shared<PeerTx>(sock);
        it->second.state = SessionState::HANDSHAKING;
        it->second.connectedAt = nowMillis();
        it->second.lastSeen = it->second.connectedAt;
        impl_->rx[peerId] = PeerRxState{};
        session = it->second;
        handler = impl_->connectHandler;
    }
    LOG_CAT(INFO, LOG_CAT_NET, "Connected to " + peerId);
    if (handler) handler(session);
    return session;
}

void Network::disconnect(const std::string& peerId, const std::string& reason) {
    std::optional<Session> gone;
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        auto it = impl_->peers.find(peerId);
        if (it != impl_->peers.end() && it->second.state != SessionState::CONNECTING) {
            gone = impl_->removeLocked(it);
        }
    }
    if (gone) impl_->notifyDisconnected(*gone, reason);
}

size_t Network::broadcast(const Message& msg, const std::set<std::string>& exclude) {
    if (msg.payload.size() > MAX_MESSAGE_SIZE) {
        LOG_CAT(WARN, LOG_CAT_NET, "Not broadcasting oversized " + msg.command);
        return 0;
    }
    std::vector<uint8_t> data = msg.serialize();

    std::vector<std::pair<std::string, std::shared_ptr<PeerTx>>> targets;
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        for (const auto& [id, peer] : impl_->peers) {
            if (!peer.handshaked() || peer.socket < 0) continue;
            if (exclude.count(id)) continue;
            auto t = impl_->tx.find(id);
            if (t != impl_->tx.end()) targets.emplace_back(id, t->second);
        }
    }

    size_t sent = 0;
    for (const auto& [id, out] : targets) {
        if (impl_->deliver(id, out, data, msg.command)) sent++;
    }
    return sent;
}

bool Network::send(const std::string& peerId, const Message& msg) {
    if (msg.payload.size() > MAX_MESSAGE_SIZE) {
        LOG_CAT(WARN, LOG_CAT_NET, "Not sending oversized " + msg.command + " to " + peerId);
        return false;
    }
    std::vector<uint8_t> data = msg.serialize();

    std::shared_ptr<PeerTx> out;
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        auto it = impl_->peers.find(peerId);
        if (it == impl_->peers.end() || it->second.socket < 0) return false;
        auto t = impl_->tx.find(peerId);
        if (t == impl_->tx.end()) return false;
        out = t->second;
    }
    return impl_->deliver(peerId, out, data, msg.command);
}

bool Network::setState(const std::string& peerId, SessionState state) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->peers.find(peerId);
    if (it == impl_->peers.end()) return false;
    if (it->second.state != state) {
        LOG_CAT(TRACE, LOG_CAT_NET, "Session " + peerId + " " + sessionStateName(it->second.state) +
                " -> " + sessionStateName(state));
    }
    it->second.state = state;
    return true;
}

bool Network::setPeerInfo(const std::string& peerId, uint32_t version, uint64_t chainHeight,
                          const std::string& userAgent) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->peers.find(peerId);
    if (it == impl_->peers.end()) return false;
    it->second.version = version;
    it->second.chainHeight = chainHeight;
    it->second.userAgent = userAgent;
    return true;
}

bool Network::setChainHeight(const std::string& peerId, uint64_t chainHeight) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->peers.find(peerId);
    if (it == impl_->peers.end()) return false;
    it->second.chainHeight = chainHeight;
    return true;
}

std::vector<Session> Network::getPeers() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::vector<Session> result;
    for (const auto& [id, peer] : impl_->peers) {
        if (peer.state != SessionState::CONNECTING) result.push_back(peer);
    }
    return result;
}

std::optional<Session> Network::getPeer(const std::string& peerId) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->peers.find(peerId);
    if (it == impl_->peers.end()) return std::nullopt;
    return it->second;
}

size_t Network::peerCount() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    size_t count = 0;
    for (const auto& [id, peer] : impl_->peers) {
        if (peer.state != SessionState::CONNECTING) count++;
    }
    return count;
}

size_t Network::outboundCount() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    size_t count = 0;
    for (const auto& [id, peer] : impl_->peers) {
        if (peer.isOutbound && peer.state != SessionState::CONNECTING) count++;
    }
    return count;
}

void Network::onMessage(std::function<void(const std::string&, const Message&)> handler) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->messageHandler = std::move(handler);
}

void Network::onPeerConnected(std::function<void(const Session&)> handler) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->connectHandler = std::move(handler);
}

void Network::onPeerDisconnected(std::function<void(const Session&)> handler) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->disconnectHandler = std::move(handler);
}

uint16_t Network::getPort() const {
    return impl_->port;
}

NetworkStats Network::getStats() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    NetworkStats stats;
    stats.bytesSent = impl_->bytesSent;
    stats.bytesReceived = impl_->bytesReceived;
    stats.messagesSent = impl_->messagesSent;
    stats.messagesReceived = impl_->messagesReceived;
    stats.uptime = impl_->running ? (nowMillis() - impl_->startTime) / 1000 : 0;

    for (const auto& [id, peer] : impl_->peers) {
        if (peer.state == SessionState::CONNECTING) continue;
        stats.totalPeers++;
        if (peer.isOutbound) stats.outboundPeers++;
        else stats.inboundPeers++;
    }
    return stats;
}

utils::NetworkConfig Network::getConfig() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->config;
}

}
}
