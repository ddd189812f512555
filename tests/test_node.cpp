#include <gtest/gtest.h>
#include "chain_fixtures.h"
#include "network/network.h"
#include "network/protocol.h"
#include "node/node.h"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>
#include <thread>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace sigelnet;
using namespace sigelnet::fixtures;

namespace {

constexpr uint64_t kAttempts = 1000000;

template<typename Pred>
bool waitFor(Pred pred, int timeoutMs = 10000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return pred();
}

node::NodeConfig testConfig() {
    node::NodeConfig c;
    c.chain = easyParams();
    c.network.bindAddress = "127.0.0.1";
    c.network.port = 0;
    c.network.handshakeTimeoutMs = 3000;
    c.mining.attemptsPerRound = 5000;
    return c;
}

// Listening socket that accepts nothing and never speaks.
int listenSilent(uint16_t& port) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return -1;
    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    socklen_t len = sizeof(addr);
    if (bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0 || listen(fd, 4) != 0 ||
        getsockname(fd, reinterpret_cast<struct sockaddr*>(&addr), &len) != 0) {
        close(fd);
        return -1;
    }
    port = ntohs(addr.sin_port);
    return fd;
}

int connectRaw(uint16_t port) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return -1;
    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = htons(port);
    if (::connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0) {
        close(fd);
        return -1;
    }
    return fd;
}

// Drains the socket until the peer closes it or the timeout passes.
bool closedByPeer(int fd, int timeoutMs) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    uint8_t buf[4096];
    while (std::chrono::steady_clock::now() < deadline) {
        struct pollfd pfd{fd, POLLIN, 0};
        if (poll(&pfd, 1, 50) <= 0) continue;
        ssize_t n = recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) return true;
    }
    return false;
}

bool recvExact(int fd, uint8_t* out, size_t n, std::chrono::steady_clock::time_point deadline) {
    size_t got = 0;
    while (got < n) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (left <= 0) return false;
        struct pollfd pfd{fd, POLLIN, 0};
        if (poll(&pfd, 1, static_cast<int>(left)) <= 0) return false;
        ssize_t r = recv(fd, out + got, n - got, 0);
        if (r <= 0) return false;
        got += static_cast<size_t>(r);
    }
    return true;
}

std::optional<network::Message> readFrame(int fd, int timeoutMs) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    std::vector<uint8_t> frame(network::FRAME_HEADER_SIZE);
    if (!recvExact(fd, frame.data(), frame.size(), deadline)) return std::nullopt;
    network::MessageHeader hdr = network::MessageHeader::decode(frame.data());
    if (hdr.length > network::MAX_MESSAGE_SIZE) return std::nullopt;
    frame.resize(network::FRAME_HEADER_SIZE + hdr.length);
    if (hdr.length > 0 &&
        !recvExact(fd, frame.data() + network::FRAME_HEADER_SIZE, hdr.length, deadline)) {
        return std::nullopt;
    }
    network::Message msg = network::Message::deserialize(frame);
    if (msg.command.empty()) return std::nullopt;
    return msg;
}

// Skips other traffic until a frame of the given type arrives.
std::optional<network::Message> awaitFrame(int fd, network::MessageType type, int timeoutMs = 5000) {
    for (;;) {
        auto msg = readFrame(fd, timeoutMs);
        if (!msg || network::commandType(msg->command) == type) return msg;
    }
}

bool sendFrame(int fd, network::MessageType type, const std::vector<uint8_t>& payload) {
    auto data = network::Message(network::commandName(type), payload).serialize();
    return send(fd, data.data(), data.size(), MSG_NOSIGNAL) == static_cast<ssize_t>(data.size());
}

// Plays the remote side of the hello exchange on a raw socket.
bool rawHandshake(int fd) {
    network::HelloMessage hello;
    hello.nonce = 0x5eed5eed5eedULL;
    hello.userAgent = "raw-peer";
    if (!sendFrame(fd, network::MessageType::HELLO, hello.serialize())) return false;
    return awaitFrame(fd, network::MessageType::HELLO).has_value();
}

// Round-trips a ping so everything sent before it has been handled.
bool pingPong(int fd) {
    network::PingMessage ping;
    ping.nonce = 77;
    if (!sendFrame(fd, network::MessageType::PING, ping.serialize())) return false;
    return awaitFrame(fd, network::MessageType::PONG).has_value();
}

}

class NodeTest : public ::testing::Test {
protected:
    void TearDown() override {
        for (auto& n : nodes) n->stop();
        nodes.clear();
    }

    node::Node& startNode(const node::NodeConfig& config = testConfig()) {
        nodes.push_back(std::make_unique<node::Node>(config));
        auto res = nodes.back()->start();
        EXPECT_TRUE(res.ok()) << res.error().message;
        return *nodes.back();
    }

    static uint16_t portOf(node::Node& n) { return n.status().port; }

    static bool sameTip(node::Node& a, node::Node& b) {
        return a.status().tipHash == b.status().tipHash;
    }

    std::vector<std::unique_ptr<node::Node>> nodes;
};

TEST_F(NodeTest, StartsAtGenesis) {
    node::Node& a = startNode();
    node::NodeStatus s = a.status();
    EXPECT_TRUE(a.isRunning());
    EXPECT_EQ(s.height, 0u);
    EXPECT_EQ(s.tipHash, core::Ledger::createGenesisBlock(easyParams()).hash);
    EXPECT_NE(s.port, 0);
    EXPECT_EQ(s.knownPeers, 0u);

    auto again = a.start();
    ASSERT_FALSE(again.ok());
    EXPECT_EQ(again.error().code, ErrorCode::INVALID_STATE);
}

TEST_F(NodeTest, RejectsInvalidChainParameters) {
    node::NodeConfig config = testConfig();
    config.chain.retargetInterval = 0;
    node::Node n(config);
    auto res = n.start();
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error().code, ErrorCode::INVALID_ARGUMENT);
}

TEST_F(NodeTest, PeerCatchesUpOnConnect) {
    node::Node& a = startNode();
    auto miner = a.createIdentity("miner");
    ASSERT_TRUE(miner.ok());
    auto block = a.mineBlock(miner.value().id, kAttempts);
    ASSERT_TRUE(block.ok());
    EXPECT_EQ(block.value().index, 1u);
    EXPECT_EQ(block.value().previousHash, core::Ledger::createGenesisBlock(easyParams()).hash);
    EXPECT_EQ(a.status().height, 1u);

    node::Node& b = startNode();
    EXPECT_EQ(b.status().height, 0u);
    auto session = b.connect("127.0.0.1", portOf(a));
    ASSERT_TRUE(session.ok()) << session.error().message;
    EXPECT_TRUE(session.value().handshaked());
    EXPECT_EQ(session.value().chainHeight, 1u);

    ASSERT_TRUE(waitFor([&] { return b.status().height == 1; }));
    EXPECT_TRUE(sameTip(a, b));
    EXPECT_TRUE(b.identities().contains(miner.value().id));
    EXPECT_FALSE(b.identities().isLocal(miner.value().id));
}

TEST_F(NodeTest, TransferIsEmbeddedOnce) {
    node::Node& a = startNode();
    auto x = a.createIdentity("x").value();
    auto y = a.createIdentity("y").value();
    ASSERT_TRUE(a.mineBlock(x.id, kAttempts).ok());

    auto t = a.transfer(x.id, y.id, "Mathematics", {'p', 'y', 't', 'h'});
    ASSERT_TRUE(t.ok()) << t.error().message;
    EXPECT_EQ(a.status().pendingTransfers, 1u);

    auto block2 = a.mineBlock(x.id, kAttempts);
    ASSERT_TRUE(block2.ok());
    EXPECT_EQ(block2.value().index, 2u);
    ASSERT_EQ(block2.value().transactions.size(), 1u);
    EXPECT_EQ(block2.value().transactions[0], t.value());
    EXPECT_EQ(a.status().pendingTransfers, 0u);

    auto received = a.knowledge().getByIdentity(y.id);
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0].topic, "Mathematics");
    EXPECT_EQ(received[0].blockIndex, 2u);

    auto resubmit = a.submitTransfer(t.value());
    ASSERT_FALSE(resubmit.ok());
    EXPECT_EQ(resubmit.error().code, ErrorCode::VALIDATION_ERROR);

    core::Block block3 = mineOn(a.ledger().snapshot(), x, easyParams(), {t.value()});
    auto embedded = a.submitBlock(block3);
    ASSERT_FALSE(embedded.ok());
    EXPECT_EQ(embedded.error().code, ErrorCode::VALIDATION_ERROR);
    EXPECT_EQ(a.status().height, 2u);

    auto next = a.mineBlock(x.id, kAttempts);
    ASSERT_TRUE(next.ok());
    EXPECT_TRUE(next.value().transactions.empty());
}

TEST_F(NodeTest, DuplicatePendingTransferRejected) {
    node::Node& a = startNode();
    auto x = a.createIdentity("x").value();
    auto y = a.createIdentity("y").value();
    auto t = a.transfer(x.id, y.id, "Mathematics", {1});
    ASSERT_TRUE(t.ok());

    auto dup = a.submitTransfer(t.value());
    ASSERT_FALSE(dup.ok());
    EXPECT_EQ(dup.error().code, ErrorCode::ALREADY_EXISTS);

    auto unknown = a.transfer(x.id, "00112233445566778899aabbccddeeff", "Mathematics", {1});
    ASSERT_FALSE(unknown.ok());
    EXPECT_EQ(unknown.error().code, ErrorCode::VALIDATION_ERROR);
}

TEST_F(NodeTest, StaleBlockIsConsensusConflict) {
    node::Node& a = startNode();
    auto x = a.createIdentity("x").value();
    core::Block b = mineOn(a.ledger().snapshot(), x, easyParams());
    ASSERT_TRUE(a.submitBlock(b).ok());

    auto again = a.submitBlock(b);
    ASSERT_FALSE(again.ok());
    EXPECT_EQ(again.error().code, ErrorCode::CONSENSUS_CONFLICT);

    core::Block forged = mineOn(a.ledger().snapshot(), x, easyParams());
    forged.nonce++;
    auto bad = a.submitBlock(forged);
    ASSERT_FALSE(bad.ok());
    EXPECT_EQ(bad.error().code, ErrorCode::VALIDATION_ERROR);
}

TEST_F(NodeTest, BlocksAndTransfersRelayToPeers) {
    node::Node& a = startNode();
    node::Node& b = startNode();
    ASSERT_TRUE(b.connect("127.0.0.1", portOf(a)).ok());
    ASSERT_TRUE(waitFor([&] { return a.status().syncedPeers == 1; }));

    auto x = a.createIdentity("x").value();
    auto y = a.createIdentity("y").value();
    ASSERT_TRUE(waitFor([&] { return b.identities().contains(x.id) && b.identities().contains(y.id); }));

    ASSERT_TRUE(a.mineBlock(x.id, kAttempts).ok());
    ASSERT_TRUE(a.mineBlock(x.id, kAttempts).ok());
    ASSERT_TRUE(waitFor([&] { return b.status().height == 2; }));
    EXPECT_TRUE(sameTip(a, b));

    auto t = a.transfer(x.id, y.id, "Astronomy", {'s', 't', 'a', 'r'});
    ASSERT_TRUE(t.ok());
    ASSERT_TRUE(waitFor([&] { return b.pool().contains(t.value().contentHash()); }));

    ASSERT_TRUE(a.mineBlock(x.id, kAttempts).ok());
    ASSERT_TRUE(waitFor([&] { return b.status().height == 3; }));
    EXPECT_EQ(b.pool().size(), 0u);
    EXPECT_EQ(b.knowledge().getTopics(y.id), (std::vector<std::string>{"Astronomy"}));
}

TEST_F(NodeTest, HeavierChainReplacesLocalFork) {
    node::Node& a = startNode();
    node::Node& b = startNode();
    auto x = a.createIdentity("x").value();
    auto y = a.createIdentity("y").value();
    auto t = a.transfer(x.id, y.id, "Mathematics", {'e'});
    ASSERT_TRUE(t.ok());
    auto aBlock = a.mineBlock(x.id, kAttempts);
    ASSERT_TRUE(aBlock.ok());
    ASSERT_EQ(aBlock.value().transactions.size(), 1u);
    EXPECT_EQ(a.knowledge().count(), 1u);

    auto z = b.createIdentity("z").value();
    for (int i = 0; i < 3; i++) ASSERT_TRUE(b.mineBlock(z.id, kAttempts).ok());

    ASSERT_TRUE(a.connect("127.0.0.1", portOf(b)).ok());
    ASSERT_TRUE(waitFor([&] { return sameTip(a, b); }));
    EXPECT_EQ(a.status().height, 3u);
    EXPECT_FALSE(a.ledger().containsTransfer(t.value().contentHash()));
    EXPECT_EQ(a.knowledge().count(), 0u);
    EXPECT_TRUE(a.pool().contains(t.value().contentHash()));
}

TEST_F(NodeTest, RacingMinersConverge) {
    node::Node& a = startNode();
    node::Node& b = startNode();
    ASSERT_TRUE(b.connect("127.0.0.1", portOf(a)).ok());
    auto x = a.createIdentity("x").value();
    auto z = b.createIdentity("z").value();

    std::atomic<bool> go{false};
    std::thread ta([&] {
        while (!go) std::this_thread::yield();
        EXPECT_TRUE(a.mineBlock(x.id, kAttempts).ok());
    });
    std::thread tb([&] {
        while (!go) std::this_thread::yield();
        EXPECT_TRUE(b.mineBlock(z.id, kAttempts).ok());
    });
    go = true;
    ta.join();
    tb.join();

    node::Node& leader = b.status().height > a.status().height ? b : a;
    ASSERT_TRUE(leader.mineBlock(&leader == &a ? x.id : z.id, kAttempts).ok());
    ASSERT_TRUE(waitFor([&] { return sameTip(a, b); }));
    EXPECT_TRUE(a.ledger().verifyChain());
    EXPECT_TRUE(b.ledger().verifyChain());
}

TEST_F(NodeTest, SelfConnectionRefused) {
    node::Node& a = startNode();
    auto res = a.connect("127.0.0.1", portOf(a));
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error().code, ErrorCode::TRANSPORT_ERROR);
    EXPECT_TRUE(waitFor([&] { return a.peers().empty(); }));
}

TEST_F(NodeTest, ConnectArgumentErrors) {
    node::Node& a = startNode();
    auto res = a.connect("127.0.0.1", 1, "ffffffffffffffffffffffffffffffff");
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error().code, ErrorCode::NOT_FOUND);

    node::Node idle(testConfig());
    auto notRunning = idle.connect("127.0.0.1", portOf(a));
    ASSERT_FALSE(notRunning.ok());
    EXPECT_EQ(notRunning.error().code, ErrorCode::INVALID_STATE);
}

TEST_F(NodeTest, HandshakeTimesOutAgainstSilentListener) {
    uint16_t port = 0;
    int listener = listenSilent(port);
    ASSERT_GE(listener, 0);

    node::NodeConfig config = testConfig();
    config.network.handshakeTimeoutMs = 300;
    node::Node& a = startNode(config);

    auto started = std::chrono::steady_clock::now();
    auto res = a.connect("127.0.0.1", port);
    auto elapsed = std::chrono::steady_clock::now() - started;
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error().code, ErrorCode::TRANSPORT_ERROR);
    EXPECT_LT(elapsed, std::chrono::seconds(3));
    EXPECT_TRUE(waitFor([&] { return a.peers().empty(); }, 2000));
    close(listener);
}

TEST_F(NodeTest, SilentInboundPeerIsDropped) {
    node::NodeConfig config = testConfig();
    config.network.handshakeTimeoutMs = 300;
    node::Node& a = startNode(config);

    int fd = connectRaw(portOf(a));
    ASSERT_GE(fd, 0);
    EXPECT_TRUE(closedByPeer(fd, 3000));
    EXPECT_TRUE(waitFor([&] { return a.peers().empty(); }, 2000));
    close(fd);
}

TEST_F(NodeTest, TrafficBeforeHandshakeDisconnects) {
    node::Node& a = startNode();
    int fd = connectRaw(portOf(a));
    ASSERT_GE(fd, 0);

    network::ChainRequest req;
    req.fromIndex = 0;
    auto frame = network::Message(network::commandName(network::MessageType::GET_CHAIN), req.serialize())
                     .serialize();
    ASSERT_EQ(send(fd, frame.data(), frame.size(), MSG_NOSIGNAL), static_cast<ssize_t>(frame.size()));
    EXPECT_TRUE(closedByPeer(fd, 3000));
    close(fd);
}

TEST_F(NodeTest, PeerCannotOverwriteLocalIdentity) {
    node::Node& a = startNode();
    auto x = a.createIdentity("x").value();
    int fd = connectRaw(portOf(a));
    ASSERT_GE(fd, 0);
    ASSERT_TRUE(rawHandshake(fd));

    network::IdentityAnnounce ann;
    ann.identity = x;
    ann.identity.name = "hijacked";
    ann.identity.dimensionalAwareness = 0.0;
    ann.identity.trainingIterations = x.trainingIterations + 100;
    ASSERT_TRUE(sendFrame(fd, network::MessageType::IDENTITY, ann.serialize()));
    ASSERT_TRUE(pingPong(fd));

    auto stored = a.identities().get(x.id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(*stored, x);
    EXPECT_TRUE(a.identities().isLocal(x.id));
    EXPECT_TRUE(a.mineBlock(x.id, kAttempts).ok());
    close(fd);
}

TEST_F(NodeTest, ConnectAnnouncesChosenIdentityFirst) {
    uint16_t port = 0;
    int listener = listenSilent(port);
    ASSERT_GE(listener, 0);

    node::Node& a = startNode();
    std::vector<std::string> ids;
    for (int i = 0; i < 4; i++) ids.push_back(a.createIdentity("id" + std::to_string(i)).value().id);
    const std::string lead = *std::max_element(ids.begin(), ids.end());

    std::vector<std::string> announced;
    std::thread remote([&] {
        struct pollfd pfd{listener, POLLIN, 0};
        if (poll(&pfd, 1, 5000) <= 0) return;
        int fd = accept(listener, nullptr, nullptr);
        if (fd < 0) return;
        if (rawHandshake(fd)) {
            while (announced.size() < ids.size()) {
                auto msg = awaitFrame(fd, network::MessageType::IDENTITY);
                if (!msg) break;
                auto ann = network::IdentityAnnounce::deserialize(msg->payload);
                if (ann) announced.push_back(ann->identity.id);
            }
        }
        close(fd);
    });

    auto res = a.connect("127.0.0.1", port, lead);
    remote.join();
    close(listener);
    ASSERT_TRUE(res.ok()) << res.error().message;
    ASSERT_EQ(announced.size(), ids.size());
    EXPECT_EQ(announced.front(), lead);
}

TEST_F(NodeTest, NetworkHeightFollowsLedgerWithRacingMiners) {
    node::Node& a = startNode();
    auto x = a.createIdentity("x").value();
    auto y = a.createIdentity("y").value();
    ASSERT_TRUE(a.mine(x.id, true).ok());
    ASSERT_TRUE(a.mine(y.id, true).ok());
    ASSERT_TRUE(waitFor([&] { return a.status().height >= 8; }));
    ASSERT_TRUE(a.stopMining(x.id).ok());
    ASSERT_TRUE(a.stopMining(y.id).ok());

    node::NodeStatus s = a.status();
    EXPECT_EQ(s.networkHeight, s.height);
}

TEST_F(NodeTest, MiningControl) {
    node::Node& a = startNode();
    auto x = a.createIdentity("x").value();

    auto unknown = a.mine("ffffffffffffffffffffffffffffffff", true);
    ASSERT_FALSE(unknown.ok());
    EXPECT_EQ(unknown.error().code, ErrorCode::NOT_FOUND);

    auto notMining = a.stopMining(x.id);
    ASSERT_FALSE(notMining.ok());
    EXPECT_EQ(notMining.error().code, ErrorCode::NOT_FOUND);

    ASSERT_TRUE(a.mine(x.id, true).ok());
    EXPECT_EQ(a.status().activeMiners, (std::vector<std::string>{x.id}));
    ASSERT_TRUE(waitFor([&] { return a.status().height >= 3; }));
    ASSERT_TRUE(a.stopMining(x.id).ok());
    EXPECT_TRUE(a.status().activeMiners.empty());
    EXPECT_TRUE(a.ledger().verifyChain());
}

class NetworkSendTest : public ::testing::Test {
protected:
    void SetUp() override {
        utils::NetworkConfig config;
        config.bindAddress = "127.0.0.1";
        config.port = 0;
        config.handshakeTimeoutMs = 60000;
        config.readTimeoutMs = 60000;
        net.onPeerConnected([this](const network::Session& s) {
            std::lock_guard<std::mutex> lock(mtx);
            connected = s.id;
        });
        net.onPeerDisconnected([this](const network::Session& s) {
            std::lock_guard<std::mutex> lock(mtx);
            dropped.push_back(s.id);
        });
        ASSERT_TRUE(net.start(config));

        // The raw client never reads, so its receive window fills up.
        fd = connectRaw(net.getPort());
        ASSERT_GE(fd, 0);
        ASSERT_TRUE(waitFor([&] {
            std::lock_guard<std::mutex> lock(mtx);
            return !connected.empty();
        }));
        std::lock_guard<std::mutex> lock(mtx);
        peerId = connected;
    }

    void TearDown() override {
        net.stop();
        if (fd >= 0) close(fd);
    }

    size_t dropCount() {
        std::lock_guard<std::mutex> lock(mtx);
        return static_cast<size_t>(std::count(dropped.begin(), dropped.end(), peerId));
    }

    static network::Message bigMessage() {
        return network::Message("filler", std::vector<uint8_t>(4 * 1024 * 1024, 0x5a));
    }

    std::mutex mtx;
    std::string connected;
    std::vector<std::string> dropped;
    std::string peerId;
    int fd = -1;
    network::Network net;
};

TEST_F(NetworkSendTest, StalledPeerIsDroppedOnSend) {
    network::Message big = bigMessage();
    bool failed = false;
    for (int i = 0; i < 64 && !failed; i++) failed = !net.send(peerId, big);
    ASSERT_TRUE(failed);

    EXPECT_FALSE(net.getPeer(peerId).has_value());
    EXPECT_EQ(net.peerCount(), 0u);
    EXPECT_FALSE(net.send(peerId, network::Message("ping", {1})));
    EXPECT_TRUE(waitFor([&] { return dropCount() == 1; }, 3000));
}

TEST_F(NetworkSendTest, StalledPeerIsDroppedOnBroadcastWithoutBlockingOthers) {
    ASSERT_TRUE(net.setState(peerId, network::SessionState::SYNCED));
    network::Message big = bigMessage();

    std::atomic<bool> done{false};
    size_t lastReach = 1;
    std::thread sender([&] {
        for (int i = 0; i < 64 && lastReach > 0; i++) lastReach = net.broadcast(big);
        done = true;
    });

    auto slowest = std::chrono::steady_clock::duration::zero();
    while (!done) {
        auto started = std::chrono::steady_clock::now();
        net.getPeers();
        slowest = std::max(slowest, std::chrono::steady_clock::now() - started);
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    sender.join();

    EXPECT_EQ(lastReach, 0u);
    EXPECT_LT(slowest, std::chrono::milliseconds(150));
    EXPECT_FALSE(net.getPeer(peerId).has_value());
    EXPECT_TRUE(waitFor([&] { return dropCount() == 1; }, 3000));
    EXPECT_EQ(net.broadcast(big), 0u);
}

TEST(NodePersistenceTest, RestartKeepsChainAndIdentities) {
    auto dir = std::filesystem::temp_directory_path() / "sigelnet_test_node";
    std::filesystem::remove_all(dir);

    node::NodeConfig config = testConfig();
    config.dataDir = dir.string();
    config.listen = false;

    std::string id;
    crypto::Hash256 tip{};
    {
        node::Node n(config);
        ASSERT_TRUE(n.start().ok());
        auto x = n.createIdentity("keeper").value();
        auto y = n.createIdentity("reader").value();
        id = x.id;
        ASSERT_TRUE(n.mineBlock(id, kAttempts).ok());
        ASSERT_TRUE(n.transfer(x.id, y.id, "Mathematics", {'m'}).ok());
        ASSERT_TRUE(n.mineBlock(id, kAttempts).ok());
        tip = n.status().tipHash;
        n.stop();
    }
    {
        node::Node n(config);
        ASSERT_TRUE(n.start().ok());
        node::NodeStatus s = n.status();
        EXPECT_EQ(s.height, 2u);
        EXPECT_EQ(s.tipHash, tip);
        EXPECT_EQ(s.knowledgeEntries, 1u);
        EXPECT_TRUE(n.identities().isLocal(id));
        n.stop();
    }
    std::filesystem::remove_all(dir);
}
