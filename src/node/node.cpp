#include "node/node.h"
#include "node/seen_cache.h"
#include "network/protocol.h"
#include "network/sync.h"
#include "utils/logger.h"
#include <atomic>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <map>
#include <set>
#include <chrono>
#include <filesystem>
#include <algorithm>

namespace sigelnet {
namespace node {

static const char* LOG_CAT_NODE = "node";
static constexpr uint64_t SYNC_REQUEST_TIMEOUT_MS = 30000;
static constexpr uint64_t POOL_PRUNE_INTERVAL_MS = 60000;
static constexpr size_t CHAIN_RESPONSE_BUDGET = network::MAX_MESSAGE_SIZE - 1024;

static uint64_t nowMillis() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count());
}

NodeConfig NodeConfig::fromConfig(const utils::Config& config) {
    NodeConfig c;
    c.dataDir = config.getDataDir();
    c.network = config.getNetworkConfig();
    c.chain = core::ChainParams::fromConfig(config.getChainConfig());
    c.mining = config.getMiningConfig();
    return c;
}

struct PeerTimers {
    uint64_t lastPing = 0;
    uint64_t lastStatus = 0;
};

struct Node::Impl {
    NodeConfig config;
    core::Ledger ledger;
    core::IdentityRegistry identities;
    core::KnowledgeStore knowledge;
    core::TransferPool pool;
    core::TransferProtocol transfers;
    core::Miner miner;
    network::Network network;
    network::ChainSync sync;
    SeenCache seenBlocks;
    SeenCache seenTransfers;
    uint64_t localNonce;

    std::atomic<bool> running{false};
    std::atomic<bool> failed{false};
    std::thread maintenanceThread;
    std::mutex mtx;
    std::condition_variable cv;
    std::map<std::string, PeerTimers> timers;
    std::function<void(const std::string&)> fatalCallback;

    std::mutex helloMtx;
    std::set<std::string> helloSent;
    // Outbound peer id to the local identity announced ahead of the others.
    std::map<std::string, std::string> leadIdentity;
    std::mutex heightMtx;

    explicit Impl(const NodeConfig& cfg)
        : config(cfg),
          ledger(cfg.chain),
          pool(cfg.mining.poolSize),
          transfers(ledger),
          miner(ledger, pool, identities, cfg.mining),
          sync(cfg.network.maxBlocksPerResponse, SYNC_REQUEST_TIMEOUT_MS),
          seenBlocks(cfg.network.seenCacheSize),
          seenTransfers(cfg.network.seenCacheSize),
          localNonce(crypto::randomUint64()) {}

    void fatal(const std::string& what);
    void wake();

    bool sendMessage(const std::string& peerId, network::MessageType type, std::vector<uint8_t> payload);
    void sendHelloOnce(const std::string& peerId);
    void announceIdentities(const std::string& peerId);
    // Reads the ledger height and hands it to sync as one step, so a late
    // notification can't overwrite a newer height.
    void refreshLocalHeight();
    void sendChainRequest(const network::SyncRequest& req);
    void maybeSync(const std::string& peerId);
    void malformed(const std::string& peerId, const std::string& command);

    void handlePeerConnected(const network::Session& session);
    void handlePeerDisconnected(const network::Session& session);
    void handleMessage(const std::string& peerId, const network::Message& msg);
    void dispatch(const std::string& peerId, const network::Message& msg);

    void handleHello(const network::Session& session, const network::Message& msg);
    void handlePing(const std::string& peerId, const network::Message& msg);
    void handleGetStatus(const std::string& peerId);
    void handleStatus(const std::string& peerId, const network::Message& msg);
    void handleGetChain(const std::string& peerId, const network::Message& msg);
    void handleChain(const std::string& peerId, const network::Message& msg);
    void handleBlock(const std::string& peerId, const network::Message& msg);
    void handleTransfer(const std::string& peerId, const network::Message& msg);
    void handleIdentity(const std::string& peerId, const network::Message& msg);

    Result<void> acceptTransfer(const core::KnowledgeTransfer& transfer);
    Result<void> submitBlock(const core::Block& block);
    void relayBlock(const core::Block& block, const std::string& fromPeer);
    void relayTransfer(const core::KnowledgeTransfer& transfer, const std::string& fromPeer);
    void relayIdentity(const core::IdentityRecord& record, const std::string& fromPeer);

    void onBlockCommitted(const core::Block& block);
    void onChainSwitched(uint64_t forkIndex, const std::vector<core::Block>& removed,
                         const std::vector<core::Block>& added);

    void connectSeeds();
    void maintenanceLoop();
};

void Node::Impl::fatal(const std::string& what) {
    if (failed.exchange(true)) return;
    LOG_FATAL("Storage failure: " + what);
    ErrorHandler::instance().handle(makeCritical(ErrorCode::STORAGE_ERROR, what));
    std::function<void(const std::string&)> cb;
    {
        std::lock_guard<std::mutex> lock(mtx);
        cb = fatalCallback;
    }
    if (cb) cb(what);
}

void Node::Impl::wake() {
    { std::lock_guard<std::mutex> lock(mtx); }
    cv.notify_all();
}

bool Node::Impl::sendMessage(const std::string& peerId, network::MessageType type,
                             std::vector<uint8_t> payload) {
    return network.send(peerId, network::Message(network::commandName(type), std::move(payload)));
}

void Node::Impl::sendHelloOnce(const std::string& peerId) {
    // Held across the send so nothing else reaches the peer ahead of our hello.
    std::lock_guard<std::mutex> lock(helloMtx);
    if (!helloSent.insert(peerId).second) return;
    network::HelloMessage hello;
    hello.version = network::PROTOCOL_VERSION;
    hello.chainHeight = ledger.height();
    hello.nonce = localNonce;
    hello.userAgent = config.userAgent;
    sendMessage(peerId, network::MessageType::HELLO, hello.serialize());
}

void Node::Impl::announceIdentities(const std::string& peerId) {
    std::string lead;
    {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = leadIdentity.find(peerId);
        if (it != leadIdentity.end()) {
            lead = it->second;
            leadIdentity.erase(it);
        }
    }
    std::vector<core::IdentityRecord> records = identities.all();
    std::stable_partition(records.begin(), records.end(),
                          [&lead](const core::IdentityRecord& r) { return r.id == lead; });
    for (const auto& record : records) {
        network::IdentityAnnounce ann;
        ann.identity = record;
        sendMessage(peerId, network::MessageType::IDENTITY, ann.serialize());
    }
}

void Node::Impl::refreshLocalHeight() {
    std::lock_guard<std::mutex> lock(heightMtx);
    sync.setLocalHeight(ledger.height());
}

void Node::Impl::sendChainRequest(const network::SyncRequest& req) {
    network::ChainRequest msg;
    msg.fromIndex = req.fromIndex;
    msg.maxBlocks = req.maxBlocks;
    LOG_CAT(DEBUG, LOG_CAT_NODE, "Requesting chain from " + req.peerId + " starting at " +
            std::to_string(req.fromIndex));
    sendMessage(req.peerId, network::MessageType::GET_CHAIN, msg.serialize());
}

void Node::Impl::maybeSync(const std::string& peerId) {
    auto req = sync.begin(peerId, ledger.height());
    if (req) sendChainRequest(*req);
}

void Node::Impl::malformed(const std::string& peerId, const std::string& command) {
    network.disconnect(peerId, "malformed " + command);
}

void Node::Impl::handlePeerConnected(const network::Session& session) {
    uint64_t now = nowMillis();
    {
        std::lock_guard<std::mutex> lock(mtx);
        timers[session.id] = PeerTimers{now, now};
    }
    sendHelloOnce(session.id);
}

void Node::Impl::handlePeerDisconnected(const network::Session& session) {
    sync.removePeer(session.id);
    seenBlocks.forgetPeer(session.id);
    seenTransfers.forgetPeer(session.id);
    {
        std::lock_guard<std::mutex> lock(helloMtx);
        helloSent.erase(session.id);
    }
    {
        std::lock_guard<std::mutex> lock(mtx);
        timers.erase(session.id);
    }
    cv.notify_all();
}

void Node::Impl::handleMessage(const std::string& peerId, const network::Message& msg) {
    try {
        dispatch(peerId, msg);
    } catch (const StorageError& e) {
        fatal(e.what());
    }
}

void Node::Impl::dispatch(const std::string& peerId, const network::Message& msg) {
    using network::MessageType;

    MessageType type = network::commandType(msg.command);
    auto session = network.getPeer(peerId);
    if (!session) return;

    if (!session->handshaked() && !network::allowedBeforeHandshake(type)) {
        network.disconnect(peerId, msg.command + " before handshake");
        return;
    }

    switch (type) {
        case MessageType::HELLO: handleHello(*session, msg); break;
        case MessageType::PING: handlePing(peerId, msg); break;
        case MessageType::PONG:
            if (!network::PingMessage::deserialize(msg.payload)) malformed(peerId, msg.command);
            break;
        case MessageType::GET_STATUS: handleGetStatus(peerId); break;
        case MessageType::STATUS: handleStatus(peerId, msg); break;
        case MessageType::GET_CHAIN: handleGetChain(peerId, msg); break;
        case MessageType::CHAIN: handleChain(peerId, msg); break;
        case MessageType::BLOCK: handleBlock(peerId, msg); break;
        case MessageType::TRANSFER: handleTransfer(peerId, msg); break;
        case MessageType::IDENTITY: handleIdentity(peerId, msg); break;
        case MessageType::UNKNOWN:
            LOG_CAT(DEBUG, LOG_CAT_NODE, "Ignoring unknown command '" + msg.command + "' from " + peerId);
            break;
    }
}

void Node::Impl::handleHello(const network::Session& session, const network::Message& msg) {
    auto hello = network::HelloMessage::deserialize(msg.payload);
    if (!hello) {
        malformed(session.id, msg.command);
        return;
    }
    if (session.handshaked()) {
        LOG_CAT(DEBUG, LOG_CAT_NODE, "Duplicate hello from " + session.id);
        return;
    }
    if (hello->nonce == localNonce) {
        network.disconnect(session.id, "connected to self");
        return;
    }
    if (hello->version < network::MIN_PROTOCOL_VERSION) {
        network.disconnect(session.id, "incompatible protocol version " + std::to_string(hello->version));
        return;
    }

    sendHelloOnce(session.id);
    network.setPeerInfo(session.id, hello->version, hello->chainHeight, hello->userAgent);
    network.setState(session.id, network::SessionState::SYNCED);
    sync.updatePeerHeight(session.id, hello->chainHeight);
    LOG_CAT(INFO, LOG_CAT_NODE, "Handshake with " + session.id + " complete (" + hello->userAgent +
            ", height " + std::to_string(hello->chainHeight) + ")");

    announceIdentities(session.id);
    wake();
    maybeSync(session.id);
}

void Node::Impl::handlePing(const std::string& peerId, const network::Message& msg) {
    auto ping = network::PingMessage::deserialize(msg.payload);
    if (!ping) {
        malformed(peerId, msg.command);
        return;
    }
    sendMessage(peerId, network::MessageType::PONG, ping->serialize());
}

void Node::Impl::handleGetStatus(const std::string& peerId) {
    core::ChainTip tip = ledger.snapshot();
    network::StatusResponse status;
    status.chainHeight = tip.block.index;
    status.tipHash = tip.block.hash;
    sendMessage(peerId, network::MessageType::STATUS, status.serialize());
}

void Node::Impl::handleStatus(const std::string& peerId, const network::Message& msg) {
    auto status = network::StatusResponse::deserialize(msg.payload);
    if (!status) {
        malformed(peerId, msg.command);
        return;
    }
    network.setChainHeight(peerId, status->chainHeight);
    sync.updatePeerHeight(peerId, status->chainHeight);
    if (status->chainHeight > ledger.height()) maybeSync(peerId);
}

void Node::Impl::handleGetChain(const std::string& peerId, const network::Message& msg) {
    auto req = network::ChainRequest::deserialize(msg.payload);
    if (!req) {
        malformed(peerId, msg.command);
        return;
    }

    size_t limit = std::min<size_t>(config.network.maxBlocksPerResponse, network::MAX_CHAIN_RESPONSE_BLOCKS);
    if (req->maxBlocks > 0) limit = std::min<size_t>(limit, req->maxBlocks);

    network::ChainResponse resp;
    resp.peerHeight = ledger.height();
    size_t bytes = 0;
    for (auto& block : ledger.getBlocks(req->fromIndex, limit)) {
        size_t size = block.serialize().size();
        if (!resp.blocks.empty() && bytes + size > CHAIN_RESPONSE_BUDGET) break;
        bytes += size;
        resp.blocks.push_back(std::move(block));
    }
    sendMessage(peerId, network::MessageType::CHAIN, resp.serialize());
}

void Node::Impl::handleChain(const std::string& peerId, const network::Message& msg) {
    auto resp = network::ChainResponse::deserialize(msg.payload);
    if (!resp) {
        malformed(peerId, msg.command);
        return;
    }

    auto links = [this](const core::Block& b) {
        if (b.index == 0) return false;
        auto prev = ledger.getBlock(b.index - 1);
        return prev && prev->hash == b.previousHash;
    };

    network::SyncStep step = sync.processResponse(peerId, *resp, links);
    switch (step.action) {
        case network::SyncAction::REQUEST_MORE:
        case network::SyncAction::STEP_BACK:
            sendChainRequest(step.next);
            break;
        case network::SyncAction::COMPLETE: {
            network.setState(peerId, network::SessionState::RELAYING);
            bool adopted = ledger.replaceIfBetter(step.blocks);
            network.setState(peerId, network::SessionState::SYNCED);
            if (!adopted) break;
            for (const auto& b : step.blocks) {
                std::string key = b.hashHex();
                seenBlocks.insert(key);
                seenBlocks.markPeer(key, peerId);
            }
            relayBlock(ledger.tip(), peerId);
            break;
        }
        case network::SyncAction::ABANDON:
            break;
    }
}

void Node::Impl::handleBlock(const std::string& peerId, const network::Message& msg) {
    auto ann = network::BlockAnnounce::deserialize(msg.payload);
    if (!ann) {
        malformed(peerId, msg.command);
        return;
    }
    const core::Block& block = ann->block;

    std::string key = block.hashHex();
    bool fresh = seenBlocks.insert(key);
    seenBlocks.markPeer(key, peerId);
    if (!fresh) return;

    if (block.index > sync.getPeerHeight(peerId)) {
        sync.updatePeerHeight(peerId, block.index);
        network.setChainHeight(peerId, block.index);
    }

    uint64_t height = ledger.height();
    if (block.index <= height) {
        LOG_CAT(DEBUG, LOG_CAT_NODE, "Ignoring block " + std::to_string(block.index) + " from " + peerId +
                " at or below our height");
        return;
    }
    if (block.index > height + 1) {
        maybeSync(peerId);
        return;
    }

    network.setState(peerId, network::SessionState::RELAYING);
    auto res = ledger.append(block);
    network.setState(peerId, network::SessionState::SYNCED);

    if (res.ok()) {
        LOG_CAT(INFO, LOG_CAT_NODE, "Accepted block " + std::to_string(block.index) + " from " + peerId);
        relayBlock(block, peerId);
        return;
    }

    switch (res.error()) {
        case core::RejectReason::STALE_INDEX:
            LOG_CAT(DEBUG, LOG_CAT_NODE, "Block " + std::to_string(block.index) + " from " + peerId +
                    " lost the race");
            break;
        case core::RejectReason::HASH_MISMATCH:
            if (block.previousHash != ledger.tipHash()) {
                LOG_CAT(DEBUG, LOG_CAT_NODE, "Block " + std::to_string(block.index) + " from " + peerId +
                        " is on another branch");
                maybeSync(peerId);
                break;
            }
            LOG_CAT(WARN, LOG_CAT_NODE, "Rejected block " + std::to_string(block.index) + " from " + peerId +
                    ": " + core::rejectReasonToString(res.error()));
            break;
        default:
            LOG_CAT(WARN, LOG_CAT_NODE, "Rejected block " + std::to_string(block.index) + " from " + peerId +
                    ": " + core::rejectReasonToString(res.error()));
            break;
    }
}

void Node::Impl::handleTransfer(const std::string& peerId, const network::Message& msg) {
    auto ann = network::TransferAnnounce::deserialize(msg.payload);
    if (!ann) {
        malformed(peerId, msg.command);
        return;
    }

    std::string key = ann->transfer.contentId();
    bool fresh = seenTransfers.insert(key);
    seenTransfers.markPeer(key, peerId);
    if (!fresh) return;

    auto res = acceptTransfer(ann->transfer);
    if (!res.ok()) {
        LOG_CAT(DEBUG, LOG_CAT_NODE, "Dropped transfer from " + peerId + ": " + res.error().message);
        return;
    }
    relayTransfer(ann->transfer, peerId);
}

void Node::Impl::handleIdentity(const std::string& peerId, const network::Message& msg) {
    auto ann = network::IdentityAnnounce::deserialize(msg.payload);
    if (!ann) {
        malformed(peerId, msg.command);
        return;
    }

    auto res = identities.upsert(ann->identity);
    if (!res.ok()) {
        LOG_CAT(DEBUG, LOG_CAT_NODE, "Ignored identity from " + peerId + ": " + res.error().message);
        return;
    }
    if (res.value()) relayIdentity(ann->identity, peerId);
}

Result<void> Node::Impl::acceptTransfer(const core::KnowledgeTransfer& transfer) {
    std::string reason;
    core::IdentityLookup lookup = [this](const std::string& id) { return identities.contains(id); };
    if (!core::validateTransferFields(transfer, lookup, &reason)) {
        return makeError(ErrorCode::VALIDATION_ERROR, "invalid transfer: " + reason);
    }
    auto valid = transfers.validate(transfer);
    if (!valid.ok()) {
        return makeError(ErrorCode::VALIDATION_ERROR,
                         "transfer " + transfer.contentId().substr(0, 16) + " already committed");
    }
    return pool.add(transfer);
}

Result<void> Node::Impl::submitBlock(const core::Block& block) {
    try {
        auto res = ledger.append(block);
        if (!res.ok()) {
            std::string why = "block " + std::to_string(block.index) + " rejected: " +
                              core::rejectReasonToString(res.error());
            if (res.error() == core::RejectReason::STALE_INDEX) {
                return makeError(ErrorCode::CONSENSUS_CONFLICT, why);
            }
            return makeError(ErrorCode::VALIDATION_ERROR, why);
        }
        relayBlock(block, "");
        return Result<void>();
    } catch (const StorageError& e) {
        fatal(e.what());
        return makeCritical(ErrorCode::STORAGE_ERROR, e.what());
    }
}

void Node::Impl::relayBlock(const core::Block& block, const std::string& fromPeer) {
    std::string key = block.hashHex();
    seenBlocks.insert(key);
    std::set<std::string> exclude = seenBlocks.peers(key);
    if (!fromPeer.empty()) exclude.insert(fromPeer);

    network::BlockAnnounce ann;
    ann.block = block;
    size_t sent = network.broadcast(network::Message(network::commandName(network::MessageType::BLOCK),
                                                     ann.serialize()), exclude);
    for (const auto& s : network.getPeers()) {
        if (s.handshaked()) seenBlocks.markPeer(key, s.id);
    }
    LOG_CAT(DEBUG, LOG_CAT_NODE, "Relayed block " + std::to_string(block.index) + " to " +
            std::to_string(sent) + " peers");
}

void Node::Impl::relayTransfer(const core::KnowledgeTransfer& transfer, const std::string& fromPeer) {
    std::string key = transfer.contentId();
    seenTransfers.insert(key);
    std::set<std::string> exclude = seenTransfers.peers(key);
    if (!fromPeer.empty()) exclude.insert(fromPeer);

    network::TransferAnnounce ann;
    ann.transfer = transfer;
    network.broadcast(network::Message(network::commandName(network::MessageType::TRANSFER),
                                       ann.serialize()), exclude);
    for (const auto& s : network.getPeers()) {
        if (s.handshaked()) seenTransfers.markPeer(key, s.id);
    }
}

void Node::Impl::relayIdentity(const core::IdentityRecord& record, const std::string& fromPeer) {
    std::set<std::string> exclude;
    if (!fromPeer.empty()) exclude.insert(fromPeer);
    network::IdentityAnnounce ann;
    ann.identity = record;
    network.broadcast(network::Message(network::commandName(network::MessageType::IDENTITY),
                                       ann.serialize()), exclude);
}

void Node::Impl::onBlockCommitted(const core::Block& block) {
    for (const auto& t : block.transactions) knowledge.apply(t, block.index);
    pool.removeIncluded(block.transactions);
    refreshLocalHeight();
}

void Node::Impl::onChainSwitched(uint64_t forkIndex, const std::vector<core::Block>& removed,
                                 const std::vector<core::Block>& added) {
    std::set<std::string> kept;
    for (const auto& b : added) {
        for (const auto& t : b.transactions) kept.insert(t.contentId());
    }

    size_t requeued = 0;
    for (const auto& b : removed) {
        for (const auto& t : b.transactions) {
            if (kept.count(t.contentId())) continue;
            knowledge.revoke(t);
            if (pool.add(t).ok()) requeued++;
        }
    }

    for (const auto& b : added) {
        for (const auto& t : b.transactions) knowledge.apply(t, b.index);
        pool.removeIncluded(b.transactions);
    }
    refreshLocalHeight();

    LOG_CAT(INFO, LOG_CAT_NODE, "Chain switched at " + std::to_string(forkIndex) + ", " +
            std::to_string(requeued) + " orphaned transfers returned to the pool");
}

void Node::Impl::connectSeeds() {
    for (const auto& seed : config.network.seedNodes) {
        if (!running) return;
        auto colon = seed.rfind(':');
        if (colon == std::string::npos) {
            LOG_CAT(WARN, LOG_CAT_NODE, "Ignoring seed without port: " + seed);
            continue;
        }
        uint16_t port = 0;
        try {
            int p = std::stoi(seed.substr(colon + 1));
            if (p <= 0 || p > 65535) throw std::out_of_range("port");
            port = static_cast<uint16_t>(p);
        } catch (const std::logic_error&) {
            LOG_CAT(WARN, LOG_CAT_NODE, "Ignoring seed with bad port: " + seed);
            continue;
        }
        auto res = network.connect(seed.substr(0, colon), port);
        if (!res.ok()) {
            LOG_CAT(WARN, LOG_CAT_NODE, "Seed " + seed + " unreachable: " + res.error().message);
        }
    }
}

void Node::Impl::maintenanceLoop() {
    connectSeeds();
    uint64_t lastPrune = nowMillis();

    while (running) {
        {
            std::unique_lock<std::mutex> lock(mtx);
            cv.wait_for(lock, std::chrono::seconds(1), [this] { return !running; });
        }
        if (!running) break;

        uint64_t now = nowMillis();
        uint64_t pingEvery = static_cast<uint64_t>(config.network.pingInterval) * 1000;
        uint64_t statusEvery = static_cast<uint64_t>(config.network.statusInterval) * 1000;

        std::vector<std::string> pingDue;
        std::vector<std::string> statusDue;
        std::vector<network::Session> sessions = network.getPeers();
        {
            std::lock_guard<std::mutex> lock(mtx);
            for (const auto& s : sessions) {
                if (!s.handshaked()) continue;
                PeerTimers& t = timers[s.id];
                if (now - t.lastPing >= pingEvery) {
                    t.lastPing = now;
                    pingDue.push_back(s.id);
                }
                if (now - t.lastStatus >= statusEvery) {
                    t.lastStatus = now;
                    statusDue.push_back(s.id);
                }
            }
        }

        for (const auto& id : pingDue) {
            network::PingMessage ping;
            ping.nonce = crypto::randomUint64();
            sendMessage(id, network::MessageType::PING, ping.serialize());
        }
        for (const auto& id : statusDue) {
            sendMessage(id, network::MessageType::GET_STATUS, network::StatusRequest().serialize());
        }

        for (const auto& peerId : sync.expire()) {
            LOG_CAT(DEBUG, LOG_CAT_NODE, "Chain request to " + peerId + " timed out");
        }

        if (now - lastPrune >= POOL_PRUNE_INTERVAL_MS) {
            lastPrune = now;
            size_t pruned = pool.pruneExpired();
            if (pruned > 0) {
                LOG_CAT(DEBUG, LOG_CAT_NODE, "Pruned " + std::to_string(pruned) + " expired transfers");
            }
        }
    }
}

Node::Node(const NodeConfig& config) : impl_(std::make_unique<Impl>(config)) {
    Impl* impl = impl_.get();
    impl->ledger.setIdentityResolver([impl](const std::string& id) { return impl->identities.get(id); });
    impl->ledger.onBlockAppended([impl](const core::Block& b) { impl->onBlockCommitted(b); });
    impl->ledger.onChainReplaced([impl](uint64_t fork, const std::vector<core::Block>& removed,
                                        const std::vector<core::Block>& added) {
        impl->onChainSwitched(fork, removed, added);
    });
    impl->miner.onBlockFound([impl](const core::Block& b) { return impl->submitBlock(b).ok(); });

    impl->network.onPeerConnected([impl](const network::Session& s) { impl->handlePeerConnected(s); });
    impl->network.onPeerDisconnected([impl](const network::Session& s) { impl->handlePeerDisconnected(s); });
    impl->network.onMessage([impl](const std::string& peerId, const network::Message& msg) {
        impl->handleMessage(peerId, msg);
    });
}

Node::~Node() {
    stop();
}

Result<void> Node::start() {
    if (impl_->running) return makeError(ErrorCode::INVALID_STATE, "node already running");

    std::string reason;
    if (!impl_->config.chain.validate(&reason)) {
        return makeError(ErrorCode::INVALID_ARGUMENT, "invalid chain parameters: " + reason);
    }

    const std::string& dir = impl_->config.dataDir;
    if (!dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            return makeError(ErrorCode::STORAGE_ERROR, "cannot create data directory " + dir + ": " + ec.message());
        }
        try {
            if (!impl_->identities.open(dir + "/identities.db")) {
                return makeError(ErrorCode::STORAGE_ERROR, "cannot open identity store");
            }
            if (!impl_->ledger.open(dir + "/ledger.db")) {
                return makeError(ErrorCode::STORAGE_ERROR, "cannot open ledger");
            }
            if (!impl_->knowledge.open(dir + "/knowledge.db")) {
                return makeError(ErrorCode::STORAGE_ERROR, "cannot open knowledge store");
            }
        } catch (const StorageError& e) {
            return makeCritical(ErrorCode::STORAGE_ERROR, e.what());
        }
    }
    impl_->refreshLocalHeight();

    if (impl_->config.listen && !impl_->network.start(impl_->config.network)) {
        return makeError(ErrorCode::TRANSPORT_ERROR,
                         "cannot listen on port " + std::to_string(impl_->config.network.port));
    }

    impl_->running = true;
    impl_->maintenanceThread = std::thread(&Impl::maintenanceLoop, impl_.get());

    LOG_CAT(INFO, LOG_CAT_NODE, "Node started at height " + std::to_string(impl_->ledger.height()) +
            " tip " + impl_->ledger.tip().hashHex().substr(0, 16));
    return Result<void>();
}

void Node::stop() {
    impl_->miner.stopAll();

    bool wasRunning = impl_->running.exchange(false);
    impl_->wake();
    if (impl_->maintenanceThread.joinable()) impl_->maintenanceThread.join();
    impl_->network.stop();

    if (!wasRunning) return;
    impl_->knowledge.close();
    impl_->ledger.close();
    impl_->identities.close();
    LOG_CAT(INFO, LOG_CAT_NODE, "Node stopped");
}

bool Node::isRunning() const {
    return impl_->running;
}

Result<core::IdentityRecord> Node::createIdentity(const std::string& name) {
    try {
        auto res = impl_->identities.create(name);
        if (!res.ok()) return res.error();
        LOG_CAT(INFO, LOG_CAT_NODE, "Created identity " + res.value().name + " (" + res.value().id + ")");
        impl_->relayIdentity(res.value(), "");
        return res;
    } catch (const StorageError& e) {
        impl_->fatal(e.what());
        return makeCritical(ErrorCode::STORAGE_ERROR, e.what());
    }
}

Result<network::Session> Node::connect(const std::string& host, uint16_t port, const std::string& identityId) {
    if (!impl_->running || !impl_->network.isRunning()) {
        return makeError(ErrorCode::INVALID_STATE, "node not running");
    }
    if (!identityId.empty() && !impl_->identities.isLocal(identityId)) {
        return makeError(ErrorCode::NOT_FOUND, "no local identity " + identityId);
    }

    const std::string target = host + ":" + std::to_string(port);
    if (!identityId.empty()) {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        impl_->leadIdentity[target] = identityId;
    }
    auto res = impl_->network.connect(host, port);
    if (!res.ok()) {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        impl_->leadIdentity.erase(target);
        return res.error();
    }
    const std::string peerId = res.value().id;

    {
        std::unique_lock<std::mutex> lock(impl_->mtx);
        impl_->cv.wait_for(lock, std::chrono::milliseconds(impl_->config.network.handshakeTimeoutMs), [&] {
            auto s = impl_->network.getPeer(peerId);
            return !impl_->running || !s || s->handshaked();
        });
        impl_->leadIdentity.erase(peerId);
    }

    auto session = impl_->network.getPeer(peerId);
    if (!session) {
        return makeError(ErrorCode::TRANSPORT_ERROR, "handshake with " + peerId + " failed");
    }
    if (!session->handshaked()) {
        impl_->network.disconnect(peerId, "handshake timeout");
        return makeError(ErrorCode::TRANSPORT_ERROR, "handshake with " + peerId + " timed out");
    }
    return *session;
}

void Node::disconnect(const std::string& peerId) {
    impl_->network.disconnect(peerId, "requested");
}

Result<void> Node::mine(const std::string& identityId, bool continuous) {
    return impl_->miner.start(identityId, continuous);
}

Result<core::Block> Node::mineBlock(const std::string& identityId, uint64_t maxAttempts) {
    return impl_->miner.mineOne(identityId, maxAttempts);
}

Result<void> Node::stopMining(const std::string& identityId) {
    if (!impl_->miner.stop(identityId)) {
        return makeError(ErrorCode::NOT_FOUND, "not mining for " + identityId);
    }
    return Result<void>();
}

NodeStatus Node::status() const {
    NodeStatus s;
    core::ChainTip tip = impl_->ledger.snapshot();
    s.height = tip.block.index;
    s.tipHash = tip.block.hash;
    s.nextTarget = tip.nextTarget;
    s.cumulativeWork = impl_->ledger.cumulativeWork();
    for (const auto& p : impl_->network.getPeers()) {
        s.knownPeers++;
        if (p.handshaked()) s.syncedPeers++;
    }
    s.pendingTransfers = impl_->pool.size();
    s.identities = impl_->identities.size();
    s.knowledgeEntries = impl_->knowledge.count();
    s.networkHeight = impl_->sync.getNetworkHeight();
    s.port = impl_->network.getPort();
    s.activeMiners = impl_->miner.activeMiners();
    return s;
}

std::vector<network::Session> Node::peers() const {
    return impl_->network.getPeers();
}

Result<core::KnowledgeTransfer> Node::transfer(const std::string& fromId, const std::string& toId,
                                               const std::string& topic,
                                               const std::vector<uint8_t>& payload) {
    auto prepared = impl_->transfers.prepare(fromId, toId, topic, payload);
    if (!prepared.ok()) return prepared.error();
    auto res = submitTransfer(prepared.value());
    if (!res.ok()) return res.error();
    return prepared;
}

Result<void> Node::submitTransfer(const core::KnowledgeTransfer& transfer) {
    auto res = impl_->acceptTransfer(transfer);
    if (!res.ok()) return res;
    LOG_CAT(INFO, LOG_CAT_NODE, "Queued transfer '" + transfer.topic + "' " + transfer.fromId.substr(0, 8) +
            " -> " + transfer.toId.substr(0, 8));
    impl_->relayTransfer(transfer, "");
    return res;
}

Result<void> Node::submitBlock(const core::Block& block) {
    return impl_->submitBlock(block);
}

core::Ledger& Node::ledger() { return impl_->ledger; }
const core::Ledger& Node::ledger() const { return impl_->ledger; }
core::IdentityRegistry& Node::identities() { return impl_->identities; }
core::KnowledgeStore& Node::knowledge() { return impl_->knowledge; }
core::TransferPool& Node::pool() { return impl_->pool; }

void Node::onFatal(std::function<void(const std::string&)> callback) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->fatalCallback = std::move(callback);
}

}
}
