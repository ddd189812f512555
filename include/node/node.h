#pragma once

#include "core/block.h"
#include "core/difficulty.h"
#include "core/identity.h"
#include "core/knowledge.h"
#include "core/ledger.h"
#include "core/miner.h"
#include "core/transfer.h"
#include "infrastructure/error_handling.h"
#include "network/network.h"
#include "utils/config.h"
#include <string>
#include <vector>
#include <functional>
#include <memory>
#include <cstdint>

namespace sigelnet {
namespace node {

struct NodeConfig {
    // Empty keeps every store in memory.
    std::string dataDir;
    utils::NetworkConfig network;
    core::ChainParams chain;
    utils::MiningConfig mining;
    std::string userAgent = "sigelnet/0.1";
    bool listen = true;

    static NodeConfig fromConfig(const utils::Config& config);
};

struct NodeStatus {
    uint64_t height = 0;
    crypto::Hash256 tipHash{};
    long double cumulativeWork = 0;
    uint64_t nextTarget = 0;
    size_t knownPeers = 0;
    size_t syncedPeers = 0;
    size_t pendingTransfers = 0;
    size_t identities = 0;
    uint64_t knowledgeEntries = 0;
    uint64_t networkHeight = 0;
    uint16_t port = 0;
    std::vector<std::string> activeMiners;
};

class Node {
public:
    explicit Node(const NodeConfig& config);
    ~Node();

    // Opens the stores, binds the listener and starts maintenance.
    Result<void> start();
    void stop();
    bool isRunning() const;

    Result<core::IdentityRecord> createIdentity(const std::string& name);
    // Blocks until the handshake finishes or times out. With a non-empty
    // identityId, that local identity is announced to the peer first.
    Result<network::Session> connect(const std::string& host, uint16_t port,
                                     const std::string& identityId = "");
    void disconnect(const std::string& peerId);

    Result<void> mine(const std::string& identityId, bool continuous);
    Result<core::Block> mineBlock(const std::string& identityId, uint64_t maxAttempts);
    Result<void> stopMining(const std::string& identityId);

    NodeStatus status() const;
    std::vector<network::Session> peers() const;

    // Prepares, validates, pools and relays a new transfer.
    Result<core::KnowledgeTransfer> transfer(const std::string& fromId, const std::string& toId,
                                             const std::string& topic,
                                             const std::vector<uint8_t>& payload);
    Result<void> submitTransfer(const core::KnowledgeTransfer& transfer);
    // Appends a locally produced block and relays it to every synced peer.
    Result<void> submitBlock(const core::Block& block);

    core::Ledger& ledger();
    const core::Ledger& ledger() const;
    core::IdentityRegistry& identities();
    core::KnowledgeStore& knowledge();
    core::TransferPool& pool();

    // Called once when persistence fails; the owner should shut down.
    void onFatal(std::function<void(const std::string&)> callback);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
