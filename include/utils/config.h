#pragma once

#include <string>
#include <vector>
#include <memory>
#include <cstdint>

namespace sigelnet {
namespace utils {

struct NetworkConfig {
    std::string bindAddress = "0.0.0.0";
    uint16_t port = 8533;
    uint32_t maxPeers = 32;
    uint32_t maxInbound = 24;
    uint32_t maxOutbound = 8;
    uint32_t connectTimeoutMs = 5000;
    uint32_t handshakeTimeoutMs = 10000;
    uint32_t readTimeoutMs = 90000;
    uint32_t pingInterval = 30;
    uint32_t statusInterval = 15;
    uint32_t seenCacheSize = 1024;
    uint32_t maxBlocksPerResponse = 500;
    std::vector<std::string> seedNodes;
};

struct ChainConfig {
    uint64_t genesisTarget = 0x0000FFFFFFFFFFFFULL;
    uint32_t retargetInterval = 10;
    uint32_t targetBlockTime = 60;
    double maxAdjustment = 4.0;
    double maxScore = 64.0;
};

struct MiningConfig {
    uint64_t attemptsPerRound = 250000;
    uint32_t maxTransfersPerBlock = 100;
    uint32_t poolSize = 5000;
};

class Config {
public:
    static Config& instance();

    // key=value lines; # starts a comment. Loaded keys override defaults.
    bool load(const std::string& path);
    // Writes every key, sorted and grouped by section.
    bool save(const std::string& path);
    // Drops loaded and overridden keys, restoring the defaults.
    void reset();

    std::string getString(const std::string& key, const std::string& def = "") const;
    int getInt(const std::string& key, int def = 0) const;
    // Accepts decimal or 0x-prefixed hex.
    uint64_t getUInt64(const std::string& key, uint64_t def = 0) const;
    double getDouble(const std::string& key, double def = 0.0) const;
    bool getBool(const std::string& key, bool def = false) const;
    // Comma separated.
    std::vector<std::string> getList(const std::string& key) const;

    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, const char* value);
    void set(const std::string& key, int value);
    void set(const std::string& key, uint64_t value);
    void set(const std::string& key, double value);
    void set(const std::string& key, bool value);

    bool has(const std::string& key) const;

    NetworkConfig getNetworkConfig() const;
    ChainConfig getChainConfig() const;
    MiningConfig getMiningConfig() const;

    std::string getDataDir() const;
    void setDataDir(const std::string& path);

private:
    Config();
    void loadDefaultsLocked();
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
