#include "utils/config.h"
#include <unordered_map>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <mutex>
#include <stdexcept>

namespace sigelnet {
namespace utils {

struct Config::Impl {
    std::unordered_map<std::string, std::string> data;
    std::string configPath;
    std::string dataDir;
    mutable std::mutex mtx;

    void store(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mtx);
        data[key] = value;
    }

    bool lookup(const std::string& key, std::string& out) const {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = data.find(key);
        if (it == data.end()) return false;
        out = it->second;
        return true;
    }
};

static std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

static std::string hex64(uint64_t v) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setw(16) << std::setfill('0') << v;
    return oss.str();
}

Config::Config() : impl_(std::make_unique<Impl>()) {
    const char* home = std::getenv("HOME");
    if (home) {
        impl_->dataDir = std::string(home) + "/.sigelnet";
    } else {
        impl_->dataDir = ".sigelnet";
    }
    loadDefaultsLocked();
}

Config& Config::instance() {
    static Config inst;
    return inst;
}

void Config::loadDefaultsLocked() {
    NetworkConfig net;
    ChainConfig chain;
    MiningConfig mining;
    auto& d = impl_->data;

    d["network.bind"] = net.bindAddress;
    d["network.port"] = std::to_string(net.port);
    d["network.max_peers"] = std::to_string(net.maxPeers);
    d["network.max_inbound"] = std::to_string(net.maxInbound);
    d["network.max_outbound"] = std::to_string(net.maxOutbound);
    d["network.connect_timeout_ms"] = std::to_string(net.connectTimeoutMs);
    d["network.handshake_timeout_ms"] = std::to_string(net.handshakeTimeoutMs);
    d["network.read_timeout_ms"] = std::to_string(net.readTimeoutMs);
    d["network.ping_interval"] = std::to_string(net.pingInterval);
    d["network.status_interval"] = std::to_string(net.statusInterval);
    d["network.seen_cache_size"] = std::to_string(net.seenCacheSize);
    d["network.max_blocks_per_response"] = std::to_string(net.maxBlocksPerResponse);

    d["chain.genesis_target"] = hex64(chain.genesisTarget);
    d["chain.retarget_interval"] = std::to_string(chain.retargetInterval);
    d["chain.target_block_time"] = std::to_string(chain.targetBlockTime);
    d["chain.max_adjustment"] = "4.0";
    d["chain.max_score"] = "64.0";

    d["mining.attempts_per_round"] = std::to_string(mining.attemptsPerRound);
    d["mining.max_transfers_per_block"] = std::to_string(mining.maxTransfersPerBlock);
    d["mining.pool_size"] = std::to_string(mining.poolSize);

    d["log.level"] = "info";
    d["log.console"] = "true";
    d["log.max_size_mb"] = "10";
    d["log.max_files"] = "5";
}

void Config::reset() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->data.clear();
    loadDefaultsLocked();
}

bool Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return false;

    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->configPath = path;
    std::string line;

    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        auto pos = line.find('=');
        if (pos == std::string::npos) continue;
        std::string key = trim(line.substr(0, pos));
        std::string value = trim(line.substr(pos + 1));
        if (key.empty()) continue;
        impl_->data[key] = value;
    }
    return true;
}

bool Config::save(const std::string& path) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::string savePath = path.empty() ? impl_->configPath : path;
    if (savePath.empty()) return false;

    std::ofstream file(savePath);
    if (!file.is_open()) return false;

    file << "# SigelNet configuration\n\n";

    std::vector<std::string> sortedKeys;
    for (const auto& [key, value] : impl_->data) {
        sortedKeys.push_back(key);
    }
    std::sort(sortedKeys.begin(), sortedKeys.end());

    std::string lastPrefix;
    for (const auto& key : sortedKeys) {
        auto pos = key.find('.');
        std::string prefix = pos != std::string::npos ? key.substr(0, pos) : "";
        if (prefix != lastPrefix && !lastPrefix.empty()) {
            file << "\n";
        }
        lastPrefix = prefix;
        file << key << "=" << impl_->data[key] << "\n";
    }
    return static_cast<bool>(file);
}

std::string Config::getString(const std::string& key, const std::string& def) const {
    std::string v;
    return impl_->lookup(key, v) ? v : def;
}

int Config::getInt(const std::string& key, int def) const {
    std::string v;
    if (!impl_->lookup(key, v)) return def;
    try { return std::stoi(v); }
    catch (const std::logic_error&) { return def; }
}

uint64_t Config::getUInt64(const std::string& key, uint64_t def) const {
    std::string v;
    if (!impl_->lookup(key, v)) return def;
    if (v.empty() || v[0] == '-') return def;
    try { return std::stoull(v, nullptr, 0); }
    catch (const std::logic_error&) { return def; }
}

double Config::getDouble(const std::string& key, double def) const {
    std::string v;
    if (!impl_->lookup(key, v)) return def;
    try { return std::stod(v); }
    catch (const std::logic_error&) { return def; }
}

bool Config::getBool(const std::string& key, bool def) const {
    std::string val;
    if (!impl_->lookup(key, val)) return def;
    std::transform(val.begin(), val.end(), val.begin(), [](unsigned char c) { return std::tolower(c); });
    return val == "true" || val == "1" || val == "yes" || val == "on";
}

std::vector<std::string> Config::getList(const std::string& key) const {
    std::vector<std::string> result;
    std::string v;
    if (!impl_->lookup(key, v)) return result;

    std::istringstream iss(v);
    std::string item;
    while (std::getline(iss, item, ',')) {
        item = trim(item);
        if (!item.empty()) result.push_back(item);
    }
    return result;
}

void Config::set(const std::string& key, const std::string& value) {
    impl_->store(key, value);
}

void Config::set(const std::string& key, const char* value) {
    impl_->store(key, value ? std::string(value) : std::string());
}

void Config::set(const std::string& key, int value) {
    impl_->store(key, std::to_string(value));
}

void Config::set(const std::string& key, uint64_t value) {
    impl_->store(key, std::to_string(value));
}

void Config::set(const std::string& key, double value) {
    std::ostringstream oss;
    oss << value;
    impl_->store(key, oss.str());
}

void Config::set(const std::string& key, bool value) {
    impl_->store(key, value ? "true" : "false");
}

bool Config::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->data.find(key) != impl_->data.end();
}

NetworkConfig Config::getNetworkConfig() const {
    NetworkConfig cfg;
    cfg.bindAddress = getString("network.bind", cfg.bindAddress);
    cfg.port = static_cast<uint16_t>(getInt("network.port", cfg.port));
    cfg.maxPeers = getInt("network.max_peers", cfg.maxPeers);
    cfg.maxInbound = getInt("network.max_inbound", cfg.maxInbound);
    cfg.maxOutbound = getInt("network.max_outbound", cfg.maxOutbound);
    cfg.connectTimeoutMs = getInt("network.connect_timeout_ms", cfg.connectTimeoutMs);
    cfg.handshakeTimeoutMs = getInt("network.handshake_timeout_ms", cfg.handshakeTimeoutMs);
    cfg.readTimeoutMs = getInt("network.read_timeout_ms", cfg.readTimeoutMs);
    cfg.pingInterval = getInt("network.ping_interval", cfg.pingInterval);
    cfg.statusInterval = getInt("network.status_interval", cfg.statusInterval);
    cfg.seenCacheSize = getInt("network.seen_cache_size", cfg.seenCacheSize);
    cfg.maxBlocksPerResponse = getInt("network.max_blocks_per_response", cfg.maxBlocksPerResponse);
    cfg.seedNodes = getList("network.seed_nodes");
    return cfg;
}

ChainConfig Config::getChainConfig() const {
    ChainConfig cfg;
    cfg.genesisTarget = getUInt64("chain.genesis_target", cfg.genesisTarget);
    cfg.retargetInterval = getInt("chain.retarget_interval", cfg.retargetInterval);
    cfg.targetBlockTime = getInt("chain.target_block_time", cfg.targetBlockTime);
    cfg.maxAdjustment = getDouble("chain.max_adjustment", cfg.maxAdjustment);
    cfg.maxScore = getDouble("chain.max_score", cfg.maxScore);
    return cfg;
}

MiningConfig Config::getMiningConfig() const {
    MiningConfig cfg;
    cfg.attemptsPerRound = getUInt64("mining.attempts_per_round", cfg.attemptsPerRound);
    cfg.maxTransfersPerBlock = getInt("mining.max_transfers_per_block", cfg.maxTransfersPerBlock);
    cfg.poolSize = getInt("mining.pool_size", cfg.poolSize);
    return cfg;
}

std::string Config::getDataDir() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->dataDir;
}

void Config::setDataDir(const std::string& path) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->dataDir = path;
}

}
}
