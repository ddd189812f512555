#include "node/node.h"
#include "utils/config.h"
#include "utils/logger.h"
#include "utils/single_instance.h"
#include "infrastructure/error_handling.h"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <getopt.h>

namespace sigelnet {

static std::atomic<bool> g_running{true};
static std::atomic<int> g_exitCode{0};

struct DaemonOptions {
    std::string dataDir;
    std::string configPath;
    std::string logLevel;
    std::string mineAs;
    std::vector<std::string> connect;
    int port = -1;
    bool showHelp = false;
    bool showVersion = false;
};

void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running = false;
    }
}

void registerSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    std::signal(SIGPIPE, SIG_IGN);
}

void printHelp(const char* prog) {
    std::cout << "Usage: " << prog << " [options]\n\n"
              << "  -h, --help              show this help\n"
              << "  -v, --version           print version\n"
              << "  -D, --datadir DIR       data directory (default ~/.sigelnet)\n"
              << "  -c, --config FILE       configuration file (default DATADIR/sigelnet.conf)\n"
              << "  -p, --port PORT         listen port, 0 for any\n"
              << "  -C, --connect HOST:PORT connect to a peer (repeatable)\n"
              << "  -m, --mine NAME         mine continuously as the local identity NAME,\n"
              << "                          creating it if needed\n"
              << "  -l, --loglevel LEVEL    trace, debug, info, warn, error, fatal\n";
}

void printVersion() {
    std::cout << "sigelnetd 0.1 (protocol 1)\n";
}

bool splitHostPort(const std::string& addr, std::string& host, uint16_t& port) {
    auto colon = addr.rfind(':');
    if (colon == std::string::npos || colon == 0) return false;
    try {
        int p = std::stoi(addr.substr(colon + 1));
        if (p <= 0 || p > 65535) return false;
        port = static_cast<uint16_t>(p);
    } catch (const std::logic_error&) {
        return false;
    }
    host = addr.substr(0, colon);
    return true;
}

bool parseArgs(int argc, char* argv[], DaemonOptions& opts) {
    static struct option longOptions[] = {
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'v'},
        {"datadir", required_argument, nullptr, 'D'},
        {"config", required_argument, nullptr, 'c'},
        {"port", required_argument, nullptr, 'p'},
        {"connect", required_argument, nullptr, 'C'},
        {"mine", required_argument, nullptr, 'm'},
        {"loglevel", required_argument, nullptr, 'l'},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    int optionIndex = 0;
    while ((opt = getopt_long(argc, argv, "hvD:c:p:C:m:l:", longOptions, &optionIndex)) != -1) {
        switch (opt) {
            case 'h':
                opts.showHelp = true;
                return true;
            case 'v':
                opts.showVersion = true;
                return true;
            case 'D':
                opts.dataDir = optarg;
                break;
            case 'c':
                opts.configPath = optarg;
                break;
            case 'p':
                try {
                    opts.port = std::stoi(optarg);
                } catch (const std::logic_error&) {
                    opts.port = -2;
                }
                if (opts.port < 0 || opts.port > 65535) {
                    std::cerr << "Invalid port: " << optarg << "\n";
                    return false;
                }
                break;
            case 'C':
                opts.connect.push_back(optarg);
                break;
            case 'm':
                opts.mineAs = optarg;
                break;
            case 'l':
                opts.logLevel = optarg;
                break;
            default:
                return false;
        }
    }
    return true;
}

// Finds the local identity with the given name, creating it when absent.
Result<core::IdentityRecord> resolveMiner(node::Node& node, const std::string& name) {
    for (const auto& record : node.identities().localIdentities()) {
        if (record.name == name) return record;
    }
    return node.createIdentity(name);
}

int run(const DaemonOptions& opts) {
    utils::Config& config = utils::Config::instance();
    if (!opts.dataDir.empty()) config.setDataDir(opts.dataDir);
    const std::string dataDir = config.getDataDir();

    std::string configPath = opts.configPath.empty() ? dataDir + "/sigelnet.conf" : opts.configPath;
    if (std::filesystem::exists(configPath)) {
        if (!config.load(configPath)) {
            std::cerr << "Cannot read config " << configPath << "\n";
            return 1;
        }
    } else if (!opts.configPath.empty()) {
        std::cerr << "Config file not found: " << configPath << "\n";
        return 1;
    } else {
        std::error_code ec;
        std::filesystem::create_directories(dataDir, ec);
        if (ec || !config.save(configPath)) {
            std::cerr << "Cannot write default config " << configPath << "\n";
        }
    }
    if (opts.port >= 0) config.set("network.port", opts.port);
    if (!opts.logLevel.empty()) config.set("log.level", opts.logLevel);

    std::string lockError;
    auto instanceLock = utils::SingleInstanceLock::acquire(dataDir, &lockError);
    if (!instanceLock) {
        std::cerr << "sigelnetd: " << lockError << "\n";
        return 1;
    }

    utils::Logger::setRotation(static_cast<uint64_t>(config.getInt("log.max_size_mb", 10)) * 1024 * 1024,
                               static_cast<uint32_t>(config.getInt("log.max_files", 5)));
    utils::Logger::enableConsole(config.getBool("log.console", true));
    utils::Logger::init(config.getString("log.file", dataDir + "/sigelnetd.log"));
    utils::Logger::setLevel(utils::Logger::parseLevel(config.getString("log.level", "info")));
    LOG_INFO(std::string("Log level ") + utils::Logger::levelName(utils::Logger::getLevel()));

    node::NodeConfig nodeConfig = node::NodeConfig::fromConfig(config);
    node::Node node(nodeConfig);
    node.onFatal([](const std::string&) {
        g_exitCode = 2;
        g_running = false;
    });

    auto started = node.start();
    if (!started.ok()) {
        LOG_FATAL(std::string("Failed to start node (") + errorToString(started.error().code) + "): " +
                  started.error().message);
        utils::Logger::shutdown();
        return 1;
    }

    for (const auto& addr : opts.connect) {
        std::string host;
        uint16_t port = 0;
        if (!splitHostPort(addr, host, port)) {
            LOG_WARN("Ignoring malformed peer address " + addr);
            continue;
        }
        auto session = node.connect(host, port);
        if (!session.ok()) {
            LOG_WARN(session.error().message);
        }
    }

    if (!opts.mineAs.empty()) {
        auto miner = resolveMiner(node, opts.mineAs);
        if (!miner.ok()) {
            LOG_ERROR("Cannot mine as " + opts.mineAs + ": " + miner.error().message);
        } else {
            auto res = node.mine(miner.value().id, true);
            if (!res.ok()) LOG_ERROR("Cannot start miner: " + res.error().message);
        }
    }

    uint64_t lastHeight = node.status().height;
    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        node::NodeStatus status = node.status();
        if (status.height != lastHeight) {
            lastHeight = status.height;
            LOG_INFO("Height " + std::to_string(status.height) + " tip " +
                     crypto::toHex(status.tipHash).substr(0, 16) + " peers " +
                     std::to_string(status.syncedPeers));
        }
    }

    LOG_INFO("Shutting down");
    node.stop();

    ErrorHandler& errors = ErrorHandler::instance();
    if (errors.getErrorCount() > 0) {
        for (const auto& err : errors.getRecentErrors(5)) {
            LOG_WARN(std::string(severityToString(err.severity)) + " " + errorToString(err.code) + ": " +
                     err.message);
        }
    }
    if (errors.hasCriticalErrors()) g_exitCode = 2;
    utils::Logger::flush();
    utils::Logger::shutdown();
    return g_exitCode;
}

}

int main(int argc, char* argv[]) {
    sigelnet::registerSignalHandlers();

    sigelnet::DaemonOptions opts;
    if (!sigelnet::parseArgs(argc, argv, opts)) {
        sigelnet::printHelp(argv[0]);
        return 1;
    }
    if (opts.showHelp) {
        sigelnet::printHelp(argv[0]);
        return 0;
    }
    if (opts.showVersion) {
        sigelnet::printVersion();
        return 0;
    }

    return sigelnet::run(opts);
}
