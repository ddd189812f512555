#include <gtest/gtest.h>
#include "node/node.h"
#include "utils/config.h"
#include "utils/logger.h"
#include <filesystem>
#include <fstream>

using namespace sigelnet;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = std::filesystem::temp_directory_path() / "sigelnet_test_config";
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(dir);
        utils::Config::instance().reset();
    }

    void TearDown() override {
        utils::Config::instance().reset();
        std::filesystem::remove_all(dir);
    }

    std::string writeFile(const std::string& body) {
        std::string path = (dir / "sigelnet.conf").string();
        std::ofstream out(path);
        out << body;
        return path;
    }

    std::filesystem::path dir;
};

TEST_F(ConfigTest, DefaultsMatchSectionStructs) {
    utils::Config& config = utils::Config::instance();
    utils::NetworkConfig net = config.getNetworkConfig();
    EXPECT_EQ(net.port, utils::NetworkConfig().port);
    EXPECT_EQ(net.handshakeTimeoutMs, utils::NetworkConfig().handshakeTimeoutMs);
    EXPECT_TRUE(net.seedNodes.empty());

    utils::ChainConfig chain = config.getChainConfig();
    EXPECT_EQ(chain.genesisTarget, utils::ChainConfig().genesisTarget);
    EXPECT_DOUBLE_EQ(chain.maxAdjustment, 4.0);

    EXPECT_EQ(config.getString("log.level"), "info");
    EXPECT_TRUE(config.getBool("log.console"));
    EXPECT_TRUE(config.has("mining.pool_size"));
    EXPECT_FALSE(config.has("mining.nonsense"));
}

TEST_F(ConfigTest, LoadOverridesAndIgnoresComments) {
    std::string path = writeFile(
        "# local node\n"
        "network.port = 9100\n"
        "network.seed_nodes = 10.0.0.1:8533, 10.0.0.2:8533 ,\n"
        "chain.genesis_target=0x00000fffffffffff\n"
        "chain.max_score = 12.5\n"
        "log.console = off\n"
        "not a key value line\n"
        "=orphan\n");
    utils::Config& config = utils::Config::instance();
    ASSERT_TRUE(config.load(path));

    EXPECT_EQ(config.getInt("network.port"), 9100);
    EXPECT_EQ(config.getList("network.seed_nodes"),
              (std::vector<std::string>{"10.0.0.1:8533", "10.0.0.2:8533"}));
    EXPECT_EQ(config.getUInt64("chain.genesis_target"), 0x00000fffffffffffULL);
    EXPECT_DOUBLE_EQ(config.getDouble("chain.max_score"), 12.5);
    EXPECT_FALSE(config.getBool("log.console", true));
    EXPECT_EQ(config.getNetworkConfig().seedNodes.size(), 2u);

    EXPECT_FALSE(config.load((dir / "missing.conf").string()));
}

TEST_F(ConfigTest, MalformedNumbersFallBackToDefault) {
    utils::Config& config = utils::Config::instance();
    config.set("network.port", "many");
    config.set("chain.genesis_target", "-5");
    EXPECT_EQ(config.getInt("network.port", 42), 42);
    EXPECT_EQ(config.getUInt64("chain.genesis_target", 7), 7u);
    EXPECT_DOUBLE_EQ(config.getDouble("chain.max_score", 1.5), 64.0);
}

TEST_F(ConfigTest, SaveWritesLoadableFile) {
    utils::Config& config = utils::Config::instance();
    config.set("network.port", 9200);
    config.set("mining.attempts_per_round", static_cast<uint64_t>(777));
    std::string path = (dir / "saved.conf").string();
    ASSERT_TRUE(config.save(path));

    config.reset();
    EXPECT_NE(config.getInt("network.port"), 9200);
    ASSERT_TRUE(config.load(path));
    EXPECT_EQ(config.getInt("network.port"), 9200);
    EXPECT_EQ(config.getMiningConfig().attemptsPerRound, 777u);
}

TEST_F(ConfigTest, NodeConfigTakesEverySection) {
    utils::Config& config = utils::Config::instance();
    config.setDataDir(dir.string());
    config.set("network.bind", "127.0.0.1");
    config.set("chain.retarget_interval", 5);
    config.set("chain.max_adjustment", 2.0);
    config.set("mining.max_transfers_per_block", 3);

    node::NodeConfig nc = node::NodeConfig::fromConfig(config);
    EXPECT_EQ(nc.dataDir, dir.string());
    EXPECT_EQ(nc.network.bindAddress, "127.0.0.1");
    EXPECT_EQ(nc.chain.retargetInterval, 5u);
    EXPECT_DOUBLE_EQ(nc.chain.maxAdjustment, 2.0);
    EXPECT_EQ(nc.mining.maxTransfersPerBlock, 3u);
    EXPECT_TRUE(nc.chain.validate());
}

TEST(LoggerTest, ParsesLevelNames) {
    using utils::Logger;
    using utils::LogLevel;
    EXPECT_EQ(Logger::parseLevel("DEBUG"), LogLevel::DEBUG);
    EXPECT_EQ(Logger::parseLevel("warning"), LogLevel::WARN);
    EXPECT_EQ(Logger::parseLevel("off"), LogLevel::OFF);
    EXPECT_EQ(Logger::parseLevel("loud"), LogLevel::INFO);
    EXPECT_STREQ(Logger::levelName(LogLevel::ERROR), "error");
}

TEST(LoggerTest, RotatesPastSizeLimit) {
    using utils::Logger;
    auto dir = std::filesystem::temp_directory_path() / "sigelnet_test_logger";
    std::filesystem::remove_all(dir);
    std::string path = (dir / "node.log").string();

    Logger::enableConsole(false);
    Logger::setRotation(4096, 3);
    Logger::init(path);
    Logger::setLevel(utils::LogLevel::INFO);
    for (int i = 0; i < 200; i++) {
        LOG_CAT(INFO, "test", "line " + std::to_string(i) + std::string(40, 'x'));
    }
    LOG_DEBUG("filtered");
    Logger::flush();
    Logger::shutdown();

    EXPECT_TRUE(std::filesystem::exists(path));
    EXPECT_TRUE(std::filesystem::exists(path + ".1"));
    EXPECT_FALSE(std::filesystem::exists(path + ".3"));
    EXPECT_LE(std::filesystem::file_size(path), 4096u + 128u);

    Logger::init("");
    Logger::setRotation(10 * 1024 * 1024, 5);
    Logger::enableConsole(true);
    std::filesystem::remove_all(dir);
}
