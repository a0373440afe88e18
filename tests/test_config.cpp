#include "core/Config.hpp"
#include "core/downloader/DecisionEngine.hpp"
#include "core/downloader/TransferClient.hpp"
#include "core/downloader/TransferEngine.hpp"
#include "support/TestSupport.hpp"

#include <gtest/gtest.h>

#include <fstream>

using flux::core::Config;
using namespace flux::core::downloader;
using namespace std::chrono_literals;

namespace {

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        Config::instance().setDefaults();
    }

    void TearDown() override {
        Config::instance().setDefaults();
    }

    Config& config = Config::instance();
    flux::test::TempDirectory dir;
};

} // namespace

TEST_F(ConfigTest, DefaultsAreReadable) {
    EXPECT_EQ(config.get<int>("client.maxRetries", 0), 3);
    EXPECT_EQ(config.get<std::string>("client.userAgent", ""), "Flux/1.0.0");
    EXPECT_DOUBLE_EQ(config.get<double>("decisions.stableCv", 0.0), 0.15);
    EXPECT_EQ(config.get<uint32_t>("engine.initialConnections", 0), 8u);
    EXPECT_EQ(config.get<std::string>("logging.level", ""), "info");
}

TEST_F(ConfigTest, MissingOrMistypedKeysFallBack) {
    EXPECT_EQ(config.get<int>("client.noSuchKey", 42), 42);
    EXPECT_EQ(config.get<int>("noSuchSection.key", 7), 7);
    EXPECT_EQ(config.get<int>("client.userAgent", 5), 5);
}

TEST_F(ConfigTest, SetCreatesNestedValues) {
    config.set("client.maxRetries", 9);
    config.set("custom.section.flag", true);

    EXPECT_EQ(config.get<int>("client.maxRetries", 0), 9);
    EXPECT_TRUE(config.get<bool>("custom.section.flag", false));
}

TEST_F(ConfigTest, LoadMergesOverDefaults) {
    auto path = dir.path() / "config.json";
    {
        std::ofstream file(path);
        file << R"({"client": {"maxRetries": 7}, "engine": {"outputDirectory": "/tmp/out"}})";
    }

    ASSERT_TRUE(config.load(path.string()));

    EXPECT_EQ(config.get<int>("client.maxRetries", 0), 7);
    EXPECT_EQ(config.get<int>("client.timeoutSeconds", 0), 30);
    EXPECT_EQ(config.get<std::string>("engine.outputDirectory", ""), "/tmp/out");
}

TEST_F(ConfigTest, LoadRejectsMissingAndInvalidFiles) {
    EXPECT_FALSE(config.load((dir.path() / "absent.json").string()));

    auto path = dir.path() / "broken.json";
    {
        std::ofstream file(path);
        file << "{ \"client\": ";
    }
    EXPECT_FALSE(config.load(path.string()));
    EXPECT_EQ(config.get<int>("client.maxRetries", 0), 3);
}

TEST_F(ConfigTest, SaveThenLoadKeepsChanges) {
    auto path = dir.path() / "nested" / "config.json";
    config.set("decisions.maxConnections", 24);

    ASSERT_TRUE(config.save(path.string()));
    config.setDefaults();
    ASSERT_TRUE(config.load(path.string()));

    EXPECT_EQ(config.get<uint32_t>("decisions.maxConnections", 0), 24u);
}

TEST_F(ConfigTest, ClientOptionsFromConfig) {
    config.set("client.maxRetries", -4);
    config.set("client.backoffBaseMillis", 250);
    config.set("client.probeTimeoutSeconds", 2);
    config.set("client.userAgent", "Test/2.0");

    auto options = ClientOptions::fromConfig(config);

    EXPECT_EQ(options.maxRetries, 0);
    EXPECT_EQ(options.backoffBase, 250ms);
    EXPECT_EQ(options.probeTimeoutSeconds, 2);
    EXPECT_EQ(options.http.userAgent, "Test/2.0");
    EXPECT_EQ(options.http.timeoutSeconds, 30);
}

TEST_F(ConfigTest, DecisionPolicyFromConfig) {
    auto defaults = DecisionPolicy::fromConfig(config);
    EXPECT_EQ(defaults.minSamples, 10u);
    EXPECT_EQ(defaults.cooldown, 5000ms);
    EXPECT_EQ(defaults.minChunkSize, kMiB);
    EXPECT_EQ(defaults.maxChunkSize, 16 * kMiB);

    config.set("decisions.cooldownSeconds", 2.5);
    config.set("decisions.minChunkSize", 8 * kMiB);
    config.set("decisions.maxChunkSize", 2 * kMiB);
    config.set("decisions.minConnections", 0);

    auto policy = DecisionPolicy::fromConfig(config);

    EXPECT_EQ(policy.cooldown, 2500ms);
    EXPECT_EQ(policy.minChunkSize, 8 * kMiB);
    EXPECT_EQ(policy.maxChunkSize, 8 * kMiB);
    EXPECT_EQ(policy.minConnections, 1u);
    EXPECT_EQ(policy.maxConnections, 16u);
}

TEST_F(ConfigTest, EngineOptionsFromConfig) {
    config.set("engine.fetchThreads", 0);
    config.set("engine.initialConnections", 4);
    config.set("engine.outputDirectory", "/data/downloads");

    auto options = EngineOptions::fromConfig(config);

    EXPECT_EQ(options.fetchThreads, 1u);
    EXPECT_EQ(options.initialConnections, 4u);
    EXPECT_EQ(options.outputDirectory, std::filesystem::path("/data/downloads"));
}
