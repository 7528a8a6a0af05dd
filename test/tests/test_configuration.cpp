#include <gtest/gtest.h>
#include "layer_log.hpp"
#include "utils/test_utils.hpp"
#include <map>
#include <string>
#include <stdexcept>

using namespace layerlog;

class ConfigurationTest : public ::testing::Test {
protected:
    void SetUp() override {
        TestUtils::cleanupLogFiles();
        log = std::make_shared<TransportLog>();
    }
    void TearDown() override { TestUtils::cleanupLogFiles(); }

    std::shared_ptr<TransportLog> log;
};

// ---------------------------------------------------------------------------
// Fluent builder
// ---------------------------------------------------------------------------

TEST_F(ConfigurationTest, BuildSync) {
    auto logger = LoggerConfiguration()
        .name("built")
        .layer("APP", LogLevel::WARNING)
        .writeTo("APP", makeMemorySink("app", log, 1))
        .context("service", "api")
        .flushInterval(std::chrono::milliseconds(0))
        .buildSync();

    EXPECT_EQ(logger->name(), "built");
    EXPECT_FALSE(logger->info("filtered", "APP"));
    EXPECT_TRUE(logger->error("kept", "APP"));
    EXPECT_EQ(log->allLines(), (std::vector<std::string>{"kept"}));
    EXPECT_EQ(logger->context().at("service"), "api");
}

TEST_F(ConfigurationTest, BuildAsyncWithDispatcherOptions) {
    auto logger = LoggerConfiguration()
        .name("async-built")
        .writeTo("default", makeMemorySink("d", log, 1))
        .dispatcher(DispatcherOptions().setPrimaryCapacity(1).setOverflowCapacity(1))
        .autoStart(false)
        .buildAsync();

    logger->info("1");
    logger->info("2");
    logger->info("3");
    EXPECT_EQ(logger->droppedCount(), 1u);
    logger->close();
    EXPECT_EQ(log->lineCount(), 2u);
}

TEST_F(ConfigurationTest, BuildOnlyOnce) {
    LoggerConfiguration config;
    config.writeTo("default", makeMemorySink("d", log, 1)).flushInterval(std::chrono::milliseconds(0));
    auto first = config.buildSync();
    EXPECT_THROW(config.buildSync(), std::logic_error);
    EXPECT_THROW(config.buildAsync(), std::logic_error);
}

TEST_F(ConfigurationTest, RedactionThroughBuilder) {
    auto logger = LoggerConfiguration()
        .writeTo("default", makeMemorySink("d", log, 1))
        .redact([](const std::string &m) { return "[" + m + "]"; })
        .flushInterval(std::chrono::milliseconds(0))
        .buildSync();
    logger->info("wrapped");
    EXPECT_EQ(log->allLines(), (std::vector<std::string>{"[wrapped]"}));
}

// ---------------------------------------------------------------------------
// Environment
// ---------------------------------------------------------------------------

TEST_F(ConfigurationTest, EnvironmentDefaults) {
    LayerConfiguration cfg = configurationFromEnvironment(EnvironmentInputs());
    ASSERT_EQ(cfg.size(), 1u);
    const LayerSpec *def = cfg.find("default");
    ASSERT_NE(def, nullptr);
    EXPECT_EQ(def->threshold, LogLevel::INFO);
    ASSERT_EQ(def->sinks.size(), 1u);
    EXPECT_EQ(def->sinks[0]->name(), "console");
}

TEST_F(ConfigurationTest, EnvironmentFileAndLevel) {
    std::map<std::string, std::string> vars;
    vars["LAYER_LOG_LEVEL"] = "debug";
    vars["LAYER_LOG_FORMAT"] = "json";
    vars["LAYER_LOG_FILE"] = "env_test_log.txt";
    vars["LAYER_LOG_CONSOLE"] = "off";

    LayerConfiguration cfg = configurationFromEnvironment(EnvironmentInputs::fromMap(vars));
    const LayerSpec *def = cfg.find("default");
    ASSERT_NE(def, nullptr);
    EXPECT_EQ(def->threshold, LogLevel::DEBUG);
    ASSERT_EQ(def->sinks.size(), 1u);
    EXPECT_EQ(def->sinks[0]->name(), "file");

    {
        auto logger = LoggerConfiguration()
            .layers(cfg)
            .flushInterval(std::chrono::milliseconds(0))
            .buildSync();
        logger->debug("from env", "anything");
    }
    std::string content = TestUtils::readLogFile("env_test_log.txt");
    EXPECT_NE(content.find("\"message\":\"from env\""), std::string::npos);
    EXPECT_NE(content.find("\"level\":\"DEBUG\""), std::string::npos);
}

TEST_F(ConfigurationTest, UnknownLevelFallsBackToInfo) {
    std::map<std::string, std::string> vars;
    vars["LAYER_LOG_LEVEL"] = "chatty";
    vars["LAYER_LOG_CONSOLE"] = "0";
    LayerConfiguration cfg = configurationFromEnvironment(EnvironmentInputs::fromMap(vars));
    EXPECT_EQ(cfg.find("default")->threshold, LogLevel::INFO);
    EXPECT_TRUE(cfg.find("default")->sinks.empty());
}

TEST_F(ConfigurationTest, FromProcessReadsEnvironment) {
    setenv("LAYER_LOG_LEVEL", "error", 1);
    EnvironmentInputs in = EnvironmentInputs::fromProcess();
    unsetenv("LAYER_LOG_LEVEL");
    EXPECT_EQ(in.level, "error");
}
