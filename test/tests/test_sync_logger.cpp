#include <gtest/gtest.h>
#include "layer_log.hpp"
#include "utils/test_utils.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <thread>
#include <stdexcept>

using namespace layerlog;

class SyncLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        TestUtils::cleanupLogFiles();
        log = std::make_shared<TransportLog>();
    }
    void TearDown() override { TestUtils::cleanupLogFiles(); }

    LoggerSettings settingsWith(const std::string &layer, SinkPtr sink, LogLevel threshold = LogLevel::DEBUG) {
        LoggerSettings s;
        LayerConfiguration layers;
        layers.addLayer(layer, threshold).addSink(layer, std::move(sink));
        s.setName("sync-test").setLayers(layers).setFlushInterval(std::chrono::milliseconds(0));
        return s;
    }

    std::shared_ptr<TransportLog> log;
};

// --- Test 1: A, B, C into a 3-record buffer produce one ordered batch ---
TEST_F(SyncLoggerTest, EndToEndSingleBatch) {
    SyncLogger logger(settingsWith("APP", makeMemorySink("app", log, 3, std::chrono::seconds(60))));

    EXPECT_TRUE(logger.log(LogLevel::INFO, "A", "APP"));
    EXPECT_TRUE(logger.log(LogLevel::INFO, "B", "APP"));
    EXPECT_EQ(log->batchCount(), 0u);
    EXPECT_TRUE(logger.log(LogLevel::INFO, "C", "APP"));

    ASSERT_EQ(log->batchCount(), 1u);
    EXPECT_EQ(log->snapshot()[0], (std::vector<std::string>{"A", "B", "C"}));
}

// --- Test 2: no layers means no writes and no errors ---
TEST_F(SyncLoggerTest, NoLayersIsSilentNoop) {
    LoggerSettings s;
    s.setFlushInterval(std::chrono::milliseconds(0));
    SyncLogger logger(s);

    EXPECT_NO_THROW({
        EXPECT_FALSE(logger.log(LogLevel::CRITICAL, "lost", "X"));
        EXPECT_FALSE(logger.info("also lost"));
    });
    EXPECT_EQ(logger.health().logged, 0u);
    EXPECT_EQ(logger.health().sinks, 0u);
}

// --- Test 3: layer threshold fast-rejects ---
TEST_F(SyncLoggerTest, LayerThresholdRejects) {
    SyncLogger logger(settingsWith("APP", makeMemorySink("app", log, 1), LogLevel::WARNING));
    EXPECT_FALSE(logger.isEnabled("APP", LogLevel::INFO));
    EXPECT_FALSE(logger.info("quiet", "APP"));
    EXPECT_TRUE(logger.error("loud", "APP"));
    EXPECT_EQ(log->allLines(), (std::vector<std::string>{"loud"}));
}

// --- Test 4: unknown layers follow the fallback chain ---
TEST_F(SyncLoggerTest, UnknownLayerUsesDefault) {
    auto other = std::make_shared<TransportLog>();
    LoggerSettings s = settingsWith("default", makeMemorySink("def", log, 1));
    s.layers_.addSink("AUDIT", makeMemorySink("audit", other, 1));
    SyncLogger logger(s);

    logger.info("routed", "NOT_CONFIGURED");
    logger.info("audited", "AUDIT");
    EXPECT_EQ(log->allLines(), (std::vector<std::string>{"routed"}));
    EXPECT_EQ(other->allLines(), (std::vector<std::string>{"audited"}));
}

// --- Test 5: close is idempotent and later calls are ignored ---
TEST_F(SyncLoggerTest, CloseTwice) {
    SyncLogger logger(settingsWith("APP", makeMemorySink("app", log, 100)));
    logger.info("buffered", "APP");
    EXPECT_EQ(logger.state(), LoggerState::Initialized);

    logger.close();
    EXPECT_EQ(logger.state(), LoggerState::Closed);
    EXPECT_EQ(log->allLines(), (std::vector<std::string>{"buffered"}));
    EXPECT_EQ(log->closes(), 1);

    EXPECT_NO_THROW(logger.close());
    EXPECT_EQ(logger.state(), LoggerState::Closed);
    EXPECT_EQ(log->closes(), 1);

    EXPECT_FALSE(logger.info("after close", "APP"));
    EXPECT_EQ(log->lineCount(), 1u);
}

// --- Test 6: redaction hook, including its failure mode ---
TEST_F(SyncLoggerTest, RedactionRewritesMessage) {
    LoggerSettings s = settingsWith("APP", makeMemorySink("app", log, 1));
    s.setRedaction([](const std::string &m) {
        std::string out = m;
        size_t pos = out.find("secret");
        if (pos != std::string::npos) out.replace(pos, 6, "******");
        return out;
    });
    SyncLogger logger(s);
    logger.info("password=secret", "APP");
    EXPECT_EQ(log->allLines(), (std::vector<std::string>{"password=******"}));
}

TEST_F(SyncLoggerTest, FailingRedactionKeepsOriginal) {
    ErrorCapture errors;
    LoggerSettings s = settingsWith("APP", makeMemorySink("app", log, 1));
    s.setRedaction([](const std::string &) -> std::string {
        throw std::runtime_error("regex exploded");
    });
    SyncLogger logger(s);

    EXPECT_TRUE(logger.info("kept as is", "APP"));
    EXPECT_EQ(log->allLines(), (std::vector<std::string>{"kept as is"}));
    EXPECT_EQ(errors.count(), 1u);
}

TEST_F(SyncLoggerTest, NonStandardRedactionErrorKeepsOriginal) {
    ErrorCapture errors;
    LoggerSettings s = settingsWith("APP", makeMemorySink("app", log, 1));
    s.setRedaction([](const std::string &) -> std::string {
        throw 42;
    });
    SyncLogger logger(s);

    bool accepted = false;
    EXPECT_NO_THROW(accepted = logger.info("still delivered", "APP"));
    EXPECT_TRUE(accepted);
    EXPECT_EQ(log->allLines(), (std::vector<std::string>{"still delivered"}));
    ASSERT_EQ(errors.count(), 1u);
    EXPECT_NE(errors.messages()[0].find("unknown exception"), std::string::npos);
}

// --- Test 7: a broken sink does not affect its sibling ---
TEST_F(SyncLoggerTest, BrokenSinkIsIsolated) {
    ErrorCapture errors;
    auto broken = std::make_shared<TransportLog>();
    SinkOptions bopts;
    bopts.setName("broken").setMaxBufferSize(1);
    SinkPtr bad = std::make_shared<Sink>(bopts, detail::make_unique<MessageOnlyFormatter>(),
                                         detail::make_unique<FailingTransport>(broken, 1000));

    LoggerSettings s = settingsWith("APP", bad);
    s.layers_.addSink("APP", makeMemorySink("good", log, 1));
    SyncLogger logger(s);

    EXPECT_TRUE(logger.info("one", "APP"));
    EXPECT_TRUE(logger.info("two", "APP"));
    EXPECT_EQ(log->allLines(), (std::vector<std::string>{"one", "two"}));

    LoggerHealth h = logger.health();
    EXPECT_EQ(h.sinkWriteErrors, 2u);
    EXPECT_EQ(h.recordsLost, 2u);
}

// --- Test 8: context, caller capture and sequence ids ---
TEST_F(SyncLoggerTest, RecordsCarryContextAndCaller) {
    auto jsonLog = std::make_shared<TransportLog>();
    SinkOptions opts;
    opts.setMaxBufferSize(1);
    SinkPtr sink = std::make_shared<Sink>(opts, detail::make_unique<JsonFormatter>(),
                                          detail::make_unique<MemoryTransport>(jsonLog));
    LoggerSettings s = settingsWith("APP", sink);
    s.addContext("service", "billing");
    SyncLogger logger(s);
    logger.setContext("region", "eu");

    ExtraFields extra;
    extra.push_back(std::make_pair("order", "42"));
    logger.log(LogLevel::INFO, "plain", "APP", extra);
    LAYER_LOG_WARNING(logger, "APP", "with caller");

    auto lines = jsonLog->allLines();
    ASSERT_EQ(lines.size(), 2u);
    nlohmann::json first = nlohmann::json::parse(lines[0]);
    EXPECT_EQ(first["logger"], "sync-test");
    EXPECT_EQ(first["context"]["service"], "billing");
    EXPECT_EQ(first["context"]["region"], "eu");
    EXPECT_EQ(first["extra"]["order"], "42");
    EXPECT_FALSE(first.contains("file"));

    nlohmann::json second = nlohmann::json::parse(lines[1]);
    EXPECT_EQ(second["level"], "WARNING");
    EXPECT_TRUE(second.contains("file"));
    EXPECT_GT(second["line"].get<int>(), 0);
}

TEST_F(SyncLoggerTest, MacroSkipsDisabledLevels) {
    SyncLogger logger(settingsWith("APP", makeMemorySink("app", log, 1), LogLevel::ERROR));
    int evaluated = 0;
    auto message = [&evaluated]() { ++evaluated; return std::string("built"); };
    LAYER_LOG_DEBUG(logger, "APP", message());
    EXPECT_EQ(evaluated, 0);
    LAYER_LOG_ERROR(logger, "APP", message());
    EXPECT_EQ(evaluated, 1);
    EXPECT_EQ(log->allLines(), (std::vector<std::string>{"built"}));
}

// --- Test 9: reload retires sinks until close ---
TEST_F(SyncLoggerTest, ReloadRetiresOldSinks) {
    auto second = std::make_shared<TransportLog>();
    SyncLogger logger(settingsWith("APP", makeMemorySink("first", log, 100)));
    logger.info("before", "APP");

    LayerConfiguration next;
    next.addLayer("APP", LogLevel::DEBUG).addSink("APP", makeMemorySink("second", second, 1));
    logger.reload(next);
    logger.info("after", "APP");

    EXPECT_EQ(second->allLines(), (std::vector<std::string>{"after"}));
    EXPECT_EQ(log->lineCount(), 0u);
    EXPECT_EQ(log->closes(), 0);

    logger.close();
    EXPECT_EQ(log->allLines(), (std::vector<std::string>{"before"}));
    EXPECT_EQ(log->closes(), 1);
    EXPECT_EQ(second->closes(), 1);
}

TEST_F(SyncLoggerTest, LogBatchCountsAccepted) {
    SyncLogger logger(settingsWith("APP", makeMemorySink("app", log, 1), LogLevel::INFO));
    std::vector<LogCall> calls;
    calls.push_back(LogCall(LogLevel::INFO, "a", "APP"));
    calls.push_back(LogCall(LogLevel::DEBUG, "filtered", "APP"));
    calls.push_back(LogCall(LogLevel::ERROR, "b", "APP"));
    EXPECT_EQ(logger.logBatch(calls), 2u);
    EXPECT_EQ(log->allLines(), (std::vector<std::string>{"a", "b"}));
}

TEST_F(SyncLoggerTest, ConcurrentCallersLoseNothing) {
    SyncLogger logger(settingsWith("APP", makeMemorySink("app", log, 16)));
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&logger] {
            for (int i = 0; i < 250; ++i) logger.info("x", "APP");
        });
    }
    for (auto &th : threads) th.join();
    logger.close();
    EXPECT_EQ(log->lineCount(), 1000u);
    EXPECT_EQ(logger.health().logged, 1000u);
}

TEST_F(SyncLoggerTest, HealthJson) {
    SyncLogger logger(settingsWith("APP", makeMemorySink("app", log, 1)));
    logger.info("x", "APP");
    nlohmann::ordered_json j = logger.health().toJson();
    EXPECT_EQ(j["name"], "sync-test");
    EXPECT_EQ(j["kind"], "sync");
    EXPECT_EQ(j["state"], "initialized");
    EXPECT_EQ(j["healthy"], true);
    EXPECT_EQ(j["logged"], 1);
    EXPECT_FALSE(j.contains("primary_queued"));
}

TEST_F(SyncLoggerTest, WritesToFile) {
    LoggerSettings s = settingsWith("APP", makeFileSink("layer_test_log.txt",
        SinkOptions::file().setMaxBufferSize(1)));
    {
        SyncLogger logger(s);
        logger.info("to disk", "APP");
    }
    std::string content = TestUtils::readLogFile("layer_test_log.txt");
    EXPECT_NE(content.find("[INFO] [APP] to disk"), std::string::npos);
}
