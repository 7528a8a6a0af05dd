#include <gtest/gtest.h>
#include "layer_log.hpp"
#include "utils/test_utils.hpp"
#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace layerlog;

/// Logger whose close() throws a non-standard exception type.
class CloseThrowingLogger : public SyncLogger {
public:
    explicit CloseThrowingLogger(const LoggerSettings &s) : SyncLogger(s) {}
    void close() override {
        SyncLogger::close();
        throw 99;
    }
};

class LoggerRegistryTest : public ::testing::Test {
protected:
    static LoggerPtr makeQuiet(const std::string &name) {
        LoggerSettings s;
        s.setName(name).setFlushInterval(std::chrono::milliseconds(0));
        return std::make_shared<SyncLogger>(s);
    }
};

// --- Test 1: same name, same instance ---
TEST_F(LoggerRegistryTest, GetOrCreateReturnsSameInstance) {
    LoggerRegistry registry;
    int created = 0;
    LoggerFactory factory = [&created](const std::string &name) {
        ++created;
        return makeQuiet(name);
    };

    LoggerPtr a = registry.getOrCreate("orders", factory);
    LoggerPtr b = registry.getOrCreate("orders", factory);
    EXPECT_EQ(a, b);
    EXPECT_EQ(created, 1);
    EXPECT_EQ(a->name(), "orders");
    EXPECT_TRUE(registry.contains("orders"));
    EXPECT_EQ(registry.size(), 1u);
}

TEST_F(LoggerRegistryTest, GetUnknownIsNull) {
    LoggerRegistry registry;
    EXPECT_FALSE(registry.get("missing"));
    EXPECT_FALSE(registry.contains("missing"));
}

TEST_F(LoggerRegistryTest, RemoveClosesLogger) {
    LoggerRegistry registry;
    LoggerPtr logger = registry.getOrCreate("tmp", &LoggerRegistryTest::makeQuiet);
    EXPECT_TRUE(registry.remove("tmp"));
    EXPECT_EQ(logger->state(), LoggerState::Closed);
    EXPECT_FALSE(registry.remove("tmp"));
    EXPECT_FALSE(registry.contains("tmp"));
}

TEST_F(LoggerRegistryTest, AddRejectsDuplicates) {
    LoggerRegistry registry;
    EXPECT_TRUE(registry.add("x", makeQuiet("x")));
    EXPECT_FALSE(registry.add("x", makeQuiet("x2")));
    EXPECT_FALSE(registry.add("y", LoggerPtr()));
    EXPECT_EQ(registry.get("x")->name(), "x");
}

TEST_F(LoggerRegistryTest, NamesAreSorted) {
    LoggerRegistry registry;
    registry.getOrCreate("beta", &LoggerRegistryTest::makeQuiet);
    registry.getOrCreate("alpha", &LoggerRegistryTest::makeQuiet);
    EXPECT_EQ(registry.names(), (std::vector<std::string>{"alpha", "beta"}));
}

TEST_F(LoggerRegistryTest, NullFactoryResultThrows) {
    LoggerRegistry registry;
    EXPECT_THROW(registry.getOrCreate("bad", [](const std::string &) { return LoggerPtr(); }),
                 std::invalid_argument);
    EXPECT_FALSE(registry.contains("bad"));
}

TEST_F(LoggerRegistryTest, CloseAllAndDestructor) {
    LoggerPtr kept;
    {
        LoggerRegistry registry;
        kept = registry.getOrCreate("a", &LoggerRegistryTest::makeQuiet);
        LoggerPtr other = registry.getOrCreate("b", &LoggerRegistryTest::makeQuiet);
        registry.closeAll();
        EXPECT_EQ(other->state(), LoggerState::Closed);
        EXPECT_EQ(registry.size(), 0u);

        kept = registry.getOrCreate("a", &LoggerRegistryTest::makeQuiet);
        EXPECT_EQ(kept->state(), LoggerState::Initialized);
    }
    EXPECT_EQ(kept->state(), LoggerState::Closed);
}

TEST_F(LoggerRegistryTest, ThrowingCloseDoesNotStopTheOthers) {
    ErrorCapture errors;
    LoggerRegistry registry;
    LoggerSettings s;
    s.setName("odd").setFlushInterval(std::chrono::milliseconds(0));
    registry.add("a-odd", std::make_shared<CloseThrowingLogger>(s));
    LoggerPtr plain = registry.getOrCreate("b-plain", &LoggerRegistryTest::makeQuiet);

    EXPECT_NO_THROW(registry.closeAll());
    EXPECT_EQ(plain->state(), LoggerState::Closed);
    ASSERT_EQ(errors.count(), 1u);
    EXPECT_EQ(errors.components()[0], "LoggerRegistry");
}

TEST_F(LoggerRegistryTest, ConcurrentGetOrCreateCreatesOnce) {
    LoggerRegistry registry;
    std::atomic<int> created(0);
    LoggerFactory factory = [&created](const std::string &name) {
        created.fetch_add(1);
        return makeQuiet(name);
    };

    std::vector<std::thread> threads;
    std::vector<LoggerPtr> results(8);
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&, t] { results[t] = registry.getOrCreate("shared", factory); });
    }
    for (auto &th : threads) th.join();

    EXPECT_EQ(created.load(), 1);
    for (size_t i = 1; i < results.size(); ++i) {
        EXPECT_EQ(results[i], results[0]);
    }
}
