#include <gtest/gtest.h>
#include "layer_log.hpp"
#include "utils/test_utils.hpp"
#include <nlohmann/json.hpp>
#include <string>

using namespace layerlog;

class LogRecordTest : public ::testing::Test {};

// --- Test 1: fields are kept as given ---
TEST_F(LogRecordTest, StoresAllFields) {
    ExtraFields extra;
    extra.push_back(std::make_pair("zeta", "1"));
    extra.push_back(std::make_pair("alpha", "2"));
    ContextFields ctx;
    ctx["service"] = "orders";

    LogRecord rec(LogLevel::WARNING, "APP", "main", "hello", extra, ctx,
                  CallerContext("main.cpp", "run", 42), 7);

    EXPECT_EQ(rec.level(), LogLevel::WARNING);
    EXPECT_EQ(rec.levelValue(), 30);
    EXPECT_STREQ(rec.levelName(), "WARNING");
    EXPECT_EQ(rec.layer(), "APP");
    EXPECT_EQ(rec.loggerName(), "main");
    EXPECT_EQ(rec.message(), "hello");
    EXPECT_EQ(rec.sequence(), 7u);
    ASSERT_TRUE(rec.hasCaller());
    EXPECT_EQ(rec.caller().line, 42);
    ASSERT_EQ(rec.extra().size(), 2u);
    EXPECT_EQ(rec.extra()[0].first, "zeta");
    EXPECT_EQ(rec.context().at("service"), "orders");
}

// --- Test 2: withMessage leaves the original untouched ---
TEST_F(LogRecordTest, WithMessageCopies) {
    RecordPtr original = makeRecord(LogLevel::INFO, "APP", "card 4111");
    LogRecord redacted = original->withMessage("card ****");

    EXPECT_EQ(original->message(), "card 4111");
    EXPECT_EQ(redacted.message(), "card ****");
    EXPECT_EQ(redacted.layer(), "APP");
    EXPECT_EQ(redacted.timestamp(), original->timestamp());
}

TEST_F(LogRecordTest, NoCallerByDefault) {
    RecordPtr rec = makeRecord(LogLevel::DEBUG, "X", "m");
    EXPECT_FALSE(rec->hasCaller());
    EXPECT_TRUE(rec->extra().empty());
}

// ---------------------------------------------------------------------------
// Formatters
// ---------------------------------------------------------------------------

TEST_F(LogRecordTest, PlainTextFormatterLayout) {
    ExtraFields extra;
    extra.push_back(std::make_pair("user", "bob"));
    extra.push_back(std::make_pair("id", "5"));
    LogRecord rec(LogLevel::ERROR, "DB", "", "query failed", extra, ContextFields(),
                  CallerContext("db.cpp", "exec", 12));

    PlainTextFormatter fmt;
    std::string out = fmt.format(rec);

    EXPECT_NE(out.find("[ERROR] [DB] query failed"), std::string::npos);
    EXPECT_NE(out.find("[db.cpp:12 exec]"), std::string::npos);
    EXPECT_NE(out.find("{user=bob, id=5}"), std::string::npos);
}

TEST_F(LogRecordTest, JsonFormatterProducesParsableObject) {
    ExtraFields extra;
    extra.push_back(std::make_pair("k", "v"));
    ContextFields ctx;
    ctx["env"] = "test";
    LogRecord rec(LogLevel::INFO, "APP", "svc", "say \"hi\"", extra, ctx);

    JsonFormatter fmt;
    nlohmann::json j = nlohmann::json::parse(fmt.format(rec));

    EXPECT_EQ(j["level"], "INFO");
    EXPECT_EQ(j["level_value"], 20);
    EXPECT_EQ(j["layer"], "APP");
    EXPECT_EQ(j["logger"], "svc");
    EXPECT_EQ(j["message"], "say \"hi\"");
    EXPECT_EQ(j["extra"]["k"], "v");
    EXPECT_EQ(j["context"]["env"], "test");
    EXPECT_FALSE(j.contains("file"));
}

TEST_F(LogRecordTest, MessageOnlyFormatter) {
    MessageOnlyFormatter fmt;
    EXPECT_EQ(fmt.format(*makeRecord(LogLevel::INFO, "A", "just this")), "just this");
}
