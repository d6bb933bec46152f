/**
 * Unit tests for the shared logger
 */

#include "common/logging.h"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <sstream>

using namespace periwinkle::common;

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved_level = Logger::instance().level();
        Logger::instance().set_output(captured);
        Logger::instance().set_level(LogLevel::INFO);
        Logger::instance().set_json_format(false);
    }

    void TearDown() override {
        Logger::instance().set_output(std::cout);
        Logger::instance().set_level(saved_level);
        Logger::instance().set_json_format(false);
    }

    std::ostringstream captured;
    LogLevel saved_level = LogLevel::INFO;
};

// Test 1: lines below the level are dropped
TEST_F(LoggingTest, LevelFiltering) {
    LOG_DEBUG("hidden ", 1);
    EXPECT_TRUE(captured.str().empty());

    LOG_INFO("shown ", 2);
    EXPECT_NE(std::string::npos, captured.str().find("[INFO] [periwinkle] shown 2"));

    Logger::instance().set_level(LogLevel::ERROR);
    LOG_WARN("quiet");
    EXPECT_EQ(std::string::npos, captured.str().find("quiet"));
}

// Test 2: argument evaluation is skipped when disabled
TEST_F(LoggingTest, DisabledArgumentsNotEvaluated) {
    int evaluated = 0;
    auto touch = [&evaluated]() { return ++evaluated; };
    LOG_TRACE("value ", touch());
    LOG_DEBUG("value ", touch());
    EXPECT_EQ(0, evaluated);
}

// Test 3: failures carry their code and bypass the level
TEST_F(LoggingTest, CriticalFailure) {
    Logger::instance().set_level(LogLevel::CRITICAL);
    LOG_HARNESS_ERROR("Program image unavailable", "PROGRAM_NOT_FOUND");
    EXPECT_NE(std::string::npos,
              captured.str().find("[CRITICAL] [harness] Program image unavailable "
                                  "(error: PROGRAM_NOT_FOUND)"));
}

// Test 4: context is rendered in key order
TEST_F(LoggingTest, StructuredContext) {
    LOG_STRUCTURED(LogLevel::WARN, "fixture", "Mismatch", "CHECK_FAILED",
                   {{"step", "2"}, {"account", "abc"}});
    EXPECT_NE(std::string::npos,
              captured.str().find("[fixture] Mismatch (error: CHECK_FAILED) {account=abc, step=2}"));
}

// Test 5: JSON lines parse back
TEST_F(LoggingTest, JsonFormat) {
    Logger::instance().set_json_format(true);
    LOG_STRUCTURED(LogLevel::ERROR, "bencher", "Report write failed", "IO",
                   {{"path", "/tmp/out"}});

    auto line = nlohmann::json::parse(captured.str());
    EXPECT_EQ("ERROR", line["level"].get<std::string>());
    EXPECT_EQ("bencher", line["module"].get<std::string>());
    EXPECT_EQ("Report write failed", line["message"].get<std::string>());
    EXPECT_EQ("IO", line["error_code"].get<std::string>());
    EXPECT_EQ("/tmp/out", line["context"]["path"].get<std::string>());
    EXPECT_EQ('Z', line["timestamp"].get<std::string>().back());
}

// Test 6: invalid UTF-8 in a message does not break JSON output
TEST_F(LoggingTest, JsonReplacesInvalidUtf8) {
    Logger::instance().set_json_format(true);
    LOG_INFO("bytes ", std::string("\xff\xfe"));
    EXPECT_NO_THROW(nlohmann::json::parse(captured.str()));
}

// Test 7: level names
TEST_F(LoggingTest, ParseLevel) {
    EXPECT_EQ(LogLevel::DEBUG, Logger::parse_level("debug"));
    EXPECT_EQ(LogLevel::WARN, Logger::parse_level("Warning"));
    EXPECT_EQ(LogLevel::CRITICAL, Logger::parse_level("CRITICAL"));
    EXPECT_FALSE(Logger::parse_level("loud").has_value());
    EXPECT_EQ("TRACE", Logger::level_to_string(LogLevel::TRACE));
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
