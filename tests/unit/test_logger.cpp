/**
 * @file test_logger.cpp
 * @brief Unit tests for the logging framework
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <cmdkit/utils/logger.hpp>

#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace cmdkit::utils;
using ::testing::HasSubstr;
using ::testing::Not;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().setLevel(LogLevel::TRACE);
        Logger::instance().setStream(&captured_);
    }

    void TearDown() override {
        Logger::instance().setStream(nullptr);
        Logger::instance().setLevel(LogLevel::WARN);
    }

    std::ostringstream captured_;
};

TEST_F(LoggerTest, SingletonInstance) {
    auto& instance1 = Logger::instance();
    auto& instance2 = Logger::instance();
    EXPECT_EQ(&instance1, &instance2);
}

TEST_F(LoggerTest, LogLevelFiltering) {
    Logger::instance().setLevel(LogLevel::WARN);

    LOG_TRACE("Test", "filtered trace");
    LOG_DEBUG("Test", "filtered debug");
    LOG_INFO("Test", "filtered info");
    LOG_WARN("Test", "visible warn");
    LOG_ERROR("Test", "visible error");

    std::string out = captured_.str();
    EXPECT_THAT(out, Not(HasSubstr("filtered")));
    EXPECT_THAT(out, HasSubstr("visible warn"));
    EXPECT_THAT(out, HasSubstr("visible error"));
}

TEST_F(LoggerTest, OffSilencesEverything) {
    Logger::instance().setLevel(LogLevel::OFF);
    LOG_ERROR("Test", "nothing");
    EXPECT_TRUE(captured_.str().empty());
}

TEST_F(LoggerTest, LogLevelNames) {
    EXPECT_EQ(Logger::levelName(LogLevel::TRACE), "TRACE");
    EXPECT_EQ(Logger::levelName(LogLevel::DEBUG), "DEBUG");
    EXPECT_EQ(Logger::levelName(LogLevel::INFO), "INFO");
    EXPECT_EQ(Logger::levelName(LogLevel::WARN), "WARN");
    EXPECT_EQ(Logger::levelName(LogLevel::ERROR), "ERROR");
    EXPECT_EQ(Logger::levelName(LogLevel::FATAL), "FATAL");
}

TEST_F(LoggerTest, LevelFromString) {
    EXPECT_EQ(logLevelFromString("debug"), LogLevel::DEBUG);
    EXPECT_EQ(logLevelFromString(" Warning "), LogLevel::WARN);
    EXPECT_EQ(logLevelFromString("OFF"), LogLevel::OFF);
    EXPECT_FALSE(logLevelFromString("verbose").has_value());
}

TEST_F(LoggerTest, FormatsPlaceholdersAndComponent) {
    LOG_INFO("Registry", "Registered {} with {} argument(s)", "greet", 2);

    std::string out = captured_.str();
    EXPECT_THAT(out, HasSubstr("[INFO ]"));
    EXPECT_THAT(out, HasSubstr("[Registry]"));
    EXPECT_THAT(out, HasSubstr("Registered greet with 2 argument(s)"));
}

TEST_F(LoggerTest, PlainTextLines) {
    LOG_WARN("Command", "greet requires environment variable {}", "USER");

    std::string out = captured_.str();
    EXPECT_THAT(out, HasSubstr("[WARN ] [Command] greet requires environment variable USER\n"));
    EXPECT_EQ(out.find('\033'), std::string::npos);
}

TEST_F(LoggerTest, ThreadSafety) {
    std::vector<std::thread> threads;
    const int num_threads = 10;
    const int logs_per_thread = 100;

    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([i]() {
            for (int j = 0; j < logs_per_thread; ++j) {
                LOG_INFO("Thread", "Message {} from {}", j, i);
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    std::istringstream lines(captured_.str());
    std::string line;
    int count = 0;
    while (std::getline(lines, line)) {
        ++count;
    }
    EXPECT_EQ(count, num_threads * logs_per_thread);
}
