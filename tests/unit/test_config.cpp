/**
 * @file test_config.cpp
 * @brief Unit tests for global option parsing
 *
 * Tests cover:
 * - Default configuration values
 * - Global options before the command path
 * - Error handling
 * - Log level parsing
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <cmdkit/app/config.hpp>

#include <sstream>
#include <string>
#include <vector>

using namespace cmdkit;
using namespace cmdkit::app;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;

// =============================================================================
// Default Values
// =============================================================================

TEST(ConfigTest, DefaultValues) {
    Config config;

    EXPECT_EQ(config.program_name, "cmdkit");
    EXPECT_EQ(config.version, "1.0.0");
    EXPECT_EQ(config.log_level, "WARN");
    EXPECT_FALSE(config.help);
    EXPECT_FALSE(config.version_requested);
    EXPECT_TRUE(config.command.empty());
    EXPECT_THAT(config.env_assignments, IsEmpty());
}

// =============================================================================
// Parsing
// =============================================================================

TEST(ConfigTest, CommandAndArguments) {
    Config config = parseArgs({"greet", "bob", "--capitalize"});
    EXPECT_EQ(config.command, "greet");
    EXPECT_THAT(config.command_args, ElementsAre("bob", "--capitalize"));
    EXPECT_TRUE(config.error.empty());
}

TEST(ConfigTest, GlobalOptionsBeforeCommand) {
    Config config = parseArgs({"--log-level", "debug", "--env", "A=1", "--env=B=2", "run", "--log-level", "x"});
    EXPECT_EQ(config.log_level, "debug");
    EXPECT_THAT(config.env_assignments, ElementsAre("A=1", "B=2"));
    EXPECT_EQ(config.command, "run");
    EXPECT_THAT(config.command_args, ElementsAre("--log-level", "x"));
}

TEST(ConfigTest, InlineLogLevel) {
    Config config = parseArgs({"--log-level=TRACE"});
    EXPECT_EQ(config.log_level, "TRACE");
    EXPECT_TRUE(config.command.empty());
}

TEST(ConfigTest, HelpAndVersion) {
    EXPECT_TRUE(parseArgs({"-h"}).help);
    EXPECT_TRUE(parseArgs({"--help", "greet"}).help);
    EXPECT_TRUE(parseArgs({"--version"}).version_requested);
}

TEST(ConfigTest, StartsFromGivenDefaults) {
    Config defaults;
    defaults.program_name = "tool";
    defaults.log_level = "ERROR";

    Config config = parseArgs({"cmd"}, defaults);
    EXPECT_EQ(config.program_name, "tool");
    EXPECT_EQ(config.log_level, "ERROR");
}

// =============================================================================
// Error Handling
// =============================================================================

TEST(ConfigTest, MissingValue) {
    Config config = parseArgs({"--log-level"});
    EXPECT_THAT(config.error, HasSubstr("requires a value"));
}

TEST(ConfigTest, InvalidLogLevel) {
    Config config = parseArgs({"--log-level", "loud"});
    EXPECT_THAT(config.error, HasSubstr("invalid log level: loud"));
}

TEST(ConfigTest, InvalidEnvAssignment) {
    Config config = parseArgs({"--env", "NOVALUE"});
    EXPECT_THAT(config.error, HasSubstr("KEY=VALUE"));
}

TEST(ConfigTest, UnknownOption) {
    Config config = parseArgs({"--bogus", "cmd"});
    EXPECT_EQ(config.error, "unknown option: --bogus");
    EXPECT_TRUE(config.command.empty());
}

// =============================================================================
// Environment and Log Level
// =============================================================================

TEST(ConfigTest, LogLevelFromEnvironment) {
    MapEnvironment env(EnvMap{{kLogLevelVariable, "DEBUG"}});
    Config config;
    applyEnvironment(config, env);
    EXPECT_EQ(config.log_level, "DEBUG");

    // Command line still wins.
    config = parseArgs({"--log-level", "ERROR"}, config);
    EXPECT_EQ(config.log_level, "ERROR");
}

TEST(ConfigTest, ParseLogLevel) {
    EXPECT_EQ(parseLogLevel("TRACE"), utils::LogLevel::TRACE);
    EXPECT_EQ(parseLogLevel("debug"), utils::LogLevel::DEBUG);
    EXPECT_EQ(parseLogLevel("INFO"), utils::LogLevel::INFO);
    EXPECT_EQ(parseLogLevel("ERROR"), utils::LogLevel::ERROR);
    EXPECT_EQ(parseLogLevel("OFF"), utils::LogLevel::OFF);
    EXPECT_EQ(parseLogLevel("INVALID"), utils::LogLevel::WARN);
}

TEST(ConfigTest, UsageMentionsOptions) {
    std::ostringstream out;
    printUsage(out, "tool");
    EXPECT_THAT(out.str(), HasSubstr("usage: tool"));
    EXPECT_THAT(out.str(), HasSubstr("--log-level"));
    EXPECT_THAT(out.str(), HasSubstr("--env"));
    EXPECT_THAT(out.str(), HasSubstr(kLogLevelVariable));
}
