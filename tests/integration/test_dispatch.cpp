/**
 * @file test_dispatch.cpp
 * @brief Integration test: demo commands dispatched through the top-level entry point
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <cmdkit/app/dispatcher.hpp>
#include <cmdkit/utils/logger.hpp>

#include "commands.hpp"

#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

using namespace cmdkit;
using ::testing::HasSubstr;
using ::testing::Not;
using ::testing::StartsWith;

class DispatchTest : public ::testing::Test {
protected:
    void SetUp() override {
        demo::commands::register_basic(registry);
        registry.merge(demo::commands::config_registry(), "config");

        store_ = std::filesystem::temp_directory_path() /
                 ("cmdkit-dispatch-" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()) + ".env");
        std::filesystem::remove(store_);
        env.set("CMDKIT_DEMO_STORE", store_.string());
    }

    void TearDown() override {
        std::filesystem::remove(store_);
        utils::Logger::instance().setLevel(utils::LogLevel::WARN);
    }

    int run(const std::vector<std::string>& args, const std::string& input = "") {
        out.str("");
        err.str("");
        in.str(input);
        in.clear();

        app::Config defaults;
        defaults.program_name = "cmdkit-demo";
        return app::Dispatcher(registry, defaults).run(args, ctx);
    }

    Registry registry;
    std::istringstream in;
    std::ostringstream out;
    std::ostringstream err;
    MapEnvironment env;
    Context ctx{in, out, err, env};

private:
    std::filesystem::path store_;
};

// =============================================================================
// Top level
// =============================================================================

TEST_F(DispatchTest, HelpListsRootCommandsThenNamespaces) {
    EXPECT_EQ(run({"--help"}), 0);
    std::string help = out.str();

    EXPECT_THAT(help, StartsWith("usage: cmdkit-demo"));
    EXPECT_THAT(help, HasSubstr("  greet   Greet someone\n"));
    EXPECT_THAT(help, HasSubstr("\nconfig:\n    delete  Delete a setting\n"));

    size_t add = help.find("  add ");
    size_t whoami = help.find("  whoami ");
    size_t config = help.find("config:");
    ASSERT_NE(add, std::string::npos);
    ASSERT_NE(config, std::string::npos);
    EXPECT_LT(add, whoami);
    EXPECT_LT(whoami, config);
}

TEST_F(DispatchTest, NoCommandPrintsUsageToStderr) {
    EXPECT_EQ(run({}), 1);
    EXPECT_THAT(err.str(), HasSubstr("usage: cmdkit-demo"));
    EXPECT_TRUE(out.str().empty());
}

TEST_F(DispatchTest, UnknownCommand) {
    EXPECT_EQ(run({"fly"}), 1);
    EXPECT_THAT(err.str(), HasSubstr("unknown command: fly"));
}

TEST_F(DispatchTest, Version) {
    EXPECT_EQ(run({"--version"}), 0);
    EXPECT_EQ(out.str(), "cmdkit-demo version 1.0.0\n");
}

TEST_F(DispatchTest, InvalidGlobalOption) {
    EXPECT_EQ(run({"--log-level", "loud", "greet", "bob"}), 2);
    EXPECT_THAT(err.str(), HasSubstr("invalid log level"));
}

TEST_F(DispatchTest, LogLevelApplied) {
    EXPECT_EQ(run({"--log-level", "error", "greet", "bob"}), 0);
    EXPECT_EQ(utils::Logger::instance().getLevel(), utils::LogLevel::ERROR);
}

// =============================================================================
// Root commands
// =============================================================================

TEST_F(DispatchTest, Greet) {
    EXPECT_EQ(run({"greet", "bob"}), 0);
    EXPECT_EQ(out.str(), "Hello, bob!\n");

    EXPECT_EQ(run({"greet", "-c", "--greeting", "Howdy", "bob"}), 0);
    EXPECT_EQ(out.str(), "Howdy, BOB!\n");
}

TEST_F(DispatchTest, GreetUsageErrors) {
    EXPECT_EQ(run({"greet"}), 2);
    EXPECT_THAT(err.str(), HasSubstr("greet: error: the following arguments are required: name"));

    EXPECT_EQ(run({"greet", "-g", "Yo", "bob"}), 2);
    EXPECT_THAT(err.str(), HasSubstr("invalid choice: 'Yo'"));
}

TEST_F(DispatchTest, CommandHelp) {
    EXPECT_EQ(run({"greet", "-h"}), 0);
    EXPECT_THAT(out.str(), HasSubstr("usage: greet"));
    EXPECT_THAT(out.str(), HasSubstr("who to greet"));
}

TEST_F(DispatchTest, AddTypedPositionals) {
    EXPECT_EQ(run({"add", "2", "-5"}), 0);
    EXPECT_EQ(out.str(), "-3\n");

    EXPECT_EQ(run({"add", "2", "x"}), 2);
    EXPECT_THAT(err.str(), HasSubstr("invalid int value: 'x'"));
}

TEST_F(DispatchTest, AddReportsOverflow) {
    EXPECT_EQ(run({"add", "9223372036854775807", "1"}), 1);
    EXPECT_EQ(err.str(), "integer overflow\n");
    EXPECT_TRUE(out.str().empty());
}

TEST_F(DispatchTest, EchoCapturesEverything) {
    EXPECT_EQ(run({"echo", "a", "--b", "-c"}), 0);
    EXPECT_EQ(out.str(), "a\n--b\n-c\n");
}

TEST_F(DispatchTest, LoginPromptsForPassword) {
    env.set("DEMO_USER", "alice");
    EXPECT_EQ(run({"login"}, "hunter22\n"), 0);
    EXPECT_THAT(out.str(), StartsWith("Password: "));
    EXPECT_THAT(out.str(), HasSubstr("user:          alice\n"));
    EXPECT_THAT(out.str(), HasSubstr("authenticated: true\n"));
}

TEST_F(DispatchTest, LoginFailure) {
    EXPECT_EQ(run({"login", "bob"}, "abc\n"), 1);
    EXPECT_THAT(err.str(), HasSubstr("password too short"));
}

TEST_F(DispatchTest, WhoamiReadsEnvironment) {
    env.set("USER", "alice");
    EXPECT_EQ(run({"whoami"}), 0);
    EXPECT_EQ(out.str(), "shell: /bin/sh\nuser:  alice\n");
}

TEST_F(DispatchTest, WhoamiExplicitOptionWins) {
    env.set("USER", "alice");
    EXPECT_EQ(run({"whoami", "--user", "bob"}), 0);
    EXPECT_THAT(out.str(), HasSubstr("user:  bob\n"));
}

TEST_F(DispatchTest, EnvOptionSeedsEnvironment) {
    EXPECT_EQ(run({"--env", "USER=carol", "whoami"}), 0);
    EXPECT_THAT(out.str(), HasSubstr("user:  carol\n"));
}

TEST_F(DispatchTest, MissingEnvironmentIsConfigurationError) {
    EXPECT_EQ(run({"whoami"}), 1);
    EXPECT_THAT(err.str(), HasSubstr("configuration error: missing environment variable: USER"));
    EXPECT_THAT(err.str(), Not(HasSubstr("usage:")));
}

TEST_F(DispatchTest, ExistsReportsFailure) {
    EXPECT_EQ(run({"exists", std::filesystem::temp_directory_path().string()}), 0);
    EXPECT_EQ(out.str(), "OK\n");

    EXPECT_EQ(run({"exists", "/definitely/not/here"}), 1);
    EXPECT_EQ(out.str(), "FAILED\n");
}

// =============================================================================
// config namespace
// =============================================================================

TEST_F(DispatchTest, ConfigRoundTrip) {
    EXPECT_EQ(run({"config.set", "app.name", "demo"}), 0);
    EXPECT_EQ(out.str(), "OK\n");
    EXPECT_EQ(run({"config.set", "db.host", "localhost"}), 0);

    EXPECT_EQ(run({"config.get", "app.name"}), 0);
    EXPECT_EQ(out.str(), "demo\n");

    EXPECT_EQ(run({"config.list"}), 0);
    EXPECT_EQ(out.str(), "app.name: demo\ndb.host:  localhost\n");

    EXPECT_EQ(run({"config.list", "-n", "db"}), 0);
    EXPECT_EQ(out.str(), "host: localhost\n");

    EXPECT_EQ(run({"config.delete", "app.name"}), 0);
    EXPECT_EQ(run({"config.delete", "app.name"}), 1);
    EXPECT_EQ(out.str(), "FAILED\n");
}

TEST_F(DispatchTest, ConfigErrors) {
    EXPECT_EQ(run({"config.get", "app.missing"}), 1);
    EXPECT_THAT(err.str(), HasSubstr("key not found: app.missing"));

    EXPECT_EQ(run({"config.set", "a.b.c", "x"}), 1);
    EXPECT_THAT(err.str(), HasSubstr("invalid key path: 'a.b.c'"));

    EXPECT_EQ(run({"config.set", ".b", "x"}), 1);
    EXPECT_THAT(err.str(), HasSubstr("invalid key path"));
}

TEST_F(DispatchTest, ConfigBareKeysLiveInAll) {
    ASSERT_EQ(run({"config.set", "timeout", "30"}), 0);
    ASSERT_EQ(run({"config.set", "db.host", "localhost"}), 0);

    EXPECT_EQ(run({"config.get", "timeout"}), 0);
    EXPECT_EQ(out.str(), "30\n");
    EXPECT_EQ(run({"config.get", "all.timeout"}), 0);
    EXPECT_EQ(out.str(), "30\n");

    EXPECT_EQ(run({"config.list"}), 0);
    EXPECT_EQ(out.str(), "db.host: localhost\ntimeout: 30\n");

    EXPECT_EQ(run({"config.list", "--namespace", "db"}), 0);
    EXPECT_EQ(out.str(), "host:    localhost\ntimeout: 30\n");

    EXPECT_EQ(run({"config.delete", "timeout"}), 0);
    EXPECT_EQ(run({"config.get", "all.timeout"}), 1);
}

TEST_F(DispatchTest, ConfigMultiLineValues) {
    ASSERT_EQ(run({"config.set", "app.motd", "first\r\nsecond\nthird\n"}), 0);

    EXPECT_EQ(run({"config.get", "app.motd"}), 0);
    EXPECT_EQ(out.str(), "first\nsecond\nthird\n");

    EXPECT_EQ(run({"config.list"}), 0);
    EXPECT_EQ(out.str(), "app.motd: first\n");

    EXPECT_EQ(run({"config.list", "--expand"}), 0);
    EXPECT_EQ(out.str(), "app.motd: first\nsecond\nthird\n");
}

TEST_F(DispatchTest, ConfigReset) {
    ASSERT_EQ(run({"config.set", "app.name", "demo"}), 0);

    EXPECT_EQ(run({"config.reset"}), 1);
    EXPECT_THAT(err.str(), HasSubstr("--yes"));

    EXPECT_EQ(run({"config.reset", "--yes"}), 0);
    EXPECT_EQ(run({"config.list"}), 0);
    EXPECT_EQ(out.str(), "");
}

TEST_F(DispatchTest, ConfigStoreOptionOverridesEnvironment) {
    auto other = std::filesystem::temp_directory_path() / "cmdkit-dispatch-explicit-store.env";
    std::filesystem::remove(other);

    EXPECT_EQ(run({"config.set", "app.name", "elsewhere", "--cmdkit_demo_store", other.string()}), 0);
    EXPECT_EQ(run({"config.get", "app.name"}), 1);
    EXPECT_EQ(run({"config.get", "app.name", "--cmdkit_demo_store", other.string()}), 0);
    EXPECT_EQ(out.str(), "elsewhere\n");

    std::filesystem::remove(other);
}
