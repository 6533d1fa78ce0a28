/**
 * @file test_registry.cpp
 * @brief Unit tests for the command registry
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <cmdkit/core/registry.hpp>

#include <sstream>

using namespace cmdkit;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::Pair;
using ::testing::UnorderedElementsAre;

class RegistryTest : public ::testing::Test {
protected:
    static std::string hello() { return "hello"; }

    Registry registry;
};

TEST_F(RegistryTest, CommandIsRegisteredUnderItsName) {
    const Command& cmd = registry.command("simple_command", {}, &RegistryTest::hello);
    EXPECT_EQ(cmd.path(), "simple_command");
    EXPECT_TRUE(registry.contains("simple_command"));
    EXPECT_EQ(registry.size(), 1u);
}

TEST_F(RegistryTest, NamesAreDashless) {
    registry.command("new-command", {}, &RegistryTest::hello);
    EXPECT_TRUE(registry.contains("new_command"));
    EXPECT_FALSE(registry.contains("new-command"));
}

TEST_F(RegistryTest, NamespacedCommand) {
    registry.command("new_command", {}, &RegistryTest::hello, {.ns = "new_namespace"});
    EXPECT_TRUE(registry.contains("new_namespace.new_command"));
    EXPECT_EQ(registry.find("new_command"), nullptr);
}

TEST_F(RegistryTest, DuplicatePathIsSchemaError) {
    registry.command("cmd", {}, &RegistryTest::hello);
    EXPECT_THROW(registry.command("cmd", {}, &RegistryTest::hello), SchemaError);
}

TEST_F(RegistryTest, SameCallableUnderTwoNamespaces) {
    registry.command("cmd", {}, &RegistryTest::hello, {.ns = "one"});
    registry.command("cmd", {}, &RegistryTest::hello, {.ns = "two"});
    EXPECT_TRUE(registry.contains("one.cmd"));
    EXPECT_TRUE(registry.contains("two.cmd"));
}

TEST_F(RegistryTest, ArityMismatchIsSchemaError) {
    EXPECT_THROW(registry.command("cmd", {param("a")}, [](int, int) { return 0; }), SchemaError);
    EXPECT_NO_THROW(registry.command("raw", {param("a"), param("b")},
                                     [](const CallArgs&) { return Value(); }));
}

TEST_F(RegistryTest, DecoratorsAppliedBeforeFreezing) {
    const Command& cmd = registry.command("greet", {param("name")},
        [](const std::string& name) { return name; },
        {.doc = "Say hi", .decorators = {arg("name", {.help = "who"})}});

    EXPECT_EQ(cmd.description(), "Say hi");
    EXPECT_EQ(cmd.get_argument("name").help, "who");
}

TEST_F(RegistryTest, RawCaptureWithOtherParametersRejected) {
    EXPECT_THROW(registry.command("bad", {param("a"), rest()},
                                  [](const CallArgs&) { return Value(); }), SchemaError);
    EXPECT_TRUE(registry.empty());
}

TEST_F(RegistryTest, AddCommandWithNamespace) {
    registry.add_command(Command("cmd"), "ns");
    EXPECT_TRUE(registry.contains("ns.cmd"));
    EXPECT_EQ(registry.find("ns.cmd")->namespace_name(), "ns");
}

TEST_F(RegistryTest, MergeKeepsPaths) {
    Registry other;
    other.command("new_command", {}, &RegistryTest::hello);
    registry.command("mine", {}, &RegistryTest::hello);

    registry.merge(other);
    EXPECT_TRUE(registry.contains("new_command"));
    EXPECT_TRUE(registry.contains("mine"));
}

TEST_F(RegistryTest, MergeUnderNamespace) {
    Registry other;
    other.command("new_command", {}, &RegistryTest::hello);
    other.command("deep", {}, &RegistryTest::hello, {.ns = "inner"});
    registry.command("mine", {}, &RegistryTest::hello);

    registry.merge(other, "x");
    EXPECT_TRUE(registry.contains("x.new_command"));
    EXPECT_TRUE(registry.contains("x.inner.deep"));
    EXPECT_TRUE(registry.contains("mine"));
    EXPECT_EQ(registry.size(), 3u);

    // The source registry is untouched.
    EXPECT_TRUE(other.contains("new_command"));
    EXPECT_EQ(other.find("new_command")->path(), "new_command");
}

TEST_F(RegistryTest, MergeCollisionLeavesRegistryUnchanged) {
    Registry other;
    other.command("a", {}, &RegistryTest::hello);
    other.command("b", {}, &RegistryTest::hello);
    registry.command("b", {}, &RegistryTest::hello);

    EXPECT_THROW(registry.merge(other), SchemaError);
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_FALSE(registry.contains("a"));
}

TEST_F(RegistryTest, MergedCommandUsesNewPathInUsage) {
    Registry other;
    other.command("get", {param("key")}, [](const std::string& key) { return key; });
    registry.merge(other, "config");

    EXPECT_THAT(registry.find("config.get")->usage(), HasSubstr("usage: config.get"));
}

TEST_F(RegistryTest, EnvVarsSideTable) {
    registry.command("cmd", {param("required", Value()), param("optional", Value())},
        [](const std::string&, const std::string&) {},
        {.decorators = {env("REQUIRED"), env("OPTIONAL", "bar")}});

    ASSERT_EQ(registry.env_vars().count("cmd"), 1u);
    const auto& bindings = registry.env_vars().at("cmd");
    ASSERT_EQ(bindings.size(), 2u);
    EXPECT_EQ(bindings[1].variable, "REQUIRED");
    EXPECT_EQ(bindings[0].default_value, std::optional<std::string>("bar"));
}

TEST_F(RegistryTest, GroupedRootFirstThenSortedNamespaces) {
    registry.command("zeta", {}, &RegistryTest::hello, {.ns = "b"});
    registry.command("beta", {}, &RegistryTest::hello);
    registry.command("alpha", {}, &RegistryTest::hello, {.ns = "b"});
    registry.command("gamma", {}, &RegistryTest::hello, {.ns = "a"});
    registry.command("alpha", {}, &RegistryTest::hello);

    auto groups = registry.grouped();
    ASSERT_EQ(groups.size(), 3u);
    EXPECT_EQ(groups[0].ns, "");
    EXPECT_EQ(groups[1].ns, "a");
    EXPECT_EQ(groups[2].ns, "b");

    ASSERT_EQ(groups[0].commands.size(), 2u);
    EXPECT_EQ(groups[0].commands[0]->name(), "alpha");
    EXPECT_EQ(groups[0].commands[1]->name(), "beta");
    EXPECT_EQ(groups[2].commands[0]->name(), "alpha");
    EXPECT_EQ(groups[2].commands[1]->name(), "zeta");
}

TEST_F(RegistryTest, PrintCommands) {
    registry.command("run", {}, &RegistryTest::hello, {.doc = "Run it"});
    registry.command("get", {}, &RegistryTest::hello, {.ns = "config"});

    std::ostringstream out;
    registry.print_commands(out);
    EXPECT_EQ(out.str(),
              "  run  Run it\n"
              "\n"
              "config:\n"
              "    get  no description\n");
}

// =============================================================================
// Environment blobs
// =============================================================================

TEST(ParseEnvTest, SingleForms) {
    EXPECT_THAT(Registry::parse_env("key=value"), UnorderedElementsAre(Pair("key", "value")));
    EXPECT_THAT(Registry::parse_env("key='value'"), UnorderedElementsAre(Pair("key", "value")));
    EXPECT_THAT(Registry::parse_env("key=\"value\""), UnorderedElementsAre(Pair("key", "value")));
}

TEST(ParseEnvTest, MultiLine) {
    EXPECT_THAT(Registry::parse_env("key=\"value\"\nanother_key=another value"),
                UnorderedElementsAre(Pair("key", "value"), Pair("another_key", "another value")));
}

TEST(ParseEnvTest, LastDuplicateWins) {
    EXPECT_THAT(Registry::parse_env("key=first\nkey=second"), UnorderedElementsAre(Pair("key", "second")));
}

TEST(ParseEnvTest, SkipsBlankCommentAndMalformedLines) {
    EXPECT_THAT(Registry::parse_env("\n# comment\n  spaced = ' padded '  \nnot a pair\n"),
                UnorderedElementsAre(Pair("spaced", " padded ")));
}

TEST(LoadEnvTest, KeepsExistingUnlessOverride) {
    MapEnvironment env(EnvMap{{"KEPT", "old"}});

    EXPECT_EQ(Registry::load_env("KEPT=new\nADDED=1", env), 1u);
    EXPECT_EQ(env.get("KEPT"), std::optional<std::string>("old"));
    EXPECT_EQ(env.get("ADDED"), std::optional<std::string>("1"));

    EXPECT_EQ(Registry::load_env("KEPT=new", env, true), 1u);
    EXPECT_EQ(env.get("KEPT"), std::optional<std::string>("new"));
}
