/**
 * @file basic_cmd.cpp
 * @brief Root commands of the demo tool
 */

#include "../commands.hpp"

#include "cmdkit/core/errors.hpp"
#include "cmdkit/utils/string_utils.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace cmdkit::demo::commands {

void register_basic(Registry& registry) {
    registry.command("greet",
        {param("name"), param("capitalize", false), param("greeting", "Hello")},
        [](const std::string& name, bool capitalize, const std::string& greeting) {
            std::string who = capitalize ? utils::to_upper(name) : name;
            return greeting + ", " + who + "!";
        },
        {.doc = "Greet someone\n\nPrints a single greeting line.",
         .decorators = {
             arg("name", {.help = "who to greet"}),
             arg("capitalize", {.help = "shout the name", .shortcut = 'c'}),
             arg("greeting", {.help = "greeting word", .shortcut = 'g',
                              .choices = std::vector<std::string>{"Hello", "Hi", "Howdy"}}),
         }});

    registry.command("add", {param("a"), param("b")},
        [](int64_t a, int64_t b) {
            int64_t sum = 0;
            if (__builtin_add_overflow(a, b, &sum)) {
                throw Error("integer overflow");
            }
            return sum;
        },
        {.doc = "Add two integers",
         .decorators = {
             arg("a", {.help = "first operand", .type = ValueType::Integer}),
             arg("b", {.help = "second operand", .type = ValueType::Integer}),
         }});

    registry.add_command(Command::raw("echo",
        cmdkit::bind([](const Argv& argv) { return Value(argv); }),
        "Print each argument on its own line"));

    registry.command("login", {param("user"), param("password")},
        [](const std::string& user, const std::string& password) {
            if (password.size() < 4) {
                throw Error("password too short");
            }
            return Map{{"user", Value(user)}, {"authenticated", Value(true)}};
        },
        {.doc = "Pretend to log in",
         .decorators = {
             arg("user", {.help = "account name", .env_var = "DEMO_USER"}),
             prompt("password", {.text = "Password", .hidden = true}),
         }});

    registry.command("whoami", {extra()},
        [](const Kwargs& kwargs) { return kwargs; },
        {.doc = "Show identity taken from the environment",
         .decorators = {
             env("USER"),
             env("SHELL", "/bin/sh"),
         }});

    registry.command("exists", {param("path")},
        [](const std::string& path) { return std::filesystem::exists(path); },
        {.doc = "Check whether a path exists"});
}

} // namespace cmdkit::demo::commands
