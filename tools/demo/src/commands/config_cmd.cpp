/**
 * @file config_cmd.cpp
 * @brief Settings commands backed by ConfigStore
 */

#include "../commands.hpp"
#include "../config_store.hpp"

#include "cmdkit/core/errors.hpp"

#include <optional>
#include <string>

namespace cmdkit::demo::commands {

namespace {

constexpr const char* kStoreVariable = "CMDKIT_DEMO_STORE";
constexpr const char* kStoreParam = "cmdkit_demo_store";

CommandOptions with_store(std::string doc, std::vector<Decorator> decorators = {}) {
    decorators.push_back(arg(kStoreParam, {.help = "settings file"}));
    decorators.push_back(env(kStoreVariable, kDefaultStore));
    return CommandOptions{.doc = std::move(doc), .decorators = std::move(decorators)};
}

} // anonymous namespace

Registry config_registry() {
    Registry registry;

    registry.command("set", {param("key"), param("value"), param(kStoreParam, Value())},
        [](const std::string& key, const std::string& value, const std::string& store) {
            ConfigStore(store).set(key, value);
            return true;
        },
        with_store("Store a setting", {
            arg("key", {.help = "[namespace.]key"}),
            arg("value", {.help = "value to store"}),
        }));

    registry.command("get", {param("key"), param(kStoreParam, Value())},
        [](const std::string& key, const std::string& store) {
            auto value = ConfigStore(store).get(key);
            if (!value) {
                throw Error("key not found: " + key);
            }
            return *value;
        },
        with_store("Print a setting", {arg("key", {.help = "[namespace.]key"})}));

    registry.command("list",
        {param("namespace", Value()), param("expand", false), param(kStoreParam, Value())},
        [](const std::optional<std::string>& ns, bool expand, const std::string& store) {
            return ConfigStore(store).list(ns.value_or(""), expand);
        },
        with_store("List settings", {
            arg("namespace", {.help = "only this namespace and \"all\"", .shortcut = 'n'}),
            arg("expand", {.help = "show every line of multi-line values", .shortcut = 'e'}),
        }));

    registry.command("delete", {param("key"), param(kStoreParam, Value())},
        [](const std::string& key, const std::string& store) {
            return ConfigStore(store).remove(key);
        },
        with_store("Delete a setting", {arg("key", {.help = "[namespace.]key"})}));

    registry.command("reset", {param("yes", false), param(kStoreParam, Value())},
        [](bool yes, const std::string& store) {
            if (!yes) {
                throw Error("refusing to erase every setting without --yes");
            }
            ConfigStore(store).reset();
            return true;
        },
        with_store("Erase every setting", {arg("yes", {.help = "confirm", .shortcut = 'y'})}));

    return registry;
}

} // namespace cmdkit::demo::commands
