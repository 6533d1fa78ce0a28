/**
 * @file registry.hpp
 * @brief Namespace-qualified command registry.
 *
 * Commands are registered once at start-up and stored as immutable
 * shared objects keyed by their path ("name" or "namespace.name").
 *
 * @copyright Copyright (c) 2024 cmdkit Contributors
 * @license MIT License
 */

#pragma once

#include "cmdkit/core/binding.hpp"
#include "cmdkit/core/command.hpp"
#include "cmdkit/core/decorators.hpp"
#include "cmdkit/core/environment.hpp"
#include "cmdkit/core/errors.hpp"
#include "cmdkit/core/export.hpp"
#include "cmdkit/core/signature.hpp"

#include <map>
#include <memory>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace cmdkit {

/**
 * @struct CommandOptions
 * @brief Registration options for Registry::command().
 */
struct CommandOptions {
    std::string ns;                       ///< namespace, empty for root
    std::string doc;                      ///< documentation, first line is the description
    std::vector<Decorator> decorators;    ///< applied last-listed-first
};

class CMDKIT_CORE_API Registry {
public:
    using CommandPtr = std::shared_ptr<const Command>;

    /**
     * @brief Commands of one namespace, for help output.
     */
    struct Group {
        std::string ns;
        std::vector<CommandPtr> commands;
    };

    /**
     * @brief Freeze and register a command.
     * @param ns Namespace overriding the command's own when non-empty
     * @throws SchemaError if the path is already registered or the
     *         command's option strings conflict
     */
    const Command& add_command(Command command, const std::string& ns = "");

    /**
     * @brief Build, decorate and register a command from a callable.
     * @throws SchemaError if the callable's arity differs from the signature
     */
    template<typename F>
    const Command& command(const std::string& name, const Signature& signature, F fn,
                           CommandOptions options = {}) {
        if (auto arity = arity_of<F>(); arity && *arity != signature.size()) {
            throw SchemaError("command '" + name + "' takes " + std::to_string(*arity) +
                              " parameter(s) but its signature declares " +
                              std::to_string(signature.size()));
        }
        Command cmd(name, signature, cmdkit::bind(std::move(fn)), options.doc);
        apply_decorators(cmd, options.decorators);
        return add_command(std::move(cmd), options.ns);
    }

    /**
     * @brief Copy every command of another registry into this one.
     * @param ns Prefix for the incoming paths; empty keeps them unchanged
     * @throws SchemaError on a path collision (nothing is merged then)
     */
    void merge(const Registry& other, const std::string& ns = "");

    /**
     * @brief Command by path, nullptr if unknown.
     */
    CommandPtr find(const std::string& path) const;

    bool contains(const std::string& path) const { return commands_.count(path) > 0; }
    size_t size() const { return commands_.size(); }
    bool empty() const { return commands_.empty(); }

    const std::map<std::string, CommandPtr>& commands() const { return commands_; }

    /**
     * @brief Env bindings recorded per command path.
     */
    const std::map<std::string, std::vector<EnvBinding>>& env_vars() const { return env_vars_; }

    /**
     * @brief Commands grouped for help: root first, then namespaces in
     *        order, each sorted by command name.
     */
    std::vector<Group> grouped() const;

    /**
     * @brief Write the command listing used by the top-level help.
     */
    void print_commands(std::ostream& out) const;

    /**
     * @brief Parse a KEY=VALUE blob (see parseEnvBlob).
     */
    static EnvMap parse_env(const std::string& text);

    /**
     * @brief Seed an environment from a KEY=VALUE blob.
     * @param override Replace variables that are already set
     * @return Number of variables written
     */
    static size_t load_env(const std::string& text, Environment& environment, bool override = false);

private:
    std::map<std::string, CommandPtr> commands_;
    std::map<std::string, std::vector<EnvBinding>> env_vars_;
};

} // namespace cmdkit
