/**
 * @file registry.cpp
 * @brief Registry implementation
 */

#include "cmdkit/core/registry.hpp"
#include "cmdkit/utils/logger.hpp"

#include <algorithm>
#include <iomanip>
#include <set>

namespace cmdkit {

namespace {

std::string merged_namespace(const std::string& prefix, const std::string& current) {
    if (prefix.empty()) return current;
    if (current.empty()) return prefix;
    return prefix + "." + current;
}

} // anonymous namespace

const Command& Registry::add_command(Command command, const std::string& ns) {
    if (!ns.empty()) {
        command.set_namespace(ns);
    }

    std::string path = command.path();
    if (commands_.count(path)) {
        LOG_WARN("Registry", "Duplicate command path: {}", path);
        throw SchemaError("command already registered: " + path);
    }

    command.finalize();

    if (!command.env_bindings().empty()) {
        env_vars_[path] = command.env_bindings();
    }

    auto stored = std::make_shared<const Command>(std::move(command));
    commands_.emplace(path, stored);
    LOG_DEBUG("Registry", "Registered command {} ({} argument(s))", path, stored->arguments().size());
    return *stored;
}

void Registry::merge(const Registry& other, const std::string& ns) {
    std::set<std::string> incoming;
    for (const auto& [path, cmd] : other.commands_) {
        std::string target = merged_namespace(ns, cmd->namespace_name());
        std::string new_path = target.empty() ? cmd->name() : target + "." + cmd->name();
        if (commands_.count(new_path) || !incoming.insert(new_path).second) {
            throw SchemaError("command already registered: " + new_path);
        }
    }

    for (const auto& [path, cmd] : other.commands_) {
        Command copy = *cmd;
        copy.set_namespace(merged_namespace(ns, cmd->namespace_name()));
        add_command(std::move(copy));
    }
    LOG_DEBUG("Registry", "Merged {} command(s) under '{}'", other.commands_.size(), ns);
}

Registry::CommandPtr Registry::find(const std::string& path) const {
    auto it = commands_.find(path);
    if (it == commands_.end()) {
        return nullptr;
    }
    return it->second;
}

std::vector<Registry::Group> Registry::grouped() const {
    // The empty root namespace sorts first.
    std::map<std::string, std::vector<CommandPtr>> by_namespace;
    for (const auto& [path, cmd] : commands_) {
        by_namespace[cmd->namespace_name()].push_back(cmd);
    }

    std::vector<Group> groups;
    for (auto& [ns, cmds] : by_namespace) {
        std::sort(cmds.begin(), cmds.end(),
                  [](const CommandPtr& a, const CommandPtr& b) { return a->name() < b->name(); });
        groups.push_back(Group{ns, std::move(cmds)});
    }
    return groups;
}

void Registry::print_commands(std::ostream& out) const {
    auto groups = grouped();

    size_t width = 0;
    for (const auto& group : groups) {
        for (const auto& cmd : group.commands) {
            width = std::max(width, cmd->name().size());
        }
    }

    for (const auto& group : groups) {
        std::string indent = "  ";
        if (!group.ns.empty()) {
            out << "\n" << group.ns << ":\n";
            indent = "    ";
        }
        for (const auto& cmd : group.commands) {
            out << indent << std::left << std::setw(static_cast<int>(width + 2)) << cmd->name()
                << cmd->description() << "\n";
        }
    }
}

EnvMap Registry::parse_env(const std::string& text) {
    return parseEnvBlob(text);
}

size_t Registry::load_env(const std::string& text, Environment& environment, bool override) {
    size_t written = 0;
    for (const auto& [key, value] : parseEnvBlob(text)) {
        if (!override && environment.contains(key)) {
            LOG_TRACE("Registry", "Keeping existing {}", key);
            continue;
        }
        environment.set(key, value);
        ++written;
    }
    LOG_DEBUG("Registry", "Loaded {} environment variable(s)", written);
    return written;
}

} // namespace cmdkit
