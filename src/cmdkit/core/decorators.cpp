/**
 * @file decorators.cpp
 * @brief Schema decorators
 */

#include "cmdkit/core/decorators.hpp"
#include "cmdkit/core/errors.hpp"
#include "cmdkit/utils/logger.hpp"
#include "cmdkit/utils/string_utils.hpp"

namespace cmdkit {

namespace {

// Declared argument, or a keyword one created on a catch-all command.
Argument& argument_for(Command& command, const std::string& name) {
    if (!command.has_argument(name)) {
        if (!command.accepts_extra()) {
            LOG_WARN("Decorators", "{} has no argument named {}", command.name(), name);
            throw ArgumentNotFound(name);
        }
        Argument created = Argument::optional(name, Value());
        created.keyword = true;
        created.synthesized = true;
        command.add_argument(std::move(created));
    }
    return command.get_argument(name);
}

} // anonymous namespace

Decorator arg(std::string name, ArgOptions options) {
    return [name = std::move(name), options = std::move(options)](Command& command) {
        argument_for(command, name).apply(options);
    };
}

Decorator prompt(std::string name, PromptConfig config) {
    return [name = std::move(name), config = std::move(config)](Command& command) {
        PromptConfig resolved = config;
        if (resolved.text.empty()) {
            resolved.text = name;
        }
        argument_for(command, name).prompt = std::move(resolved);
    };
}

Decorator env(std::string variable, std::optional<std::string> default_value) {
    return [variable = std::move(variable), default_value = std::move(default_value)](Command& command) {
        command.add_env_binding(EnvBinding{variable, default_value, utils::to_lower(variable)});
    };
}

void apply_decorators(Command& command, const std::vector<Decorator>& decorators) {
    for (auto it = decorators.rbegin(); it != decorators.rend(); ++it) {
        (*it)(command);
    }
}

} // namespace cmdkit
