/**
 * @file argument.cpp
 * @brief Argument descriptor construction and refinement
 */

#include "cmdkit/core/argument.hpp"
#include "cmdkit/utils/string_utils.hpp"

namespace cmdkit {

FlagPolarity flagPolarityFor(bool default_value) {
    return default_value ? FlagPolarity::Negative : FlagPolarity::Positive;
}

Argument Argument::positional(std::string name) {
    Argument arg;
    arg.name = std::move(name);
    arg.required = true;
    return arg;
}

Argument Argument::optional(std::string name, Value default_value) {
    Argument arg;
    arg.name = std::move(name);
    arg.required = false;
    if (!default_value.is_none()) {
        arg.declared_type = default_value.type();
    }
    arg.default_value = std::move(default_value);
    return arg;
}

FlagPolarity Argument::polarity() const {
    if (!is_boolean_flag()) {
        return FlagPolarity::None;
    }
    bool current = default_value && default_value->is_bool() && default_value->as_bool();
    return flagPolarityFor(current);
}

std::string Argument::flag() const {
    if (polarity() == FlagPolarity::Negative) {
        return std::string("--") + kNegationPrefix + name;
    }
    return "--" + name;
}

std::string Argument::metavar() const {
    return utils::to_upper(name);
}

void Argument::apply(const ArgOptions& options) {
    if (options.help) help = *options.help;
    if (options.shortcut) shortcut = *options.shortcut;
    if (options.choices) choices = *options.choices;
    if (options.env_var) env_var = *options.env_var;

    if (options.default_value) {
        default_value = *options.default_value;
        required = false;
        if (!options.type && !default_value->is_none()) {
            declared_type = default_value->type();
        }
    }
    if (options.type) {
        declared_type = *options.type;
        if (*options.type == ValueType::Bool && !default_value) {
            // A flag that is never presented reads as off.
            default_value = Value(false);
            required = false;
        }
    }
    if (options.required) {
        required = *options.required;
        if (required) {
            default_value.reset();
        }
    }
}

void Argument::merge(const Argument& other) {
    required = other.required;
    if (other.default_value) default_value = other.default_value;
    if (other.declared_type) declared_type = other.declared_type;
    if (!other.choices.empty()) choices = other.choices;
    if (!other.help.empty()) help = other.help;
    if (other.shortcut) shortcut = other.shortcut;
    if (other.env_var) env_var = other.env_var;
    if (other.prompt) prompt = other.prompt;
    synthesized = false;
}

} // namespace cmdkit
