/**
 * @file command.cpp
 * @brief Command schema mutation and parse/dispatch
 */

#include "cmdkit/core/command.hpp"
#include "cmdkit/core/errors.hpp"
#include "cmdkit/core/output.hpp"
#include "cmdkit/core/prompt.hpp"
#include "cmdkit/utils/logger.hpp"
#include "cmdkit/utils/string_utils.hpp"

#include <algorithm>
#include <sstream>

namespace cmdkit {

// CallArgs implementation
void CallArgs::set(const std::string& name, Value value) {
    for (auto& [k, v] : values_) {
        if (k == name) {
            v = std::move(value);
            return;
        }
    }
    values_.emplace_back(name, std::move(value));
}

const Value* CallArgs::find(const std::string& name) const {
    for (const auto& [k, v] : values_) {
        if (k == name) return &v;
    }
    for (const auto& [k, v] : extra_) {
        if (k == name) return &v;
    }
    return nullptr;
}

Value* CallArgs::find(const std::string& name) {
    return const_cast<Value*>(static_cast<const CallArgs&>(*this).find(name));
}

const Value& CallArgs::get(const std::string& name) const {
    const Value* value = find(name);
    if (value == nullptr) {
        throw ArgumentNotFound(name);
    }
    return *value;
}

// Command implementation
Command::Command(std::string name, const Signature& signature, Handler handler, std::string doc)
    : name_(utils::to_command_name(name))
    , handler_(std::move(handler))
{
    if (name_.empty()) {
        throw SchemaError("command name must not be empty");
    }

    InspectedSignature inspected = inspect(signature);
    arguments_ = std::move(inspected.arguments);
    capture_all_ = inspected.capture_all;
    accepts_extra_ = inspected.accepts_extra;
    set_description(doc);
}

Command::Command(std::string name)
    : Command(std::move(name), Signature{}, Handler{}) {}

Command Command::raw(std::string name, Handler handler, std::string doc) {
    return Command(std::move(name), Signature{rest()}, std::move(handler), std::move(doc));
}

std::string Command::path() const {
    if (namespace_.empty()) {
        return name_;
    }
    return namespace_ + "." + name_;
}

void Command::set_description(const std::string& doc) {
    std::string line = utils::first_line(doc);
    description_ = line.empty() ? kNoDescription : line;
}

void Command::add_argument(Argument argument) {
    if (capture_all_) {
        throw SchemaError("command '" + path() + "' captures raw arguments and cannot declare '" +
                          argument.name + "'");
    }
    for (auto& existing : arguments_) {
        if (existing.name != argument.name) {
            continue;
        }
        if (existing.synthesized) {
            existing.merge(argument);
            parser_.reset();
            return;
        }
        throw SchemaError("argument '" + argument.name + "' already declared on '" + path() +
                          "'; refine it with get_argument");
    }
    arguments_.push_back(std::move(argument));
    parser_.reset();
}

Argument& Command::get_argument(const std::string& name) {
    parser_.reset();
    return arguments_[position_of(name)];
}

const Argument& Command::get_argument(const std::string& name) const {
    return arguments_[position_of(name)];
}

size_t Command::position_of(const std::string& name) const {
    for (size_t i = 0; i < arguments_.size(); ++i) {
        if (arguments_[i].name == name) {
            return i;
        }
    }
    throw ArgumentNotFound(name);
}

bool Command::has_argument(const std::string& name) const {
    return std::any_of(arguments_.begin(), arguments_.end(),
                       [&](const Argument& a) { return a.name == name; });
}

void Command::add_env_binding(EnvBinding binding) {
    if (!has_argument(binding.target) && !accepts_extra_) {
        throw SchemaError("command '" + path() + "' has no parameter '" + binding.target +
                          "' for environment variable " + binding.variable);
    }
    env_bindings_.push_back(std::move(binding));
}

void Command::finalize() {
    parser_ = std::make_shared<const ArgParser>(build_parser());
}

ArgParser Command::build_parser() const {
    ArgParser parser(path(), description_ == kNoDescription ? "" : description_);
    parser.set_allow_unknown(accepts_extra_);

    for (const auto& arg : arguments_) {
        if (arg.is_boolean_flag()) {
            parser.add_flag(arg.name, arg.shortcut, arg.polarity(), arg.help);
        } else if (arg.is_positional()) {
            parser.add_positional(arg.name, arg.has_fallback() || is_env_target(arg.name),
                                  arg.choices, arg.help);
        } else {
            parser.add_option(arg.name, arg.shortcut, arg.choices, arg.help);
        }
    }
    return parser;
}

bool Command::is_env_target(const std::string& name) const {
    return std::any_of(env_bindings_.begin(), env_bindings_.end(),
                       [&](const EnvBinding& b) { return b.target == name; });
}

int Command::parse(const std::vector<std::string>& args, Context& ctx) const {
    try {
        auto bound = bind(args, ctx);
        if (!bound) {
            return 0;
        }
        LOG_DEBUG("Command", "Invoking {} with {} argument(s)", path(), bound->size());
        Value result = call(std::move(*bound), ctx);
        return puts(result, ctx.out()) ? 0 : 1;
    } catch (const UsageError& e) {
        LOG_DEBUG("Command", "Usage error in {}: {}", path(), e.what());
        ctx.err() << usage() << "\n" << path() << ": error: " << e.what() << "\n";
        return 2;
    } catch (const Error& e) {
        LOG_DEBUG("Command", "{} failed: {}", path(), e.what());
        ctx.err() << e.what() << "\n";
        return 1;
    }
}

std::optional<CallArgs> Command::bind(const std::vector<std::string>& args, Context& ctx) const {
    CallArgs call_args;
    if (capture_all_) {
        call_args.set_raw(args);
        return call_args;
    }

    std::optional<ArgParser> local;
    const ArgParser* parser = parser_.get();
    if (parser == nullptr) {
        local.emplace(build_parser());
        parser = &*local;
    }

    ParseResult parsed = parser->parse(args);
    if (parsed.help) {
        parser->print_help(ctx.out());
        return std::nullopt;
    }

    for (const auto& arg : arguments_) {
        if (parsed.values.count(arg.name)) {
            call_args.mark_given(arg.name);
        }
        Value value = resolve(arg, parsed, ctx);
        if (arg.keyword) {
            call_args.extra().emplace_back(arg.name, std::move(value));
        } else {
            call_args.set(arg.name, std::move(value));
        }
    }

    for (const auto& [key, value] : parsed.extra) {
        if (!call_args.has(key)) {
            call_args.extra().emplace_back(key, value);
            call_args.mark_given(key);
        }
    }

    return call_args;
}

Value Command::resolve(const Argument& argument, const ParseResult& parsed, Context& ctx) const {
    auto it = parsed.values.find(argument.name);
    if (it != parsed.values.end()) {
        return coerce(argument, it->second, "argument " + argument.name);
    }

    if (argument.env_var) {
        if (auto from_env = ctx.env().get(*argument.env_var)) {
            LOG_TRACE("Command", "{} resolved from environment variable {}", argument.name, *argument.env_var);
            return coerce(argument, Value(*from_env), "environment variable " + *argument.env_var);
        }
    }

    if (argument.prompt) {
        PromptOptions options;
        if (argument.default_value && !argument.default_value->is_none()) {
            options.default_value = argument.default_value;
        }
        options.type = argument.declared_type.value_or(ValueType::String);
        options.choices = argument.choices;
        options.hidden = argument.prompt->hidden;
        options.confirm = argument.prompt->confirm;
        options.empty = argument.prompt->empty;

        const std::string& text = argument.prompt->text.empty() ? argument.name : argument.prompt->text;
        return Prompter(ctx).ask(text, options);
    }

    // An env binding fills the slot at call time.
    if (argument.required && !is_env_target(argument.name)) {
        throw UsageError("the following arguments are required: " + argument.name);
    }
    return argument.default_or_none();
}

Value Command::coerce(const Argument& argument, const Value& raw, const std::string& source) const {
    if (!raw.is_string()) {
        return raw;
    }

    const std::string& text = raw.as_string();
    if (!argument.choices.empty() &&
        std::find(argument.choices.begin(), argument.choices.end(), text) == argument.choices.end()) {
        throw UsageError(source + ": invalid choice: '" + text + "' (choose from " +
                         utils::join(argument.choices, ", ") + ")");
    }

    ValueType type = argument.declared_type.value_or(ValueType::String);
    auto coerced = coerceText(text, type);
    if (!coerced) {
        throw UsageError(source + ": invalid " + valueTypeName(type) + " value: '" + text + "'");
    }
    return *coerced;
}

Value Command::call(CallArgs args, const Context& ctx) const {
    for (const auto& binding : env_bindings_) {
        if (args.given(binding.target)) {
            continue;
        }
        Value* slot = args.find(binding.target);

        Value resolved;
        if (auto from_env = ctx.env().get(binding.variable)) {
            resolved = Value(*from_env);
        } else if (binding.default_value) {
            resolved = Value(*binding.default_value);
        } else {
            LOG_WARN("Command", "{} requires environment variable {}", path(), binding.variable);
            throw MissingEnvironmentError(binding.variable);
        }

        if (slot != nullptr) {
            *slot = std::move(resolved);
        } else {
            args.extra().emplace_back(binding.target, std::move(resolved));
        }
    }

    if (!handler_) {
        return Value();
    }
    return handler_(args);
}

CallArgs Command::defaults() const {
    CallArgs args;
    for (const auto& arg : arguments_) {
        if (arg.keyword) {
            args.extra().emplace_back(arg.name, arg.default_or_none());
        } else {
            args.set(arg.name, arg.default_or_none());
        }
    }
    return args;
}

std::string Command::usage() const {
    if (capture_all_) {
        return "usage: " + path() + " [ARGS ...]";
    }
    if (parser_) {
        return parser_->usage();
    }
    return build_parser().usage();
}

void Command::print_help(std::ostream& out) const {
    if (capture_all_) {
        out << usage() << "\n\n" << description_ << "\n";
        return;
    }
    if (parser_) {
        parser_->print_help(out);
    } else {
        build_parser().print_help(out);
    }
}

} // namespace cmdkit
