/**
 * @file arg_parser.cpp
 * @brief Command-line tokenizer implementation
 */

#include "cmdkit/core/arg_parser.hpp"
#include "cmdkit/core/errors.hpp"
#include "cmdkit/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <iomanip>
#include <sstream>

namespace cmdkit {

namespace {

// "-5" and "-.5" are values, not options.
bool looks_like_option(const std::string& token) {
    if (token.size() < 2 || token[0] != '-') {
        return false;
    }
    unsigned char next = static_cast<unsigned char>(token[1]);
    return !(std::isdigit(next) || next == '.');
}

void upsert(Map& map, const std::string& key, Value value) {
    for (auto& [k, v] : map) {
        if (k == key) {
            v = std::move(value);
            return;
        }
    }
    map.emplace_back(key, std::move(value));
}

} // anonymous namespace

ArgParser::ArgParser(std::string prog, std::string description)
    : prog_(std::move(prog))
    , description_(std::move(description)) {}

void ArgParser::add_positional(const std::string& name, bool optional,
                               std::vector<std::string> choices, std::string help) {
    for (const auto& existing : positionals_) {
        if (existing.name == name) {
            throw SchemaError("conflicting positional argument: " + name);
        }
    }
    Spec spec;
    spec.name = name;
    spec.kind = Kind::Positional;
    spec.optional = optional;
    spec.choices = std::move(choices);
    spec.help = std::move(help);
    positionals_.push_back(std::move(spec));
}

void ArgParser::add_option(const std::string& name, std::optional<char> shortcut,
                           std::vector<std::string> choices, std::string help) {
    Spec spec;
    spec.name = name;
    spec.kind = Kind::Option;
    spec.optional = true;
    spec.shortcut = shortcut;
    spec.choices = std::move(choices);
    spec.help = std::move(help);
    register_option(std::move(spec));
}

void ArgParser::add_flag(const std::string& name, std::optional<char> shortcut,
                         FlagPolarity polarity, std::string help) {
    Spec spec;
    spec.name = name;
    spec.kind = Kind::Flag;
    spec.optional = true;
    spec.shortcut = shortcut;
    spec.help = std::move(help);
    spec.polarity = polarity == FlagPolarity::None ? FlagPolarity::Positive : polarity;
    register_option(std::move(spec));
}

void ArgParser::register_option(Spec spec) {
    std::vector<std::string> names{spec.name};
    if (spec.kind == Kind::Flag) {
        names.push_back(kNegationPrefix + spec.name);
    }
    for (const auto& n : names) {
        if (n == "help" || long_index_.count(n)) {
            throw SchemaError("conflicting option string: --" + n);
        }
    }
    if (spec.shortcut) {
        char c = *spec.shortcut;
        if (c == 'h' || c == '-' || short_index_.count(c)) {
            throw SchemaError(std::string("conflicting option string: -") + c);
        }
    }

    size_t idx = options_.size();
    for (const auto& n : names) {
        long_index_[n] = idx;
    }
    if (spec.shortcut) {
        short_index_[*spec.shortcut] = idx;
    }
    options_.push_back(std::move(spec));
}

void ArgParser::check_choice(const Spec& spec, const std::string& value) const {
    if (spec.choices.empty()) {
        return;
    }
    if (std::find(spec.choices.begin(), spec.choices.end(), value) == spec.choices.end()) {
        throw UsageError("argument " + display(spec) + ": invalid choice: '" + value +
                         "' (choose from " + utils::join(spec.choices, ", ") + ")");
    }
}

std::string ArgParser::display(const Spec& spec) const {
    if (spec.kind == Kind::Positional) {
        return spec.name;
    }
    std::string shown;
    if (spec.shortcut) {
        shown = std::string("-") + *spec.shortcut + "/";
    }
    if (spec.kind == Kind::Flag && spec.polarity == FlagPolarity::Negative) {
        return shown + "--" + kNegationPrefix + spec.name;
    }
    return shown + "--" + spec.name;
}

ParseResult ArgParser::parse(const std::vector<std::string>& args) const {
    ParseResult result;
    std::vector<std::string> tokens;
    bool only_positional = false;

    auto take_value = [&](size_t& i, const std::string& option) -> std::string {
        if (i + 1 >= args.size() || looks_like_option(args[i + 1])) {
            throw UsageError("argument " + option + ": expected one argument");
        }
        return args[++i];
    };

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& token = args[i];

        if (only_positional || !looks_like_option(token)) {
            tokens.push_back(token);
            continue;
        }
        if (token == "--") {
            only_positional = true;
            continue;
        }
        if (token == "-h" || token == "--help") {
            result.help = true;
            continue;
        }

        std::string key;
        std::optional<std::string> inline_value;
        const Spec* spec = nullptr;
        bool negated = false;

        if (utils::starts_with(token, "--")) {
            key = token.substr(2);
            size_t eq = key.find('=');
            if (eq != std::string::npos) {
                inline_value = key.substr(eq + 1);
                key = key.substr(0, eq);
            }
            auto it = long_index_.find(key);
            if (it != long_index_.end()) {
                spec = &options_[it->second];
                negated = key != spec->name;
            }
        } else {
            char c = token[1];
            key = token.substr(1);
            auto it = short_index_.find(c);
            if (it != short_index_.end()) {
                spec = &options_[it->second];
                if (token.size() > 2) {
                    std::string attached = token.substr(2);
                    if (!attached.empty() && attached[0] == '=') {
                        attached = attached.substr(1);
                    }
                    inline_value = attached;
                }
                negated = spec->polarity == FlagPolarity::Negative;
            }
        }

        if (spec == nullptr) {
            if (!allow_unknown_) {
                throw UsageError("unrecognized arguments: " + token);
            }
            if (inline_value) {
                upsert(result.extra, key, Value(*inline_value));
            } else if (i + 1 < args.size() && !looks_like_option(args[i + 1])) {
                upsert(result.extra, key, Value(args[++i]));
            } else {
                upsert(result.extra, key, Value(true));
            }
            continue;
        }

        if (spec->kind == Kind::Flag) {
            if (inline_value) {
                throw UsageError("argument " + display(*spec) + ": ignored explicit argument '" +
                                 *inline_value + "'");
            }
            result.values[spec->name] = Value(!negated);
            continue;
        }

        std::string value = inline_value ? *inline_value : take_value(i, token);
        check_choice(*spec, value);
        result.values[spec->name] = Value(value);
    }

    // Optional positionals only receive tokens left over after every
    // mandatory positional has one.
    size_t mandatory = 0;
    for (const auto& spec : positionals_) {
        if (!spec.optional) ++mandatory;
    }
    size_t spare = tokens.size() > mandatory ? tokens.size() - mandatory : 0;

    size_t next = 0;
    std::vector<std::string> missing;
    for (const auto& spec : positionals_) {
        if (spec.optional) {
            if (spare > 0 && next < tokens.size()) {
                check_choice(spec, tokens[next]);
                result.values[spec.name] = Value(tokens[next++]);
                --spare;
            }
            continue;
        }
        if (next < tokens.size()) {
            check_choice(spec, tokens[next]);
            result.values[spec.name] = Value(tokens[next++]);
        } else {
            missing.push_back(spec.name);
        }
    }

    if (result.help) {
        return result;
    }
    if (!missing.empty()) {
        throw UsageError("the following arguments are required: " + utils::join(missing, ", "));
    }
    if (next < tokens.size()) {
        std::vector<std::string> surplus(tokens.begin() + static_cast<std::ptrdiff_t>(next), tokens.end());
        throw UsageError("unrecognized arguments: " + utils::join(surplus, " "));
    }

    return result;
}

std::string ArgParser::usage() const {
    std::ostringstream oss;
    oss << "usage: " << prog_ << " [-h]";

    for (const auto& spec : options_) {
        oss << " [";
        if (spec.kind == Kind::Flag) {
            if (spec.shortcut) {
                oss << "-" << *spec.shortcut;
            } else {
                oss << (spec.polarity == FlagPolarity::Negative ? "--" + std::string(kNegationPrefix) : "--")
                    << spec.name;
            }
        } else {
            if (spec.shortcut) {
                oss << "-" << *spec.shortcut;
            } else {
                oss << "--" << spec.name;
            }
            if (spec.choices.empty()) {
                oss << " " << utils::to_upper(spec.name);
            } else {
                oss << " {" << utils::join(spec.choices, ",") << "}";
            }
        }
        oss << "]";
    }

    for (const auto& spec : positionals_) {
        std::string shown = spec.choices.empty() ? spec.name : "{" + utils::join(spec.choices, ",") + "}";
        oss << " " << (spec.optional ? "[" + shown + "]" : shown);
    }
    if (allow_unknown_) {
        oss << " [--KEY VALUE ...]";
    }
    return oss.str();
}

void ArgParser::print_help(std::ostream& out) const {
    out << usage() << "\n";
    if (!description_.empty()) {
        out << "\n" << description_ << "\n";
    }

    std::vector<std::pair<std::string, std::string>> rows;
    if (!positionals_.empty()) {
        out << "\npositional arguments:\n";
        size_t width = 0;
        for (const auto& spec : positionals_) width = std::max(width, spec.name.size());
        for (const auto& spec : positionals_) {
            out << "  " << std::left << std::setw(static_cast<int>(width + 2)) << spec.name
                << (spec.help.empty() ? "no description" : spec.help) << "\n";
        }
    }

    rows.emplace_back("-h, --help", "show this help message and exit");
    for (const auto& spec : options_) {
        std::string left;
        if (spec.shortcut) {
            left = std::string("-") + *spec.shortcut + ", ";
        }
        if (spec.kind == Kind::Flag) {
            left += spec.polarity == FlagPolarity::Negative ? "--" + std::string(kNegationPrefix) + spec.name
                                                            : "--" + spec.name;
        } else {
            left += "--" + spec.name + " " + utils::to_upper(spec.name);
        }
        rows.emplace_back(left, spec.help.empty() ? "no description" : spec.help);
    }

    out << "\noptional arguments:\n";
    size_t width = 0;
    for (const auto& [left, _] : rows) width = std::max(width, left.size());
    for (const auto& [left, help] : rows) {
        out << "  " << std::left << std::setw(static_cast<int>(width + 2)) << left << help << "\n";
    }
}

} // namespace cmdkit
