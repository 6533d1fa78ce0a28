/**
 * @file arg_parser.hpp
 * @brief Command-line tokenizer for a single command's arguments.
 *
 * Supports positionals, value options (--name VALUE, --name=VALUE,
 * -s VALUE, -sVALUE), presence flags (--name / --no-name), choices,
 * "--" as end of options and -h/--help.
 *
 * @copyright Copyright (c) 2024 cmdkit Contributors
 * @license MIT License
 */

#pragma once

#include "cmdkit/core/argument.hpp"
#include "cmdkit/core/export.hpp"
#include "cmdkit/core/value.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace cmdkit {

/**
 * @struct ParseResult
 * @brief Values found on the command line.
 */
struct ParseResult {
    std::unordered_map<std::string, Value> values;  ///< by argument name; strings or bools
    Map extra;                                      ///< undeclared options, in order
    bool help = false;                              ///< -h/--help was given

    bool has(const std::string& name) const { return values.count(name) > 0; }
};

class CMDKIT_CORE_API ArgParser {
public:
    explicit ArgParser(std::string prog, std::string description = "");

    /**
     * @brief Register a positional argument (bound in registration order).
     * @param optional The token may be omitted; it is then absent from
     *        the result rather than a usage error.
     */
    void add_positional(const std::string& name, bool optional = false,
                        std::vector<std::string> choices = {}, std::string help = "");

    /**
     * @brief Register a value-taking option "--name".
     * @throws SchemaError on a duplicate name or shortcut
     */
    void add_option(const std::string& name, std::optional<char> shortcut = std::nullopt,
                    std::vector<std::string> choices = {}, std::string help = "");

    /**
     * @brief Register a presence flag. Both "--name" (true) and "--no-name"
     *        (false) are accepted; the shortcut follows the polarity.
     * @throws SchemaError on a duplicate name or shortcut
     */
    void add_flag(const std::string& name, std::optional<char> shortcut,
                  FlagPolarity polarity, std::string help = "");

    /**
     * @brief Collect unknown options into ParseResult::extra instead of failing.
     */
    void set_allow_unknown(bool allow) { allow_unknown_ = allow; }
    bool allow_unknown() const { return allow_unknown_; }

    /**
     * @brief Tokenize arguments against the registered surface.
     * @throws UsageError on unknown options, missing values, missing
     *         positionals, surplus positionals or invalid choices
     */
    ParseResult parse(const std::vector<std::string>& args) const;

    std::string usage() const;
    void print_help(std::ostream& out) const;

private:
    enum class Kind { Positional, Option, Flag };

    struct Spec {
        std::string name;
        Kind kind = Kind::Option;
        bool optional = false;
        std::optional<char> shortcut;
        std::vector<std::string> choices;
        std::string help;
        FlagPolarity polarity = FlagPolarity::None;
    };

    std::string prog_;
    std::string description_;
    bool allow_unknown_ = false;
    std::vector<Spec> positionals_;
    std::vector<Spec> options_;
    std::unordered_map<std::string, size_t> long_index_;
    std::unordered_map<char, size_t> short_index_;

    void register_option(Spec spec);
    void check_choice(const Spec& spec, const std::string& value) const;
    std::string display(const Spec& spec) const;
};

} // namespace cmdkit
