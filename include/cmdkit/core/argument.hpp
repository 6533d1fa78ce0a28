/**
 * @file argument.hpp
 * @brief Argument descriptor: how one command parameter is parsed and resolved.
 *
 * @copyright Copyright (c) 2024 cmdkit Contributors
 * @license MIT License
 */

#pragma once

#include "cmdkit/core/export.hpp"
#include "cmdkit/core/value.hpp"

#include <optional>
#include <string>
#include <vector>

namespace cmdkit {

/**
 * @enum FlagPolarity
 * @brief What presenting a boolean flag does.
 *
 * The polarity is fixed by the flag's default:
 * - default false: Positive, "--name" switches the value on.
 * - default true:  Negative, "--no-name" switches the value off.
 * Non-boolean arguments have polarity None.
 */
enum class FlagPolarity {
    None,
    Positive,
    Negative
};

/// Prefix that turns "--name" into its negating form "--no-name".
inline constexpr const char* kNegationPrefix = "no-";

/**
 * @brief Polarity policy for a boolean flag with the given default.
 */
CMDKIT_CORE_API FlagPolarity flagPolarityFor(bool default_value);

/**
 * @struct PromptConfig
 * @brief Interactive resolution of an argument missing from the command line.
 */
struct PromptConfig {
    std::string text;       ///< Prompt text (argument name when empty)
    bool hidden = false;    ///< Suppress terminal echo while reading
    bool confirm = false;   ///< Ask twice, both answers must match
    bool empty = false;     ///< Accept an empty answer as none
};

/**
 * @struct ArgOptions
 * @brief Refinements applied by the `arg` decorator. Unset fields keep
 *        whatever the signature inspection produced.
 */
struct ArgOptions {
    std::optional<std::string> help;
    std::optional<char> shortcut;
    std::optional<std::vector<std::string>> choices;
    std::optional<std::string> env_var;
    std::optional<Value> default_value;
    std::optional<ValueType> type;
    std::optional<bool> required;
};

/**
 * @struct Argument
 * @brief Schema entry for one command parameter.
 */
struct CMDKIT_CORE_API Argument {
    std::string name;
    bool required = true;
    std::optional<Value> default_value;       ///< unset when required
    std::optional<ValueType> declared_type;   ///< unset means free-form text
    std::vector<std::string> choices;
    std::string help;
    std::optional<char> shortcut;
    std::optional<std::string> env_var;
    std::optional<PromptConfig> prompt;
    bool keyword = false;       ///< delivered among the extra named values
    bool synthesized = false;   ///< created for a keyword catch-all, mergeable once

    /**
     * @brief Descriptor for a parameter without a default.
     */
    static Argument positional(std::string name);

    /**
     * @brief Descriptor for a parameter with a default.
     *
     * A non-none default fixes the declared type; a none default leaves the
     * value free-form.
     */
    static Argument optional(std::string name, Value default_value);

    bool is_boolean_flag() const { return declared_type == ValueType::Bool; }

    FlagPolarity polarity() const;

    /**
     * @brief True if the argument is bound by position on the command line.
     */
    bool is_positional() const { return required && !is_boolean_flag(); }

    /**
     * @brief Whether a missing command-line value can still be resolved
     *        from the environment or a prompt.
     */
    bool has_fallback() const { return env_var.has_value() || prompt.has_value(); }

    /**
     * @brief Long option as rendered in usage: "--name" or "--no-name".
     */
    std::string flag() const;

    /**
     * @brief Placeholder for the value in usage text ("NAME").
     */
    std::string metavar() const;

    /**
     * @brief Default value, none for required arguments.
     */
    Value default_or_none() const { return default_value.value_or(Value()); }

    /**
     * @brief Apply decorator refinements on top of the inspected schema.
     */
    void apply(const ArgOptions& options);

    /**
     * @brief Overwrite with another declaration of the same name, keeping
     *        fields the other declaration leaves empty.
     */
    void merge(const Argument& other);
};

} // namespace cmdkit
