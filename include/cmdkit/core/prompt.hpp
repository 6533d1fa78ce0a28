/**
 * @file prompt.hpp
 * @brief Interactive prompt engine: line input with typed coercion.
 *
 * @copyright Copyright (c) 2024 cmdkit Contributors
 * @license MIT License
 */

#pragma once

#include "cmdkit/core/context.hpp"
#include "cmdkit/core/export.hpp"
#include "cmdkit/core/value.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace cmdkit {

/**
 * @struct PromptOptions
 * @brief How a single prompt resolves the line it reads.
 */
struct PromptOptions {
    std::optional<Value> default_value;  ///< returned for an empty answer
    ValueType type = ValueType::String;
    std::vector<std::string> choices;    ///< exact-match whitelist when non-empty
    bool hidden = false;
    bool confirm = false;
    bool empty = false;                  ///< empty answer yields none
};

/**
 * @class Prompter
 * @brief Reads one answer per prompt from a reader, writing prompts to a writer.
 *
 * Blocking and without timeout. Failures are reported as PromptError.
 */
class CMDKIT_CORE_API Prompter {
public:
    /**
     * @param in Reader for answers
     * @param out Writer for the prompt text
     * @param terminal True if `in` is the controlling terminal; hidden
     *        prompts then turn off echo while reading
     */
    Prompter(std::istream& in, std::ostream& out, bool terminal = false)
        : in_(in), out_(out), terminal_(terminal) {}

    explicit Prompter(const Context& ctx)
        : Prompter(ctx.in(), ctx.out(), ctx.is_terminal()) {}

    /**
     * @brief Ask for a value.
     * @param text Prompt text, written as "text: "
     * @param options Resolution rules
     * @return The resolved value, typed as options.type (or none)
     * @throws PromptError on an empty disallowed answer, a failed coercion,
     *         an invalid choice, a confirmation mismatch, or end of input
     */
    Value ask(const std::string& text, const PromptOptions& options = {});

private:
    std::istream& in_;
    std::ostream& out_;
    bool terminal_;

    Value ask_once(const std::string& label, const PromptOptions& options);
    std::string read_line(bool hidden);
};

} // namespace cmdkit
