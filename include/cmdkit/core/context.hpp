/**
 * @file context.hpp
 * @brief I/O and environment capabilities handed to parsing and invocation.
 *
 * Commands never touch std::cin/std::cout directly; everything goes through
 * a Context so tests can substitute string streams and a MapEnvironment.
 *
 * @copyright Copyright (c) 2024 cmdkit Contributors
 * @license MIT License
 */

#pragma once

#include "cmdkit/core/environment.hpp"
#include "cmdkit/core/export.hpp"

#include <iostream>

namespace cmdkit {

class CMDKIT_CORE_API Context {
public:
    /**
     * @param in Reader used by prompts
     * @param out Writer for command output
     * @param err Writer for errors and usage messages
     * @param env Environment variable source
     * @param terminal True if `in` is an interactive terminal (enables
     *        echo suppression for hidden prompts)
     */
    Context(std::istream& in, std::ostream& out, std::ostream& err,
            Environment& env, bool terminal = false)
        : in_(in), out_(out), err_(err), env_(env), terminal_(terminal) {}

    /**
     * @brief Context bound to the standard streams and process environment.
     */
    static Context& process();

    std::istream& in() const { return in_; }
    std::ostream& out() const { return out_; }
    std::ostream& err() const { return err_; }
    Environment& env() const { return env_; }
    bool is_terminal() const { return terminal_; }

private:
    std::istream& in_;
    std::ostream& out_;
    std::ostream& err_;
    Environment& env_;
    bool terminal_;
};

} // namespace cmdkit
