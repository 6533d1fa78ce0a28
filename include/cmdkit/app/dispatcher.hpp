/**
 * @file dispatcher.hpp
 * @brief Top-level entry point: global options, command lookup and dispatch
 *
 * @copyright Copyright (c) 2024 cmdkit Contributors
 * @license MIT License
 */

#pragma once

#include "cmdkit/app/config.hpp"
#include "cmdkit/core/context.hpp"
#include "cmdkit/core/export.hpp"
#include "cmdkit/core/registry.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace cmdkit {
namespace app {

/**
 * @class Dispatcher
 * @brief Routes a program invocation to the registered command.
 *
 * Usage:
 * @code
 * int main(int argc, char* argv[]) {
 *     cmdkit::Registry registry;
 *     register_commands(registry);
 *     return cmdkit::app::Dispatcher(registry, {.program_name = "tool"}).main(argc, argv);
 * }
 * @endcode
 */
class CMDKIT_CORE_API Dispatcher {
public:
    explicit Dispatcher(const Registry& registry, Config defaults = {});

    /**
     * @brief Run one invocation.
     * @param args Arguments without the program name
     * @param ctx Streams and environment for the command
     * @return Exit status: 0 success, 1 failure or unknown command,
     *         2 usage error
     */
    int run(const std::vector<std::string>& args, Context& ctx) const;

    /**
     * @brief Run with the process arguments and standard streams.
     */
    int main(int argc, char* argv[]) const;

    /**
     * @brief Usage banner, global options and the grouped command list.
     */
    void print_usage(std::ostream& out) const;

private:
    const Registry& registry_;
    Config defaults_;
};

} // namespace app
} // namespace cmdkit
