/**
 * @file config.hpp
 * @brief Global options of a cmdkit program and their parsing
 *
 * Global options come before the command path:
 *
 *   prog [--log-level LEVEL] [--env KEY=VALUE]... <command> [args...]
 */

#pragma once

#include "cmdkit/core/environment.hpp"
#include "cmdkit/utils/logger.hpp"
#include "cmdkit/utils/string_utils.hpp"

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace cmdkit {
namespace app {

/// Environment variable holding the default log level.
inline constexpr const char* kLogLevelVariable = "CMDKIT_LOG_LEVEL";

/**
 * @brief Dispatcher configuration structure
 */
struct Config {
    std::string program_name = "cmdkit";
    std::string version = "1.0.0";
    std::string log_level = "WARN";
    std::vector<std::string> env_assignments;   ///< KEY=VALUE, in order
    bool help = false;
    bool version_requested = false;

    std::string command;                        ///< command path, empty if none given
    std::vector<std::string> command_args;
    std::string error;                          ///< set when the global options are invalid
};

/**
 * @brief Print usage information for the global options
 * @param out Destination stream
 * @param program_name Name of the executable
 */
inline void printUsage(std::ostream& out, const std::string& program_name) {
    out << "usage: " << program_name << " [-h] [--version] [--log-level LEVEL] [--env KEY=VALUE] "
        << "<command> [args...]\n\n"
        << "Options:\n"
        << "  -h, --help             Show this help message\n"
        << "  --version              Show version information\n"
        << "  --log-level <level>    Log level: TRACE, DEBUG, INFO, WARN, ERROR, OFF (default: WARN)\n"
        << "  --env <KEY=VALUE>      Set an environment variable for the command (repeatable)\n"
        << "\n  " << kLogLevelVariable << " sets the default log level.\n";
}

/**
 * @brief Apply defaults taken from the environment
 */
inline void applyEnvironment(Config& config, const Environment& env) {
    if (auto level = env.get(kLogLevelVariable)) {
        config.log_level = *level;
    }
}

/**
 * @brief Convert log level string to LogLevel enum
 * @param level_str Log level name, case-insensitive
 * @return LogLevel value (defaults to WARN if invalid)
 */
inline utils::LogLevel parseLogLevel(const std::string& level_str) {
    return utils::logLevelFromString(level_str).value_or(utils::LogLevel::WARN);
}

/**
 * @brief Parse the global options; the first non-option token is the
 *        command path and everything after it belongs to the command.
 * @param args Arguments without the program name
 * @param config Defaults to start from
 * @return Parsed configuration; `error` is set on invalid options
 */
inline Config parseArgs(const std::vector<std::string>& args, Config config = {}) {
    for (size_t i = 0; i < args.size(); ++i) {
        std::string arg = args[i];

        if (arg == "-h" || arg == "--help") {
            config.help = true;
            return config;
        }
        if (arg == "--version") {
            config.version_requested = true;
            return config;
        }

        if (arg.empty() || arg[0] != '-') {
            config.command = arg;
            config.command_args.assign(args.begin() + static_cast<std::ptrdiff_t>(i) + 1, args.end());
            return config;
        }

        std::string value;
        size_t eq = arg.find('=');
        if (utils::starts_with(arg, "--") && eq != std::string::npos) {
            value = arg.substr(eq + 1);
            arg = arg.substr(0, eq);
        } else if (arg == "--log-level" || arg == "--env") {
            // Options that require a value
            if (i + 1 >= args.size()) {
                config.error = "option " + arg + " requires a value";
                return config;
            }
            value = args[++i];
        }

        if (arg == "--log-level") {
            if (!utils::logLevelFromString(value)) {
                config.error = "invalid log level: " + value;
                return config;
            }
            config.log_level = value;
        } else if (arg == "--env") {
            if (value.find('=') == std::string::npos) {
                config.error = "expected KEY=VALUE for --env, got: " + value;
                return config;
            }
            config.env_assignments.push_back(value);
        } else {
            config.error = "unknown option: " + arg;
            return config;
        }
    }

    return config;
}

} // namespace app
} // namespace cmdkit
