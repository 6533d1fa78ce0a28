/**
 * @file dispatcher.cpp
 * @brief Dispatcher implementation
 */

#include "cmdkit/app/dispatcher.hpp"
#include "cmdkit/core/errors.hpp"
#include "cmdkit/utils/logger.hpp"

namespace cmdkit {
namespace app {

Dispatcher::Dispatcher(const Registry& registry, Config defaults)
    : registry_(registry)
    , defaults_(std::move(defaults)) {}

void Dispatcher::print_usage(std::ostream& out) const {
    printUsage(out, defaults_.program_name);

    out << "\nCommands:\n";
    if (registry_.empty()) {
        out << "  (none registered)\n";
        return;
    }
    registry_.print_commands(out);
}

int Dispatcher::run(const std::vector<std::string>& args, Context& ctx) const {
    Config config = defaults_;
    applyEnvironment(config, ctx.env());
    config = parseArgs(args, config);

    utils::Logger::instance().setLevel(parseLogLevel(config.log_level));

    if (!config.error.empty()) {
        ctx.err() << config.program_name << ": error: " << config.error << "\n";
        ctx.err() << "Use --help for usage information.\n";
        return 2;
    }
    if (config.help) {
        print_usage(ctx.out());
        return 0;
    }
    if (config.version_requested) {
        ctx.out() << config.program_name << " version " << config.version << "\n";
        return 0;
    }

    for (const auto& assignment : config.env_assignments) {
        Registry::load_env(assignment, ctx.env(), true);
    }

    if (config.command.empty()) {
        print_usage(ctx.err());
        return 1;
    }

    auto command = registry_.find(config.command);
    if (!command) {
        LOG_DEBUG("Dispatcher", "Unknown command: {}", config.command);
        ctx.err() << config.program_name << ": unknown command: " << config.command << "\n\n";
        print_usage(ctx.err());
        return 1;
    }

    LOG_DEBUG("Dispatcher", "Dispatching {} with {} argument(s)", command->path(), config.command_args.size());
    try {
        return command->parse(config.command_args, ctx);
    } catch (const MissingEnvironmentError& e) {
        LOG_ERROR("Dispatcher", "{} cannot run: {}", command->path(), e.what());
        ctx.err() << config.program_name << ": configuration error: " << e.what() << "\n";
        return 1;
    }
}

int Dispatcher::main(int argc, char* argv[]) const {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return run(args, Context::process());
}

} // namespace app
} // namespace cmdkit
