/**
 * @file main.cpp
 * @brief cmdkit demo tool entry point
 */

#include "commands.hpp"

#include "cmdkit/app/dispatcher.hpp"

#include <exception>
#include <iostream>

int main(int argc, char* argv[]) {
    try {
        cmdkit::Registry registry;
        cmdkit::demo::commands::register_basic(registry);
        registry.merge(cmdkit::demo::commands::config_registry(), "config");

        cmdkit::app::Config defaults;
        defaults.program_name = "cmdkit-demo";
        return cmdkit::app::Dispatcher(registry, defaults).main(argc, argv);
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
