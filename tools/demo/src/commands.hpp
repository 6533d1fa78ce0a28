/**
 * @file commands.hpp
 * @brief Command registration for the cmdkit demo tool
 */

#pragma once

#include "cmdkit/core/registry.hpp"

namespace cmdkit::demo::commands {

/// Root commands: greet, add, echo, login, whoami, exists.
void register_basic(Registry& registry);

/// Settings commands, meant to be merged under the "config" namespace.
Registry config_registry();

/// Settings file used when CMDKIT_DEMO_STORE is unset.
inline constexpr const char* kDefaultStore = ".cmdkit-demo.env";

} // namespace cmdkit::demo::commands
