/**
 * @file decorators.hpp
 * @brief Composable refinements of a command's argument schema.
 *
 * A decorator mutates a Command before it is registered. Decorators are
 * listed outermost first and applied last-listed-first, so the one written
 * closest to the handler runs first:
 *
 * @code
 * registry.command("login", {param("user"), param("password")}, login, {
 *     .decorators = {
 *         arg("user", {.help = "account name"}),
 *         prompt("password", {.text = "Password", .hidden = true}),
 *     }});
 * @endcode
 *
 * @copyright Copyright (c) 2024 cmdkit Contributors
 * @license MIT License
 */

#pragma once

#include "cmdkit/core/argument.hpp"
#include "cmdkit/core/command.hpp"
#include "cmdkit/core/export.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace cmdkit {

using Decorator = std::function<void(Command&)>;

/**
 * @brief Refine an argument's help, shortcut, choices, env var, default or type.
 *
 * On a command with a keyword catch-all, an unknown name creates a new
 * optional argument delivered among the extra values.
 *
 * @throws ArgumentNotFound when applied, if the name is undeclared and the
 *         command has no catch-all
 */
CMDKIT_CORE_API Decorator arg(std::string name, ArgOptions options = {});

/**
 * @brief Resolve a missing value interactively. Prompt text defaults to
 *        the argument name.
 */
CMDKIT_CORE_API Decorator prompt(std::string name, PromptConfig config = {});

/**
 * @brief Inject an environment variable into the parameter named after it
 *        (lower-cased) when the command is called.
 *
 * Without a default the variable is required and its absence raises
 * MissingEnvironmentError at call time.
 */
CMDKIT_CORE_API Decorator env(std::string variable,
                              std::optional<std::string> default_value = std::nullopt);

/**
 * @brief Apply decorators in reverse listing order.
 */
CMDKIT_CORE_API void apply_decorators(Command& command, const std::vector<Decorator>& decorators);

} // namespace cmdkit
