/**
 * @file output.hpp
 * @brief Rendering of command return values into process output.
 *
 * @copyright Copyright (c) 2024 cmdkit Contributors
 * @license MIT License
 */

#pragma once

#include "cmdkit/core/export.hpp"
#include "cmdkit/core/value.hpp"

#include <ostream>

namespace cmdkit {

/**
 * @brief Write a command's return value.
 *
 * - none: nothing
 * - "": a single newline
 * - true / false: "OK" / "FAILED"
 * - list: one element per line, trailing line breaks stripped
 * - mapping: one "key: value" line per entry, keys aligned
 * - anything else: its text followed by a newline
 *
 * @return false only for boolean false.
 */
CMDKIT_CORE_API bool puts(const Value& value, std::ostream& out);

} // namespace cmdkit
