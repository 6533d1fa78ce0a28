/**
 * @file errors.hpp
 * @brief Exception taxonomy for registration, parsing and invocation.
 *
 * - SchemaError: a defect in how commands were declared. Raised while the
 *   program registers its commands; not recoverable by the user.
 * - UsageError: the command line does not fit the command's schema.
 * - Error: a command reports a failure meant for the user. Printed without
 *   further detail and turned into a non-zero exit status.
 * - MissingEnvironmentError: a required environment variable is absent.
 *   Deployment problem, so it is never rendered as a usage message.
 *
 * @copyright Copyright (c) 2024 cmdkit Contributors
 * @license MIT License
 */

#pragma once

#include "cmdkit/core/export.hpp"

#include <stdexcept>
#include <string>

namespace cmdkit {

class CMDKIT_CORE_API Exception : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class CMDKIT_CORE_API SchemaError : public Exception {
public:
    using Exception::Exception;
};

/**
 * @brief Raised by Command::get_argument for an undeclared name.
 */
class CMDKIT_CORE_API ArgumentNotFound : public SchemaError {
public:
    explicit ArgumentNotFound(const std::string& name)
        : SchemaError("argument not found: " + name), name_(name) {}

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

class CMDKIT_CORE_API UsageError : public Exception {
public:
    using Exception::Exception;
};

/**
 * @brief User-facing command failure.
 *
 * Throw from a command handler to abort it with a message:
 * @code
 * throw cmdkit::Error("No way dude!");
 * @endcode
 */
class CMDKIT_CORE_API Error : public Exception {
public:
    using Exception::Exception;
};

/**
 * @brief Interactive prompt could not produce a value.
 */
class CMDKIT_CORE_API PromptError : public Error {
public:
    using Error::Error;
};

class CMDKIT_CORE_API MissingEnvironmentError : public Exception {
public:
    explicit MissingEnvironmentError(const std::string& variable)
        : Exception("missing environment variable: " + variable), variable_(variable) {}

    const std::string& variable() const { return variable_; }

private:
    std::string variable_;
};

} // namespace cmdkit
