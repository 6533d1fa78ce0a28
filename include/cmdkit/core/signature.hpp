/**
 * @file signature.hpp
 * @brief Declared parameter lists and their inspection into argument schemas.
 *
 * A Signature is the explicit description of a command callable's
 * parameters. It is inspected once, when the Command is constructed:
 *
 * @code
 * Signature sig{param("name"), param("capitalize", false), extra()};
 * InspectedSignature schema = inspect(sig);
 * @endcode
 *
 * @copyright Copyright (c) 2024 cmdkit Contributors
 * @license MIT License
 */

#pragma once

#include "cmdkit/core/argument.hpp"
#include "cmdkit/core/export.hpp"
#include "cmdkit/core/value.hpp"

#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

namespace cmdkit {

enum class ParameterKind {
    Regular,        ///< named parameter, with or without default
    VarPositional,  ///< receives the raw argument list
    VarKeyword      ///< receives undeclared named options
};

struct Parameter {
    std::string name;
    ParameterKind kind = ParameterKind::Regular;
    std::optional<Value> default_value;
};

/// Parameter without a default (required).
CMDKIT_CORE_API Parameter param(std::string name);

/// Parameter with a default; a none default keeps the value free-form.
CMDKIT_CORE_API Parameter param(std::string name, Value default_value);

/// Raw argument capture; must be the only parameter.
CMDKIT_CORE_API Parameter rest(std::string name = "argv");

/// Keyword catch-all; must be the last parameter.
CMDKIT_CORE_API Parameter extra(std::string name = "kwargs");

class CMDKIT_CORE_API Signature {
public:
    Signature() = default;
    Signature(std::initializer_list<Parameter> parameters) : parameters_(parameters) {}
    explicit Signature(std::vector<Parameter> parameters) : parameters_(std::move(parameters)) {}

    const std::vector<Parameter>& parameters() const { return parameters_; }
    size_t size() const { return parameters_.size(); }
    bool empty() const { return parameters_.empty(); }

private:
    std::vector<Parameter> parameters_;
};

/**
 * @struct InspectedSignature
 * @brief Argument schema derived from a Signature.
 */
struct InspectedSignature {
    std::vector<Argument> arguments;
    bool capture_all = false;
    bool accepts_extra = false;
};

/**
 * @brief Derive the ordered argument schema of a signature.
 * @throws SchemaError on duplicate names, a raw capture mixed with other
 *         parameters, or a catch-all that is not last.
 */
CMDKIT_CORE_API InspectedSignature inspect(const Signature& signature);

} // namespace cmdkit
