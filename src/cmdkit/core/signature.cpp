/**
 * @file signature.cpp
 * @brief Signature inspection
 */

#include "cmdkit/core/signature.hpp"
#include "cmdkit/core/errors.hpp"

#include <unordered_set>

namespace cmdkit {

Parameter param(std::string name) {
    return Parameter{std::move(name), ParameterKind::Regular, std::nullopt};
}

Parameter param(std::string name, Value default_value) {
    return Parameter{std::move(name), ParameterKind::Regular, std::move(default_value)};
}

Parameter rest(std::string name) {
    return Parameter{std::move(name), ParameterKind::VarPositional, std::nullopt};
}

Parameter extra(std::string name) {
    return Parameter{std::move(name), ParameterKind::VarKeyword, std::nullopt};
}

InspectedSignature inspect(const Signature& signature) {
    InspectedSignature result;
    std::unordered_set<std::string> seen;
    const auto& params = signature.parameters();

    for (size_t i = 0; i < params.size(); ++i) {
        const Parameter& p = params[i];
        if (p.name.empty()) {
            throw SchemaError("parameter " + std::to_string(i) + " has no name");
        }
        if (!seen.insert(p.name).second) {
            throw SchemaError("duplicate parameter: " + p.name);
        }

        switch (p.kind) {
            case ParameterKind::VarPositional:
                if (params.size() != 1) {
                    throw SchemaError("raw argument capture '" + p.name +
                                      "' cannot be combined with other parameters");
                }
                result.capture_all = true;
                break;

            case ParameterKind::VarKeyword:
                if (i + 1 != params.size()) {
                    throw SchemaError("keyword catch-all '" + p.name + "' must be the last parameter");
                }
                result.accepts_extra = true;
                break;

            case ParameterKind::Regular:
                if (p.default_value) {
                    result.arguments.push_back(Argument::optional(p.name, *p.default_value));
                } else {
                    result.arguments.push_back(Argument::positional(p.name));
                }
                break;
        }
    }

    return result;
}

} // namespace cmdkit
