/**
 * @file environment.hpp
 * @brief Environment variable sources and the KEY=VALUE blob format.
 *
 * @copyright Copyright (c) 2024 cmdkit Contributors
 * @license MIT License
 */

#pragma once

#include "cmdkit/core/export.hpp"

#include <optional>
#include <string>
#include <unordered_map>

namespace cmdkit {

using EnvMap = std::unordered_map<std::string, std::string>;

/**
 * @class Environment
 * @brief Read/write access to environment variables.
 */
class CMDKIT_CORE_API Environment {
public:
    virtual ~Environment() = default;

    virtual std::optional<std::string> get(const std::string& name) const = 0;
    virtual void set(const std::string& name, const std::string& value) = 0;

    bool contains(const std::string& name) const { return get(name).has_value(); }
};

/**
 * @class ProcessEnvironment
 * @brief The environment of the running process (getenv/setenv).
 */
class CMDKIT_CORE_API ProcessEnvironment : public Environment {
public:
    std::optional<std::string> get(const std::string& name) const override;
    void set(const std::string& name, const std::string& value) override;
};

/**
 * @class MapEnvironment
 * @brief In-memory environment, used to isolate tests from the process.
 */
class CMDKIT_CORE_API MapEnvironment : public Environment {
public:
    MapEnvironment() = default;
    explicit MapEnvironment(EnvMap vars) : vars_(std::move(vars)) {}

    std::optional<std::string> get(const std::string& name) const override;
    void set(const std::string& name, const std::string& value) override;
    void unset(const std::string& name) { vars_.erase(name); }

    const EnvMap& vars() const { return vars_; }

private:
    EnvMap vars_;
};

/**
 * @brief Parse a newline-separated KEY=VALUE blob.
 *
 * Keys and values are trimmed; a value wrapped in matching single or double
 * quotes is unquoted. Blank lines, '#' comment lines and lines without '='
 * are skipped. A later key overrides an earlier one.
 */
CMDKIT_CORE_API EnvMap parseEnvBlob(const std::string& text);

} // namespace cmdkit
