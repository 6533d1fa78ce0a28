/**
 * @file environment.cpp
 * @brief Environment sources and env blob parsing
 */

#include "cmdkit/core/environment.hpp"
#include "cmdkit/utils/logger.hpp"
#include "cmdkit/utils/string_utils.hpp"

#include <cstdlib>

namespace cmdkit {

std::optional<std::string> ProcessEnvironment::get(const std::string& name) const {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

void ProcessEnvironment::set(const std::string& name, const std::string& value) {
#ifdef _WIN32
    _putenv_s(name.c_str(), value.c_str());
#else
    ::setenv(name.c_str(), value.c_str(), 1);
#endif
}

std::optional<std::string> MapEnvironment::get(const std::string& name) const {
    auto it = vars_.find(name);
    if (it == vars_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MapEnvironment::set(const std::string& name, const std::string& value) {
    vars_[name] = value;
}

EnvMap parseEnvBlob(const std::string& text) {
    EnvMap result;
    size_t line_no = 0;

    for (const auto& raw : utils::split_lines(text)) {
        ++line_no;
        std::string line = utils::trim(raw);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            LOG_WARN("Environment", "Ignoring line {} without '=': {}", line_no, line);
            continue;
        }

        std::string key = utils::trim(line.substr(0, eq));
        if (key.empty()) {
            LOG_WARN("Environment", "Ignoring line {} with empty key", line_no);
            continue;
        }
        result[key] = utils::unquote(utils::trim(line.substr(eq + 1)));
    }

    return result;
}

} // namespace cmdkit
