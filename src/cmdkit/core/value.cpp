/**
 * @file value.cpp
 * @brief Value rendering and text coercion
 */

#include "cmdkit/core/value.hpp"
#include "cmdkit/utils/string_utils.hpp"

#include <cerrno>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace cmdkit {

const char* valueTypeName(ValueType type) {
    switch (type) {
        case ValueType::None: return "none";
        case ValueType::Bool: return "bool";
        case ValueType::Integer: return "int";
        case ValueType::Float: return "float";
        case ValueType::String: return "str";
        case ValueType::List: return "list";
        case ValueType::Map: return "map";
        default: return "unknown";
    }
}

Value::Value(const std::vector<std::string>& strings) {
    List list;
    list.reserve(strings.size());
    for (const auto& s : strings) {
        list.emplace_back(s);
    }
    data = std::move(list);
}

const Value* Value::find(const std::string& key) const {
    if (!is_map()) {
        return nullptr;
    }
    for (const auto& [k, v] : as_map()) {
        if (k == key) {
            return &v;
        }
    }
    return nullptr;
}

std::string Value::to_string() const {
    return std::visit([](const auto& val) -> std::string {
        using T = std::decay_t<decltype(val)>;

        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return "";
        } else if constexpr (std::is_same_v<T, bool>) {
            return val ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(val);
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream oss;
            oss << std::setprecision(15) << val;
            return oss.str();
        } else if constexpr (std::is_same_v<T, std::string>) {
            return val;
        } else if constexpr (std::is_same_v<T, List>) {
            std::vector<std::string> parts;
            parts.reserve(val.size());
            for (const auto& item : val) {
                parts.push_back(item.to_string());
            }
            return utils::join(parts, ", ");
        } else if constexpr (std::is_same_v<T, Map>) {
            std::vector<std::string> parts;
            parts.reserve(val.size());
            for (const auto& [key, item] : val) {
                parts.push_back(item.to_string());
            }
            return utils::join(parts, ", ");
        }
        return "";
    }, data);
}

std::optional<bool> parseBoolean(const std::string& word) {
    std::string lower = utils::to_lower(utils::trim(word));
    if (lower == "y" || lower == "yes" || lower == "true" || lower == "1") {
        return true;
    }
    if (lower == "n" || lower == "no" || lower == "false" || lower == "0") {
        return false;
    }
    return std::nullopt;
}

std::optional<Value> coerceText(const std::string& text, ValueType type) {
    switch (type) {
        case ValueType::Bool: {
            auto parsed = parseBoolean(text);
            if (!parsed) return std::nullopt;
            return Value(*parsed);
        }
        case ValueType::Integer: {
            if (text.empty()) return std::nullopt;
            errno = 0;
            char* end = nullptr;
            long long parsed = std::strtoll(text.c_str(), &end, 10);
            if (errno != 0 || end == text.c_str() || *end != '\0') return std::nullopt;
            return Value(static_cast<int64_t>(parsed));
        }
        case ValueType::Float: {
            if (text.empty()) return std::nullopt;
            errno = 0;
            char* end = nullptr;
            double parsed = std::strtod(text.c_str(), &end);
            if (errno != 0 || end == text.c_str() || *end != '\0') return std::nullopt;
            return Value(parsed);
        }
        case ValueType::None:
        case ValueType::String:
            return Value(text);
        default:
            // Lists and mappings have no command-line literal.
            return std::nullopt;
    }
}

} // namespace cmdkit
