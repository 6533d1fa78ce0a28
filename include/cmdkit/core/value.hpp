/**
 * @file value.hpp
 * @brief Dynamically typed values exchanged between parser, commands and output.
 *
 * A Value is what an argument resolves to and what a command returns.
 * Mappings keep insertion order because command output is rendered in the
 * order the command produced it.
 *
 * @copyright Copyright (c) 2024 cmdkit Contributors
 * @license MIT License
 */

#pragma once

#include "cmdkit/core/export.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace cmdkit {

struct Value;

using List = std::vector<Value>;
using Map = std::vector<std::pair<std::string, Value>>;

/**
 * @enum ValueType
 * @brief Alternatives of Value, in storage order.
 */
enum class ValueType {
    None,
    Bool,
    Integer,
    Float,
    String,
    List,
    Map
};

CMDKIT_CORE_API const char* valueTypeName(ValueType type);

/**
 * @struct Value
 * @brief Tagged value: none, bool, integer, float, string, list or mapping.
 */
struct CMDKIT_CORE_API Value {
    using Storage = std::variant<
        std::nullptr_t,
        bool,
        int64_t,
        double,
        std::string,
        List,
        Map
    >;

    Storage data;

    Value() : data(nullptr) {}
    Value(std::nullptr_t) : data(nullptr) {}
    Value(bool b) : data(b) {}
    Value(int i) : data(static_cast<int64_t>(i)) {}
    Value(int64_t i) : data(i) {}
    Value(double d) : data(d) {}
    Value(const char* s) : data(std::string(s)) {}
    Value(std::string s) : data(std::move(s)) {}
    Value(List list) : data(std::move(list)) {}
    Value(Map map) : data(std::move(map)) {}
    Value(const std::vector<std::string>& strings);

    ValueType type() const { return static_cast<ValueType>(data.index()); }

    bool is_none() const { return type() == ValueType::None; }
    bool is_bool() const { return type() == ValueType::Bool; }
    bool is_integer() const { return type() == ValueType::Integer; }
    bool is_float() const { return type() == ValueType::Float; }
    bool is_string() const { return type() == ValueType::String; }
    bool is_list() const { return type() == ValueType::List; }
    bool is_map() const { return type() == ValueType::Map; }

    // Accessors throw std::bad_variant_access on a type mismatch.
    bool as_bool() const { return std::get<bool>(data); }
    int64_t as_integer() const { return std::get<int64_t>(data); }
    double as_float() const { return std::get<double>(data); }
    const std::string& as_string() const { return std::get<std::string>(data); }
    const List& as_list() const { return std::get<List>(data); }
    const Map& as_map() const { return std::get<Map>(data); }

    /**
     * @brief Look up a key in a mapping value.
     * @return Pointer to the value, or nullptr if absent or not a mapping.
     */
    const Value* find(const std::string& key) const;

    /**
     * @brief Plain textual representation.
     *
     * none is empty, booleans are "true"/"false", lists and the values of a
     * mapping are joined with ", ".
     */
    std::string to_string() const;

    bool operator==(const Value& other) const { return data == other.data; }
    bool operator!=(const Value& other) const { return !(*this == other); }
};

/**
 * @brief Interpret a word as a boolean.
 *
 * Case-insensitive: y, yes, true, 1 are true; n, no, false, 0 are false.
 * @return std::nullopt for any other word.
 */
CMDKIT_CORE_API std::optional<bool> parseBoolean(const std::string& word);

/**
 * @brief Convert command-line text into a value of the given type.
 * @return std::nullopt when the text is not a valid literal of that type.
 */
CMDKIT_CORE_API std::optional<Value> coerceText(const std::string& text, ValueType type);

} // namespace cmdkit
