/**
 * @file output.cpp
 * @brief Output normalization
 */

#include "cmdkit/core/output.hpp"
#include "cmdkit/utils/string_utils.hpp"

#include <algorithm>
#include <iomanip>

namespace cmdkit {

namespace {

void print_map(const Map& map, std::ostream& out) {
    size_t max_key_len = 0;
    for (const auto& [key, _] : map) {
        max_key_len = std::max(max_key_len, key.size());
    }
    for (const auto& [key, value] : map) {
        // Nested mappings collapse into their joined values; none is blank.
        out << std::left << std::setw(static_cast<int>(max_key_len + 1)) << (key + ":")
            << " " << value.to_string() << "\n";
    }
}

} // anonymous namespace

bool puts(const Value& value, std::ostream& out) {
    switch (value.type()) {
        case ValueType::None:
            return true;

        case ValueType::Bool:
            out << (value.as_bool() ? "OK" : "FAILED") << "\n";
            return value.as_bool();

        case ValueType::List:
            for (const auto& item : value.as_list()) {
                out << utils::rstrip_newlines(item.to_string()) << "\n";
            }
            return true;

        case ValueType::Map:
            print_map(value.as_map(), out);
            return true;

        default:
            out << value.to_string() << "\n";
            return true;
    }
}

} // namespace cmdkit
