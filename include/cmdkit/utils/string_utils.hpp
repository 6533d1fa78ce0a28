/**
 * @file string_utils.hpp
 * @brief String utility functions shared by the parser, registry and output
 */

#pragma once

#include <string>
#include <algorithm>
#include <cctype>
#include <vector>
#include <sstream>

namespace cmdkit::utils {

/**
 * @brief Convert string to uppercase
 */
inline std::string to_upper(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return result;
}

/**
 * @brief Convert string to lowercase (for case-insensitive vocabularies)
 */
inline std::string to_lower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

/**
 * @brief Trim whitespace from both ends of a string
 */
inline std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

/**
 * @brief Strip trailing line-break characters only
 */
inline std::string rstrip_newlines(const std::string& str) {
    size_t end = str.find_last_not_of("\r\n");
    if (end == std::string::npos) return "";
    return str.substr(0, end + 1);
}

/**
 * @brief Split text into lines, dropping the line terminators
 * @param text Input text ("\n" or "\r\n" separated)
 * @return Lines in order, empty lines included
 */
inline std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

/**
 * @brief Remove one pair of matching single or double quotes
 */
inline std::string unquote(const std::string& str) {
    if (str.size() >= 2) {
        char first = str.front();
        if ((first == '"' || first == '\'') && str.back() == first) {
            return str.substr(1, str.size() - 2);
        }
    }
    return str;
}

/**
 * @brief First line of a documentation string, trimmed
 */
inline std::string first_line(const std::string& doc) {
    std::istringstream stream(trim(doc));
    std::string line;
    std::getline(stream, line);
    return trim(line);
}

/**
 * @brief Normalize an identifier into a command name
 *
 * "MyCommand" -> "my_command", "new-command" -> "new_command".
 */
inline std::string to_command_name(const std::string& identifier) {
    std::string result;
    result.reserve(identifier.size() + 4);
    for (size_t i = 0; i < identifier.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(identifier[i]);
        if (c == '-') {
            result += '_';
        } else if (std::isupper(c)) {
            if (i > 0 && result.back() != '_') {
                result += '_';
            }
            result += static_cast<char>(std::tolower(c));
        } else {
            result += static_cast<char>(c);
        }
    }
    return result;
}

/**
 * @brief Check if string starts with prefix
 */
inline bool starts_with(const std::string& str, const std::string& prefix) {
    if (prefix.size() > str.size()) return false;
    return str.compare(0, prefix.size(), prefix) == 0;
}

/**
 * @brief Join strings with delimiter
 */
inline std::string join(const std::vector<std::string>& parts, const std::string& delimiter = " ") {
    if (parts.empty()) return "";
    std::string result = parts[0];
    for (size_t i = 1; i < parts.size(); ++i) {
        result += delimiter + parts[i];
    }
    return result;
}

} // namespace cmdkit::utils
