#pragma once

#include "core/constants.h"
#include <string>
#include <algorithm>
#include <cctype>

namespace polyglot {

/**
 * @brief String utility functions
 */
namespace utils {

/**
 * @brief Trim whitespace from both ends of a string (returns copy)
 */
inline std::string trim_copy(const std::string& str) {
    std::string result = str;
    result.erase(0, result.find_first_not_of(" \t\n\r"));
    result.erase(result.find_last_not_of(" \t\n\r") + 1);
    return result;
}

/**
 * @brief Lowercase copy of a string
 */
inline std::string normalize_copy(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

/**
 * @brief Check if string is empty or contains only whitespace
 */
inline bool is_empty_or_whitespace(const std::string& str) {
    return str.find_first_not_of(" \t\n\r") == std::string::npos;
}

/**
 * @brief Collapse runs of internal whitespace into single spaces and trim the ends
 *
 * Recognizers emit interim hypotheses with irregular spacing; segments are
 * compared and logged in this normalized form.
 */
inline std::string collapse_whitespace(const std::string& str) {
    std::string out;
    out.reserve(str.size());
    bool in_space = false;
    for (char c : str) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            in_space = true;
            continue;
        }
        if (in_space && !out.empty()) {
            out += ' ';
        }
        in_space = false;
        out += c;
    }
    return out;
}

/**
 * @brief Shorten text for log lines ("abc..." when longer than max_chars)
 */
inline std::string snippet(const std::string& text, size_t max_chars = constants::logging::TEXT_SNIPPET_CHARS) {
    if (text.size() <= max_chars) return text;
    if (max_chars <= 3) return text.substr(0, max_chars);
    return text.substr(0, max_chars - 3) + "...";
}

} // namespace utils

} // namespace polyglot
