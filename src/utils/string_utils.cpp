/**
 * @file string_utils.cpp
 * @brief Implementation of string manipulation helpers
 *
 * @date 2025
 */

#include "cloister/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace cloister {
namespace utils {

// ============================================================================
// TRANSFORMATION
// ============================================================================

std::string StringUtils::Trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

std::string StringUtils::ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

// ============================================================================
// SPLITTING AND JOINING
// ============================================================================

std::vector<std::string> StringUtils::SplitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            lines.push_back(line);
        }
    }

    return lines;
}

std::string StringUtils::Join(const std::vector<std::string>& strings,
                              const std::string& delimiter) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < strings.size(); ++i) {
        if (i > 0) {
            oss << delimiter;
        }
        oss << strings[i];
    }
    return oss.str();
}

// ============================================================================
// MATCHING
// ============================================================================

bool StringUtils::StartsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::Contains(const std::string& str, const std::string& substring) {
    return str.find(substring) != std::string::npos;
}

std::string StringUtils::Truncate(const std::string& str, std::size_t max_length,
                                  const std::string& ellipsis) {
    if (str.length() <= max_length) {
        return str;
    }
    if (max_length <= ellipsis.length()) {
        return str.substr(0, max_length);
    }
    return str.substr(0, max_length - ellipsis.length()) + ellipsis;
}

} // namespace utils
} // namespace cloister
