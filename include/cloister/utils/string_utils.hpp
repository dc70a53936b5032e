/**
 * @file string_utils.hpp
 * @brief String manipulation helpers shared by the runtime client and engine
 *
 * Small, allocation-friendly helpers for trimming runtime output, splitting
 * listings into lines and matching prefixes/suffixes on paths and URLs.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>

namespace cloister {
namespace utils {

/**
 * @class StringUtils
 * @brief Stateless string helpers
 */
class StringUtils {
public:
    /***************************************************************************
     * Transformation
     ***************************************************************************/

    /**
     * @brief Remove leading and trailing whitespace
     * @param str Input string
     * @return Trimmed copy
     */
    static std::string Trim(const std::string& str);

    /**
     * @brief Convert to lowercase (ASCII only)
     * @param str Input string
     * @return Lowercased copy
     */
    static std::string ToLower(const std::string& str);

    /***************************************************************************
     * Splitting and Joining
     ***************************************************************************/

    /**
     * @brief Split text into lines
     *
     * Handles both LF and CRLF line endings. Empty lines are dropped.
     *
     * @param text Multi-line text
     * @return Lines without terminators
     */
    static std::vector<std::string> SplitLines(const std::string& text);

    /**
     * @brief Join strings with delimiter
     * @param strings Parts to join
     * @param delimiter Separator placed between parts
     * @return Joined string
     */
    static std::string Join(const std::vector<std::string>& strings, const std::string& delimiter);

    /***************************************************************************
     * Matching
     ***************************************************************************/

    static bool StartsWith(const std::string& str, const std::string& prefix);
    static bool Contains(const std::string& str, const std::string& substring);

    /**
     * @brief Truncate string to maximum length
     * @param str Input string
     * @param max_length Maximum length including the ellipsis
     * @param ellipsis Marker appended when truncated
     * @return Possibly truncated copy
     */
    static std::string Truncate(const std::string& str, std::size_t max_length,
                                const std::string& ellipsis = "...");
};

} // namespace utils
} // namespace cloister
