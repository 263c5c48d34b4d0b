/**
 * @file string_utils.hpp
 * @brief String manipulation helpers shared by providers and the CLI
 *
 * Used mostly to pick apart the text output of docker, terraform and the
 * jailer, and to build shell-safe command arguments.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>

namespace cerberus {
namespace utils {

/**
 * @class StringUtils
 * @brief Static string helpers
 */
class StringUtils {
public:
    /// Strip leading and trailing whitespace
    static std::string Trim(const std::string& str);

    static std::string ToLower(const std::string& str);

    /**
     * @brief Split string by delimiter
     *
     * Empty fields are kept, so `Split("a,,b", ',')` yields three parts.
     */
    static std::vector<std::string> Split(const std::string& str, char delimiter);

    /// Split by newlines, dropping blank lines
    static std::vector<std::string> SplitLines(const std::string& str);

    static std::string Join(const std::vector<std::string>& strings, const std::string& delimiter);

    static bool StartsWith(const std::string& str, const std::string& prefix);
    static bool EndsWith(const std::string& str, const std::string& suffix);
    static bool Contains(const std::string& str, const std::string& substring);

    /// Case-insensitive substring search
    static bool ContainsIgnoreCase(const std::string& str, const std::string& substring);

    /**
     * @brief Keep at most the last @p max_lines lines of @p text
     */
    static std::string TailLines(const std::string& text, int max_lines);
};

} // namespace utils
} // namespace cerberus
