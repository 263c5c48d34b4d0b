/**
 * @file string_utils.cpp
 * @brief Implementation of string manipulation helpers
 *
 * @date 2025
 */

#include "cerberus/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace cerberus {
namespace utils {

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
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::vector<std::string> StringUtils::Split(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : str) {
        if (c == delimiter) {
            parts.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    parts.push_back(current);
    return parts;
}

std::vector<std::string> StringUtils::SplitLines(const std::string& str) {
    std::vector<std::string> lines;
    std::istringstream iss(str);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!Trim(line).empty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

std::string StringUtils::Join(const std::vector<std::string>& strings, const std::string& delimiter) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < strings.size(); ++i) {
        if (i > 0) {
            oss << delimiter;
        }
        oss << strings[i];
    }
    return oss.str();
}

bool StringUtils::StartsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::EndsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool StringUtils::Contains(const std::string& str, const std::string& substring) {
    return str.find(substring) != std::string::npos;
}

bool StringUtils::ContainsIgnoreCase(const std::string& str, const std::string& substring) {
    return Contains(ToLower(str), ToLower(substring));
}

std::string StringUtils::TailLines(const std::string& text, int max_lines) {
    if (max_lines <= 0) {
        return "";
    }

    std::size_t pos = text.size();
    // A trailing newline does not start a new line
    if (pos > 0 && text[pos - 1] == '\n') {
        --pos;
    }

    int seen = 0;
    while (pos > 0) {
        std::size_t nl = text.rfind('\n', pos - 1);
        if (nl == std::string::npos) {
            return text;
        }
        if (++seen == max_lines) {
            return text.substr(nl + 1);
        }
        pos = nl;
    }
    return text;
}

} // namespace utils
} // namespace cerberus
