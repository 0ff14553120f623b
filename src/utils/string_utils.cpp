/**
 * @file string_utils.cpp
 * @brief Implementation of string helpers used while decoding log lines
 *
 * @date 2025
 */

#include "logprof/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace logprof {
namespace utils {

// ============================================================================
// STRING MANIPULATION UTILITIES
// ============================================================================

std::string StringUtils::Trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

bool StringUtils::Contains(const std::string& str, const std::string& substring) {
    return str.find(substring) != std::string::npos;
}

std::string StringUtils::Truncate(const std::string& str, std::size_t max_length) {
    if (str.length() <= max_length) {
        return str;
    }
    if (max_length <= 3) {
        return str.substr(0, max_length);
    }
    return str.substr(0, max_length - 3) + "...";
}

// ============================================================================
// NUMERIC PARSING
// ============================================================================

std::optional<std::int64_t> StringUtils::ParseInt64(const std::string& str) {
    std::string trimmed = Trim(str);
    if (trimmed.empty()) {
        return std::nullopt;
    }

    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(trimmed.c_str(), &end, 10);

    if (errno == ERANGE || end != trimmed.c_str() + trimmed.size()) {
        return std::nullopt;
    }

    return static_cast<std::int64_t>(value);
}

} // namespace utils
} // namespace logprof
