/**
 * @file string_utils.hpp
 * @brief String helpers used while decoding log lines
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <optional>
#include <cstdint>

namespace logprof {
namespace utils {

/**
 * @class StringUtils
 * @brief Static string helpers for log processing
 *
 * All methods are static - no instantiation required.
 *
 * **Usage Example**:
 * @code
 * std::string line = StringUtils::Trim(raw_line);
 * auto tid = StringUtils::ParseInt64(" 1234");
 * @endcode
 */
class StringUtils {
public:
    /**
     * @brief Trim whitespace from both ends of string
     * @param str Input string
     * @return Trimmed string
     */
    static std::string Trim(const std::string& str);

    /**
     * @brief Check if string contains substring
     * @param str String to search
     * @param substring Substring to find
     * @return true if found
     */
    static bool Contains(const std::string& str, const std::string& substring);

    /**
     * @brief Parse a signed decimal integer
     *
     * Surrounding whitespace is accepted; any other trailing character
     * makes the parse fail.
     *
     * @param str Text to parse
     * @return Parsed value, or std::nullopt if not a valid integer
     */
    static std::optional<std::int64_t> ParseInt64(const std::string& str);

    /**
     * @brief Shorten a string to a maximum length, appending an ellipsis
     * @param str Input string
     * @param max_length Maximum length of the result
     * @return Original string or truncated copy ending in "..."
     */
    static std::string Truncate(const std::string& str, std::size_t max_length);
};

} // namespace utils
} // namespace logprof
