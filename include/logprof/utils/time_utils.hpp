/**
 * @file time_utils.hpp
 * @brief Timestamp decoding and conversion helpers
 *
 * Decodes the textual timestamp of a log header into an Instant using a
 * strptime-style format, and converts instants and durations into the units
 * used by the reporters.
 *
 * @date 2025
 */

#pragma once

#include "logprof/core/types.hpp"

#include <string>
#include <optional>
#include <cstdint>

namespace logprof {
namespace utils {

/**
 * @class TimeUtils
 * @brief Static timestamp helpers
 *
 * Format strings follow std::get_time conversions with one addition:
 * `%f` reads 1-9 digits of fractional seconds (e.g. "10:00:00.123" with
 * "%H:%M:%S.%f"). Decoded times are interpreted as UTC.
 *
 * **Usage Example**:
 * @code
 * auto instant = TimeUtils::ParseTimestamp("2025-01-15 10:00:00.250",
 *                                          "%Y-%m-%d %H:%M:%S.%f");
 * if (instant) {
 *     auto us = TimeUtils::ToEpochMicroseconds(*instant);
 * }
 * @endcode
 */
class TimeUtils {
public:
    /**
     * @brief Decode timestamp text using a strptime-style format
     * @param text Timestamp text
     * @param format Format string (supports %f for fractional seconds)
     * @return Decoded instant, or std::nullopt if text does not fit format
     */
    static std::optional<Instant> ParseTimestamp(const std::string& text,
                                                 const std::string& format);

    /**
     * @brief Microseconds since the Unix epoch
     */
    static std::int64_t ToEpochMicroseconds(const Instant& instant);

    /**
     * @brief Convert a duration to fractional milliseconds
     */
    static double ToMilliseconds(const Duration& duration);

    /**
     * @brief Current calendar year in UTC
     */
    static int CurrentYear();
};

} // namespace utils
} // namespace logprof
