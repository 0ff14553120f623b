/**
 * @file time_utils.cpp
 * @brief Implementation of timestamp decoding and conversion helpers
 *
 * std::get_time has no conversion for fractional seconds, so the format is
 * split at each `%f`. Every segment is decoded with std::get_time into the
 * same std::tm, and the digits between segments are read as the fraction.
 *
 * **Example**:
 * ```
 * format: "%Y-%m-%d %H:%M:%S.%f"
 * text:   "2025-01-15 10:00:00.123"
 *          └──── get_time ────┘ └─ fraction (123 ms)
 * ```
 *
 * @date 2025
 */

#include "logprof/utils/time_utils.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>
#include <vector>

namespace logprof {
namespace utils {

namespace {

constexpr int kMaxFractionDigits = 9;

std::time_t ToUtcSeconds(std::tm* tm) {
#ifdef _WIN32
    return _mkgmtime(tm);
#else
    return timegm(tm);
#endif
}

bool ToUtcCalendar(std::time_t seconds, std::tm* out) {
#ifdef _WIN32
    return gmtime_s(out, &seconds) == 0;
#else
    return gmtime_r(&seconds, out) != nullptr;
#endif
}

std::vector<std::string> SplitOnFraction(const std::string& format) {
    std::vector<std::string> segments;
    std::size_t pos = 0;

    while (true) {
        std::size_t next = format.find("%f", pos);
        if (next == std::string::npos) {
            segments.push_back(format.substr(pos));
            break;
        }
        segments.push_back(format.substr(pos, next - pos));
        pos = next + 2;
    }

    return segments;
}

// Reads up to nine digits as nanoseconds; further digits are consumed and
// dropped. Returns false if no digit is present.
bool ReadFraction(std::istream& in, std::int64_t& nanos) {
    int digits = 0;
    std::int64_t value = 0;

    while (std::isdigit(in.peek())) {
        char c = static_cast<char>(in.get());
        if (digits < kMaxFractionDigits) {
            value = value * 10 + (c - '0');
        }
        digits++;
    }

    if (digits == 0) {
        return false;
    }

    for (int i = digits; i < kMaxFractionDigits; ++i) {
        value *= 10;
    }
    nanos += value;
    return true;
}

} // namespace

// ============================================================================
// TIMESTAMP DECODING
// ============================================================================

std::optional<Instant> TimeUtils::ParseTimestamp(const std::string& text,
                                                 const std::string& format) {
    if (text.empty() || format.empty()) {
        return std::nullopt;
    }

    std::tm tm{};
    tm.tm_mday = 1;
    std::int64_t nanos = 0;

    std::istringstream in(text);
    in.imbue(std::locale::classic());

    auto segments = SplitOnFraction(format);
    for (std::size_t i = 0; i < segments.size(); ++i) {
        if (!segments[i].empty()) {
            in >> std::get_time(&tm, segments[i].c_str());
            if (in.fail()) {
                return std::nullopt;
            }
        }
        if (i + 1 < segments.size() && !ReadFraction(in, nanos)) {
            return std::nullopt;
        }
    }

    // Unconverted trailing text makes the timestamp invalid
    in >> std::ws;
    if (in.peek() != std::char_traits<char>::eof()) {
        return std::nullopt;
    }

    std::tm decoded = tm;
    std::time_t seconds = ToUtcSeconds(&tm);

    // Day-of-month is only range-checked to 1-31; normalization would roll
    // e.g. Feb 30 into March
    std::tm normalized{};
    if (!ToUtcCalendar(seconds, &normalized) ||
        normalized.tm_year != decoded.tm_year ||
        normalized.tm_mon != decoded.tm_mon ||
        normalized.tm_mday != decoded.tm_mday) {
        return std::nullopt;
    }

    return std::chrono::system_clock::from_time_t(seconds) +
           std::chrono::duration_cast<Duration>(std::chrono::nanoseconds(nanos));
}

// ============================================================================
// CONVERSIONS
// ============================================================================

std::int64_t TimeUtils::ToEpochMicroseconds(const Instant& instant) {
    return std::chrono::duration_cast<std::chrono::microseconds>(
        instant.time_since_epoch()).count();
}

double TimeUtils::ToMilliseconds(const Duration& duration) {
    return std::chrono::duration<double, std::milli>(duration).count();
}

int TimeUtils::CurrentYear() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
    if (!ToUtcCalendar(now, &utc)) {
        return 1970;
    }
    return utc.tm_year + 1900;
}

} // namespace utils
} // namespace logprof
