/**
 * @file log_line_parser.hpp
 * @brief Decomposition of raw log lines into timestamped records
 *
 * Splits each line with the configured header regex, decodes the timestamp
 * and thread identifier, and hands the message to the EventClassifier.
 * Lines that do not carry a header are skipped, not treated as errors.
 *
 * @date 2025
 */

#pragma once

#include "logprof/core/types.hpp"

#include <string>
#include <regex>
#include <optional>
#include <cstddef>
#include <cstdint>

namespace logprof {
namespace parsers {

/**
 * @struct HeaderLayout
 * @brief Capture-group indices of the header fields
 *
 * Indices refer to std::smatch groups (1-based). Optional fields may be
 * absent from the pattern.
 */
struct HeaderLayout {
    std::size_t time{1};                 ///< Timestamp text
    std::optional<std::size_t> uid;      ///< User id (ignored by the core)
    std::optional<std::size_t> pid;      ///< Process id
    std::size_t tid{2};                  ///< Thread id
    std::optional<std::size_t> level;    ///< Log level
    std::optional<std::size_t> tag;      ///< Log tag
    std::size_t message{3};              ///< Free-text message

    /**
     * @brief Default layout for a pattern with the given group count
     *
     * - 7 groups: time, uid, pid, tid, level, tag, message (logcat with UID)
     * - 6 groups: time, pid, tid, level, tag, message (logcat threadtime)
     *
     * @param group_count Number of capture groups in the header pattern
     * @return Layout, or std::nullopt for any other group count
     */
    static std::optional<HeaderLayout> ForGroupCount(std::size_t group_count);

    /**
     * @brief Highest group index referenced by the layout
     */
    std::size_t MaxIndex() const;
};

/**
 * @struct LogRecord
 * @brief Decoded header fields and message of one log line
 */
struct LogRecord {
    Instant instant;                  ///< Decoded timestamp
    std::string time_text;            ///< Timestamp as written in the log
    std::string uid;                  ///< User id (may be empty)
    std::optional<std::int64_t> pid;  ///< Process id
    ThreadId tid{0};                  ///< Thread id
    std::string level;                ///< Log level
    std::string tag;                  ///< Log tag
    std::string message;              ///< Message text
};

/**
 * @enum LineStatus
 * @brief Outcome of parsing one line
 */
enum class LineStatus {
    PARSED,      ///< Header matched and all fields decoded
    NO_MATCH,    ///< Header pattern did not match (line ignored)
    MALFORMED    ///< Header matched but timestamp or thread id is invalid
};

/**
 * @struct LineParseResult
 * @brief Result of LogLineParser::Parse
 */
struct LineParseResult {
    LineStatus status{LineStatus::NO_MATCH};
    std::optional<LogRecord> record;   ///< Set when status is PARSED
    std::string reason;                ///< Set when status is MALFORMED
};

/**
 * @class LogLineParser
 * @brief Header decomposition and timestamp decoding for log lines
 *
 * The header pattern is anchored at the beginning of the line but need not
 * consume all of it. When the time format has no year conversion and
 * `assume_current_year` is set, the current year is prefixed to the
 * timestamp text before decoding (logcat timestamps omit the year).
 *
 * **Usage Example**:
 * @code
 * LogLineParser parser(std::regex(R"(^(\S+ \S+)\s+(\d+)\s+(\d+)\s+(\w)\s+(\S+):\s(.*)$)"),
 *                      *HeaderLayout::ForGroupCount(6), "%m-%d %H:%M:%S.%f", true);
 * auto result = parser.Parse("01-15 10:00:00.000  100  101 D Tag: onCreate begin");
 * @endcode
 */
class LogLineParser {
public:
    LogLineParser(std::regex header_pattern, HeaderLayout layout,
                  std::string time_format, bool assume_current_year);

    /**
     * @brief Decompose and decode one line
     * @param line Raw line (surrounding whitespace is ignored)
     * @return Parse status with the decoded record
     */
    LineParseResult Parse(const std::string& line) const;

    /**
     * @brief Format actually used for decoding (after year prefixing)
     */
    const std::string& EffectiveTimeFormat() const { return effective_format_; }

private:
    std::regex header_pattern_;
    HeaderLayout layout_;
    std::string time_format_;
    std::string effective_format_;
    std::string year_prefix_;
};

} // namespace parsers
} // namespace logprof
