/**
 * @file log_line_parser.cpp
 * @brief Implementation of log header decomposition and timestamp decoding
 *
 * **Android logcat (threadtime with UID)**:
 * ```
 * 01-15 10:00:00.123  u0_a12  1234  1250 D MyTag: onCreate begin
 * └─ time ─────────┘  └uid─┘  └pid  └tid └lvl└tag  └─ message ──┘
 * ```
 *
 * @date 2025
 */

#include "logprof/parsers/log_line_parser.hpp"
#include "logprof/utils/string_utils.hpp"
#include "logprof/utils/time_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace logprof {
namespace parsers {

// ============================================================================
// HEADER LAYOUT
// ============================================================================

std::optional<HeaderLayout> HeaderLayout::ForGroupCount(std::size_t group_count) {
    HeaderLayout layout;

    switch (group_count) {
        case 7:
            layout.time = 1;
            layout.uid = 2;
            layout.pid = 3;
            layout.tid = 4;
            layout.level = 5;
            layout.tag = 6;
            layout.message = 7;
            return layout;
        case 6:
            layout.time = 1;
            layout.pid = 2;
            layout.tid = 3;
            layout.level = 4;
            layout.tag = 5;
            layout.message = 6;
            return layout;
        default:
            return std::nullopt;
    }
}

std::size_t HeaderLayout::MaxIndex() const {
    std::size_t max_index = std::max({time, tid, message});
    for (const auto& optional_index : {uid, pid, level, tag}) {
        if (optional_index) {
            max_index = std::max(max_index, *optional_index);
        }
    }
    return max_index;
}

// ============================================================================
// LINE PARSING
// ============================================================================

LogLineParser::LogLineParser(std::regex header_pattern, HeaderLayout layout,
                             std::string time_format, bool assume_current_year)
    : header_pattern_(std::move(header_pattern))
    , layout_(layout)
    , time_format_(std::move(time_format)) {

    bool has_year = utils::StringUtils::Contains(time_format_, "%Y") ||
                    utils::StringUtils::Contains(time_format_, "%y");

    if (assume_current_year && !has_year) {
        year_prefix_ = std::to_string(utils::TimeUtils::CurrentYear()) + "-";
        effective_format_ = "%Y-" + time_format_;
    } else {
        effective_format_ = time_format_;
    }

    spdlog::debug("Log line parser initialized (time format: '{}')", effective_format_);
}

LineParseResult LogLineParser::Parse(const std::string& line) const {
    LineParseResult result;
    std::string trimmed = utils::StringUtils::Trim(line);

    std::smatch match;
    if (!std::regex_search(trimmed, match, header_pattern_,
                           std::regex_constants::match_continuous)) {
        result.status = LineStatus::NO_MATCH;
        return result;
    }

    auto group = [&match](std::size_t index) -> std::string {
        return index < match.size() ? match[index].str() : std::string();
    };

    LogRecord record;
    record.time_text = group(layout_.time);
    record.message = group(layout_.message);
    if (layout_.uid) record.uid = group(*layout_.uid);
    if (layout_.level) record.level = group(*layout_.level);
    if (layout_.tag) record.tag = group(*layout_.tag);
    if (layout_.pid) record.pid = utils::StringUtils::ParseInt64(group(*layout_.pid));

    auto tid = utils::StringUtils::ParseInt64(group(layout_.tid));
    if (!tid) {
        result.status = LineStatus::MALFORMED;
        result.reason = "invalid thread id '" + group(layout_.tid) + "'";
        return result;
    }
    record.tid = *tid;

    auto instant = utils::TimeUtils::ParseTimestamp(year_prefix_ + record.time_text,
                                                    effective_format_);
    if (!instant) {
        result.status = LineStatus::MALFORMED;
        result.reason = "timestamp '" + record.time_text + "' does not match format '" +
                        time_format_ + "'";
        return result;
    }
    record.instant = *instant;

    result.status = LineStatus::PARSED;
    result.record = std::move(record);
    return result;
}

} // namespace parsers
} // namespace logprof
