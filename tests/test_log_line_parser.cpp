#include "logprof/parsers/log_line_parser.hpp"
#include "logprof/utils/string_utils.hpp"
#include "logprof/utils/time_utils.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <string>

using logprof::Instant;
using logprof::parsers::HeaderLayout;
using logprof::parsers::LineStatus;
using logprof::parsers::LogLineParser;
using logprof::utils::StringUtils;
using logprof::utils::TimeUtils;

namespace {

// 2025-01-15T10:00:00Z
constexpr std::int64_t kJan15Seconds = 1736935200;

const char* kUidPattern =
    R"(^(\d{2}-\d{2} \d{2}:\d{2}:\d{2}\.\d{3})\s+(\S+)\s+(\d+)\s+(\S+)\s+([VDIWEF])\s+([^:]+?)\s*:\s(.*)$)";

} // namespace

TEST(TimeUtilsTest, ParsesFullDateWithFraction) {
  auto instant = TimeUtils::ParseTimestamp("2025-01-15 10:00:00.250", "%Y-%m-%d %H:%M:%S.%f");
  ASSERT_TRUE(instant.has_value());
  EXPECT_EQ(TimeUtils::ToEpochMicroseconds(*instant), kJan15Seconds * 1000000 + 250000);
}

TEST(TimeUtilsTest, FractionDigitsAreScaled) {
  auto micro = TimeUtils::ParseTimestamp("2025-01-15 10:00:00.000007", "%Y-%m-%d %H:%M:%S.%f");
  ASSERT_TRUE(micro.has_value());
  EXPECT_EQ(TimeUtils::ToEpochMicroseconds(*micro), kJan15Seconds * 1000000 + 7);
}

TEST(TimeUtilsTest, RejectsMismatchedText) {
  EXPECT_FALSE(TimeUtils::ParseTimestamp("not a time", "%Y-%m-%d %H:%M:%S").has_value());
  EXPECT_FALSE(TimeUtils::ParseTimestamp("2025-01-15 10:00:00", "%Y-%m-%d %H:%M:%S.%f").has_value());
  EXPECT_FALSE(TimeUtils::ParseTimestamp("2025-01-15 10:00:00 extra", "%Y-%m-%d %H:%M:%S").has_value());
  EXPECT_FALSE(TimeUtils::ParseTimestamp("", "%Y").has_value());
}

TEST(TimeUtilsTest, RejectsImpossibleCalendarDates) {
  const char* format = "%Y-%m-%d %H:%M:%S.%f";
  EXPECT_FALSE(TimeUtils::ParseTimestamp("2025-02-30 10:00:00.000", format).has_value());
  EXPECT_FALSE(TimeUtils::ParseTimestamp("2025-04-31 10:00:00.000", format).has_value());
  EXPECT_FALSE(TimeUtils::ParseTimestamp("2025-02-29 10:00:00.000", format).has_value());
  EXPECT_FALSE(TimeUtils::ParseTimestamp("2100-02-29 10:00:00.000", format).has_value());
}

TEST(TimeUtilsTest, AcceptsLeapDayAndMonthEnds) {
  const char* format = "%Y-%m-%d %H:%M:%S.%f";

  auto leap_day = TimeUtils::ParseTimestamp("2024-02-29 10:00:00.000", format);
  ASSERT_TRUE(leap_day.has_value());
  // 2024-02-29T10:00:00Z
  EXPECT_EQ(TimeUtils::ToEpochMicroseconds(*leap_day), std::int64_t{1709200800} * 1000000);

  EXPECT_TRUE(TimeUtils::ParseTimestamp("2000-02-29 00:00:00.000", format).has_value());
  EXPECT_TRUE(TimeUtils::ParseTimestamp("2025-01-31 23:59:59.999", format).has_value());
  EXPECT_TRUE(TimeUtils::ParseTimestamp("2025-12-31 23:59:59.999", format).has_value());
}

TEST(TimeUtilsTest, MillisecondConversion) {
  EXPECT_DOUBLE_EQ(TimeUtils::ToMilliseconds(std::chrono::microseconds(2500)), 2.5);
}

TEST(StringUtilsTest, TrimAndParse) {
  EXPECT_EQ(StringUtils::Trim("  line \r\n"), "line");
  EXPECT_EQ(StringUtils::Trim(" \t "), "");
  EXPECT_EQ(StringUtils::ParseInt64(" 1234 "), std::optional<std::int64_t>(1234));
  EXPECT_EQ(StringUtils::ParseInt64("-5"), std::optional<std::int64_t>(-5));
  EXPECT_FALSE(StringUtils::ParseInt64("12ab").has_value());
  EXPECT_FALSE(StringUtils::ParseInt64("").has_value());
  EXPECT_EQ(StringUtils::Truncate("abcdefgh", 6), "abc...");
  EXPECT_EQ(StringUtils::Truncate("abc", 6), "abc");
}

TEST(HeaderLayoutTest, InferredFromGroupCount) {
  auto with_uid = HeaderLayout::ForGroupCount(7);
  ASSERT_TRUE(with_uid.has_value());
  EXPECT_EQ(with_uid->uid, std::optional<std::size_t>(2));
  EXPECT_EQ(with_uid->tid, 4u);
  EXPECT_EQ(with_uid->message, 7u);

  auto threadtime = HeaderLayout::ForGroupCount(6);
  ASSERT_TRUE(threadtime.has_value());
  EXPECT_FALSE(threadtime->uid.has_value());
  EXPECT_EQ(threadtime->tid, 3u);
  EXPECT_EQ(threadtime->MaxIndex(), 6u);

  EXPECT_FALSE(HeaderLayout::ForGroupCount(3).has_value());
}

class LogLineParserTest : public ::testing::Test {
protected:
  LogLineParser parser{std::regex(kUidPattern), *HeaderLayout::ForGroupCount(7),
                       "%m-%d %H:%M:%S.%f", true};
};

TEST_F(LogLineParserTest, DecodesLogcatLineWithUid) {
  auto result = parser.Parse("01-15 10:00:00.123  u0_a12  1234  1250 D MyTag: onCreate begin  ");

  ASSERT_EQ(result.status, LineStatus::PARSED);
  ASSERT_TRUE(result.record.has_value());
  const auto& record = *result.record;
  EXPECT_EQ(record.uid, "u0_a12");
  EXPECT_EQ(record.pid, std::optional<std::int64_t>(1234));
  EXPECT_EQ(record.tid, 1250);
  EXPECT_EQ(record.level, "D");
  EXPECT_EQ(record.tag, "MyTag");
  EXPECT_EQ(record.message, "onCreate begin");
  EXPECT_EQ(record.time_text, "01-15 10:00:00.123");

  auto expected = TimeUtils::ParseTimestamp(
      std::to_string(TimeUtils::CurrentYear()) + "-01-15 10:00:00.123", "%Y-%m-%d %H:%M:%S.%f");
  ASSERT_TRUE(expected.has_value());
  EXPECT_EQ(record.instant, *expected);
}

TEST_F(LogLineParserTest, PrefixesCurrentYearToFormat) {
  EXPECT_EQ(parser.EffectiveTimeFormat(), "%Y-%m-%d %H:%M:%S.%f");
}

TEST_F(LogLineParserTest, LinesWithoutHeaderAreSkipped) {
  EXPECT_EQ(parser.Parse("--------- beginning of main").status, LineStatus::NO_MATCH);
  EXPECT_EQ(parser.Parse("").status, LineStatus::NO_MATCH);
}

TEST_F(LogLineParserTest, InvalidThreadIdIsMalformed) {
  auto result = parser.Parse("01-15 10:00:00.123  u0_a12  1234  main D MyTag: hello");
  EXPECT_EQ(result.status, LineStatus::MALFORMED);
  EXPECT_FALSE(result.record.has_value());
  EXPECT_FALSE(result.reason.empty());
}

TEST_F(LogLineParserTest, InvalidTimestampIsMalformed) {
  auto result = parser.Parse("13-45 10:00:00.123  u0_a12  1234  1250 D MyTag: hello");
  EXPECT_EQ(result.status, LineStatus::MALFORMED);
}

TEST_F(LogLineParserTest, DayPastMonthEndIsMalformed) {
  auto result = parser.Parse("04-31 10:00:00.123  u0_a12  1234  1250 D MyTag: hello");
  EXPECT_EQ(result.status, LineStatus::MALFORMED);
  EXPECT_FALSE(result.record.has_value());
}

TEST(LogLineParserYearTest, FormatWithYearIsUsedAsIs) {
  HeaderLayout layout;
  layout.time = 1;
  layout.tid = 2;
  layout.message = 3;
  LogLineParser parser(std::regex(R"((\S+ \S+) \[(\d+)\] (.*))"), layout,
                       "%Y-%m-%d %H:%M:%S.%f", true);

  EXPECT_EQ(parser.EffectiveTimeFormat(), "%Y-%m-%d %H:%M:%S.%f");

  auto result = parser.Parse("2025-01-15 10:00:00.500 [7] work begin");
  ASSERT_EQ(result.status, LineStatus::PARSED);
  EXPECT_EQ(result.record->tid, 7);
  EXPECT_EQ(result.record->message, "work begin");
  EXPECT_EQ(TimeUtils::ToEpochMicroseconds(result.record->instant),
            kJan15Seconds * 1000000 + 500000);
}
