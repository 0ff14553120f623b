#include "logprof/core/log_profiler.hpp"
#include "logprof/reporters/chrome_trace_reporter.hpp"
#include "logprof/reporters/text_reporter.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <streambuf>
#include <string>
#include <utility>

using json = nlohmann::json;
using logprof::core::LogProfiler;
using logprof::core::ProfilerConfig;

namespace {

ProfilerConfig MakeConfig() {
  json document = {
      {"log_header_pattern",
       R"(^(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}\.\d{3})\s+(\d+)\s+(\d+)\s+([VDIWEF])\s+([^:]+?)\s*:\s(.*)$)"},
      {"time_format", "%Y-%m-%d %H:%M:%S.%f"},
      {"events", json::array({
           {{"name", "Activity"}, {"start_regex", "onCreate begin"}, {"end_regex", "onCreate end"},
            {"threshold_ms", 5}},
           {{"name", "Inflate"}, {"start_regex", "inflate begin"}, {"end_regex", "inflate end"}},
       })},
  };
  return ProfilerConfig::LoadFromJson(document);
}

const char* kLog =
    "--------- beginning of main\n"
    "2025-01-15 10:00:00.000  100  101 D Main: onCreate begin\n"
    "2025-01-15 10:00:00.001  100  101 D Main: inflate begin\n"
    "2025-01-15 10:00:00.002  100  202 D Worker: inflate begin\n"
    "2025-01-15 10:00:00.003  100  101 I Main: unrelated message\n"
    "2025-01-15 10:00:00.004  100  202 D Worker: onCreate end\n"
    "2025-01-15 10:00:00.005  100  101 D Main: inflate end\n"
    "2025-13-99 10:00:00.006  100  101 D Main: onCreate end\n"
    "2025-01-15 10:00:00.010  100  101 D Main: onCreate end\n"
    "   \n";

// Serves its data, then fails every further read like a broken device
class FailingStreamBuf : public std::streambuf {
public:
  explicit FailingStreamBuf(std::string data) : data_(std::move(data)) {
    setg(&data_[0], &data_[0], &data_[0] + data_.size());
  }

protected:
  int_type underflow() override { throw std::runtime_error("device read failed"); }

private:
  std::string data_;
};

} // namespace

TEST(LogProfilerTest, ReadErrorAfterLinesIsPartial) {
  FailingStreamBuf buffer(
      "--------- beginning of main\n"
      "2025-01-15 10:00:00.000  100  101 D Main: onCreate begin\n"
      "2025-01-15 10:00:00.001  100  101 D Main: inflate begin\n");
  std::istream input(&buffer);

  LogProfiler profiler(MakeConfig());
  auto status = profiler.ProcessStream(input, "device");

  EXPECT_TRUE(status.has_error);
  EXPECT_TRUE(status.is_partial);
  EXPECT_FALSE(status.is_complete);
  EXPECT_EQ(status.lines_read, 3u);
  EXPECT_EQ(status.signals, 2u);
  EXPECT_NE(status.error_message.find("device"), std::string::npos);

  // Everything read before the failure is still reconstructed
  profiler.Finalize();
  const auto& roots = profiler.Roots();
  ASSERT_EQ(roots.size(), 1u);
  EXPECT_EQ(roots[0]->Name(), "Activity");
  EXPECT_EQ(roots[0]->Thread(), 101);
  ASSERT_EQ(roots[0]->Children().size(), 1u);
  EXPECT_EQ(roots[0]->Children()[0]->Name(), "Inflate");
  EXPECT_EQ(profiler.Engine().Stats().forced_closures, 2u);
}

TEST(LogProfilerTest, ReadErrorBeforeFirstLineIsNotPartial) {
  FailingStreamBuf buffer("");
  std::istream input(&buffer);

  LogProfiler profiler(MakeConfig());
  auto status = profiler.ProcessStream(input, "device");

  EXPECT_TRUE(status.has_error);
  EXPECT_FALSE(status.is_partial);
  EXPECT_FALSE(status.is_complete);
  EXPECT_EQ(status.lines_read, 0u);

  profiler.Finalize();
  EXPECT_TRUE(profiler.Roots().empty());
}

TEST(LogProfilerTest, ReconstructsForestFromStream) {
  LogProfiler profiler(MakeConfig());
  std::istringstream input(kLog);

  auto status = profiler.ProcessStream(input, "memory");
  profiler.Finalize();

  EXPECT_TRUE(status.is_complete);
  EXPECT_FALSE(status.has_error);
  EXPECT_EQ(status.source, "memory");
  EXPECT_EQ(status.lines_read, 10u);
  EXPECT_EQ(status.lines_parsed, 7u);
  EXPECT_EQ(status.lines_skipped, 2u);
  EXPECT_EQ(status.lines_malformed, 1u);
  EXPECT_EQ(status.signals, 6u);

  const auto& roots = profiler.Roots();
  ASSERT_EQ(roots.size(), 2u);

  // Thread 101 closed normally
  EXPECT_EQ(roots[0]->Name(), "Activity");
  EXPECT_EQ(roots[0]->Thread(), 101);
  EXPECT_DOUBLE_EQ(roots[0]->DurationMs(), 10.0);
  EXPECT_DOUBLE_EQ(roots[0]->SelfTimeMs(), 6.0);
  ASSERT_EQ(roots[0]->Children().size(), 1u);
  EXPECT_EQ(roots[0]->Children()[0]->Name(), "Inflate");

  // Thread 202: mismatched end ignored, inflate force-closed
  EXPECT_EQ(roots[1]->Name(), "Inflate");
  EXPECT_EQ(roots[1]->Thread(), 202);
  EXPECT_DOUBLE_EQ(roots[1]->DurationMs(), 0.0);

  EXPECT_EQ(profiler.Engine().Stats().discarded_ends, 1u);
  EXPECT_EQ(profiler.Engine().Stats().forced_closures, 1u);
}

TEST(LogProfilerTest, ReportsUseConfiguredThresholds) {
  LogProfiler profiler(MakeConfig());
  std::istringstream input(kLog);
  profiler.ProcessStream(input);
  profiler.Finalize();

  logprof::reporters::TextReporter reporter(profiler.Classifier());
  auto entries = reporter.BuildEntries(profiler.Roots());
  ASSERT_EQ(entries.size(), 3u);
  EXPECT_EQ(entries[0].status, logprof::reporters::ThresholdStatus::WARN);
  EXPECT_EQ(entries[1].status, logprof::reporters::ThresholdStatus::OK);

  logprof::reporters::ChromeTraceReporter trace_reporter;
  auto events = trace_reporter.BuildEvents(profiler.Roots());
  ASSERT_EQ(events.size(), 6u);
  EXPECT_EQ(events[0].ts, 1736935200000000);
  EXPECT_EQ(events[3].ts, 1736935200010000);
}

class LogProfilerFileTest : public ::testing::Test {
protected:
  std::filesystem::path test_path =
      std::filesystem::temp_directory_path() / "logprof_test_input.log";

  void TearDown() override {
    if (std::filesystem::exists(test_path)) {
      std::filesystem::remove(test_path);
    }
  }
};

TEST_F(LogProfilerFileTest, ProcessesFile) {
  {
    std::ofstream file(test_path);
    file << kLog;
  }

  LogProfiler profiler(MakeConfig());
  auto status = profiler.ProcessFile(test_path);
  profiler.Finalize();

  EXPECT_TRUE(status.is_complete);
  EXPECT_FALSE(status.has_error);
  EXPECT_EQ(status.source, test_path.string());
  EXPECT_EQ(profiler.Roots().size(), 2u);
}

TEST_F(LogProfilerFileTest, MissingFileIsAnError) {
  LogProfiler profiler(MakeConfig());
  auto status = profiler.ProcessFile(test_path);

  EXPECT_TRUE(status.has_error);
  EXPECT_FALSE(status.is_complete);
  EXPECT_FALSE(status.is_partial);
  EXPECT_FALSE(status.error_message.empty());
  EXPECT_EQ(status.lines_read, 0u);
}

TEST(LogProfilerRecordTest, ProcessRecordBypassesLineParsing) {
  LogProfiler profiler(MakeConfig());

  logprof::parsers::LogRecord record;
  record.tid = 5;
  record.instant = logprof::Instant{};
  record.message = "onCreate begin";
  EXPECT_TRUE(profiler.ProcessRecord(record));

  record.message = "nothing here";
  EXPECT_FALSE(profiler.ProcessRecord(record));

  EXPECT_EQ(profiler.Engine().OpenDepth(5), 1u);
  profiler.Finalize();
  EXPECT_EQ(profiler.Roots().size(), 1u);
}
