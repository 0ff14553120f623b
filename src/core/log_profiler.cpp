/**
 * @file log_profiler.cpp
 * @brief Implementation of the log-to-forest pipeline
 *
 * **Pipeline**:
 * ```
 * line ─▶ LogLineParser ─▶ EventClassifier ─▶ StackEngine ─▶ Forest
 *          (header, time)   (start / end)      (per-thread stacks)
 * ```
 *
 * Lines are processed strictly in input order; the engine relies on it.
 *
 * @date 2025
 */

#include "logprof/core/log_profiler.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <utility>

namespace logprof {
namespace core {

LogProfiler::LogProfiler(ProfilerConfig config)
    : config_(std::move(config))
    , line_parser_(config_.header_pattern, config_.header_layout,
                   config_.time_format, config_.assume_current_year)
    , classifier_(config_.events) {
    spdlog::debug("Log profiler initialized ({} events)", classifier_.Definitions().size());
}

// ============================================================================
// INPUT PROCESSING
// ============================================================================

ProcessStatus LogProfiler::ProcessFile(const std::filesystem::path& log_path) {
    ProcessStatus status;
    status.source = log_path.string();

    if (!std::filesystem::exists(log_path)) {
        status.has_error = true;
        status.error_message = "Log file not found: " + log_path.string();
        spdlog::error("{}", status.error_message);
        return status;
    }

    std::ifstream file(log_path);
    if (!file.is_open()) {
        status.has_error = true;
        status.error_message = "Failed to open log file: " + log_path.string();
        spdlog::error("{}", status.error_message);
        return status;
    }

    spdlog::info("Analyzing: {}", log_path.string());
    return ProcessStream(file, log_path.string());
}

ProcessStatus LogProfiler::ProcessStream(std::istream& input, const std::string& source_label) {
    ProcessStatus status;
    status.source = source_label;

    std::string line;
    while (std::getline(input, line)) {
        status.lines_read++;
        ProcessLine(line, status);
    }

    if (input.bad()) {
        status.has_error = true;
        status.is_partial = status.lines_read > 0;
        status.error_message = "Read error in " + source_label + " after " +
                               std::to_string(status.lines_read) + " lines";
        spdlog::warn("{}", status.error_message);
    } else {
        status.is_complete = true;
    }

    spdlog::info("Processed {} lines from {} ({} parsed, {} signals, {} skipped, {} malformed)",
                 status.lines_read, source_label, status.lines_parsed, status.signals,
                 status.lines_skipped, status.lines_malformed);
    if (status.lines_malformed > 0) {
        spdlog::warn("{} line(s) in {} matched the header but had an invalid timestamp or thread id",
                     status.lines_malformed, source_label);
    }

    return status;
}

void LogProfiler::ProcessLine(const std::string& line, ProcessStatus& status) {
    auto result = line_parser_.Parse(line);

    switch (result.status) {
        case parsers::LineStatus::NO_MATCH:
            status.lines_skipped++;
            return;
        case parsers::LineStatus::MALFORMED:
            status.lines_malformed++;
            spdlog::debug("Skipping malformed line {}: {}", status.lines_read, result.reason);
            return;
        case parsers::LineStatus::PARSED:
            break;
    }

    status.lines_parsed++;
    if (ProcessRecord(*result.record)) {
        status.signals++;
    }
}

bool LogProfiler::ProcessRecord(const parsers::LogRecord& record) {
    auto signal = classifier_.Classify(record.message);
    if (!signal) {
        return false;
    }

    engine_.Observe(record.tid, record.instant, *signal);
    return true;
}

void LogProfiler::Finalize() {
    std::size_t open_frames = engine_.OpenFrameCount();
    if (open_frames > 0) {
        spdlog::warn("Closing {} unterminated event(s) with zero duration", open_frames);
    }

    engine_.Finalize();

    const auto& stats = engine_.Stats();
    spdlog::info("Reconstructed {} root(s): {} starts, {} ends, {} discarded ends, {} forced closures",
                 stats.roots, stats.starts, stats.ends, stats.discarded_ends, stats.forced_closures);
}

} // namespace core
} // namespace logprof
