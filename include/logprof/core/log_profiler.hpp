/**
 * @file log_profiler.hpp
 * @brief Orchestration of line parsing, classification and stack reconstruction
 *
 * Owns one StackEngine per run and drives it from a log file or stream:
 * each line is decomposed, classified and fed to the engine in the order it
 * appears. Reporters consume the resulting forest.
 *
 * @date 2025
 */

#pragma once

#include "logprof/core/profiler_config.hpp"
#include "logprof/core/stack_engine.hpp"
#include "logprof/parsers/event_classifier.hpp"
#include "logprof/parsers/log_line_parser.hpp"

#include <string>
#include <istream>
#include <filesystem>
#include <cstddef>

namespace logprof {
namespace core {

/**
 * @struct ProcessStatus
 * @brief Outcome of ingesting one input source
 */
struct ProcessStatus {
    std::string source;                 ///< File path or stream label
    bool is_complete{false};            ///< Input consumed to the end
    bool is_partial{false};             ///< Read failed after some lines were consumed
    bool has_error{false};              ///< Input could not be (fully) read
    std::string error_message;          ///< Error details (if has_error = true)

    std::size_t lines_read{0};          ///< Lines read from the source
    std::size_t lines_parsed{0};        ///< Lines whose header decoded
    std::size_t lines_skipped{0};       ///< Lines without a recognizable header
    std::size_t lines_malformed{0};     ///< Header matched, fields invalid
    std::size_t signals{0};             ///< Lines classified as start/end
};

/**
 * @class LogProfiler
 * @brief Single-run profiler from raw log text to a call-tree forest
 *
 * **Usage Example**:
 * @code
 * auto config = ProfilerConfig::LoadFromFile("config.json");
 * LogProfiler profiler(std::move(config));
 * auto status = profiler.ProcessFile("app.log");
 * profiler.Finalize();
 * TextReporter(profiler.Classifier()).Render(profiler.Roots(), std::cout);
 * @endcode
 */
class LogProfiler {
public:
    explicit LogProfiler(ProfilerConfig config);

    /**
     * @brief Read and process a log file line by line
     * @param log_path Path to log file
     * @return Ingestion status; has_error set if the file is missing or unreadable
     */
    ProcessStatus ProcessFile(const std::filesystem::path& log_path);

    /**
     * @brief Process every line of a stream
     * @param input Input stream
     * @param source_label Name used in logs and in the status
     * @return Ingestion status
     */
    ProcessStatus ProcessStream(std::istream& input, const std::string& source_label = "<stream>");

    /**
     * @brief Feed one already decoded record to the classifier and engine
     * @return true if the record produced a signal
     */
    bool ProcessRecord(const parsers::LogRecord& record);

    /**
     * @brief Close all dangling events; call once after the last input
     */
    void Finalize();

    const Forest& Roots() const { return engine_.Roots(); }
    const StackEngine& Engine() const { return engine_; }
    const parsers::EventClassifier& Classifier() const { return classifier_; }
    const ProfilerConfig& Config() const { return config_; }

private:
    void ProcessLine(const std::string& line, ProcessStatus& status);

    ProfilerConfig config_;
    parsers::LogLineParser line_parser_;
    parsers::EventClassifier classifier_;
    StackEngine engine_;
};

} // namespace core
} // namespace logprof
