/**
 * @file chrome_trace_reporter.hpp
 * @brief Trace Event Format export for chrome://tracing and Perfetto
 *
 * Converts the forest into paired begin/end duration events and writes them
 * as a single JSON array. Field names and shapes follow the Trace Event
 * Format so the file loads directly in third-party trace viewers.
 *
 * @date 2025
 */

#pragma once

#include "logprof/core/types.hpp"
#include "logprof/core/trace_node.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>
#include <chrono>
#include <filesystem>
#include <cstdint>

namespace logprof {
namespace reporters {

/**
 * @struct TraceEvent
 * @brief One Trace Event Format record
 */
struct TraceEvent {
    std::string name;     ///< Event name
    std::string cat;      ///< Category tag
    std::string ph;       ///< Phase: "B" (begin) or "E" (end)
    std::int64_t ts{0};   ///< Microseconds since the Unix epoch
    std::int64_t pid{0};  ///< Process id
    ThreadId tid{0};      ///< Thread id
};

/**
 * @struct ChromeTraceConfig
 * @brief Options for trace export
 */
struct ChromeTraceConfig {
    std::string category{"PERF"};                           ///< Category of every record
    std::int64_t pid{1};                                    ///< Process id of every record
    std::chrono::microseconds open_end_offset{100};         ///< End offset for unclosed nodes
    bool pretty_print{false};                               ///< Indent JSON output
    int indent_size{2};                                     ///< Indentation when pretty printing
};

/**
 * @class ChromeTraceReporter
 * @brief Exports the forest as begin/end trace events
 *
 * Events are emitted depth-first in pre-order: a node's "B" record, the
 * records of its whole subtree, then its "E" record. Every subtree is thus
 * enclosed by its root's pair.
 *
 * **Usage Example**:
 * @code
 * ChromeTraceReporter reporter;
 * auto path = reporter.WriteFile(profiler.Roots(), "trace_result.json");
 * if (path.empty()) { ... }
 * @endcode
 */
class ChromeTraceReporter {
public:
    explicit ChromeTraceReporter(const ChromeTraceConfig& config = ChromeTraceConfig{});

    /**
     * @brief Flatten the forest into nested begin/end records
     */
    std::vector<TraceEvent> BuildEvents(const core::Forest& forest) const;

    /**
     * @brief Convert records to a JSON array
     */
    nlohmann::json ToJson(const std::vector<TraceEvent>& events) const;

    /**
     * @brief Serialize the forest to a JSON string
     */
    std::string GenerateJsonString(const core::Forest& forest) const;

    /**
     * @brief Write the trace file
     * @param forest Completed roots
     * @param output_path Destination file
     * @return Path written, or empty path on failure
     */
    std::filesystem::path WriteFile(const core::Forest& forest,
                                    const std::filesystem::path& output_path) const;

private:
    TraceEvent MakeEvent(const core::TraceNode& node, const char* phase, Instant at) const;

    ChromeTraceConfig config_;
};

} // namespace reporters
} // namespace logprof
