/**
 * @file text_reporter.hpp
 * @brief Human-readable call-tree report with timing annotations
 *
 * Walks each root of the forest depth-first and prints one block per node
 * with total duration, self time, thread and a slow/ok marker derived from
 * the event's configured threshold.
 *
 * @date 2025
 */

#pragma once

#include "logprof/core/types.hpp"
#include "logprof/core/trace_node.hpp"
#include "logprof/parsers/event_classifier.hpp"

#include <string>
#include <vector>
#include <ostream>
#include <cstddef>

namespace logprof {
namespace reporters {

/**
 * @enum ThresholdStatus
 * @brief Result of comparing a node's duration with its threshold
 */
enum class ThresholdStatus {
    OK,     ///< Within threshold, or no threshold configured
    WARN    ///< Duration strictly greater than threshold
};

/**
 * @struct ReportEntry
 * @brief One node of the report in pre-order
 */
struct ReportEntry {
    std::size_t depth{0};        ///< 0 for roots
    std::string name;            ///< Event name
    double duration_ms{0.0};     ///< Total duration
    double self_time_ms{0.0};    ///< Duration minus direct children
    ThreadId thread_id{0};       ///< Owning thread
    ThresholdStatus status{ThresholdStatus::OK};
};

/**
 * @struct TextReporterConfig
 * @brief Formatting options for the text report
 */
struct TextReporterConfig {
    std::size_t indent_width{2};     ///< Spaces per nesting level
    int duration_precision{0};       ///< Decimals printed for milliseconds
    bool show_header{true};          ///< Print header and footer lines
    std::string warn_marker{"[SLOW]"};
    std::string ok_marker{"[OK]"};
};

/**
 * @class TextReporter
 * @brief Renders the forest as an indented text call tree
 *
 * **Output Example**:
 * @code
 * --- PERFORMANCE REPORT (Call Tree) ---
 * ROOT: [OK] [Activity]
 *    Total: 10ms | Self: 6ms | Thread: 1
 *   └─ [OK] [Inflate]
 *      Total: 4ms | Self: 4ms | Thread: 1
 * --------------------------------------
 * @endcode
 */
class TextReporter {
public:
    explicit TextReporter(const parsers::EventClassifier& classifier,
                          const TextReporterConfig& config = TextReporterConfig{});

    /**
     * @brief Flatten the forest into pre-order report entries
     * @param forest Completed roots
     * @return Entries in the order they are printed
     */
    std::vector<ReportEntry> BuildEntries(const core::Forest& forest) const;

    /**
     * @brief Write the report to a stream
     */
    void Render(const core::Forest& forest, std::ostream& out) const;

    /**
     * @brief Render the report into a string
     */
    std::string RenderToString(const core::Forest& forest) const;

    /**
     * @brief Compare a node's duration with its definition's threshold
     */
    ThresholdStatus Evaluate(const core::TraceNode& node) const;

private:
    void RenderEntry(const ReportEntry& entry, std::ostream& out) const;

    const parsers::EventClassifier& classifier_;
    TextReporterConfig config_;
};

} // namespace reporters
} // namespace logprof
