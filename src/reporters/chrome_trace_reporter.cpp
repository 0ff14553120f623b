/**
 * @file chrome_trace_reporter.cpp
 * @brief Implementation of Trace Event Format export
 *
 * **Output Format**:
 * ```json
 * [
 *   {"name": "Activity", "cat": "PERF", "ph": "B", "ts": 1736935200000000, "pid": 1, "tid": 101},
 *   {"name": "Inflate",  "cat": "PERF", "ph": "B", "ts": 1736935200001000, "pid": 1, "tid": 101},
 *   {"name": "Inflate",  "cat": "PERF", "ph": "E", "ts": 1736935200005000, "pid": 1, "tid": 101},
 *   {"name": "Activity", "cat": "PERF", "ph": "E", "ts": 1736935200010000, "pid": 1, "tid": 101}
 * ]
 * ```
 *
 * @date 2025
 */

#include "logprof/reporters/chrome_trace_reporter.hpp"
#include "logprof/utils/time_utils.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <utility>

using json = nlohmann::json;

namespace logprof {
namespace reporters {

ChromeTraceReporter::ChromeTraceReporter(const ChromeTraceConfig& config)
    : config_(config) {
    spdlog::debug("Chrome trace reporter initialized (category: {}, pid: {})",
                  config_.category, config_.pid);
}

TraceEvent ChromeTraceReporter::MakeEvent(const core::TraceNode& node, const char* phase,
                                          Instant at) const {
    TraceEvent event;
    event.name = node.Name();
    event.cat = config_.category;
    event.ph = phase;
    event.ts = utils::TimeUtils::ToEpochMicroseconds(at);
    event.pid = config_.pid;
    event.tid = node.Thread();
    return event;
}

// ============================================================================
// EVENT GENERATION
// ============================================================================

std::vector<TraceEvent> ChromeTraceReporter::BuildEvents(const core::Forest& forest) const {
    std::vector<TraceEvent> events;

    // Second member marks a node whose subtree has been emitted
    std::vector<std::pair<const core::TraceNode*, bool>> pending;

    for (const auto& root : forest) {
        pending.emplace_back(root.get(), false);

        while (!pending.empty()) {
            auto [node, expanded] = pending.back();
            pending.pop_back();

            if (expanded) {
                Instant end = node->End()
                    ? *node->End()
                    : node->Start() + std::chrono::duration_cast<Duration>(config_.open_end_offset);
                events.push_back(MakeEvent(*node, "E", end));
                continue;
            }

            events.push_back(MakeEvent(*node, "B", node->Start()));
            pending.emplace_back(node, true);

            const auto& children = node->Children();
            for (auto it = children.rbegin(); it != children.rend(); ++it) {
                pending.emplace_back(it->get(), false);
            }
        }
    }

    return events;
}

json ChromeTraceReporter::ToJson(const std::vector<TraceEvent>& events) const {
    json array = json::array();

    for (const auto& event : events) {
        json record = {
            {"name", event.name},
            {"cat", event.cat},
            {"ph", event.ph},
            {"ts", event.ts},
            {"pid", event.pid},
            {"tid", event.tid}
        };
        array.push_back(std::move(record));
    }

    return array;
}

std::string ChromeTraceReporter::GenerateJsonString(const core::Forest& forest) const {
    json array = ToJson(BuildEvents(forest));
    return config_.pretty_print ? array.dump(config_.indent_size) : array.dump();
}

// ============================================================================
// FILE OUTPUT
// ============================================================================

std::filesystem::path ChromeTraceReporter::WriteFile(const core::Forest& forest,
                                                     const std::filesystem::path& output_path) const {
    try {
        if (output_path.has_parent_path() && !std::filesystem::exists(output_path.parent_path())) {
            std::filesystem::create_directories(output_path.parent_path());
        }

        std::ofstream file(output_path);
        if (!file.is_open()) {
            spdlog::error("Failed to open trace file for writing: {}", output_path.string());
            return {};
        }

        file << GenerateJsonString(forest);
        file.close();

        if (file.fail()) {
            spdlog::error("Failed to write trace file: {}", output_path.string());
            return {};
        }

        spdlog::info("Chrome trace exported to: {}", output_path.string());
        return output_path;
    }
    catch (const std::exception& e) {
        spdlog::error("Failed to export chrome trace: {}", e.what());
        return {};
    }
}

} // namespace reporters
} // namespace logprof
