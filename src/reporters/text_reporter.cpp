/**
 * @file text_reporter.cpp
 * @brief Implementation of the indented call-tree text report
 *
 * Traversal uses an explicit work stack so that pathologically deep traces
 * cannot exhaust the call stack. Children are pushed in reverse so they are
 * visited in arrival order.
 *
 * @date 2025
 */

#include "logprof/reporters/text_reporter.hpp"

#include <spdlog/spdlog.h>

#include <iomanip>
#include <sstream>
#include <utility>

namespace logprof {
namespace reporters {

namespace {

const char* kReportHeader = "--- PERFORMANCE REPORT (Call Tree) ---";
const char* kReportFooter = "--------------------------------------";

} // namespace

TextReporter::TextReporter(const parsers::EventClassifier& classifier,
                           const TextReporterConfig& config)
    : classifier_(classifier)
    , config_(config) {
}

ThresholdStatus TextReporter::Evaluate(const core::TraceNode& node) const {
    const auto* definition = classifier_.FindDefinition(node.Name());
    if (definition == nullptr || !definition->warn_threshold_ms) {
        return ThresholdStatus::OK;
    }
    return node.DurationMs() > *definition->warn_threshold_ms ? ThresholdStatus::WARN
                                                              : ThresholdStatus::OK;
}

// ============================================================================
// TRAVERSAL
// ============================================================================

std::vector<ReportEntry> TextReporter::BuildEntries(const core::Forest& forest) const {
    std::vector<ReportEntry> entries;
    std::vector<std::pair<const core::TraceNode*, std::size_t>> pending;

    for (const auto& root : forest) {
        pending.emplace_back(root.get(), 0);

        while (!pending.empty()) {
            auto [node, depth] = pending.back();
            pending.pop_back();

            ReportEntry entry;
            entry.depth = depth;
            entry.name = node->Name();
            entry.duration_ms = node->DurationMs();
            entry.self_time_ms = node->SelfTimeMs();
            entry.thread_id = node->Thread();
            entry.status = Evaluate(*node);
            entries.push_back(std::move(entry));

            const auto& children = node->Children();
            for (auto it = children.rbegin(); it != children.rend(); ++it) {
                pending.emplace_back(it->get(), depth + 1);
            }
        }
    }

    return entries;
}

// ============================================================================
// RENDERING
// ============================================================================

void TextReporter::RenderEntry(const ReportEntry& entry, std::ostream& out) const {
    std::string indent(entry.depth * config_.indent_width, ' ');
    const char* branch = entry.depth > 0 ? "└─" : "ROOT:";
    const std::string& marker = entry.status == ThresholdStatus::WARN ? config_.warn_marker
                                                                      : config_.ok_marker;

    // Formatted locally so the caller's stream flags stay untouched
    std::ostringstream block;
    block << indent << branch << " " << marker << " [" << entry.name << "]\n";
    block << indent << "   Total: " << std::fixed << std::setprecision(config_.duration_precision)
          << entry.duration_ms << "ms | Self: " << entry.self_time_ms
          << "ms | Thread: " << entry.thread_id << "\n";
    out << block.str();
}

void TextReporter::Render(const core::Forest& forest, std::ostream& out) const {
    auto entries = BuildEntries(forest);

    if (config_.show_header) {
        out << "\n" << kReportHeader << "\n";
    }

    for (const auto& entry : entries) {
        RenderEntry(entry, out);
    }

    if (config_.show_header) {
        out << kReportFooter << "\n";
    }

    std::size_t slow = 0;
    for (const auto& entry : entries) {
        if (entry.status == ThresholdStatus::WARN) {
            slow++;
        }
    }
    spdlog::debug("Text report: {} roots, {} nodes, {} over threshold", forest.size(), entries.size(), slow);
}

std::string TextReporter::RenderToString(const core::Forest& forest) const {
    std::ostringstream oss;
    Render(forest, oss);
    return oss.str();
}

} // namespace reporters
} // namespace logprof
