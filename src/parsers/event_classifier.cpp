/**
 * @file event_classifier.cpp
 * @brief Implementation of message classification against event definitions
 *
 * Classification runs in two passes over the definitions in configured order:
 * every start pattern is tried first, then every end pattern. A message that
 * would satisfy the start of one definition and the end of another therefore
 * always yields the start signal.
 *
 * @date 2025
 */

#include "logprof/parsers/event_classifier.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace logprof {
namespace parsers {

EventDefinition MakeEventDefinition(const std::string& name,
                                    const std::string& start_regex,
                                    const std::string& end_regex,
                                    std::optional<double> warn_threshold_ms) {
    EventDefinition definition;
    definition.name = name;
    definition.start_regex = start_regex;
    definition.end_regex = end_regex;
    definition.start_pattern = std::regex(start_regex);
    definition.end_pattern = std::regex(end_regex);
    definition.warn_threshold_ms = warn_threshold_ms;
    return definition;
}

EventClassifier::EventClassifier(std::vector<EventDefinition> definitions)
    : definitions_(std::move(definitions)) {
    spdlog::debug("Event classifier initialized with {} definitions", definitions_.size());
}

std::optional<Signal> EventClassifier::Classify(const std::string& message) const {
    for (std::size_t i = 0; i < definitions_.size(); ++i) {
        if (std::regex_search(message, definitions_[i].start_pattern)) {
            return Signal{SignalKind::START, definitions_[i].name, i};
        }
    }

    for (std::size_t i = 0; i < definitions_.size(); ++i) {
        if (std::regex_search(message, definitions_[i].end_pattern)) {
            return Signal{SignalKind::END, definitions_[i].name, i};
        }
    }

    return std::nullopt;
}

const EventDefinition* EventClassifier::FindDefinition(const std::string& name) const {
    for (const auto& definition : definitions_) {
        if (definition.name == name) {
            return &definition;
        }
    }
    return nullptr;
}

} // namespace parsers
} // namespace logprof
