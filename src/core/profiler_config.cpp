/**
 * @file profiler_config.cpp
 * @brief Loading and validation of the profiler JSON configuration
 *
 * Every failure is reported as ConfigError with a message naming the
 * offending key or event, e.g.:
 * ```
 * events[2] ("Binder"): invalid pattern: ...
 * ```
 *
 * @date 2025
 */

#include "logprof/core/profiler_config.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <fstream>

using json = nlohmann::json;

namespace logprof {
namespace core {

namespace {

std::string RequireString(const json& object, const std::string& key, const std::string& context) {
    if (!object.contains(key)) {
        throw ConfigError(context + "missing required key '" + key + "'");
    }
    if (!object.at(key).is_string()) {
        throw ConfigError(context + "'" + key + "' must be a string");
    }
    return object.at(key).get<std::string>();
}

std::size_t RequireGroupIndex(const json& groups, const std::string& key) {
    const json& value = groups.at(key);
    if (!value.is_number_integer() || value.get<std::int64_t>() <= 0) {
        throw ConfigError("header_groups." + key + " must be a positive integer");
    }
    return static_cast<std::size_t>(value.get<std::int64_t>());
}

parsers::HeaderLayout ParseHeaderLayout(const json& document, std::size_t group_count) {
    if (!document.contains("header_groups")) {
        auto layout = parsers::HeaderLayout::ForGroupCount(group_count);
        if (!layout) {
            throw ConfigError("log_header_pattern has " + std::to_string(group_count) +
                              " capture groups; expected 6 or 7, or an explicit header_groups map");
        }
        return *layout;
    }

    const json& groups = document.at("header_groups");
    if (!groups.is_object()) {
        throw ConfigError("header_groups must be an object");
    }

    for (const char* required : {"time", "tid", "message"}) {
        if (!groups.contains(required)) {
            throw ConfigError(std::string("header_groups is missing '") + required + "'");
        }
    }

    parsers::HeaderLayout layout;
    layout.time = RequireGroupIndex(groups, "time");
    layout.tid = RequireGroupIndex(groups, "tid");
    layout.message = RequireGroupIndex(groups, "message");
    if (groups.contains("uid")) layout.uid = RequireGroupIndex(groups, "uid");
    if (groups.contains("pid")) layout.pid = RequireGroupIndex(groups, "pid");
    if (groups.contains("level")) layout.level = RequireGroupIndex(groups, "level");
    if (groups.contains("tag")) layout.tag = RequireGroupIndex(groups, "tag");

    if (layout.MaxIndex() > group_count) {
        throw ConfigError("header_groups references group " + std::to_string(layout.MaxIndex()) +
                          " but log_header_pattern has only " + std::to_string(group_count));
    }

    return layout;
}

parsers::EventDefinition ParseEvent(const json& entry, std::size_t index) {
    std::string context = "events[" + std::to_string(index) + "]: ";
    if (!entry.is_object()) {
        throw ConfigError(context + "must be an object");
    }

    std::string name = RequireString(entry, "name", context);
    context = "events[" + std::to_string(index) + "] (\"" + name + "\"): ";

    std::string start_regex = RequireString(entry, "start_regex", context);
    std::string end_regex = RequireString(entry, "end_regex", context);

    std::optional<double> threshold;
    if (entry.contains("threshold_ms") && !entry.at("threshold_ms").is_null()) {
        if (!entry.at("threshold_ms").is_number()) {
            throw ConfigError(context + "'threshold_ms' must be a number");
        }
        threshold = entry.at("threshold_ms").get<double>();
    }

    try {
        return parsers::MakeEventDefinition(name, start_regex, end_regex, threshold);
    } catch (const std::regex_error& e) {
        throw ConfigError(context + "invalid pattern: " + e.what());
    }
}

} // namespace

// ============================================================================
// LOADING
// ============================================================================

ProfilerConfig ProfilerConfig::LoadFromFile(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Failed to open config file: " + path.string());
    }

    spdlog::info("Loading configuration: {}", path.string());

    json document;
    try {
        file >> document;
    } catch (const json::parse_error& e) {
        throw ConfigError("Invalid JSON in " + path.string() + ": " + e.what());
    }

    return LoadFromJson(document);
}

ProfilerConfig ProfilerConfig::LoadFromJson(const json& document) {
    if (!document.is_object()) {
        throw ConfigError("Configuration root must be a JSON object");
    }

    ProfilerConfig config;

    config.header_pattern_source = RequireString(document, "log_header_pattern", "");
    try {
        config.header_pattern = std::regex(config.header_pattern_source);
    } catch (const std::regex_error& e) {
        throw ConfigError(std::string("invalid log_header_pattern: ") + e.what());
    }

    config.header_layout = ParseHeaderLayout(document, config.header_pattern.mark_count());

    config.time_format = RequireString(document, "time_format", "");
    if (config.time_format.empty()) {
        throw ConfigError("'time_format' must not be empty");
    }

    if (document.contains("assume_current_year")) {
        if (!document.at("assume_current_year").is_boolean()) {
            throw ConfigError("'assume_current_year' must be a boolean");
        }
        config.assume_current_year = document.at("assume_current_year").get<bool>();
    }

    if (!document.contains("events")) {
        throw ConfigError("missing required key 'events'");
    }
    const json& events = document.at("events");
    if (!events.is_array()) {
        throw ConfigError("'events' must be an array");
    }

    for (std::size_t i = 0; i < events.size(); ++i) {
        config.events.push_back(ParseEvent(events[i], i));
    }

    if (config.events.empty()) {
        spdlog::warn("Configuration defines no events; no line will be classified");
    }

    spdlog::debug("Loaded {} event definitions", config.events.size());
    return config;
}

} // namespace core
} // namespace logprof
