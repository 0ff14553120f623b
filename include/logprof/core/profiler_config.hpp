/**
 * @file profiler_config.hpp
 * @brief Profiler configuration loaded from JSON
 *
 * Holds the log header pattern, timestamp format and ordered event
 * definitions. All validation happens at load time so that no line is
 * consumed with a broken configuration.
 *
 * **Configuration file**:
 * ```json
 * {
 *   "log_header_pattern": "^(\\d{2}-\\d{2} [\\d:.]+)\\s+(\\S+)\\s+(\\d+)\\s+(\\d+)\\s+(\\w)\\s+([^:]+):\\s(.*)$",
 *   "time_format": "%m-%d %H:%M:%S.%f",
 *   "events": [
 *     {"name": "Activity", "start_regex": "onCreate begin", "end_regex": "onCreate end", "threshold_ms": 500}
 *   ]
 * }
 * ```
 *
 * @date 2025
 */

#pragma once

#include "logprof/parsers/event_classifier.hpp"
#include "logprof/parsers/log_line_parser.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>
#include <regex>
#include <filesystem>
#include <stdexcept>

namespace logprof {
namespace core {

/**
 * @class ConfigError
 * @brief Missing, unreadable or malformed configuration
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @struct ProfilerConfig
 * @brief Validated profiler configuration
 */
struct ProfilerConfig {
    std::string header_pattern_source;              ///< Header regex as configured
    std::regex header_pattern;                      ///< Compiled header regex
    parsers::HeaderLayout header_layout;            ///< Capture-group layout
    std::string time_format;                        ///< strptime-style format
    bool assume_current_year{true};                 ///< Prefix year when format lacks one
    std::vector<parsers::EventDefinition> events;   ///< Ordered event definitions

    /**
     * @brief Load and validate configuration from a JSON file
     * @param path Path to config file
     * @return Validated configuration
     * @throws ConfigError if the file is unreadable or invalid
     */
    static ProfilerConfig LoadFromFile(const std::filesystem::path& path);

    /**
     * @brief Validate configuration from an already parsed JSON document
     * @throws ConfigError on missing keys, wrong types or invalid patterns
     */
    static ProfilerConfig LoadFromJson(const nlohmann::json& document);
};

} // namespace core
} // namespace logprof
