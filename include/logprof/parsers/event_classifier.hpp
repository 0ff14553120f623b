/**
 * @file event_classifier.hpp
 * @brief Classification of log messages into event start/end signals
 *
 * Matches the free-text message of a decoded log line against the ordered
 * list of configured event definitions. Used by LogProfiler to turn lines
 * into signals for the StackEngine.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <regex>
#include <optional>
#include <cstddef>

namespace logprof {
namespace parsers {

/**
 * @struct EventDefinition
 * @brief One configured event with its start and end signatures
 */
struct EventDefinition {
    std::string name;                          ///< Event identifier
    std::string start_regex;                   ///< Start pattern source
    std::string end_regex;                     ///< End pattern source
    std::regex start_pattern;                  ///< Compiled start pattern
    std::regex end_pattern;                    ///< Compiled end pattern
    std::optional<double> warn_threshold_ms;   ///< Slow-event threshold (none = never warn)
};

/**
 * @enum SignalKind
 * @brief Whether a matched line opens or closes an event
 */
enum class SignalKind {
    START,  ///< Start marker
    END     ///< End marker
};

/**
 * @struct Signal
 * @brief Classified start/end occurrence of a configured event
 */
struct Signal {
    SignalKind kind;                ///< Start or end
    std::string event_name;         ///< Name of the matched definition
    std::size_t definition_index;   ///< Position in configured order
};

/**
 * @class EventClassifier
 * @brief Maps log messages to at most one start or end signal
 *
 * Start patterns of all definitions take precedence over end patterns:
 * the first definition (in configured order) whose start pattern matches
 * wins; otherwise the first whose end pattern matches. Patterns may match
 * anywhere in the message.
 *
 * **Usage Example**:
 * @code
 * EventClassifier classifier(definitions);
 * if (auto signal = classifier.Classify("onCreate begin")) {
 *     engine.Observe(tid, instant, *signal);
 * }
 * @endcode
 */
class EventClassifier {
public:
    explicit EventClassifier(std::vector<EventDefinition> definitions);

    /**
     * @brief Classify a log message
     * @param message Free-text message of the log line
     * @return Signal for the first matching definition, or std::nullopt
     */
    std::optional<Signal> Classify(const std::string& message) const;

    /**
     * @brief Find the first definition with the given name
     * @param name Event name
     * @return Pointer to the definition, or nullptr if not configured
     */
    const EventDefinition* FindDefinition(const std::string& name) const;

    const std::vector<EventDefinition>& Definitions() const { return definitions_; }

private:
    std::vector<EventDefinition> definitions_;
};

/**
 * @brief Build a definition, compiling both patterns
 * @throws std::regex_error if either pattern is invalid
 */
EventDefinition MakeEventDefinition(const std::string& name,
                                    const std::string& start_regex,
                                    const std::string& end_regex,
                                    std::optional<double> warn_threshold_ms = std::nullopt);

} // namespace parsers
} // namespace logprof
