/**
 * @file stack_engine.hpp
 * @brief Per-thread call stack reconstruction from classified signals
 *
 * Consumes start/end signals in arrival order, maintains one open-frame
 * stack per thread identifier and builds the forest of completed call
 * trees. This is the stateful core of the profiler.
 *
 * @date 2025
 */

#pragma once

#include "logprof/core/types.hpp"
#include "logprof/core/trace_node.hpp"
#include "logprof/parsers/event_classifier.hpp"

#include <map>
#include <memory>
#include <vector>
#include <cstddef>

namespace logprof {
namespace core {

/**
 * @struct EngineStats
 * @brief Counters describing one reconstruction run
 */
struct EngineStats {
    std::size_t starts{0};            ///< Start signals accepted
    std::size_t ends{0};              ///< End signals that closed a frame
    std::size_t discarded_ends{0};    ///< End signals with no matching top frame
    std::size_t forced_closures{0};   ///< Nodes closed by Finalize()
    std::size_t roots{0};             ///< Roots appended to the forest
};

/**
 * @class StackEngine
 * @brief Single-threaded state machine rebuilding call trees per thread
 *
 * **Signal handling**:
 * - Start: a new node becomes the last child of the thread's top frame (if
 *   any) and is pushed. Starts are never rejected, so re-entrant events nest.
 * - End: closes the top frame only when its name equals the signal's event
 *   name. Any other end signal is discarded without touching the stack.
 *   The engine never unwinds through several frames.
 * - Finalize: closes every open frame (unset ends become `end = start`)
 *   and appends each thread's root to the forest, in ascending thread order.
 *
 * Exactly one caller drives the engine; no locking is performed.
 *
 * **Usage Example**:
 * @code
 * StackEngine engine;
 * engine.Observe(1, t0, start_a);
 * engine.Observe(1, t1, end_a);
 * engine.Finalize();
 * for (const auto& root : engine.Roots()) { ... }
 * @endcode
 */
class StackEngine {
public:
    StackEngine();
    ~StackEngine();

    StackEngine(const StackEngine&) = delete;
    StackEngine& operator=(const StackEngine&) = delete;

    /**
     * @brief Process one classified signal
     * @param thread_id Thread that emitted the log line
     * @param instant Timestamp of the log line
     * @param signal Classified start or end signal
     */
    void Observe(ThreadId thread_id, Instant instant, const parsers::Signal& signal);

    /**
     * @brief Force-close all open frames after end of input
     *
     * Signals observed after a Finalize() are still accepted; a later call
     * closes only the frames they opened. Without intervening signals a
     * repeated call has no effect.
     */
    void Finalize();

    /**
     * @brief Completed roots in the order they were closed
     */
    const Forest& Roots() const { return forest_; }

    /**
     * @brief Number of open frames on a thread (0 for unknown threads)
     */
    std::size_t OpenDepth(ThreadId thread_id) const;

    /**
     * @brief Total number of open frames across all threads
     */
    std::size_t OpenFrameCount() const;

    bool IsFinalized() const { return finalized_; }

    const EngineStats& Stats() const { return stats_; }

private:
    /**
     * @struct ThreadStack
     * @brief Open call path of one thread
     *
     * `root` owns the bottom frame while it is open; `frames` holds the path
     * from the root to the innermost open frame.
     */
    struct ThreadStack {
        std::unique_ptr<TraceNode> root;
        std::vector<TraceNode*> frames;
    };

    void HandleStart(ThreadStack& stack, ThreadId thread_id, Instant instant,
                     const std::string& name);
    void HandleEnd(ThreadStack& stack, Instant instant, const std::string& name);
    void EmitRoot(ThreadStack& stack);

    std::map<ThreadId, ThreadStack> stacks_;
    Forest forest_;
    EngineStats stats_;
    bool finalized_{false};
};

} // namespace core
} // namespace logprof
