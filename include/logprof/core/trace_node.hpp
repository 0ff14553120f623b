/**
 * @file trace_node.hpp
 * @brief Call-tree node reconstructed from start/end log markers
 *
 * @date 2025
 */

#pragma once

#include "logprof/core/types.hpp"

#include <string>
#include <vector>
#include <memory>
#include <optional>

namespace logprof {
namespace core {

/**
 * @class TraceNode
 * @brief One event occurrence in a per-thread call tree
 *
 * A node is created when its start marker is recognized and closed exactly
 * once, either by the matching end marker or by forced closure at the end
 * of the stream. Children are owned by their parent and kept in arrival
 * order. The parent link is non-owning and only serves stack bookkeeping.
 *
 * **Timing**:
 * - Duration: `end - start`, zero while the node is open
 * - Self time: `max(0, duration - sum(child durations))`
 */
class TraceNode {
public:
    TraceNode(std::string name, Instant start, ThreadId thread_id);

    TraceNode(const TraceNode&) = delete;
    TraceNode& operator=(const TraceNode&) = delete;

    const std::string& Name() const { return name_; }
    Instant Start() const { return start_; }
    const std::optional<Instant>& End() const { return end_; }
    ThreadId Thread() const { return thread_id_; }

    bool IsClosed() const { return end_.has_value(); }

    /**
     * @brief Set the end instant
     * @param end Instant at which the end marker was observed
     */
    void Close(Instant end);

    /**
     * @brief Append a child and point its parent link at this node
     * @param child Newly started node
     * @return Non-owning pointer to the appended child
     */
    TraceNode* AddChild(std::unique_ptr<TraceNode> child);

    const std::vector<std::unique_ptr<TraceNode>>& Children() const { return children_; }
    TraceNode* Parent() const { return parent_; }

    Duration GetDuration() const;
    Duration GetSelfTime() const;

    double DurationMs() const;
    double SelfTimeMs() const;

    /**
     * @brief Number of nodes in this subtree, including this node
     */
    std::size_t SubtreeSize() const;

private:
    std::string name_;
    Instant start_;
    std::optional<Instant> end_;
    ThreadId thread_id_;

    std::vector<std::unique_ptr<TraceNode>> children_;
    TraceNode* parent_{nullptr};
};

/// Ordered sequence of closed root nodes produced by one run
using Forest = std::vector<std::unique_ptr<TraceNode>>;

} // namespace core
} // namespace logprof
