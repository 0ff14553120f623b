/**
 * @file trace_node.cpp
 * @brief Implementation of call-tree node timing and ownership
 *
 * @date 2025
 */

#include "logprof/core/trace_node.hpp"
#include "logprof/utils/time_utils.hpp"

#include <utility>

namespace logprof {
namespace core {

TraceNode::TraceNode(std::string name, Instant start, ThreadId thread_id)
    : name_(std::move(name))
    , start_(start)
    , thread_id_(thread_id) {
}

void TraceNode::Close(Instant end) {
    end_ = end;
}

TraceNode* TraceNode::AddChild(std::unique_ptr<TraceNode> child) {
    child->parent_ = this;
    children_.push_back(std::move(child));
    return children_.back().get();
}

Duration TraceNode::GetDuration() const {
    if (!end_) {
        return Duration::zero();
    }
    return *end_ - start_;
}

Duration TraceNode::GetSelfTime() const {
    Duration child_total = Duration::zero();
    for (const auto& child : children_) {
        child_total += child->GetDuration();
    }

    Duration self = GetDuration() - child_total;
    return self < Duration::zero() ? Duration::zero() : self;
}

double TraceNode::DurationMs() const {
    return utils::TimeUtils::ToMilliseconds(GetDuration());
}

double TraceNode::SelfTimeMs() const {
    return utils::TimeUtils::ToMilliseconds(GetSelfTime());
}

std::size_t TraceNode::SubtreeSize() const {
    std::size_t count = 0;
    std::vector<const TraceNode*> pending{this};

    while (!pending.empty()) {
        const TraceNode* node = pending.back();
        pending.pop_back();
        count++;
        for (const auto& child : node->children_) {
            pending.push_back(child.get());
        }
    }

    return count;
}

} // namespace core
} // namespace logprof
