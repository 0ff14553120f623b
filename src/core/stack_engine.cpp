/**
 * @file stack_engine.cpp
 * @brief Implementation of per-thread call stack reconstruction
 *
 * **Example** (thread 1):
 * ```
 * t=0  START A   stack: [A]
 * t=1  START B   stack: [A, B]      A.children = [B]
 * t=5  END B     stack: [A]         B = 1..5
 * t=10 END A     stack: []          A = 0..10 -> forest
 * ```
 *
 * End matching only inspects the top frame, which keeps every signal O(1).
 * Out-of-order or spurious end markers are dropped instead of unwinding.
 *
 * @date 2025
 */

#include "logprof/core/stack_engine.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace logprof {
namespace core {

StackEngine::StackEngine() {
    spdlog::debug("Stack engine initialized");
}

StackEngine::~StackEngine() = default;

// ============================================================================
// SIGNAL PROCESSING
// ============================================================================

void StackEngine::Observe(ThreadId thread_id, Instant instant, const parsers::Signal& signal) {
    if (finalized_ && signal.kind == parsers::SignalKind::START) {
        spdlog::debug("Start of '{}' on thread {} after finalize; it stays open until the next Finalize()",
                      signal.event_name, thread_id);
    }

    // Stacks are created lazily and live for the whole run
    ThreadStack& stack = stacks_[thread_id];

    switch (signal.kind) {
        case parsers::SignalKind::START:
            HandleStart(stack, thread_id, instant, signal.event_name);
            break;
        case parsers::SignalKind::END:
            HandleEnd(stack, instant, signal.event_name);
            break;
    }
}

void StackEngine::HandleStart(ThreadStack& stack, ThreadId thread_id, Instant instant,
                              const std::string& name) {
    auto node = std::make_unique<TraceNode>(name, instant, thread_id);

    TraceNode* pushed = nullptr;
    if (stack.frames.empty()) {
        stack.root = std::move(node);
        pushed = stack.root.get();
    } else {
        pushed = stack.frames.back()->AddChild(std::move(node));
    }

    stack.frames.push_back(pushed);
    stats_.starts++;
}

void StackEngine::HandleEnd(ThreadStack& stack, Instant instant, const std::string& name) {
    if (stack.frames.empty() || stack.frames.back()->Name() != name) {
        spdlog::debug("Discarding end marker for '{}' (top frame: '{}')",
                      name, stack.frames.empty() ? "<none>" : stack.frames.back()->Name());
        stats_.discarded_ends++;
        return;
    }

    stack.frames.back()->Close(instant);
    stack.frames.pop_back();
    stats_.ends++;

    if (stack.frames.empty()) {
        EmitRoot(stack);
    }
}

void StackEngine::EmitRoot(ThreadStack& stack) {
    forest_.push_back(std::move(stack.root));
    stats_.roots++;
}

// ============================================================================
// END OF STREAM
// ============================================================================

void StackEngine::Finalize() {
    if (finalized_) {
        spdlog::debug("Stack engine already finalized");
    }
    finalized_ = true;

    for (auto& [thread_id, stack] : stacks_) {
        if (stack.frames.empty()) {
            continue;
        }

        spdlog::debug("Closing {} dangling event(s) on thread {}", stack.frames.size(), thread_id);

        while (!stack.frames.empty()) {
            TraceNode* node = stack.frames.back();
            stack.frames.pop_back();

            if (!node->IsClosed()) {
                // Zero-duration fallback keeps downstream timing non-negative
                node->Close(node->Start());
                stats_.forced_closures++;
            }
        }

        EmitRoot(stack);
    }
}

// ============================================================================
// QUERIES
// ============================================================================

std::size_t StackEngine::OpenDepth(ThreadId thread_id) const {
    auto it = stacks_.find(thread_id);
    return it == stacks_.end() ? 0 : it->second.frames.size();
}

std::size_t StackEngine::OpenFrameCount() const {
    std::size_t total = 0;
    for (const auto& entry : stacks_) {
        total += entry.second.frames.size();
    }
    return total;
}

} // namespace core
} // namespace logprof
