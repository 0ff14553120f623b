/**
 * @file types.hpp
 * @brief Basic value types shared by the parsing, engine and reporting layers
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <cstdint>

namespace logprof {

/// Point in time decoded from a log line header
using Instant = std::chrono::system_clock::time_point;

/// Span between two instants
using Duration = Instant::duration;

/// Thread identifier as printed by the traced application
using ThreadId = std::int64_t;

} // namespace logprof
