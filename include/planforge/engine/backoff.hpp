#pragma once

#include "planforge/plan/task.hpp"

#include <chrono>
#include <random>
#include <string_view>

namespace planforge {

/// Delay before retry number `attempt + 1`, where `attempt` (1-based) is the
/// attempt that just failed.
///
///   fixed        base
///   linear       base * attempt
///   exponential  base * 2^(attempt-1)
///   jitter       exponential * (1 + u), u uniform in [-r, +r],
///                r = policy.jitter_ratio
///
/// Every kind is clamped to max_delay when one is set.
[[nodiscard]] auto compute_backoff(const RetryPolicy &policy, int attempt,
                                   std::mt19937_64 &rng)
    -> std::chrono::milliseconds;

// Jitter draws from a thread-local generator.
[[nodiscard]] auto compute_backoff(const RetryPolicy &policy, int attempt)
    -> std::chrono::milliseconds;

// True if the failure message may be retried under this policy.
[[nodiscard]] auto is_retryable(const RetryPolicy &policy,
                                std::string_view message) -> bool;

} // namespace planforge
