#include "planforge/engine/backoff.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace planforge {
namespace {

// 2^62 ms is already far beyond any meaningful delay.
constexpr int kMaxShift = 62;

[[nodiscard]] auto exponential_ms(std::int64_t base, int attempt)
    -> std::int64_t {
  const int shift = std::clamp(attempt - 1, 0, kMaxShift);
  if (base > 0 &&
      base > (std::numeric_limits<std::int64_t>::max() >> shift)) {
    return std::numeric_limits<std::int64_t>::max();
  }
  return base << shift;
}

[[nodiscard]] auto linear_ms(std::int64_t base, int attempt) -> std::int64_t {
  if (base > 0 && base > std::numeric_limits<std::int64_t>::max() / attempt) {
    return std::numeric_limits<std::int64_t>::max();
  }
  return base * attempt;
}

} // namespace

auto compute_backoff(const RetryPolicy &policy, int attempt,
                     std::mt19937_64 &rng) -> std::chrono::milliseconds {
  attempt = std::max(attempt, 1);
  const std::int64_t base = std::max<std::int64_t>(policy.base_delay.count(), 0);

  std::int64_t delay = base;
  switch (policy.backoff) {
  case BackoffKind::Fixed:
    break;
  case BackoffKind::Linear:
    delay = linear_ms(base, attempt);
    break;
  case BackoffKind::Exponential:
    delay = exponential_ms(base, attempt);
    break;
  case BackoffKind::Jitter: {
    const double ratio = std::clamp(policy.jitter_ratio, 0.0, 1.0);
    std::uniform_real_distribution<double> spread(-ratio, ratio);
    const auto scaled =
        static_cast<double>(exponential_ms(base, attempt)) * (1.0 + spread(rng));
    delay = scaled >= static_cast<double>(std::numeric_limits<std::int64_t>::max())
                ? std::numeric_limits<std::int64_t>::max()
                : static_cast<std::int64_t>(std::llround(scaled));
    break;
  }
  }

  if (policy.max_delay) {
    delay = std::min<std::int64_t>(delay, policy.max_delay->count());
  }
  return std::chrono::milliseconds{std::max<std::int64_t>(delay, 0)};
}

auto compute_backoff(const RetryPolicy &policy, int attempt)
    -> std::chrono::milliseconds {
  thread_local std::mt19937_64 rng(std::random_device{}());
  return compute_backoff(policy, attempt, rng);
}

auto is_retryable(const RetryPolicy &policy, std::string_view message)
    -> bool {
  if (policy.retryable_errors.empty()) {
    return true;
  }
  return std::ranges::any_of(policy.retryable_errors,
                             [message](const std::string &needle) {
                               return message.find(needle) !=
                                      std::string_view::npos;
                             });
}

} // namespace planforge
