// File: src/util/retry.hpp
#pragma once

#include "core/debug_log.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <chrono>
#include <string>
#include <thread>

namespace engram {

/// Bounded exponential backoff
struct RetryPolicy {
    int max_attempts{3};
    std::chrono::milliseconds initial_delay{50};
    std::chrono::milliseconds max_delay{2000};
    double multiplier{2.0};

    bool IsValid() const {
        return max_attempts >= 1 && initial_delay.count() >= 0 &&
               max_delay >= initial_delay && multiplier >= 1.0;
    }
};

/// Run `fn`, retrying on retryable UpstreamUnavailable with growing delays
///
/// Other exceptions and non-retryable upstream errors propagate at once.
/// After the last attempt the final UpstreamUnavailable is rethrown.
template <typename Fn>
auto RetryWithBackoff(const RetryPolicy& policy, const std::string& operation,
                      const DebugLog& log, Fn&& fn) -> decltype(fn()) {
    auto delay = policy.initial_delay;
    for (int attempt = 1;; ++attempt) {
        try {
            return fn();
        } catch (const UpstreamUnavailable& e) {
            if (!e.IsRetryable() || attempt >= policy.max_attempts) {
                throw;
            }
            log.Warning(operation + " attempt " + std::to_string(attempt) + " failed (" +
                        e.what() + "), retrying in " + std::to_string(delay.count()) + "ms");
        }
        std::this_thread::sleep_for(delay);
        auto next = std::chrono::duration_cast<std::chrono::milliseconds>(delay * policy.multiplier);
        delay = std::min(next, policy.max_delay);
    }
}

} // namespace engram
