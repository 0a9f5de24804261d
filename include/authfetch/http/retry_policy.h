#pragma once

#include <authfetch/core/types.h>

#include <chrono>

namespace authfetch::http {

inline constexpr double kDefaultBaseDelaySeconds = 2.5;
inline constexpr double kDefaultMaxDelaySeconds = 90.0;

/**
 * Retry/backoff policy.
 *
 * delayFor(n) = min(maxDelaySeconds, baseDelaySeconds * 2^(n-1)), where n is the 1-based
 * number of the attempt that just failed.
 */
struct RetryPolicy {
    int maxAttempts{5};
    double baseDelaySeconds{kDefaultBaseDelaySeconds};
    double maxDelaySeconds{kDefaultMaxDelaySeconds};

    [[nodiscard]] std::chrono::duration<double> delayFor(int attempt) const;
    [[nodiscard]] Result<void> validate() const;
};

} // namespace authfetch::http
