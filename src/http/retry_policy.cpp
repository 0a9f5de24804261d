#include <authfetch/http/retry_policy.h>

#include <algorithm>
#include <cmath>
#include <string>

namespace authfetch::http {

std::chrono::duration<double> RetryPolicy::delayFor(int attempt) const {
    if (attempt < 1)
        attempt = 1;
    // ldexp saturates to +inf for large exponents, which the min() below caps.
    const double raw = std::ldexp(baseDelaySeconds, attempt - 1);
    return std::chrono::duration<double>(std::max(0.0, std::min(maxDelaySeconds, raw)));
}

Result<void> RetryPolicy::validate() const {
    if (maxAttempts < 1) {
        return Error{ErrorCode::ConfigurationError,
                     "retry max_attempts must be >= 1 (got " + std::to_string(maxAttempts) + ")"};
    }
    if (!std::isfinite(baseDelaySeconds) || baseDelaySeconds < 0.0) {
        return Error{ErrorCode::ConfigurationError, "retry base_delay_seconds must be >= 0"};
    }
    if (!std::isfinite(maxDelaySeconds) || maxDelaySeconds < baseDelaySeconds) {
        return Error{ErrorCode::ConfigurationError,
                     "retry max_delay_seconds must be >= base_delay_seconds"};
    }
    return {};
}

} // namespace authfetch::http
