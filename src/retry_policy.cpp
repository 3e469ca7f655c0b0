#include "retry_policy.hpp"
#include <cmath>
#include <cstdint>

namespace queuectl {

RetryDecision next_retry(int attempts, int retry_limit, double backoff_base,
                         std::chrono::seconds max_delay) {
    RetryDecision d;
    if (attempts >= retry_limit) {
        d.exhausted = true;
        return d;
    }

    double seconds = std::pow(backoff_base, attempts);
    const double ceiling = static_cast<double>(kMaxRetryDelay.count());
    if (!std::isfinite(seconds) || seconds > ceiling) seconds = ceiling;
    if (seconds < 0) seconds = 0;
    if (max_delay.count() > 0 && seconds > static_cast<double>(max_delay.count())) {
        seconds = static_cast<double>(max_delay.count());
    }

    d.delay = std::chrono::milliseconds(static_cast<int64_t>(std::llround(seconds * 1000.0)));
    return d;
}

} // namespace queuectl
