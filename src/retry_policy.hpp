#pragma once
#include <chrono>

namespace queuectl {

struct RetryDecision {
    bool exhausted = false;
    std::chrono::milliseconds delay{0};   // meaningful only when !exhausted
};

// Upper bound on any retry delay, applied even when max_delay is 0
constexpr std::chrono::seconds kMaxRetryDelay{7 * 24 * 3600};

// attempts: failures so far, including the one just observed.
// Delay is backoff_base ^ attempts seconds, never more than kMaxRetryDelay;
// max_delay > 0 lowers that cap further.
RetryDecision next_retry(int attempts, int retry_limit, double backoff_base,
                         std::chrono::seconds max_delay = std::chrono::seconds(0));

} // namespace queuectl
