#pragma once
#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>

namespace queuectl {

// Cooperative stop request for a worker loop. request() is safe to call from
// a signal handler; only the first call has any effect.
class ShutdownFlag {
public:
    ShutdownFlag() = default;
    ShutdownFlag(const ShutdownFlag&) = delete;
    ShutdownFlag& operator=(const ShutdownFlag&) = delete;

    // Returns true for the call that actually raised the flag
    bool request() noexcept {
        bool expected = false;
        return requested_.compare_exchange_strong(expected, true);
    }

    bool requested() const noexcept { return requested_.load(); }

    // Sleeps up to d in 100ms slices; returns early once requested
    void sleep_for(std::chrono::milliseconds d) const {
        auto until = std::chrono::steady_clock::now() + d;
        while (!requested()) {
            auto left = until - std::chrono::steady_clock::now();
            if (left <= std::chrono::steady_clock::duration::zero()) break;
            std::this_thread::sleep_for(
                std::min<std::chrono::steady_clock::duration>(left, std::chrono::milliseconds(100)));
        }
    }

private:
    std::atomic<bool> requested_{false};
};

// Routes SIGINT/SIGTERM of the current process to flag. The flag must outlive
// the installation; pass nullptr to detach.
void install_shutdown_handlers(ShutdownFlag* flag);

} // namespace queuectl
