#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>

/// Set-once cancellation flag shared by the pool and every worker.
/// request() only performs a lock-free atomic store, so it may be called
/// from a signal handler.
class ShutdownSignal {
public:
    void request() { requested_.store(true); }

    bool requested() const { return requested_.load(); }

    /// Sleep up to `duration`, returning early (true) once shutdown is requested
    bool wait_for(std::chrono::milliseconds duration) const {
        auto deadline = std::chrono::steady_clock::now() + duration;
        while (!requested()) {
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) return false;
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            std::this_thread::sleep_for(std::min(left, std::chrono::milliseconds(50)));
        }
        return true;
    }

private:
    std::atomic<bool> requested_{false};
};
