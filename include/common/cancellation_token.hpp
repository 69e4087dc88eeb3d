#pragma once

#include <atomic>

// Shared stop flag for one run. Set at most once, never reset mid-run.
class CancellationToken {
public:
    // Returns true only for the call that flipped the flag.
    bool cancel() {
        bool expected = false;
        return cancelled_.compare_exchange_strong(expected, true, std::memory_order_acq_rel);
    }

    bool isCancelled() const { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> cancelled_{false};
};
