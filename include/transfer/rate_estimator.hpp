#pragma once

#include "common/transfer_status.hpp"
#include <chrono>
#include <cstdint>
#include <optional>

// Turns cumulative (bytes, time) observations into progress samples.
//
// Throughput is the run average: bytes / elapsed, 0 while nothing has elapsed.
// The ETA is computed from an exponential moving average of the rate between
// emitted samples, seeded with the run average, so a stall or a burst right at
// the start does not swing it wildly. The ETA stays unknown while that rate
// is zero.
class RateEstimator {
public:
    using Clock = std::chrono::steady_clock;

    RateEstimator(uint64_t totalBytes,
                  std::chrono::milliseconds minInterval,
                  Clock::time_point start = Clock::now(),
                  double smoothing = 0.3);

    // True when at least minInterval has passed since the last emitted sample.
    bool due(Clock::time_point now = Clock::now()) const;

    // Builds a sample and marks it emitted. bytesDone never goes backwards.
    ProgressSample sample(uint64_t bytesDone, Clock::time_point now = Clock::now());

    static double throughput(uint64_t bytes, std::chrono::duration<double> elapsed);
    static std::optional<double> eta(uint64_t bytesDone, uint64_t bytesTotal, double rate);

    uint64_t totalBytes() const { return totalBytes_; }

private:
    uint64_t totalBytes_;
    std::chrono::milliseconds minInterval_;
    Clock::time_point start_;
    Clock::time_point lastEmit_;
    uint64_t lastBytes_{0};
    double smoothing_;
    double smoothedRate_{0.0};
    bool haveRate_{false};
};
