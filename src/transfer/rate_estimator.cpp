#include "transfer/rate_estimator.hpp"
#include <algorithm>

RateEstimator::RateEstimator(uint64_t totalBytes,
                             std::chrono::milliseconds minInterval,
                             Clock::time_point start,
                             double smoothing)
    : totalBytes_(totalBytes)
    , minInterval_(minInterval)
    , start_(start)
    , lastEmit_(start)
    , smoothing_(std::clamp(smoothing, 0.0, 1.0)) {
}

bool RateEstimator::due(Clock::time_point now) const {
    return now - lastEmit_ >= minInterval_;
}

double RateEstimator::throughput(uint64_t bytes, std::chrono::duration<double> elapsed) {
    if (elapsed.count() <= 0.0) {
        return 0.0;
    }
    return static_cast<double>(bytes) / elapsed.count();
}

std::optional<double> RateEstimator::eta(uint64_t bytesDone, uint64_t bytesTotal, double rate) {
    if (bytesDone >= bytesTotal) {
        return 0.0;
    }
    if (rate <= 0.0) {
        return std::nullopt;
    }
    return static_cast<double>(bytesTotal - bytesDone) / rate;
}

ProgressSample RateEstimator::sample(uint64_t bytesDone, Clock::time_point now) {
    bytesDone = std::max(bytesDone, lastBytes_);

    std::chrono::duration<double> elapsed = now - start_;
    double average = throughput(bytesDone, elapsed);

    std::chrono::duration<double> sinceLast = now - lastEmit_;
    if (!haveRate_) {
        if (average > 0.0) {
            smoothedRate_ = average;
            haveRate_ = true;
        }
    } else if (sinceLast.count() > 0.0) {
        double instant = throughput(bytesDone - lastBytes_, sinceLast);
        smoothedRate_ = smoothing_ * instant + (1.0 - smoothing_) * smoothedRate_;
    }

    ProgressSample result;
    result.bytesDone = bytesDone;
    result.bytesTotal = totalBytes_;
    result.timestamp = std::chrono::system_clock::now();
    result.throughputBytesPerSec = average;
    result.etaSeconds = eta(bytesDone, totalBytes_, haveRate_ ? smoothedRate_ : 0.0);

    lastEmit_ = now;
    lastBytes_ = bytesDone;
    return result;
}
