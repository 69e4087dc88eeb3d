#include <gtest/gtest.h>
#include "transfer/rate_estimator.hpp"

using namespace std::chrono;

class RateEstimatorTest : public ::testing::Test {
protected:
    RateEstimator::Clock::time_point start_ = RateEstimator::Clock::now();
};

TEST_F(RateEstimatorTest, ZeroElapsedHasNoRate) {
    EXPECT_DOUBLE_EQ(RateEstimator::throughput(1000, duration<double>(0)), 0.0);

    RateEstimator estimator(1000, milliseconds(200), start_);
    ProgressSample sample = estimator.sample(0, start_);
    EXPECT_DOUBLE_EQ(sample.throughputBytesPerSec, 0.0);
    EXPECT_FALSE(sample.etaSeconds.has_value());
    EXPECT_EQ(sample.bytesTotal, 1000u);
}

TEST_F(RateEstimatorTest, EtaUnknownWithoutRate) {
    EXPECT_FALSE(RateEstimator::eta(10, 100, 0.0).has_value());
    ASSERT_TRUE(RateEstimator::eta(10, 100, 10.0).has_value());
    EXPECT_DOUBLE_EQ(*RateEstimator::eta(10, 100, 10.0), 9.0);
    EXPECT_DOUBLE_EQ(*RateEstimator::eta(100, 100, 0.0), 0.0);
}

TEST_F(RateEstimatorTest, AverageThroughput) {
    RateEstimator estimator(4000, milliseconds(200), start_);
    ProgressSample sample = estimator.sample(1000, start_ + seconds(1));
    EXPECT_DOUBLE_EQ(sample.throughputBytesPerSec, 1000.0);
    ASSERT_TRUE(sample.etaSeconds.has_value());
    EXPECT_DOUBLE_EQ(*sample.etaSeconds, 3.0);
}

TEST_F(RateEstimatorTest, EtaIsSmoothed) {
    RateEstimator estimator(10000, milliseconds(0), start_, 0.5);
    estimator.sample(1000, start_ + seconds(1));
    // Instant rate jumps to 3000 B/s; smoothed rate is 2000 B/s.
    ProgressSample sample = estimator.sample(4000, start_ + seconds(2));
    ASSERT_TRUE(sample.etaSeconds.has_value());
    EXPECT_DOUBLE_EQ(*sample.etaSeconds, 3.0);
    EXPECT_DOUBLE_EQ(sample.throughputBytesPerSec, 2000.0);
}

TEST_F(RateEstimatorTest, EmissionIsRateLimited) {
    RateEstimator estimator(1000, milliseconds(200), start_);
    EXPECT_FALSE(estimator.due(start_ + milliseconds(100)));
    EXPECT_TRUE(estimator.due(start_ + milliseconds(200)));

    estimator.sample(10, start_ + milliseconds(250));
    EXPECT_FALSE(estimator.due(start_ + milliseconds(400)));
    EXPECT_TRUE(estimator.due(start_ + milliseconds(450)));
}

TEST_F(RateEstimatorTest, BytesDoneNeverDecreases) {
    RateEstimator estimator(1000, milliseconds(0), start_);
    estimator.sample(500, start_ + seconds(1));
    ProgressSample sample = estimator.sample(200, start_ + seconds(2));
    EXPECT_EQ(sample.bytesDone, 500u);
}
