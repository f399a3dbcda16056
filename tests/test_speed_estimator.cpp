#include <gtest/gtest.h>

#include "speed_estimator.hpp"
#include "test_support.hpp"

namespace {

std::vector<TrackPoint> linearPositions(int n, float pxPerFrame, int frameStep = 1) {
    std::vector<TrackPoint> positions;
    for (int i = 0; i < n; i++) {
        positions.push_back({cv::Point2f(100.0f + pxPerFrame * frameStep * i, 200.0f), i * frameStep});
    }
    return positions;
}

Config quietConfig() {
    Config config;
    config.verbose = false;
    return config;
}

}  // namespace

TEST(SpeedEstimatorTest, UniformMotionGivesTrueSpeed) {
    Config config = quietConfig();
    // 20 px/frame * 0.01 m/px * 30 fps = 6 m/s
    SpeedResult result = estimateSpeed(linearPositions(12, 20.0f), 30.0, 0.01, 1.0, config);

    ASSERT_TRUE(result.valid);
    EXPECT_NEAR(result.rawSpeedMps, 6.0, 1e-6);
    EXPECT_NEAR(result.speedKmh, 21.6, 1e-6);
    EXPECT_NEAR(result.speedMph(), 21.6 * 0.621371, 1e-6);
    EXPECT_EQ(result.trackLength, 12);
    EXPECT_EQ(result.intervalCount, 11);
}

TEST(SpeedEstimatorTest, FilterDropsSlowIntervalsAndAveragesFastest) {
    IntervalFilter filter = filterIntervalSpeeds({1, 2, 3, 4, 10, 11, 12}, 0.75, 0.5);

    // floor(0.75 * 7) = 5 kept: threshold is the fifth fastest value
    ASSERT_EQ(filter.kept.size(), 5u);
    EXPECT_DOUBLE_EQ(filter.kept.back(), 3.0);
    EXPECT_DOUBLE_EQ(filter.kept.front(), 12.0);

    // floor(5 / 2) = 2 fastest averaged
    ASSERT_EQ(filter.averaged.size(), 2u);
    EXPECT_DOUBLE_EQ(filter.averaged[0], 12.0);
    EXPECT_DOUBLE_EQ(filter.averaged[1], 11.0);
    EXPECT_DOUBLE_EQ(filter.mean, 11.5);
}

TEST(SpeedEstimatorTest, FilterKeepsTiesAtThreshold) {
    IntervalFilter filter = filterIntervalSpeeds({5, 5, 5, 5}, 0.75, 0.5);
    EXPECT_EQ(filter.kept.size(), 4u);
    EXPECT_EQ(filter.averaged.size(), 2u);
    EXPECT_DOUBLE_EQ(filter.mean, 5.0);
}

TEST(SpeedEstimatorTest, FilterKeepsAtLeastOne) {
    IntervalFilter filter = filterIntervalSpeeds({7}, 0.75, 0.5);
    ASSERT_EQ(filter.kept.size(), 1u);
    ASSERT_EQ(filter.averaged.size(), 1u);
    EXPECT_DOUBLE_EQ(filter.mean, 7.0);

    EXPECT_TRUE(filterIntervalSpeeds({}, 0.75, 0.5).kept.empty());
}

TEST(SpeedEstimatorTest, RequiresFivePositions) {
    Config config = quietConfig();
    SpeedResult result = estimateSpeed(linearPositions(4, 20.0f), 30.0, 0.01, 1.0, config);
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.trackLength, 4);
}

TEST(SpeedEstimatorTest, SkipsNonPositiveIntervals) {
    std::vector<TrackPoint> positions = {
        {cv::Point2f(0, 0), 0}, {cv::Point2f(10, 0), 1}, {cv::Point2f(50, 0), 1},
        {cv::Point2f(60, 0), 2}};
    std::vector<double> speeds = computeIntervalSpeeds(positions, 10.0, 1.0);
    ASSERT_EQ(speeds.size(), 2u);
    EXPECT_DOUBLE_EQ(speeds[0], 100.0);
    EXPECT_DOUBLE_EQ(speeds[1], 100.0);

    Config config = quietConfig();
    std::vector<TrackPoint> frozen(6, {cv::Point2f(0, 0), 3});
    EXPECT_FALSE(estimateSpeed(frozen, 30.0, 0.01, 1.0, config).valid);
}

TEST(SpeedEstimatorTest, FrameGapsUseElapsedTime) {
    // 40 px every 2 frames is the same 20 px/frame speed
    std::vector<double> speeds = computeIntervalSpeeds(linearPositions(5, 20.0f, 2), 30.0, 0.01);
    ASSERT_EQ(speeds.size(), 4u);
    for (double s : speeds) {
        EXPECT_NEAR(s, 6.0, 1e-6);
    }
}

TEST(SpeedEstimatorTest, AppliesSlowMotionMultiplier) {
    Config config = quietConfig();
    SpeedResult result = estimateSpeed(linearPositions(12, 20.0f), 30.0, 0.01, 4.0, config);
    ASSERT_TRUE(result.valid);
    EXPECT_NEAR(result.rawSpeedMps, 6.0, 1e-6);
    EXPECT_NEAR(result.speedKmh, 86.4, 1e-6);
    EXPECT_DOUBLE_EQ(result.slowMotionFactor, 4.0);
}

TEST(SlowMotionTest, SnapsToPresetSteps) {
    EXPECT_DOUBLE_EQ(snapSlowMotionFactor(8.0), 8.0);
    EXPECT_DOUBLE_EQ(snapSlowMotionFactor(1.2), 1.0);
    EXPECT_DOUBLE_EQ(snapSlowMotionFactor(1.5), 1.0);
    EXPECT_DOUBLE_EQ(snapSlowMotionFactor(1.6), 2.0);
    EXPECT_DOUBLE_EQ(snapSlowMotionFactor(3.0), 2.0);
    EXPECT_DOUBLE_EQ(snapSlowMotionFactor(3.1), 4.0);
    EXPECT_DOUBLE_EQ(snapSlowMotionFactor(6.0), 4.0);
    EXPECT_DOUBLE_EQ(snapSlowMotionFactor(12.0), 8.0);
    EXPECT_DOUBLE_EQ(snapSlowMotionFactor(12.5), 16.0);
}

TEST(SlowMotionTest, EstimatesFromClipDuration) {
    Config config = quietConfig();
    EXPECT_DOUBLE_EQ(estimateSlowMotionFactor(30.0, 120, config), 8.0);  // 4.0 s
    EXPECT_DOUBLE_EQ(estimateSlowMotionFactor(30.0, 18, config), 1.0);   // 0.6 s
    EXPECT_DOUBLE_EQ(estimateSlowMotionFactor(30.0, 60, config), 1.0);   // exactly 2.0 s
    EXPECT_DOUBLE_EQ(estimateSlowMotionFactor(60.0, 300, config), 8.0);  // 5.0 s at 60 fps
    EXPECT_DOUBLE_EQ(estimateSlowMotionFactor(120.0, 1200, config), 1.0);
    EXPECT_DOUBLE_EQ(estimateSlowMotionFactor(0.0, 100, config), 1.0);
}

TEST(SpeedEstimatorTest, PlausibilityBand) {
    Config config = quietConfig();
    EXPECT_TRUE(isPlausibleSpeed(10.0, config));
    EXPECT_TRUE(isPlausibleSpeed(200.0, config));
    EXPECT_FALSE(isPlausibleSpeed(9.9, config));
    EXPECT_FALSE(isPlausibleSpeed(200.1, config));
}
