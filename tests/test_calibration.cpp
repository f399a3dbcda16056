#include <gtest/gtest.h>

#include "calibration.hpp"
#include "test_support.hpp"

using test_support::ScriptedDetector;
using test_support::makeClip;
using test_support::makeDetection;

namespace {

Config quietConfig() {
    Config config;
    config.verbose = false;
    return config;
}

}  // namespace

TEST(CalibrationTest, FourMittsGiveMittScale) {
    Config config = quietConfig();
    CalibrationResult result =
        calibrateFromMittHeights({100, 100, 100, 100}, cv::Size(1500, 1000), config);

    EXPECT_TRUE(result.mittDetected);
    EXPECT_STREQ(result.method.c_str(), CalibrationMethod::MITT);
    EXPECT_DOUBLE_EQ(result.scale, 0.32 / 100.0);
    EXPECT_DOUBLE_EQ(result.medianMittHeight, 100.0);
    EXPECT_EQ(result.candidateCount, 4);
    EXPECT_DOUBLE_EQ(result.minScale, 0.001);
    EXPECT_DOUBLE_EQ(result.maxScale, 0.1);
}

TEST(CalibrationTest, ThreeMittsFallBackToResolution) {
    Config config = quietConfig();
    CalibrationResult result =
        calibrateFromMittHeights({100, 100, 100}, cv::Size(1920, 1080), config);

    EXPECT_FALSE(result.mittDetected);
    EXPECT_STREQ(result.method.c_str(), CalibrationMethod::RESOLUTION);
    EXPECT_DOUBLE_EQ(result.scale, 18.0 / (1920 * 0.7));
    EXPECT_EQ(result.candidateCount, 3);
}

TEST(CalibrationTest, OutOfRangeScaleFallsBack) {
    Config config = quietConfig();
    // 0.32 / 400 = 0.0008 m/px, below the lower bound
    CalibrationResult result =
        calibrateFromMittHeights({400, 400, 400, 400}, cv::Size(1080, 1920), config);

    EXPECT_FALSE(result.mittDetected);
    EXPECT_DOUBLE_EQ(result.scale, 11.0 / 1080.0);
}

TEST(CalibrationTest, ResolutionFallbackByOrientation) {
    Config config = quietConfig();
    EXPECT_DOUBLE_EQ(estimateScaleFromResolution(cv::Size(1080, 1920), config), 11.0 / 1080.0);
    EXPECT_DOUBLE_EQ(estimateScaleFromResolution(cv::Size(1920, 1080), config), 18.0 / 1344.0);
    // Square frames are not portrait
    EXPECT_DOUBLE_EQ(estimateScaleFromResolution(cv::Size(1000, 1000), config), 18.0 / 700.0);
}

TEST(CalibrationTest, MittCandidateRules) {
    Config config = quietConfig();
    const int frameHeight = 1000;

    EXPECT_TRUE(isMittCandidate(cv::Rect2f(0, 0, 80, 100), frameHeight, config));
    EXPECT_FALSE(isMittCandidate(cv::Rect2f(0, 0, 40, 50), frameHeight, config));    // not > 50 px
    EXPECT_FALSE(isMittCandidate(cv::Rect2f(0, 0, 200, 100), frameHeight, config));  // wider than tall
    EXPECT_FALSE(isMittCandidate(cv::Rect2f(0, 0, 200, 300), frameHeight, config));  // ratio 0.3
    EXPECT_TRUE(isMittCandidate(cv::Rect2f(0, 0, 200, 290), frameHeight, config));
    EXPECT_FALSE(isMittCandidate(cv::Rect2f(0, 0, 50, 60), 2000, config));           // ratio 0.03
}

TEST(CalibrationTest, MedianHandlesEvenAndOddCounts) {
    EXPECT_DOUBLE_EQ(medianOf({3, 1, 2}), 2.0);
    EXPECT_DOUBLE_EQ(medianOf({4, 1, 3, 2}), 2.5);
    EXPECT_DOUBLE_EQ(medianOf({}), 0.0);
}

TEST(CalibratorTest, ScansCatchEndOfClip) {
    Config config = quietConfig();
    VideoClip clip = makeClip(70, 30.0, 70);  // 600x400 frames
    ScriptedDetector detector;
    for (int i = 0; i < 5; i++) {
        detector.add(i, makeDetection(300, 200, 50, 60, "baseball glove", 0.5f));
    }
    // Balls never count as mitts
    detector.add(0, makeDetection(100, 100, 40, 60, "sports ball", 0.9f));

    DetectionAdapter adapter(detector);
    Calibrator calibrator(config, adapter);
    CalibrationResult result = calibrator.calibrate(clip);

    EXPECT_TRUE(result.mittDetected);
    EXPECT_EQ(result.candidateCount, 5);
    EXPECT_DOUBLE_EQ(result.scale, 0.32 / 60.0);
    EXPECT_EQ(detector.calls, 60);
    EXPECT_EQ(calibrator.getMittHeights().size(), 5u);
}

TEST(CalibratorTest, IgnoresMittsBeyondScanWindow) {
    Config config = quietConfig();
    VideoClip clip = makeClip(70, 30.0, 70);
    ScriptedDetector detector;
    for (int i = 60; i < 70; i++) {
        detector.add(i, makeDetection(300, 200, 50, 60, "baseball glove", 0.5f));
    }

    DetectionAdapter adapter(detector);
    Calibrator calibrator(config, adapter);
    CalibrationResult result = calibrator.calibrate(clip);

    EXPECT_FALSE(result.mittDetected);
    EXPECT_EQ(result.candidateCount, 0);
    EXPECT_DOUBLE_EQ(result.scale, 18.0 / (600 * 0.7));
}

TEST(CalibratorTest, LowConfidenceMittsAreNotRequested) {
    Config config = quietConfig();
    VideoClip clip = makeClip(10, 30.0, 10);
    ScriptedDetector detector;
    for (int i = 0; i < 6; i++) {
        detector.add(i, makeDetection(300, 200, 50, 60, "baseball glove", 0.1f));
    }

    DetectionAdapter adapter(detector);
    Calibrator calibrator(config, adapter);
    EXPECT_FALSE(calibrator.calibrate(clip).mittDetected);
}
