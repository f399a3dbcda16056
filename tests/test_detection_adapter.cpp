#include <gtest/gtest.h>

#include <opencv2/core.hpp>

#include "detection_adapter.hpp"
#include "test_support.hpp"

using test_support::ScriptedDetector;
using test_support::makeDetection;
using test_support::makeFrame;

namespace {

class OpenCvFailingDetector : public Detector {
public:
    std::vector<Detection> detect(const cv::Mat&, const std::set<std::string>&, float) override {
        CV_Error(cv::Error::StsError, "forward pass failed");
    }
};

const std::set<std::string> BALL = {"sports ball"};

}  // namespace

TEST(DetectionAdapterTest, SizeBandIsExclusive) {
    ScriptedDetector detector;
    detector.add(0, makeDetection(100, 100, 5, 20));     // width on the lower bound
    detector.add(0, makeDetection(200, 100, 6, 6));
    detector.add(0, makeDetection(300, 100, 199, 199));
    detector.add(0, makeDetection(400, 100, 20, 200));   // height on the upper bound

    DetectionAdapter adapter(detector);
    auto boxes = adapter.detect(makeFrame(0), BALL, 0.01f, SizeBand{5.0f, 200.0f});

    ASSERT_EQ(boxes.size(), 2u);
    EXPECT_FLOAT_EQ(boxes[0].bbox.width, 6.0f);
    EXPECT_FLOAT_EQ(boxes[1].bbox.width, 199.0f);
}

TEST(DetectionAdapterTest, WithoutBandReturnsDetectorOutput) {
    ScriptedDetector detector;
    detector.add(3, makeDetection(100, 100, 300, 400, "baseball glove", 0.3f));
    detector.add(3, makeDetection(100, 100, 10, 10, "sports ball", 0.3f));

    DetectionAdapter adapter(detector);
    auto boxes = adapter.detect(makeFrame(3), {"baseball glove"}, 0.2f);

    ASSERT_EQ(boxes.size(), 1u);
    EXPECT_EQ(boxes[0].className, "baseball glove");
    EXPECT_FLOAT_EQ(boxes[0].x1(), -50.0f);
    EXPECT_FLOAT_EQ(boxes[0].y2(), 300.0f);
}

TEST(DetectionAdapterTest, DetectorFailureDegradesToEmpty) {
    ScriptedDetector detector;
    detector.add(1, makeDetection(100, 100, 10, 10));
    detector.failOn(1);

    DetectionAdapter adapter(detector);
    EXPECT_TRUE(adapter.detect(makeFrame(1), BALL, 0.01f, SizeBand{5.0f, 200.0f}).empty());
    EXPECT_EQ(adapter.getFailedFrames(), 1);

    OpenCvFailingDetector failing;
    DetectionAdapter cvAdapter(failing);
    EXPECT_TRUE(cvAdapter.detect(makeFrame(0), BALL, 0.01f).empty());
    EXPECT_EQ(cvAdapter.getFailedFrames(), 1);
}
