/**
 * @file detector.hpp
 * @brief Object detector interface consumed by calibration and tracking.
 *
 * The pipeline only depends on this interface; YoloDetector provides the
 * ONNX implementation and tests provide scripted ones.
 */

#pragma once

#include <set>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

/**
 * @struct Detection
 * @brief A single bounding box with its confidence and class label.
 */
struct Detection {
    cv::Rect2f bbox;        ///< Box in pixel coordinates of the source frame
    float confidence = 0.0f;
    std::string className;

    float x1() const { return bbox.x; }
    float y1() const { return bbox.y; }
    float x2() const { return bbox.x + bbox.width; }
    float y2() const { return bbox.y + bbox.height; }

    cv::Point2f centroid() const {
        return cv::Point2f(bbox.x + bbox.width / 2.0f, bbox.y + bbox.height / 2.0f);
    }
};

/**
 * @class Detector
 * @brief Black-box detector: frame + class filter + threshold -> boxes.
 *
 * Implementations may throw on inference failure; DetectionAdapter turns
 * such failures into an empty result for the affected frame.
 */
class Detector {
public:
    virtual ~Detector() = default;

    virtual std::vector<Detection> detect(const cv::Mat& frame,
                                          const std::set<std::string>& classes,
                                          float minConfidence) = 0;
};
