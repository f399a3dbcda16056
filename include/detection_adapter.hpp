/**
 * @file detection_adapter.hpp
 * @brief Per-frame detector invocation with size-plausibility filtering.
 *
 * Wraps a Detector so that a failing inference call degrades to "no
 * detections" for that frame, and discards boxes whose width or height
 * falls outside a plausible pixel band before they reach calibration or
 * tracking.
 */

#pragma once

#include <set>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

#include "detector.hpp"

/**
 * @struct SizeBand
 * @brief Exclusive pixel bounds applied to both box width and height.
 */
struct SizeBand {
    float minSize;
    float maxSize;

    bool contains(const cv::Rect2f& box) const {
        return box.width > minSize && box.width < maxSize &&
               box.height > minSize && box.height < maxSize;
    }
};

/**
 * @class DetectionAdapter
 * @brief Non-owning front for a Detector used by calibration and tracking.
 */
class DetectionAdapter {
public:
    explicit DetectionAdapter(Detector& detector);

    // Raw detector output for the requested classes
    std::vector<Detection> detect(const cv::Mat& frame,
                                  const std::set<std::string>& classes,
                                  float minConfidence);

    // Detector output restricted to boxes inside the size band
    std::vector<Detection> detect(const cv::Mat& frame,
                                  const std::set<std::string>& classes,
                                  float minConfidence,
                                  const SizeBand& band);

    int getFailedFrames() const { return failedFrames; }

private:
    Detector& detector;
    int failedFrames;
};
