/**
 * @file optical_flow.hpp
 * @brief Dense optical flow between consecutive grayscale frames.
 *
 * The tracker samples the flow field at a track's last position to predict
 * where the ball will be in the next frame. FarnebackFlow is the OpenCV
 * implementation; tests substitute deterministic fields.
 */

#pragma once

#include <opencv2/core.hpp>

/// Farneback algorithm parameters
namespace FarnebackParams {
    constexpr double PYR_SCALE = 0.5;
    constexpr int LEVELS = 3;
    constexpr int WINDOW_SIZE = 15;
    constexpr int ITERATIONS = 3;
    constexpr int POLY_N = 5;
    constexpr double POLY_SIGMA = 1.2;
    constexpr int FLAGS = 0;
}

/**
 * @class OpticalFlow
 * @brief Black-box dense flow: two grayscale frames -> CV_32FC2 displacement field.
 */
class OpticalFlow {
public:
    virtual ~OpticalFlow() = default;

    /**
     * @param prevGray Previous frame in grayscale
     * @param currGray Current frame in grayscale
     * @return Per-pixel (dx, dy) field with the size of the inputs
     */
    virtual cv::Mat compute(const cv::Mat& prevGray, const cv::Mat& currGray) = 0;
};

/**
 * @class FarnebackFlow
 * @brief Gunnar Farneback dense optical flow (cv::calcOpticalFlowFarneback).
 */
class FarnebackFlow : public OpticalFlow {
public:
    cv::Mat compute(const cv::Mat& prevGray, const cv::Mat& currGray) override;
};

/**
 * @brief Convert a BGR/BGRA frame to single-channel grayscale.
 *
 * Single-channel input is returned as a copy.
 */
cv::Mat toGray(const cv::Mat& frame);

/**
 * @brief Sample a flow field at an integer pixel position.
 * @param flow CV_32FC2 displacement field
 * @param position Sub-pixel position; truncated to integer pixel coordinates
 * @param displacement Receives the (dx, dy) sample
 * @return false if the position lies outside the field
 */
bool sampleFlow(const cv::Mat& flow, const cv::Point2f& position, cv::Point2f& displacement);
