/**
 * @file calibration.hpp
 * @brief Pixel-to-metre scale estimation.
 *
 * Primary method measures the catcher's mitt in the frames near the catch and
 * divides its known real-world height by the median detected pixel height.
 * When too few plausible mitt boxes are found, or the resulting scale is out
 * of bounds, the scale is estimated from the frame resolution and orientation.
 */

#pragma once

#include <string>
#include <vector>
#include <opencv2/core.hpp>

#include "config.hpp"
#include "detection_adapter.hpp"
#include "frame_source.hpp"

/// Labels reported in the result's calibration_method field
namespace CalibrationMethod {
    constexpr const char* MITT = "mitt_auto_detection";
    constexpr const char* RESOLUTION = "resolution_estimate";
}

/**
 * @struct CalibrationResult
 * @brief Metres-per-pixel scale and how it was obtained.
 */
struct CalibrationResult {
    double scale = 0.0;            ///< m/px
    bool mittDetected = false;     ///< true if the mitt-based scale was accepted
    std::string method = CalibrationMethod::RESOLUTION;
    double medianMittHeight = 0.0; ///< px, 0 when no candidates were found
    int candidateCount = 0;
    double minScale = 0.0;         ///< Exclusive validity bounds applied to mitt scales
    double maxScale = 0.0;
};

/**
 * @brief Check a detected box against the mitt shape and size rules.
 *
 * Mitts appear taller than wide and occupy a bounded share of the frame
 * height when filmed from behind the plate.
 */
bool isMittCandidate(const cv::Rect2f& box, int frameHeight, const Config& config);

/// Median of the values (mean of the two middle values for even counts); 0 for empty input
double medianOf(std::vector<double> values);

/**
 * @brief Resolution/orientation based scale estimate.
 *
 * Portrait clips are assumed to be zoomed in so the frame width covers the
 * whole assumed field; landscape clips cover a wider scene of which only part
 * is the region of interest.
 */
double estimateScaleFromResolution(const cv::Size& frameSize, const Config& config);

/**
 * @brief Turn accepted mitt heights into a calibration, falling back when needed.
 * @param heights Pixel heights of boxes that passed isMittCandidate()
 * @param frameSize Frame size used by the fallback
 */
CalibrationResult calibrateFromMittHeights(const std::vector<double>& heights,
                                           const cv::Size& frameSize,
                                           const Config& config);

/**
 * @class Calibrator
 * @brief Scans the catch end of a clip for mitt detections.
 */
class Calibrator {
public:
    Calibrator(const Config& config, DetectionAdapter& detections);

    CalibrationResult calibrate(const VideoClip& clip);

    // Heights of mitt candidates found during the last calibrate() call
    const std::vector<double>& getMittHeights() const { return mittHeights; }

private:
    const Config& config;
    DetectionAdapter& detections;
    std::vector<double> mittHeights;
};
