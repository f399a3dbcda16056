/**
 * @file calibration.cpp
 * @brief Mitt-size calibration with resolution fallback.
 */

#include "calibration.hpp"
#include <algorithm>
#include <iostream>

bool isMittCandidate(const cv::Rect2f& box, int frameHeight, const Config& config) {
    if (frameHeight <= 0) return false;

    double height = box.height;
    double width = box.width;
    double sizeRatio = height / frameHeight;

    return height > config.mittMinHeight &&
           height < frameHeight * config.mittMaxFrameFraction &&
           height > width * config.mittMinAspect &&
           sizeRatio > config.mittMinRatio && sizeRatio < config.mittMaxRatio;
}

double medianOf(std::vector<double> values) {
    if (values.empty()) return 0.0;

    std::sort(values.begin(), values.end());
    size_t mid = values.size() / 2;
    if (values.size() % 2 == 1) {
        return values[mid];
    }
    return (values[mid - 1] + values[mid]) / 2.0;
}

double estimateScaleFromResolution(const cv::Size& frameSize, const Config& config) {
    if (frameSize.width <= 0) return 0.0;

    double fieldWidth, coverage;
    if (frameSize.height > frameSize.width) {
        fieldWidth = config.portraitFieldWidth;
        coverage = config.portraitCoverage;
    } else {
        fieldWidth = config.landscapeFieldWidth;
        coverage = config.landscapeCoverage;
    }
    return fieldWidth / (frameSize.width * coverage);
}

CalibrationResult calibrateFromMittHeights(const std::vector<double>& heights,
                                           const cv::Size& frameSize,
                                           const Config& config) {
    CalibrationResult result;
    result.minScale = config.minScale;
    result.maxScale = config.maxScale;
    result.candidateCount = static_cast<int>(heights.size());

    if (result.candidateCount >= config.mittMinCandidates) {
        result.medianMittHeight = medianOf(heights);
        double scale = config.mittHeightMeters / result.medianMittHeight;

        if (scale > config.minScale && scale < config.maxScale) {
            result.scale = scale;
            result.mittDetected = true;
            result.method = CalibrationMethod::MITT;
            return result;
        }
        if (config.verbose) {
            std::cout << "[Calibration] Mitt scale out of range (" << scale
                      << " m/px), using resolution estimate" << std::endl;
        }
    } else if (!heights.empty()) {
        result.medianMittHeight = medianOf(heights);
    }

    result.scale = estimateScaleFromResolution(frameSize, config);
    result.mittDetected = false;
    result.method = CalibrationMethod::RESOLUTION;
    return result;
}

Calibrator::Calibrator(const Config& config, DetectionAdapter& detections)
    : config(config), detections(detections) {
}

CalibrationResult Calibrator::calibrate(const VideoClip& clip) {
    mittHeights.clear();

    cv::Size frameSize = clip.frameSize();
    size_t scanCount = std::min(clip.frames.size(), static_cast<size_t>(std::max(0, config.mittScanFrames)));

    for (size_t i = 0; i < scanCount; i++) {
        auto boxes = detections.detect(clip.frames[i].image, config.mittClasses, config.mittConfidence);
        for (const auto& det : boxes) {
            if (isMittCandidate(det.bbox, frameSize.height, config)) {
                mittHeights.push_back(det.bbox.height);
            }
        }
    }

    CalibrationResult result = calibrateFromMittHeights(mittHeights, frameSize, config);

    if (config.verbose) {
        if (result.mittDetected) {
            std::cout << "[Calibration] Mitt detected: scale = " << result.scale
                      << " m/px (median mitt height " << result.medianMittHeight << " px, "
                      << result.candidateCount << " candidates)" << std::endl;
        } else {
            std::cout << "[Calibration] Mitt not detected (" << result.candidateCount
                      << " candidates): resolution estimate " << frameSize.width << "x"
                      << frameSize.height << " px -> " << result.scale << " m/px" << std::endl;
        }
    }

    return result;
}
