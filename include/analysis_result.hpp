/**
 * @file analysis_result.hpp
 * @brief Outcome of one pitch analysis and its JSON rendering.
 */

#pragma once

#include <string>

/// Which stage produced the result; decides the fields that are reported
enum class ResultKind {
    SUCCESS,
    TRACKING_FAILURE,   ///< No track met the eligibility rules
    SPEED_FAILURE,      ///< Selected track gave no usable interval
    INPUT_FAILURE,      ///< Video could not be decoded
    PROCESSING_FAILURE  ///< Model or pipeline error outside the per-frame detector guard
};

/**
 * @struct AnalysisResult
 * @brief All values reported to the caller, unrounded.
 *
 * Rounding happens in toJson(): speeds, durations and the slow-motion factor
 * to one decimal, the scale factor to six.
 */
struct AnalysisResult {
    ResultKind kind = ResultKind::INPUT_FAILURE;
    std::string message;

    double speedKmh = 0.0;
    double speedMph = 0.0;
    double rawSpeedMps = 0.0;
    int detectedFrames = 0;       ///< Positions in the winning (or longest eligible) track
    double fps = 0.0;
    int totalFrames = 0;
    double trackingDurationMs = 0.0;

    bool mittDetected = false;
    std::string calibrationMethod;
    double scaleFactor = 0.0;
    double slowmoFactor = 1.0;

    int detectionCount = 0;       ///< Ball detections that passed the size filter
    int trackCount = 0;
    int maxTrackLength = 0;

    bool hasWarning = false;
    std::string warning;

    bool success() const { return kind == ResultKind::SUCCESS; }

    std::string toJson() const;
};

/// Round half away from zero to the given number of decimals
double roundTo(double value, int decimals);
