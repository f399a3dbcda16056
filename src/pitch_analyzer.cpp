/**
 * @file pitch_analyzer.cpp
 * @brief Implementation of the PitchAnalyzer pipeline.
 *
 * Handles video loading, calibration, the frame-by-frame tracking pass,
 * track selection and speed estimation, and assembles the result object
 * including diagnostics for every failure path.
 */

#include "pitch_analyzer.hpp"
#include "speed_estimator.hpp"
#include "track_selector.hpp"
#include <exception>
#include <iostream>
#include <sstream>

namespace {
const char* const CAPTURE_HINT =
    "Record in a bright place with a plain background.";
const char* const IMPLAUSIBLE_WARNING =
    "Measured speed is outside the plausible range; the mitt may not have been detected correctly.";

AnalysisResult failureResult(ResultKind kind, const std::string& message) {
    AnalysisResult result;
    result.kind = kind;
    result.message = message;
    return result;
}

// Runs one analysis stage and converts anything it throws into a result
template <typename Stage>
AnalysisResult runGuarded(Stage stage) {
    try {
        return stage();
    } catch (const InputFormatError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return failureResult(ResultKind::INPUT_FAILURE, e.what());
    } catch (const cv::Exception& e) {
        std::cerr << "Error: OpenCV failure during analysis: " << e.what() << std::endl;
        return failureResult(ResultKind::PROCESSING_FAILURE,
                             std::string("Analysis failed: ") + e.what());
    } catch (const std::exception& e) {
        std::cerr << "Error: analysis failed: " << e.what() << std::endl;
        return failureResult(ResultKind::PROCESSING_FAILURE,
                             std::string("Analysis failed: ") + e.what());
    }
}
}

// ============================================================================
// Constructor
// ============================================================================

PitchAnalyzer::PitchAnalyzer(const Config& config, Detector& detector, OpticalFlow& flow)
    : config(config), detector(detector), flow(flow) {
}

// ============================================================================
// Entry Points
// ============================================================================

AnalysisResult PitchAnalyzer::analyzeFile(const std::string& path) {
    VideoClip clip = loadVideo(path, config.verbose);
    if (config.verbose) {
        std::cout << "Frames reversed: processing from catch to release" << std::endl;
    }
    return analyzeClip(clip);
}

AnalysisResult PitchAnalyzer::analyze(const std::string& path) {
    return runGuarded([this, &path]() { return analyzeFile(path); });
}

AnalysisResult PitchAnalyzer::analyze(const VideoClip& clip) {
    return runGuarded([this, &clip]() { return analyzeClip(clip); });
}

/**
 * @brief Run every stage on a decoded clip.
 *
 * 1. Estimate slow-motion factor from fps and duration
 * 2. Calibrate scale from mitt detections (resolution fallback)
 * 3. Track ball detections across all frames
 * 4. Select the best track
 * 5. Estimate speed and check plausibility
 */
AnalysisResult PitchAnalyzer::analyzeClip(const VideoClip& clip) {
    AnalysisResult result;
    result.fps = clip.fps;
    result.totalFrames = clip.totalFrames;

    if (clip.empty() || clip.fps <= 0.0) {
        result.kind = ResultKind::INPUT_FAILURE;
        result.message = "Video contains no decodable frames";
        return result;
    }

    // Stage 1: slow-motion correction
    result.slowmoFactor = estimateSlowMotionFactor(clip.fps, clip.totalFrames, config);

    // Stage 2: calibration
    DetectionAdapter detections(detector);
    Calibrator calibrator(config, detections);
    CalibrationResult calibration = calibrator.calibrate(clip);
    result.mittDetected = calibration.mittDetected;
    result.calibrationMethod = calibration.method;
    result.scaleFactor = calibration.scale;

    // Stage 3: tracking
    BallTracker tracker(&flow);
    tracker.configure(config);
    result.detectionCount = trackBall(clip, tracker, detections);
    result.trackCount = static_cast<int>(tracker.getTracks().size());

    if (detections.getFailedFrames() > 0) {
        std::cerr << "Warning: detector failed on " << detections.getFailedFrames()
                  << " frame(s); treated as no detections" << std::endl;
    }

    // Stage 4: selection
    SelectionStats stats;
    const Track* best = selectBestTrack(tracker.getTracks(), config, &stats);

    if (config.verbose) {
        std::cout << "[Tracking] Ball detections: " << result.detectionCount
                  << ", tracks: " << result.trackCount
                  << ", eligible: " << stats.eligibleCount
                  << ", best track: " << stats.longestEligible << " frames" << std::endl;
    }

    if (!best) {
        result.kind = ResultKind::TRACKING_FAILURE;
        result.maxTrackLength = stats.longestOverall;
        std::ostringstream msg;
        msg << "Ball could not be detected (detections: " << result.detectionCount
            << ", longest track: " << stats.longestOverall << " frames). " << CAPTURE_HINT;
        result.message = msg.str();
        return result;
    }

    result.detectedFrames = best->length();
    result.maxTrackLength = best->length();

    // Stage 5: speed
    SpeedResult speed = estimateSpeed(best->positions, clip.fps, calibration.scale,
                                      result.slowmoFactor, config);
    if (!speed.valid) {
        result.kind = ResultKind::SPEED_FAILURE;
        result.message = "Could not compute ball speed";
        return result;
    }

    result.kind = ResultKind::SUCCESS;
    result.speedKmh = speed.speedKmh;
    result.speedMph = speed.speedMph();
    result.rawSpeedMps = speed.rawSpeedMps;
    result.trackingDurationMs = result.detectedFrames / clip.fps * 1000.0;

    if (!isPlausibleSpeed(result.speedKmh, config)) {
        result.hasWarning = true;
        result.warning = IMPLAUSIBLE_WARNING;
        std::cerr << "Warning: implausible speed " << result.speedKmh << " km/h" << std::endl;
    }

    return result;
}

// ============================================================================
// Tracking Pass
// ============================================================================

int PitchAnalyzer::trackBall(const VideoClip& clip, BallTracker& tracker,
                             DetectionAdapter& detections) const {
    SizeBand ballBand{config.ballMinSize, config.ballMaxSize};
    int detectionCount = 0;

    for (const auto& frame : clip.frames) {
        auto balls = detections.detect(frame.image, config.ballClasses, config.ballConfidence, ballBand);
        detectionCount += static_cast<int>(balls.size());
        tracker.update(frame.index, balls, frame.image);
    }

    return detectionCount;
}
