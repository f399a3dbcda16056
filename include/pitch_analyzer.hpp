/**
 * @file pitch_analyzer.hpp
 * @brief End-to-end pitch speed analysis of one video clip.
 *
 * Runs the stages in order: slow-motion estimate, mitt calibration, ball
 * tracking over every frame, track selection and speed estimation. Each
 * call owns its tracker and results; nothing is shared between calls.
 */

#pragma once

#include <string>

#include "analysis_result.hpp"
#include "ball_tracker.hpp"
#include "calibration.hpp"
#include "config.hpp"
#include "detector.hpp"
#include "frame_source.hpp"
#include "optical_flow.hpp"

/**
 * @class PitchAnalyzer
 * @brief Synchronous, single-threaded analysis pipeline.
 *
 * The detector and optical flow are borrowed and must outlive the analyzer.
 */
class PitchAnalyzer {
public:
    PitchAnalyzer(const Config& config, Detector& detector, OpticalFlow& flow);

    /**
     * @brief Decode and analyze a video file.
     * @throws InputFormatError when the file is not a decodable mp4/mov/avi clip
     */
    AnalysisResult analyzeFile(const std::string& path);

    /// Analyze an already decoded, reversed clip
    AnalysisResult analyzeClip(const VideoClip& clip);

    /**
     * @brief Guarded variants of analyzeFile() and analyzeClip().
     *
     * Never throw. InputFormatError becomes an INPUT_FAILURE result; any
     * other cv::Exception or std::exception ends the run with a
     * PROCESSING_FAILURE result carrying the error text.
     */
    AnalysisResult analyze(const std::string& path);
    AnalysisResult analyze(const VideoClip& clip);

private:
    // Tracking pass over all frames; returns the number of ball detections kept
    int trackBall(const VideoClip& clip, BallTracker& tracker, DetectionAdapter& detections) const;

    const Config& config;
    Detector& detector;
    OpticalFlow& flow;
};
