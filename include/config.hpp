/**
 * @file config.hpp
 * @brief Centralized configuration for all tunable parameters.
 *
 * Provides default values and runtime configuration for detection thresholds,
 * mitt calibration, ball tracking, track selection, speed estimation and
 * slow-motion correction. Can load settings from YAML config file.
 */

#pragma once

#include <string>
#include <vector>
#include <set>
#include <opencv2/core.hpp>
#include <iostream>

/**
 * @struct Config
 * @brief Centralized configuration for all tunable parameters.
 */
struct Config {
    // Detection settings
    float ballConfidence = 0.01f;     // Ball detector threshold (low to maximize recall)
    float ballMinSize = 5.0f;         // Exclusive lower bound on ball box width/height (px)
    float ballMaxSize = 200.0f;       // Exclusive upper bound on ball box width/height (px)
    float nmsThreshold = 0.45f;       // Non-maximum suppression threshold
    int inputSize = 640;              // YOLO input size
    std::set<std::string> ballClasses = {"sports ball"};
    std::set<std::string> mittClasses = {"baseball glove"};

    // Mitt calibration
    int mittScanFrames = 60;          // Frames scanned from the catch end of the clip
    float mittConfidence = 0.2f;
    double mittHeightMeters = 0.32;   // Real-world catcher's mitt height
    double mittMinHeight = 50.0;      // px
    double mittMaxFrameFraction = 0.5;
    double mittMinAspect = 0.7;       // height must exceed this multiple of width
    double mittMinRatio = 0.05;       // height / frame height lower bound (exclusive)
    double mittMaxRatio = 0.3;        // height / frame height upper bound (exclusive)
    int mittMinCandidates = 4;
    double minScale = 0.001;          // m/px, exclusive
    double maxScale = 0.1;            // m/px, exclusive

    // Resolution fallback
    double portraitFieldWidth = 11.0;   // m
    double portraitCoverage = 1.0;
    double landscapeFieldWidth = 18.0;  // m
    double landscapeCoverage = 0.7;

    // Tracker settings
    float associationGate = 150.0f;   // Max centroid distance for detection-track matching (px)

    // Track selection
    int minTrackLength = 5;           // Positions required for a track to be considered
    double minTrackDisplacement = 10.0; // First-to-last distance (px), exclusive
    int maxTrackLength = 150;         // Longer tracks are treated as static false positives

    // Speed estimation
    double keepFraction = 0.75;       // Fastest share of intervals kept
    double averageFraction = 0.5;     // Fastest share of kept intervals averaged

    // Slow-motion correction
    double slowMotionMaxFps = 60.0;
    double slowMotionMinDuration = 2.0; // s
    double pitchFlightDuration = 0.5;   // s, assumed real pitch duration

    // Plausibility band (km/h)
    double minPlausibleSpeed = 10.0;
    double maxPlausibleSpeed = 200.0;

    // Model paths
    std::string yoloPath = "../models/yolov8n.onnx";
    std::string classesPath;  // Path to class names file (one per line); empty = COCO defaults

    // Logging
    bool verbose = true;

    // Load configuration from YAML file (OpenCV YAML requires %YAML:1.0 header)
    bool loadFromFile(const std::string& configPath) {
        cv::FileStorage fs;
        try {
            fs.open(configPath, cv::FileStorage::READ);
        } catch (const cv::Exception&) {
            std::cerr << "Warning: Invalid config file: " << configPath << std::endl;
            return false;
        }
        if (!fs.isOpened()) {
            return false;
        }

        // Detection settings
        if (!fs["detection"].empty()) {
            cv::FileNode detection = fs["detection"];
            if (!detection["ball_confidence"].empty()) detection["ball_confidence"] >> ballConfidence;
            if (!detection["ball_min_size"].empty()) detection["ball_min_size"] >> ballMinSize;
            if (!detection["ball_max_size"].empty()) detection["ball_max_size"] >> ballMaxSize;
            if (!detection["nms_threshold"].empty()) detection["nms_threshold"] >> nmsThreshold;
            if (!detection["input_size"].empty()) detection["input_size"] >> inputSize;
            readClassList(detection["ball_classes"], ballClasses);
            readClassList(detection["mitt_classes"], mittClasses);
        }

        // Calibration settings
        if (!fs["calibration"].empty()) {
            cv::FileNode calibration = fs["calibration"];
            if (!calibration["scan_frames"].empty()) calibration["scan_frames"] >> mittScanFrames;
            if (!calibration["mitt_confidence"].empty()) calibration["mitt_confidence"] >> mittConfidence;
            if (!calibration["mitt_height_m"].empty()) calibration["mitt_height_m"] >> mittHeightMeters;
            if (!calibration["mitt_min_height"].empty()) calibration["mitt_min_height"] >> mittMinHeight;
            if (!calibration["mitt_max_frame_fraction"].empty()) calibration["mitt_max_frame_fraction"] >> mittMaxFrameFraction;
            if (!calibration["mitt_min_aspect"].empty()) calibration["mitt_min_aspect"] >> mittMinAspect;
            if (!calibration["mitt_min_ratio"].empty()) calibration["mitt_min_ratio"] >> mittMinRatio;
            if (!calibration["mitt_max_ratio"].empty()) calibration["mitt_max_ratio"] >> mittMaxRatio;
            if (!calibration["min_candidates"].empty()) calibration["min_candidates"] >> mittMinCandidates;
            if (!calibration["min_scale"].empty()) calibration["min_scale"] >> minScale;
            if (!calibration["max_scale"].empty()) calibration["max_scale"] >> maxScale;
            if (!calibration["portrait_field_width_m"].empty()) calibration["portrait_field_width_m"] >> portraitFieldWidth;
            if (!calibration["portrait_coverage"].empty()) calibration["portrait_coverage"] >> portraitCoverage;
            if (!calibration["landscape_field_width_m"].empty()) calibration["landscape_field_width_m"] >> landscapeFieldWidth;
            if (!calibration["landscape_coverage"].empty()) calibration["landscape_coverage"] >> landscapeCoverage;
        }

        // Tracker settings
        if (!fs["tracker"].empty()) {
            cv::FileNode tracker = fs["tracker"];
            if (!tracker["association_gate"].empty()) tracker["association_gate"] >> associationGate;
            if (!tracker["min_track_length"].empty()) tracker["min_track_length"] >> minTrackLength;
            if (!tracker["min_displacement"].empty()) tracker["min_displacement"] >> minTrackDisplacement;
            if (!tracker["max_track_length"].empty()) tracker["max_track_length"] >> maxTrackLength;
        }

        // Speed settings
        if (!fs["speed"].empty()) {
            cv::FileNode speed = fs["speed"];
            if (!speed["keep_fraction"].empty()) speed["keep_fraction"] >> keepFraction;
            if (!speed["average_fraction"].empty()) speed["average_fraction"] >> averageFraction;
            if (!speed["slowmo_max_fps"].empty()) speed["slowmo_max_fps"] >> slowMotionMaxFps;
            if (!speed["slowmo_min_duration"].empty()) speed["slowmo_min_duration"] >> slowMotionMinDuration;
            if (!speed["pitch_duration"].empty()) speed["pitch_duration"] >> pitchFlightDuration;
            if (!speed["min_plausible_kmh"].empty()) speed["min_plausible_kmh"] >> minPlausibleSpeed;
            if (!speed["max_plausible_kmh"].empty()) speed["max_plausible_kmh"] >> maxPlausibleSpeed;
        }

        // Model paths
        if (!fs["models"].empty()) {
            cv::FileNode models = fs["models"];
            if (!models["yolo"].empty()) models["yolo"] >> yoloPath;
            if (!models["classes_file"].empty()) models["classes_file"] >> classesPath;
        }

        if (!fs["verbose"].empty()) {
            int v = 1;
            fs["verbose"] >> v;
            verbose = (v != 0);
        }

        if (verbose) {
            std::cout << "Loaded config from: " << configPath << std::endl;
        }

        fs.release();
        return true;
    }

    // Print current configuration
    void print() const {
        std::cout << "=== PitchSpeed Configuration ===" << std::endl;
        std::cout << "Detection:" << std::endl;
        std::cout << "  ball_confidence: " << ballConfidence << std::endl;
        std::cout << "  ball_size: (" << ballMinSize << ", " << ballMaxSize << ") px" << std::endl;
        std::cout << "Calibration:" << std::endl;
        std::cout << "  scan_frames: " << mittScanFrames << std::endl;
        std::cout << "  mitt_confidence: " << mittConfidence << std::endl;
        std::cout << "  mitt_height_m: " << mittHeightMeters << std::endl;
        std::cout << "  mitt_height_px: (" << mittMinHeight << ", " << mittMaxFrameFraction
                  << " x frame height)" << std::endl;
        std::cout << "  mitt_ratio: (" << mittMinRatio << ", " << mittMaxRatio << ")" << std::endl;
        std::cout << "Tracker:" << std::endl;
        std::cout << "  association_gate: " << associationGate << std::endl;
        std::cout << "  track_length: [" << minTrackLength << ", " << maxTrackLength << "]" << std::endl;
        std::cout << "Speed:" << std::endl;
        std::cout << "  keep_fraction: " << keepFraction << std::endl;
        std::cout << "  pitch_duration: " << pitchFlightDuration << std::endl;
        std::cout << "Models:" << std::endl;
        std::cout << "  yolo: " << yoloPath << std::endl;
        std::cout << "Ball classes: ";
        for (const auto& c : ballClasses) std::cout << c << " ";
        std::cout << std::endl;
        std::cout << "Mitt classes: ";
        for (const auto& c : mittClasses) std::cout << c << " ";
        std::cout << std::endl;
        std::cout << "================================" << std::endl;
    }

private:
    static void readClassList(const cv::FileNode& node, std::set<std::string>& out) {
        if (node.empty()) return;
        out.clear();
        for (auto it = node.begin(); it != node.end(); ++it) {
            std::string cls;
            *it >> cls;
            if (!cls.empty()) out.insert(cls);
        }
    }
};
