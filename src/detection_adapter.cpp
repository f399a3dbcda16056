#include "detection_adapter.hpp"
#include <algorithm>
#include <exception>
#include <iostream>

DetectionAdapter::DetectionAdapter(Detector& detector)
    : detector(detector), failedFrames(0) {
}

std::vector<Detection> DetectionAdapter::detect(const cv::Mat& frame,
                                                const std::set<std::string>& classes,
                                                float minConfidence) {
    try {
        return detector.detect(frame, classes, minConfidence);
    } catch (const cv::Exception& e) {
        std::cerr << "Warning: detection failed for frame: " << e.what() << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Warning: detection failed for frame: " << e.what() << std::endl;
    }
    failedFrames++;
    return {};
}

std::vector<Detection> DetectionAdapter::detect(const cv::Mat& frame,
                                                const std::set<std::string>& classes,
                                                float minConfidence,
                                                const SizeBand& band) {
    std::vector<Detection> detections = detect(frame, classes, minConfidence);
    detections.erase(
        std::remove_if(detections.begin(), detections.end(),
                       [&band](const Detection& d) { return !band.contains(d.bbox); }),
        detections.end());
    return detections;
}
