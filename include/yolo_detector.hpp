/**
 * @file yolo_detector.hpp
 * @brief YOLO object detector wrapper for OpenCV DNN.
 *
 * Supports YOLOv5, YOLOv8, and YOLOv11 ONNX models with automatic format detection.
 * Handles letterbox preprocessing to maintain aspect ratio and supports CUDA,
 * OpenCL, and CPU backends for inference.
 */

#pragma once

#include <set>
#include <vector>
#include <string>
#include <opencv2/opencv.hpp>
#include <opencv2/dnn.hpp>

#include "detector.hpp"

/**
 * @class YoloDetector
 * @brief YOLO-based object detector supporting YOLOv5/v8/v11 ONNX models.
 *
 * Preprocessing: Letterbox resize maintains aspect ratio with gray padding (114).
 * Postprocessing: Auto-detects output format (v5 vs v8/v11), keeps only the
 * requested classes above the requested confidence and applies NMS.
 */
class YoloDetector : public Detector {
public:
    // Preprocessing constants
    static constexpr int LETTERBOX_PAD_VALUE = 114;      // Standard YOLO padding (gray)
    static constexpr double NORMALIZATION_FACTOR = 1.0 / 255.0;

    YoloDetector();
    ~YoloDetector() override;

    // Load YOLO ONNX model
    bool load(const std::string& modelPath, const std::string& classesPath = "");

    // Run detection on frame, restricted to the named classes
    std::vector<Detection> detect(const cv::Mat& frame,
                                  const std::set<std::string>& classes,
                                  float minConfidence) override;

    void setNmsThreshold(float thresh) { nmsThreshold = thresh; }
    void setInputSize(int size) { inputSize = size; }
    void setVerbose(bool on) { verbose = on; }

    // Backend selection (call before load() or use tryEnableGPU() after load())
    void setBackend(cv::dnn::Backend backend, cv::dnn::Target target);
    bool tryEnableGPU();  // Auto-detect and enable CUDA/OpenCL if available

    bool isLoaded() const { return loaded; }
    std::string getBackendName() const;

    // Class ids whose names are in the given set (unknown names are ignored)
    std::vector<int> resolveClassIds(const std::set<std::string>& classes) const;

private:
    cv::dnn::Net net;
    std::vector<std::string> classNames;
    bool loaded;

    // Parameters
    float nmsThreshold;
    int inputSize;
    bool verbose;

    // Backend
    cv::dnn::Backend backend;
    cv::dnn::Target target;

    // Letterbox state (for coordinate conversion)
    float letterboxScale;
    int letterboxPadX;
    int letterboxPadY;

    // Preprocessing with letterbox (maintains aspect ratio)
    cv::Mat preprocess(const cv::Mat& frame);

    // Postprocessing (handles YOLOv5/v8/v11 output format)
    std::vector<Detection> postprocess(const cv::Mat& frame, const std::vector<cv::Mat>& outputs,
                                       const std::vector<int>& classIds, float minConfidence);

    cv::Rect2f toFrameRect(float cx, float cy, float w, float h, const cv::Mat& frame) const;
};
