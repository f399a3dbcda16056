/**
 * @file yolo_detector.cpp
 * @brief YOLO ONNX detector: model loading, letterbox preprocessing and
 * class-filtered postprocessing.
 */

#include "yolo_detector.hpp"
#include <opencv2/core/ocl.hpp>
#include <algorithm>
#include <fstream>
#include <iostream>

YoloDetector::YoloDetector()
    : loaded(false), nmsThreshold(0.45f), inputSize(640), verbose(true),
      backend(cv::dnn::DNN_BACKEND_OPENCV), target(cv::dnn::DNN_TARGET_CPU),
      letterboxScale(1.0f), letterboxPadX(0), letterboxPadY(0) {
}

YoloDetector::~YoloDetector() {
}

bool YoloDetector::load(const std::string& modelPath, const std::string& classesPath) {
    try {
        net = cv::dnn::readNetFromONNX(modelPath);
        net.setPreferableBackend(backend);
        net.setPreferableTarget(target);

        // Load class names if provided
        classNames.clear();
        if (!classesPath.empty()) {
            std::ifstream ifs(classesPath);
            if (ifs.is_open()) {
                std::string line;
                while (std::getline(ifs, line)) {
                    if (!line.empty()) {
                        classNames.push_back(line);
                    }
                }
            } else {
                std::cerr << "Warning: Could not open classes file: " << classesPath << std::endl;
            }
        }

        // Default COCO classes if not provided
        if (classNames.empty()) {
            classNames = {
                "person", "bicycle", "car", "motorcycle", "airplane", "bus", "train", "truck",
                "boat", "traffic light", "fire hydrant", "stop sign", "parking meter", "bench",
                "bird", "cat", "dog", "horse", "sheep", "cow", "elephant", "bear", "zebra",
                "giraffe", "backpack", "umbrella", "handbag", "tie", "suitcase", "frisbee",
                "skis", "snowboard", "sports ball", "kite", "baseball bat", "baseball glove",
                "skateboard", "surfboard", "tennis racket", "bottle", "wine glass", "cup",
                "fork", "knife", "spoon", "bowl", "banana", "apple", "sandwich", "orange",
                "broccoli", "carrot", "hot dog", "pizza", "donut", "cake", "chair", "couch",
                "potted plant", "bed", "dining table", "toilet", "tv", "laptop", "mouse",
                "remote", "keyboard", "cell phone", "microwave", "oven", "toaster", "sink",
                "refrigerator", "book", "clock", "vase", "scissors", "teddy bear", "hair drier",
                "toothbrush"
            };
        }

        loaded = true;
        if (verbose) {
            std::cout << "YOLO model loaded: " << modelPath << std::endl;
            std::cout << "Classes: " << classNames.size() << std::endl;
        }
        return true;

    } catch (const cv::Exception& e) {
        std::cerr << "Error loading YOLO model: " << e.what() << std::endl;
        loaded = false;
        return false;
    }
}

void YoloDetector::setBackend(cv::dnn::Backend newBackend, cv::dnn::Target newTarget) {
    backend = newBackend;
    target = newTarget;
    if (loaded) {
        net.setPreferableBackend(backend);
        net.setPreferableTarget(target);
    }
}

/// Prefer CUDA, then OpenCL; stay on CPU when neither is available
bool YoloDetector::tryEnableGPU() {
    if (!loaded) return false;

    auto cudaTargets = cv::dnn::getAvailableTargets(cv::dnn::DNN_BACKEND_CUDA);
    if (std::find(cudaTargets.begin(), cudaTargets.end(), cv::dnn::DNN_TARGET_CUDA) != cudaTargets.end()) {
        setBackend(cv::dnn::DNN_BACKEND_CUDA, cv::dnn::DNN_TARGET_CUDA);
        return true;
    }

    if (cv::ocl::haveOpenCL()) {
        setBackend(cv::dnn::DNN_BACKEND_OPENCV, cv::dnn::DNN_TARGET_OPENCL);
        return true;
    }

    setBackend(cv::dnn::DNN_BACKEND_OPENCV, cv::dnn::DNN_TARGET_CPU);
    return false;
}

std::string YoloDetector::getBackendName() const {
    if (backend == cv::dnn::DNN_BACKEND_CUDA) return "CUDA";
    if (target == cv::dnn::DNN_TARGET_OPENCL) return "OpenCL";
    return "CPU";
}

std::vector<int> YoloDetector::resolveClassIds(const std::set<std::string>& classes) const {
    std::vector<int> ids;
    for (size_t i = 0; i < classNames.size(); i++) {
        if (classes.count(classNames[i])) {
            ids.push_back(static_cast<int>(i));
        }
    }
    return ids;
}

cv::Mat YoloDetector::preprocess(const cv::Mat& frame) {
    // Letterbox resize: maintain aspect ratio with padding
    int imgWidth = frame.cols;
    int imgHeight = frame.rows;

    // Calculate scale to fit in inputSize while maintaining aspect ratio
    float scaleX = static_cast<float>(inputSize) / imgWidth;
    float scaleY = static_cast<float>(inputSize) / imgHeight;
    letterboxScale = std::min(scaleX, scaleY);

    int newWidth = static_cast<int>(imgWidth * letterboxScale);
    int newHeight = static_cast<int>(imgHeight * letterboxScale);

    // Calculate padding (center the image)
    letterboxPadX = (inputSize - newWidth) / 2;
    letterboxPadY = (inputSize - newHeight) / 2;

    cv::Mat resized;
    cv::resize(frame, resized, cv::Size(newWidth, newHeight), 0, 0, cv::INTER_LINEAR);

    cv::Mat letterboxed(inputSize, inputSize, CV_8UC3,
                        cv::Scalar(LETTERBOX_PAD_VALUE, LETTERBOX_PAD_VALUE, LETTERBOX_PAD_VALUE));
    resized.copyTo(letterboxed(cv::Rect(letterboxPadX, letterboxPadY, newWidth, newHeight)));

    // Convert to blob: normalize, swap RB, CHW format
    cv::Mat blob;
    cv::dnn::blobFromImage(letterboxed, blob, NORMALIZATION_FACTOR, cv::Size(inputSize, inputSize),
                           cv::Scalar(), true, false);
    return blob;
}

std::vector<Detection> YoloDetector::detect(const cv::Mat& frame,
                                            const std::set<std::string>& classes,
                                            float minConfidence) {
    if (!loaded || frame.empty()) {
        return {};
    }

    std::vector<int> classIds = resolveClassIds(classes);
    if (classIds.empty()) {
        return {};
    }

    cv::Mat blob = preprocess(frame);
    net.setInput(blob);

    std::vector<cv::Mat> outputs;
    net.forward(outputs, net.getUnconnectedOutLayersNames());

    return postprocess(frame, outputs, classIds, minConfidence);
}

/// Convert a letterboxed center/size box to frame coordinates, clamped to the image
cv::Rect2f YoloDetector::toFrameRect(float cx, float cy, float w, float h,
                                     const cv::Mat& frame) const {
    float left = (cx - w / 2 - letterboxPadX) / letterboxScale;
    float top = (cy - h / 2 - letterboxPadY) / letterboxScale;
    float right = left + w / letterboxScale;
    float bottom = top + h / letterboxScale;

    left = std::max(0.0f, std::min(left, static_cast<float>(frame.cols - 1)));
    top = std::max(0.0f, std::min(top, static_cast<float>(frame.rows - 1)));
    right = std::max(left, std::min(right, static_cast<float>(frame.cols)));
    bottom = std::max(top, std::min(bottom, static_cast<float>(frame.rows)));

    return cv::Rect2f(left, top, right - left, bottom - top);
}

std::vector<Detection> YoloDetector::postprocess(const cv::Mat& frame,
                                                 const std::vector<cv::Mat>& outputs,
                                                 const std::vector<int>& classIds,
                                                 float minConfidence) {
    std::vector<Detection> detections;
    std::vector<int> boxClassIds;
    std::vector<float> confidences;
    std::vector<cv::Rect2d> boxes;

    if (outputs.empty()) {
        return detections;
    }

    // YOLOv8/v11: [1, 84, 8400] where 84 = 4 coords + 80 classes, 8400 = predictions
    // YOLOv5: [1, 25200, 85] where 85 = 4 coords + 1 objectness + 80 classes
    const cv::Mat& output = outputs[0];
    int dim1 = output.size[1];
    int dim2 = output.size[2];
    bool isV8Format = (dim2 > dim1);

    int rows, cols;
    cv::Mat output2d;

    if (isV8Format) {
        // Data layout is features x predictions; transpose to predictions x features
        cv::Mat temp(dim1, dim2, CV_32F, output.data);
        cv::transpose(temp, output2d);
        rows = output2d.rows;
        cols = output2d.cols;
    } else {
        output2d = cv::Mat(dim1, dim2, CV_32F, output.data);
        rows = dim1;
        cols = dim2;
    }

    const int scoreOffset = isV8Format ? 4 : 5;
    const int numClasses = cols - scoreOffset;
    const float* data = reinterpret_cast<const float*>(output2d.data);

    for (int i = 0; i < rows; i++) {
        const float* row = data + i * cols;
        float objectness = isV8Format ? 1.0f : row[4];
        if (objectness <= minConfidence) continue;

        // Best score among the requested classes only
        int bestClass = -1;
        float bestScore = 0.0f;
        for (int id : classIds) {
            if (id >= numClasses) continue;
            float score = objectness * row[scoreOffset + id];
            if (score > bestScore) {
                bestScore = score;
                bestClass = id;
            }
        }

        if (bestClass < 0 || bestScore <= minConfidence) continue;

        cv::Rect2f box = toFrameRect(row[0], row[1], row[2], row[3], frame);
        if (box.width > 0 && box.height > 0) {
            boxes.emplace_back(box.x, box.y, box.width, box.height);
            confidences.push_back(bestScore);
            boxClassIds.push_back(bestClass);
        }
    }

    std::vector<int> indices;
    cv::dnn::NMSBoxes(boxes, confidences, minConfidence, nmsThreshold, indices);

    for (int idx : indices) {
        Detection det;
        det.bbox = cv::Rect2f(static_cast<float>(boxes[idx].x), static_cast<float>(boxes[idx].y),
                              static_cast<float>(boxes[idx].width), static_cast<float>(boxes[idx].height));
        det.confidence = confidences[idx];
        det.className = classNames[boxClassIds[idx]];
        detections.push_back(det);
    }

    return detections;
}
