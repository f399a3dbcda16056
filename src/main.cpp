/**
 * @file main.cpp
 * @brief Command-line entry point: analyze one pitch video and print JSON.
 */

#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "config.hpp"
#include "optical_flow.hpp"
#include "pitch_analyzer.hpp"
#include "yolo_detector.hpp"

namespace {

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " <video_file> [yolo_model] [output_json]" << std::endl;
    std::cerr << "  video_file: .mp4, .mov or .avi clip of one pitch" << std::endl;
}

bool writeResult(const std::string& path, const std::string& json) {
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        std::cerr << "Error: Cannot write result file: " << path << std::endl;
        return false;
    }
    ofs << json << std::endl;
    return true;
}

// Every result, success or failure, leaves through here
int emitResult(const AnalysisResult& result, const std::string& outputPath) {
    std::string json = result.toJson();
    std::cout << json << std::endl;

    bool written = outputPath.empty() || writeResult(outputPath, json);
    bool fatal = result.kind == ResultKind::INPUT_FAILURE ||
                 result.kind == ResultKind::PROCESSING_FAILURE;
    return (written && !fatal) ? 0 : 1;
}

}  // namespace

int main(int argc, char** argv) {
    Config config;

    // Look for config in common locations
    std::vector<std::string> configPaths = {
        "config/pitchspeed.yaml",
        "../config/pitchspeed.yaml",
        "pitchspeed.yaml"
    };

    for (const auto& path : configPaths) {
        if (config.loadFromFile(path)) {
            break;
        }
    }

    // Parse command line arguments (override config)
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }
    std::string videoPath = argv[1];
    if (argc > 2) {
        config.yoloPath = argv[2];
    }
    std::string outputPath = argc > 3 ? argv[3] : "";

    if (config.verbose) {
        config.print();
    }

    YoloDetector detector;
    detector.setVerbose(config.verbose);
    if (!detector.load(config.yoloPath, config.classesPath)) {
        AnalysisResult result;
        result.kind = ResultKind::PROCESSING_FAILURE;
        result.message = "Cannot load YOLO model: " + config.yoloPath;
        std::cerr << "Error: " << result.message << std::endl;
        return emitResult(result, outputPath);
    }
    detector.setNmsThreshold(config.nmsThreshold);
    detector.setInputSize(config.inputSize);
    detector.tryEnableGPU();
    if (config.verbose) {
        std::cout << "YOLO detection backend: " << detector.getBackendName() << std::endl;
    }

    FarnebackFlow flow;
    PitchAnalyzer analyzer(config, detector, flow);
    return emitResult(analyzer.analyze(videoPath), outputPath);
}
