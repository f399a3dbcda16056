#include "frame_source.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <string>
#include <opencv2/videoio.hpp>

bool hasSupportedExtension(const std::string& path) {
    auto dot = path.find_last_of('.');
    if (dot == std::string::npos) return false;

    std::string ext = path.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == "mp4" || ext == "mov" || ext == "avi";
}

void reverseFrames(VideoClip& clip) {
    std::reverse(clip.frames.begin(), clip.frames.end());
    for (size_t i = 0; i < clip.frames.size(); i++) {
        clip.frames[i].index = static_cast<int>(i);
    }
}

VideoClip loadVideo(const std::string& path, bool verbose) {
    if (!hasSupportedExtension(path)) {
        throw InputFormatError("Unsupported video format (expected mp4, mov or avi): " + path);
    }

    cv::VideoCapture cap;
    try {
        cap.open(path);
    } catch (const cv::Exception& e) {
        throw InputFormatError("Cannot decode video: " + path + " (" + e.what() + ")");
    }
    if (!cap.isOpened()) {
        throw InputFormatError("Cannot open video: " + path);
    }

    VideoClip clip;
    clip.fps = cap.get(cv::CAP_PROP_FPS);
    clip.totalFrames = static_cast<int>(cap.get(cv::CAP_PROP_FRAME_COUNT));
    if (clip.fps <= 0.0) {
        throw InputFormatError("Video reports an invalid frame rate: " + path);
    }

    cv::Mat image;
    try {
        while (cap.read(image)) {
            if (image.empty()) break;
            clip.frames.push_back({image.clone(), static_cast<int>(clip.frames.size())});
        }
    } catch (const cv::Exception& e) {
        throw InputFormatError("Decoding failed after " + std::to_string(clip.frames.size()) +
                               " frames: " + path + " (" + e.what() + ")");
    }
    cap.release();

    if (clip.frames.empty()) {
        throw InputFormatError("No frames could be decoded: " + path);
    }

    if (verbose) {
        std::cout << "Video loaded: " << clip.frames.size() << " frames (container reports "
                  << clip.totalFrames << "), " << clip.fps << " fps" << std::endl;
    }

    reverseFrames(clip);
    return clip;
}
