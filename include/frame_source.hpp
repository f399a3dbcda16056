/**
 * @file frame_source.hpp
 * @brief Video decoding into a reversed, indexed frame sequence.
 *
 * The whole clip is decoded up front and reversed so that the catch (mitt
 * visible, ball near rest) is processed first and the release last. The
 * reversal assumes the ball travels toward the catcher at the end of the
 * recorded clip; no check of that assumption is made.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

/**
 * @class InputFormatError
 * @brief Uploaded content cannot be decoded as a supported video.
 */
class InputFormatError : public std::runtime_error {
public:
    explicit InputFormatError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @struct Frame
 * @brief Image buffer plus its index in processing (reversed) order.
 */
struct Frame {
    cv::Mat image;
    int index = 0;
};

/**
 * @struct VideoClip
 * @brief Decoded frames with the container's timing metadata.
 */
struct VideoClip {
    std::vector<Frame> frames;
    double fps = 0.0;
    int totalFrames = 0;        ///< Frame count reported by the container

    bool empty() const { return frames.empty(); }
    cv::Size frameSize() const { return frames.empty() ? cv::Size() : frames.front().image.size(); }
    double duration() const { return fps > 0.0 ? totalFrames / fps : 0.0; }
};

/// True for .mp4, .mov and .avi (case-insensitive)
bool hasSupportedExtension(const std::string& path);

/**
 * @brief Decode a clip and reverse it.
 * @param verbose Print a summary line once the clip is decoded
 * @throws InputFormatError on unsupported extension, open failure,
 *         invalid frame rate, a decode error mid-stream or a clip with no
 *         decodable frames
 */
VideoClip loadVideo(const std::string& path, bool verbose = true);

/// Reverse frame order in place and renumber indices from 0
void reverseFrames(VideoClip& clip);
