/**
 * @file optical_flow.cpp
 * @brief Dense Farneback optical flow and flow-field sampling.
 */

#include "optical_flow.hpp"
#include <opencv2/imgproc.hpp>
#include <opencv2/video/tracking.hpp>

cv::Mat FarnebackFlow::compute(const cv::Mat& prevGray, const cv::Mat& currGray) {
    cv::Mat flow;
    cv::calcOpticalFlowFarneback(prevGray, currGray, flow,
                                 FarnebackParams::PYR_SCALE, FarnebackParams::LEVELS,
                                 FarnebackParams::WINDOW_SIZE, FarnebackParams::ITERATIONS,
                                 FarnebackParams::POLY_N, FarnebackParams::POLY_SIGMA,
                                 FarnebackParams::FLAGS);
    return flow;
}

cv::Mat toGray(const cv::Mat& frame) {
    cv::Mat gray;
    if (frame.channels() == 3) {
        cv::cvtColor(frame, gray, cv::COLOR_BGR2GRAY);
    } else if (frame.channels() == 4) {
        cv::cvtColor(frame, gray, cv::COLOR_BGRA2GRAY);
    } else {
        gray = frame.clone();
    }
    return gray;
}

bool sampleFlow(const cv::Mat& flow, const cv::Point2f& position, cv::Point2f& displacement) {
    if (flow.empty() || flow.type() != CV_32FC2) return false;

    // Truncate toward zero, matching integer pixel indexing of the track position
    int x = static_cast<int>(position.x);
    int y = static_cast<int>(position.y);
    if (x < 0 || y < 0 || x >= flow.cols || y >= flow.rows) return false;

    const cv::Vec2f& d = flow.at<cv::Vec2f>(y, x);
    displacement = cv::Point2f(d[0], d[1]);
    return true;
}
