/**
 * @file ball_tracker.cpp
 * @brief Implementation of flow-assisted centroid tracking.
 */

#include "ball_tracker.hpp"
#include <cmath>

// ============================================================================
// Constructor / Configuration
// ============================================================================

BallTracker::BallTracker()
    : nextId(0), associationGate(150.0f), flow(nullptr) {
}

BallTracker::BallTracker(OpticalFlow* flow)
    : nextId(0), associationGate(150.0f), flow(flow) {
}

void BallTracker::configure(const Config& config) {
    associationGate = config.associationGate;
}

TrackState BallTracker::getState(const Track& track, int frameIndex) {
    return track.lastSeen == frameIndex - 1 ? TrackState::ACTIVE : TrackState::STALE;
}

void BallTracker::clear() {
    tracks.clear();
    prevGray.release();
}

// ============================================================================
// Update Pipeline
// ============================================================================

/**
 * @brief Stage 1: predict next positions from dense optical flow.
 *
 * Flow is only computed once a previous frame and at least one track exist.
 * The current grayscale frame always becomes the previous frame for the next call.
 */
void BallTracker::predictWithFlow(int frameIndex, const cv::Mat& frame) {
    if (frame.empty()) return;

    cv::Mat gray = toGray(frame);

    if (flow && !prevGray.empty() && !tracks.empty() && prevGray.size() == gray.size()) {
        cv::Mat field = flow->compute(prevGray, gray);

        for (auto& track : tracks) {
            if (getState(track, frameIndex) != TrackState::ACTIVE) continue;

            cv::Point2f displacement;
            const cv::Point2f& last = track.last().position;
            if (sampleFlow(field, last, displacement)) {
                track.predicted = last + displacement;
                track.hasPrediction = true;
            } else {
                track.hasPrediction = false;
            }
        }
    }

    prevGray = gray;
}

/// Stage 2: with no existing tracks, every detection starts one
void BallTracker::seedTracks(int frameIndex, const std::vector<Detection>& detections) {
    for (const auto& det : detections) {
        createTrack(det.centroid(), frameIndex);
    }
}

/**
 * @brief Stages 3-4: greedy association, seeding unmatched detections.
 *
 * A track seeded in this frame is marked matched so no second detection of
 * the same frame can join it.
 */
void BallTracker::associateDetections(int frameIndex, const std::vector<Detection>& detections) {
    std::vector<bool> trackMatched(tracks.size(), false);

    for (const auto& det : detections) {
        cv::Point2f center = det.centroid();
        int best = findClosestTrack(center, frameIndex, trackMatched);

        if (best >= 0) {
            appendPosition(tracks[best], center, frameIndex);
            trackMatched[best] = true;
        } else {
            createTrack(center, frameIndex);
            trackMatched.push_back(true);
        }
    }
}

const std::vector<Track>& BallTracker::update(int frameIndex,
                                              const std::vector<Detection>& detections,
                                              const cv::Mat& frame) {
    predictWithFlow(frameIndex, frame);

    if (detections.empty()) {
        return noTracks;
    }

    if (tracks.empty()) {
        seedTracks(frameIndex, detections);
    } else {
        associateDetections(frameIndex, detections);
    }

    return tracks;
}

// ============================================================================
// Detection-Track Matching
// ============================================================================

/// Distance to the flow prediction for active tracks, else to the last position
float BallTracker::distanceToTrack(const Track& track, const cv::Point2f& center,
                                   int frameIndex) const {
    cv::Point2f reference = track.last().position;
    if (track.hasPrediction && getState(track, frameIndex) == TrackState::ACTIVE) {
        reference = track.predicted;
    }
    cv::Point2f d = center - reference;
    return std::sqrt(d.x * d.x + d.y * d.y);
}

/// Index of the closest unmatched track strictly inside the gate, or -1
int BallTracker::findClosestTrack(const cv::Point2f& center, int frameIndex,
                                  const std::vector<bool>& trackMatched) const {
    int best = -1;
    float bestDist = associationGate;

    for (size_t i = 0; i < tracks.size(); i++) {
        if (trackMatched[i]) continue;

        float dist = distanceToTrack(tracks[i], center, frameIndex);
        if (dist < bestDist) {
            bestDist = dist;
            best = static_cast<int>(i);
        }
    }
    return best;
}

// ============================================================================
// Track Lifecycle
// ============================================================================

void BallTracker::createTrack(const cv::Point2f& center, int frameIndex) {
    Track track;
    track.id = nextId++;
    track.positions.push_back({center, frameIndex});
    track.lastSeen = frameIndex;
    tracks.push_back(std::move(track));
}

void BallTracker::appendPosition(Track& track, const cv::Point2f& center, int frameIndex) {
    track.positions.push_back({center, frameIndex});
    track.lastSeen = frameIndex;
    track.hasPrediction = false;
}
