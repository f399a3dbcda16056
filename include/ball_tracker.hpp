/**
 * @file ball_tracker.hpp
 * @brief Centroid-distance ball tracking with optical-flow lookahead.
 *
 * BallTracker keeps every candidate track for the duration of one analysis
 * pass, matching each frame's detections to existing tracks by centroid
 * distance. Tracks that were updated in the previous frame get a one-frame
 * position prediction from the dense optical-flow field, which lets a fast
 * ball stay associated even when it moved far between frames.
 */

#pragma once

#include <vector>
#include <opencv2/core.hpp>

#include "config.hpp"
#include "detector.hpp"
#include "optical_flow.hpp"

/**
 * @struct TrackPoint
 * @brief Detection centroid recorded for one frame.
 */
struct TrackPoint {
    cv::Point2f position;
    int frameIndex;
};

/// ACTIVE: associated in the immediately preceding frame. STALE: otherwise.
enum class TrackState {
    ACTIVE,
    STALE
};

/**
 * @struct Track
 * @brief Hypothesized trajectory of one object.
 *
 * positions are appended in increasing frameIndex order; gaps are allowed.
 * The prediction slot is valid only for the frame after lastSeen.
 */
struct Track {
    int id = -1;
    std::vector<TrackPoint> positions;
    int lastSeen = -1;

    bool hasPrediction = false;
    cv::Point2f predicted;

    const TrackPoint& first() const { return positions.front(); }
    const TrackPoint& last() const { return positions.back(); }
    int length() const { return static_cast<int>(positions.size()); }
};

/**
 * @class BallTracker
 * @brief Single-owner, insertion-ordered track set updated frame by frame.
 *
 * Per-frame pipeline:
 * 1. Predict positions of tracks seen in the previous frame from optical flow
 * 2. Seed one track per detection if no tracks exist yet
 * 3. Otherwise greedily match each detection, in input order, to the closest
 *    unmatched track within the association gate
 * 4. Seed new tracks for detections that found no track
 *
 * Matching is first-come-first-served over detections, not a globally optimal
 * assignment. Tracks are never removed within a pass.
 */
class BallTracker {
public:
    BallTracker();
    explicit BallTracker(OpticalFlow* flow);

    // Configure from Config struct (recommended)
    void configure(const Config& config);

    void setAssociationGate(float gate) { associationGate = gate; }
    float getAssociationGate() const { return associationGate; }

    // Optical flow used for lookahead; nullptr disables prediction
    void setOpticalFlow(OpticalFlow* newFlow) { flow = newFlow; }

    /**
     * @brief Process one frame.
     * @param frameIndex Index of the frame in processing order (must increase between calls)
     * @param detections Ball detections of this frame
     * @param frame Raw frame used for optical flow; may be empty
     * @return All tracks, or an empty set when the frame had no detections
     */
    const std::vector<Track>& update(int frameIndex, const std::vector<Detection>& detections,
                                     const cv::Mat& frame = cv::Mat());

    const std::vector<Track>& getTracks() const { return tracks; }

    // Next ID to be assigned (equals the number of tracks ever created)
    int getNextId() const { return nextId; }

    static TrackState getState(const Track& track, int frameIndex);

    void clear();

private:
    // Update pipeline stages
    void predictWithFlow(int frameIndex, const cv::Mat& frame);
    void seedTracks(int frameIndex, const std::vector<Detection>& detections);
    void associateDetections(int frameIndex, const std::vector<Detection>& detections);

    // Matching
    float distanceToTrack(const Track& track, const cv::Point2f& center, int frameIndex) const;
    int findClosestTrack(const cv::Point2f& center, int frameIndex,
                         const std::vector<bool>& trackMatched) const;

    // Track lifecycle
    void createTrack(const cv::Point2f& center, int frameIndex);
    void appendPosition(Track& track, const cv::Point2f& center, int frameIndex);

    std::vector<Track> tracks;
    int nextId;
    float associationGate;

    OpticalFlow* flow;
    cv::Mat prevGray;

    const std::vector<Track> noTracks;
};
