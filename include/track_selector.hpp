/**
 * @file track_selector.hpp
 * @brief Choice of the track most likely to be the pitched ball's flight.
 */

#pragma once

#include <vector>

#include "ball_tracker.hpp"
#include "config.hpp"

/**
 * @struct SelectionStats
 * @brief Diagnostics gathered while selecting a track.
 */
struct SelectionStats {
    int candidateCount = 0;   ///< Tracks examined
    int eligibleCount = 0;    ///< Tracks passing length and displacement rules
    int longestEligible = 0;  ///< Positions in the selected track, 0 if none
    int longestOverall = 0;   ///< Positions in the longest track of any kind
};

/// First-to-last recorded position distance in pixels (0 for empty tracks)
double trackDisplacement(const Track& track);

/**
 * @brief A track is eligible with at least minTrackLength positions, more than
 * minTrackDisplacement px of first-to-last movement, and at most
 * maxTrackLength positions.
 */
bool isEligibleTrack(const Track& track, const Config& config);

/**
 * @brief Longest eligible track; ties keep the earliest in insertion order.
 * @return Pointer into tracks, or nullptr if no track is eligible
 */
const Track* selectBestTrack(const std::vector<Track>& tracks, const Config& config,
                             SelectionStats* stats = nullptr);
