/**
 * @file speed_estimator.hpp
 * @brief Speed from a track's frame-to-frame displacement.
 *
 * Interval speeds are filtered in two passes: the slowest quarter (ball at
 * rest, hand motion, ambiguous extremities) is dropped, then only the
 * fastest half of what remains is averaged so the estimate follows the
 * flight segment. A slow-motion multiplier estimated from the clip length
 * corrects footage played back slower than it was recorded.
 */

#pragma once

#include <vector>

#include "ball_tracker.hpp"
#include "config.hpp"

namespace SpeedConst {
    constexpr double MPS_TO_KMH = 3.6;
    constexpr double KMH_TO_MPH = 0.621371;
}

/**
 * @struct SpeedResult
 * @brief Speed estimate with the sample counts that support it.
 */
struct SpeedResult {
    bool valid = false;
    double rawSpeedMps = 0.0;       ///< Averaged speed before slow-motion correction
    double speedKmh = 0.0;          ///< Corrected speed
    double slowMotionFactor = 1.0;
    int trackLength = 0;            ///< Positions in the track
    int intervalCount = 0;          ///< Intervals with positive elapsed time
    int keptCount = 0;              ///< Intervals surviving the slow-interval filter
    int averagedCount = 0;          ///< Intervals averaged into the estimate

    double speedMph() const { return speedKmh * SpeedConst::KMH_TO_MPH; }
};

/**
 * @struct IntervalFilter
 * @brief Outcome of the two-stage interval filter.
 */
struct IntervalFilter {
    std::vector<double> kept;       ///< Fastest-first, after dropping slow intervals
    std::vector<double> averaged;   ///< Fastest share of kept
    double mean = 0.0;
};

/**
 * @brief Per-interval speeds in m/s, in track order.
 *
 * Pairs whose frame gap is not positive are skipped.
 */
std::vector<double> computeIntervalSpeeds(const std::vector<TrackPoint>& positions,
                                          double fps, double scale);

/**
 * @brief Drop slow intervals, then average the fastest of the rest.
 *
 * The keep threshold is the speed at rank max(1, floor(keepFraction * n))
 * in descending order; every interval at or above it is kept. The mean is
 * taken over the first max(1, floor(averageFraction * kept)) kept values.
 */
IntervalFilter filterIntervalSpeeds(const std::vector<double>& speeds,
                                    double keepFraction, double averageFraction);

/**
 * @brief Full estimate for a track.
 * @return SpeedResult with valid == false when there are fewer than the
 *         minimum positions or no positive-duration interval
 */
SpeedResult estimateSpeed(const std::vector<TrackPoint>& positions, double fps, double scale,
                          double slowMotionFactor, const Config& config);

/// Snap a raw multiplier down to 1, 2, 4, 8 or 16
double snapSlowMotionFactor(double rawMultiplier);

/**
 * @brief Slow-motion multiplier for a clip.
 *
 * Clips at or below slowMotionMaxFps lasting longer than
 * slowMotionMinDuration are assumed to show a pitchFlightDuration pitch
 * slowed down; other clips get 1.
 */
double estimateSlowMotionFactor(double fps, int totalFrames, const Config& config);

/// Inside the configured [min, max] km/h band
bool isPlausibleSpeed(double speedKmh, const Config& config);
