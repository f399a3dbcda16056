/**
 * @file speed_estimator.cpp
 * @brief Interval speed computation, outlier filtering and slow-motion correction.
 */

#include "speed_estimator.hpp"
#include "calibration.hpp"
#include <algorithm>
#include <cmath>
#include <functional>
#include <iostream>
#include <numeric>

std::vector<double> computeIntervalSpeeds(const std::vector<TrackPoint>& positions,
                                          double fps, double scale) {
    std::vector<double> speeds;
    if (fps <= 0.0 || positions.size() < 2) return speeds;

    for (size_t i = 0; i + 1 < positions.size(); i++) {
        const TrackPoint& a = positions[i];
        const TrackPoint& b = positions[i + 1];

        double timeDiff = (b.frameIndex - a.frameIndex) / fps;
        if (timeDiff <= 0.0) continue;

        double dx = static_cast<double>(b.position.x) - a.position.x;
        double dy = static_cast<double>(b.position.y) - a.position.y;
        double pixelDist = std::sqrt(dx * dx + dy * dy);
        speeds.push_back(pixelDist * scale / timeDiff);
    }
    return speeds;
}

IntervalFilter filterIntervalSpeeds(const std::vector<double>& speeds,
                                    double keepFraction, double averageFraction) {
    IntervalFilter filter;
    if (speeds.empty()) return filter;

    std::vector<double> sorted = speeds;
    std::sort(sorted.begin(), sorted.end(), std::greater<double>());

    int keepCount = std::max(1, static_cast<int>(sorted.size() * keepFraction));
    keepCount = std::min(keepCount, static_cast<int>(sorted.size()));
    double threshold = sorted[keepCount - 1];

    // Ties at the threshold stay in
    for (double s : sorted) {
        if (s >= threshold) filter.kept.push_back(s);
    }

    int averageCount = std::max(1, static_cast<int>(filter.kept.size() * averageFraction));
    averageCount = std::min(averageCount, static_cast<int>(filter.kept.size()));
    filter.averaged.assign(filter.kept.begin(), filter.kept.begin() + averageCount);

    filter.mean = std::accumulate(filter.averaged.begin(), filter.averaged.end(), 0.0) /
                  filter.averaged.size();
    return filter;
}

SpeedResult estimateSpeed(const std::vector<TrackPoint>& positions, double fps, double scale,
                          double slowMotionFactor, const Config& config) {
    SpeedResult result;
    result.slowMotionFactor = slowMotionFactor;
    result.trackLength = static_cast<int>(positions.size());

    if (result.trackLength < config.minTrackLength) {
        return result;
    }

    std::vector<double> speeds = computeIntervalSpeeds(positions, fps, scale);
    result.intervalCount = static_cast<int>(speeds.size());
    if (speeds.empty()) {
        return result;
    }

    IntervalFilter filter = filterIntervalSpeeds(speeds, config.keepFraction, config.averageFraction);
    result.keptCount = static_cast<int>(filter.kept.size());
    result.averagedCount = static_cast<int>(filter.averaged.size());
    result.rawSpeedMps = filter.mean;
    result.speedKmh = filter.mean * SpeedConst::MPS_TO_KMH * slowMotionFactor;
    result.valid = true;

    if (config.verbose) {
        auto range = std::minmax_element(speeds.begin(), speeds.end());
        std::cout << "[Speed] " << result.intervalCount << " intervals -> " << result.keptCount
                  << " kept -> mean of top " << result.averagedCount << std::endl;
        std::cout << "[Speed] Interval range: min " << *range.first * SpeedConst::MPS_TO_KMH
                  << " / median " << medianOf(speeds) * SpeedConst::MPS_TO_KMH
                  << " / max " << *range.second * SpeedConst::MPS_TO_KMH << " km/h" << std::endl;
        std::cout << "[Speed] Uncorrected " << result.rawSpeedMps * SpeedConst::MPS_TO_KMH
                  << " km/h -> corrected " << result.speedKmh << " km/h (x" << slowMotionFactor
                  << ")" << std::endl;
    }

    return result;
}

double snapSlowMotionFactor(double rawMultiplier) {
    if (rawMultiplier > 12.0) return 16.0;
    if (rawMultiplier > 6.0) return 8.0;
    if (rawMultiplier > 3.0) return 4.0;
    if (rawMultiplier > 1.5) return 2.0;
    return 1.0;
}

double estimateSlowMotionFactor(double fps, int totalFrames, const Config& config) {
    if (fps <= 0.0 || config.pitchFlightDuration <= 0.0) return 1.0;

    double duration = totalFrames / fps;
    if (fps <= config.slowMotionMaxFps && duration > config.slowMotionMinDuration) {
        double raw = duration / config.pitchFlightDuration;
        double factor = snapSlowMotionFactor(raw);
        if (config.verbose) {
            std::cout << "[SlowMotion] Detected " << factor << "x (fps " << fps << ", duration "
                      << duration << " s, raw multiplier " << raw << ")" << std::endl;
        }
        return factor;
    }

    if (config.verbose) {
        std::cout << "[SlowMotion] Normal speed (fps " << fps << ", duration " << duration
                  << " s)" << std::endl;
    }
    return 1.0;
}

bool isPlausibleSpeed(double speedKmh, const Config& config) {
    return speedKmh >= config.minPlausibleSpeed && speedKmh <= config.maxPlausibleSpeed;
}
