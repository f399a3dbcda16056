#include "track_selector.hpp"
#include <algorithm>
#include <cmath>

double trackDisplacement(const Track& track) {
    if (track.positions.empty()) return 0.0;

    double dx = track.last().position.x - track.first().position.x;
    double dy = track.last().position.y - track.first().position.y;
    return std::sqrt(dx * dx + dy * dy);
}

bool isEligibleTrack(const Track& track, const Config& config) {
    int length = track.length();
    return length >= config.minTrackLength &&
           length <= config.maxTrackLength &&
           trackDisplacement(track) > config.minTrackDisplacement;
}

const Track* selectBestTrack(const std::vector<Track>& tracks, const Config& config,
                             SelectionStats* stats) {
    const Track* best = nullptr;
    SelectionStats local;

    for (const auto& track : tracks) {
        local.candidateCount++;
        local.longestOverall = std::max(local.longestOverall, track.length());

        if (!isEligibleTrack(track, config)) continue;
        local.eligibleCount++;

        // Strictly greater: the first track of a given length wins ties
        if (!best || track.length() > best->length()) {
            best = &track;
        }
    }

    local.longestEligible = best ? best->length() : 0;
    if (stats) *stats = local;
    return best;
}
