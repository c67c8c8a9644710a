#pragma once
#include <span>
#include <vector>
#include "Types.hpp"

/**
 * @struct Segment
 * @brief Maximal run of samples with no gap above the threshold between neighbours.
 */
struct Segment {
    std::vector<Sample> samples;

    double start_time() const { return samples.front().timestamp; }
    double end_time() const { return samples.back().timestamp; }
    double duration() const { return samples.size() > 1 ? end_time() - start_time() : 0.0; }
};

/**
 * @brief Splits a time-ordered series wherever consecutive samples are more than gap_threshold apart.
 *
 * Input order is kept as given; the series is not re-sorted. Every sample ends
 * up in exactly one segment.
 *
 * @throws std::invalid_argument if gap_threshold is negative or not finite.
 */
std::vector<Segment> segment_series(std::span<const Sample> series, double gap_threshold = 10.0);
