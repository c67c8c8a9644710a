#pragma once
#include <span>
#include <vector>
#include "Segmenter.hpp"
#include "Types.hpp"

/**
 * @struct Episode
 * @brief Sub-range [start, end] of a segment and the segment samples inside it (both ends inclusive).
 */
struct Episode {
    double start;
    double end;
    std::vector<Sample> samples;

    double duration() const { return end - start; }
};

/**
 * @brief Splits a segment at the marks that fall inside it.
 *
 * Boundaries are [segment start] + marks within [start, end] + [segment end].
 * A sample lying exactly on a mark belongs to both neighbouring episodes.
 *
 * @param marks Ordered mark timestamps. When empty no episodes are produced.
 */
std::vector<Episode> split_by_marks(const Segment& segment, std::span<const double> marks);

/**
 * @brief One episode per explicit interval overlapping the segment's time range.
 *
 * Members are the segment samples with timestamp in [interval.start, interval.end].
 * Intervals that overlap the range but hold no sample are skipped.
 */
std::vector<Episode> split_by_intervals(const Segment& segment, std::span<const Interval> intervals);
