#include "EpisodeSplitter.hpp"

namespace {
std::vector<Sample> samples_within(const Segment& segment, double start, double end) {
    std::vector<Sample> out;
    for (const auto& s : segment.samples) {
        if (s.timestamp >= start && s.timestamp <= end) {
            out.push_back(s);
        }
    }
    return out;
}
} // namespace

std::vector<Episode> split_by_marks(const Segment& segment, std::span<const double> marks) {
    std::vector<Episode> episodes;
    if (marks.empty() || segment.samples.empty()) return episodes;

    const double seg_start = segment.start_time();
    const double seg_end = segment.end_time();

    std::vector<double> boundaries{seg_start};
    for (double m : marks) {
        if (m >= seg_start && m <= seg_end) {
            boundaries.push_back(m);
        }
    }
    boundaries.push_back(seg_end);

    for (size_t i = 0; i + 1 < boundaries.size(); ++i) {
        auto members = samples_within(segment, boundaries[i], boundaries[i + 1]);
        if (members.empty()) continue;
        episodes.push_back(Episode{boundaries[i], boundaries[i + 1], std::move(members)});
    }
    return episodes;
}

std::vector<Episode> split_by_intervals(const Segment& segment, std::span<const Interval> intervals) {
    std::vector<Episode> episodes;
    if (segment.samples.empty()) return episodes;

    const double seg_start = segment.start_time();
    const double seg_end = segment.end_time();
    for (const auto& iv : intervals) {
        if (iv.start > seg_end || iv.end < seg_start) continue;
        auto members = samples_within(segment, iv.start, iv.end);
        if (members.empty()) continue;
        episodes.push_back(Episode{iv.start, iv.end, std::move(members)});
    }
    return episodes;
}
