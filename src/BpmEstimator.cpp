#include "BpmEstimator.hpp"
#include "Statistics.hpp"
#include <vector>

double calculate_bpm(std::span<const double> beat_timestamps, double iqr_multiplier) {
    if (beat_timestamps.size() < 2) return 0.0;

    // 1. Inter-beat intervals
    const auto intervals = successive_differences(beat_timestamps);

    // 2. Second IQR pass over the whole window
    const IqrBounds bounds = iqr_bounds(intervals, iqr_multiplier);
    std::vector<double> kept;
    kept.reserve(intervals.size());
    for (double iv : intervals) {
        if (bounds.contains(iv)) kept.push_back(iv);
    }
    if (kept.empty()) return 0.0;

    // 3. Rate from the mean surviving interval
    const double mean_interval = mean(kept);
    if (mean_interval <= 0.0) return 0.0;
    return 60.0 / mean_interval;
}

double calculate_bpm(const BeatHistory& history, double iqr_multiplier) {
    const auto ts = history.timestamps();
    return calculate_bpm(ts, iqr_multiplier);
}
