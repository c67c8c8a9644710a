#include "Segmenter.hpp"
#include <cmath>
#include <stdexcept>

std::vector<Segment> segment_series(std::span<const Sample> series, double gap_threshold) {
    if (!std::isfinite(gap_threshold) || gap_threshold < 0.0) {
        throw std::invalid_argument("Gap threshold must be a non-negative number");
    }
    std::vector<Segment> segments;
    if (series.empty()) return segments;

    segments.emplace_back();
    segments.back().samples.push_back(series.front());
    for (size_t i = 1; i < series.size(); ++i) {
        if (series[i].timestamp - series[i - 1].timestamp > gap_threshold) {
            segments.emplace_back();
        }
        segments.back().samples.push_back(series[i]);
    }
    return segments;
}
