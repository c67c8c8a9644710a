#include "BeatFilter.hpp"
#include "Statistics.hpp"
#include <cmath>
#include <stdexcept>

BeatFilter::BeatFilter(size_t min_history, double iqr_multiplier)
    : m_min_history(min_history), m_k(iqr_multiplier) {
    if (m_min_history < 2) {
        throw std::invalid_argument("Outlier judgment needs at least 2 beats of history");
    }
    if (!std::isfinite(m_k) || m_k < 0.0) {
        throw std::invalid_argument("IQR multiplier must be a non-negative number");
    }
}

bool BeatFilter::is_outlier(double new_beat_time, const BeatHistory& history) const {
    if (history.size() < m_min_history) return false;

    auto intervals = history.intervals();
    const double newest = new_beat_time - history.back();
    intervals.push_back(newest);

    const IqrBounds bounds = iqr_bounds(intervals, m_k);
    return newest < bounds.lower || newest > bounds.upper;
}

FilterResult BeatFilter::accept_or_substitute(double new_beat_time, BeatHistory& history) const {
    if (!is_outlier(new_beat_time, history)) {
        history.push(new_beat_time);
        return {BeatVerdict::Accepted, new_beat_time};
    }
    // is_outlier() only fires with min_history >= 2 beats, so intervals is non-empty
    const double synthetic = history.back() + mean(history.intervals());
    history.push(synthetic);
    return {BeatVerdict::Substituted, synthetic};
}
