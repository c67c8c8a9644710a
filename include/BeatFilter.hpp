#pragma once
#include "BeatHistory.hpp"

enum class BeatVerdict {
    Accepted,
    Substituted
};

/**
 * @struct FilterResult
 * @brief What accept_or_substitute put into the history.
 */
struct FilterResult {
    BeatVerdict verdict;
    double inserted; ///< the real beat time, or the synthetic one
};

/**
 * @class BeatFilter
 * @brief Online IQR outlier rejection with synthetic beat substitution.
 *
 * A new beat is judged only once the history holds min_history beats. An
 * outlier is replaced by history.back() + mean inter-beat interval so the
 * window keeps advancing at the recent rhythm.
 */
class BeatFilter {
public:
    /**
     * @param min_history Beats needed before outliers are judged (at least 2).
     * @param iqr_multiplier Fence factor k in [q1 - k*iqr, q3 + k*iqr].
     * @throws std::invalid_argument on invalid parameters.
     */
    explicit BeatFilter(size_t min_history = 20, double iqr_multiplier = 1.5);

    /**
     * @brief True when the newest interval falls strictly outside the fences
     * computed over the intervals of history + [new_beat_time].
     */
    bool is_outlier(double new_beat_time, const BeatHistory& history) const;

    /**
     * @brief Appends the beat, or a synthetic one if it is an outlier. History grows by exactly one (capped).
     */
    FilterResult accept_or_substitute(double new_beat_time, BeatHistory& history) const;

    size_t min_history() const { return m_min_history; }
    double iqr_multiplier() const { return m_k; }

private:
    size_t m_min_history;
    double m_k;
};
