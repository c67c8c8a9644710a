#include "BeatDetector.hpp"
#include <cmath>
#include <stdexcept>

DetectResult detect_beat(const Sample& sample, double threshold, double refractory_period, double last_beat_time) {
    if (sample.value > threshold && (sample.timestamp - last_beat_time) > refractory_period) {
        return {true, sample.timestamp};
    }
    return {false, last_beat_time};
}

BeatDetector::BeatDetector(double threshold, double refractory_period)
    : m_threshold(threshold), m_refractory(refractory_period) {
    if (!std::isfinite(m_threshold) || m_threshold < 0.0) {
        throw std::invalid_argument("Beat threshold must be a non-negative number");
    }
    if (!std::isfinite(m_refractory) || m_refractory < 0.0) {
        throw std::invalid_argument("Refractory period must be a non-negative number");
    }
}

DetectResult BeatDetector::detect(const Sample& sample, double last_beat_time) const {
    return detect_beat(sample, m_threshold, m_refractory, last_beat_time);
}
