#pragma once
#include <limits>
#include "Types.hpp"

/**
 * @struct DetectResult
 * @brief Outcome of one detector step plus the state the caller threads into the next call.
 */
struct DetectResult {
    bool is_beat;
    double last_beat_time;
};

/**
 * @class BeatDetector
 * @brief Threshold crossing with a refractory period over a raw analog signal.
 *
 * Holds only its configuration. The time of the previous beat is owned by the
 * caller and passed in on every call; seed it with kNoPreviousBeat.
 */
class BeatDetector {
public:
    /// No beat seen yet. Any finite timestamp is past the refractory period.
    static constexpr double kNoPreviousBeat = -std::numeric_limits<double>::infinity();

    /**
     * @param threshold Raw units; a beat needs value > threshold.
     * @param refractory_period Seconds; a beat needs elapsed time > refractory_period.
     * @throws std::invalid_argument if either value is negative or not finite.
     */
    BeatDetector(double threshold, double refractory_period);

    /**
     * @brief Judges one sample. The beat time is the sample's own timestamp.
     */
    DetectResult detect(const Sample& sample, double last_beat_time) const;

    double threshold() const { return m_threshold; }
    double refractory_period() const { return m_refractory; }

private:
    double m_threshold;
    double m_refractory;
};

/**
 * @brief Stateless form of BeatDetector::detect.
 */
DetectResult detect_beat(const Sample& sample, double threshold, double refractory_period, double last_beat_time);
