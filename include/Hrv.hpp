#pragma once
#include <cstddef>
#include <optional>
#include <span>
#include <vector>

/**
 * @struct HrvMetrics
 * @brief Time-domain HRV metrics; each is absent when the input cannot support it.
 */
struct HrvMetrics {
    std::optional<double> rmssd;
    std::optional<double> sdnn;
    std::optional<double> pnn50;
};

/// Root mean square of successive differences. Needs at least two values.
std::optional<double> rmssd(std::span<const double> rr_ms);

/// Bessel-corrected standard deviation. Needs at least two values.
std::optional<double> sdnn(std::span<const double> rr_ms);

/**
 * @brief Percentage of successive differences with |diff| > 50 ms, relative to the number of values.
 */
std::optional<double> pnn50(std::span<const double> rr_ms);

HrvMetrics compute_hrv(std::span<const double> rr_ms);

/// RR values below this are taken as seconds.
inline constexpr double kRrSecondsCutoff = 10.0;

/**
 * @brief Scales a series to milliseconds when its maximum is below kRrSecondsCutoff (seconds recorded).
 */
std::vector<double> normalize_rr_units(std::span<const double> rr);

/**
 * @brief Replaces values with |x - mean| >= z * std by linear interpolation over the sample index.
 * Values past either end of the valid run are extrapolated from the two nearest valid values.
 * Constant series and series with fewer than two valid values are returned unchanged.
 */
std::vector<double> clean_rr_intervals(std::span<const double> rr, double z_threshold = 3.0);

/**
 * @class RrWindowTracker
 * @brief Collects live RR intervals and emits cleaned SDNN/RMSSD once per full window.
 */
class RrWindowTracker {
public:
    /**
     * @param window RR intervals per snapshot (at least 2).
     * @param z_threshold Cut used to clean each window.
     * @throws std::invalid_argument on an unusable window or threshold.
     */
    explicit RrWindowTracker(size_t window = 50, double z_threshold = 3.0);

    /**
     * @brief Adds one RR interval (ms).
     * @return Metrics for the window when this value completes it.
     */
    std::optional<HrvMetrics> add(double rr_ms);

    size_t pending() const { return m_buffer.size(); }
    void reset() { m_buffer.clear(); }

private:
    std::vector<double> m_buffer;
    size_t m_window;
    double m_z;
};
