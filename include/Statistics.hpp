#pragma once
#include <cstddef>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <vector>

/**
 * @struct IqrBounds
 * @brief Tukey fences [q1 - k*iqr, q3 + k*iqr] over a set of values.
 */
struct IqrBounds {
    double q1;
    double q3;
    double lower;
    double upper;

    bool contains(double v) const { return v >= lower && v <= upper; }
};

/**
 * @struct StatisticsReport
 * @brief Metric set for one segment or episode. RR-only metrics are absent on other channels.
 */
struct StatisticsReport {
    size_t count{0};
    double mean{0.0};
    double median{0.0};
    double min{0.0};
    double max{0.0};
    double std_dev{0.0}; ///< population (divisor N)
    double iqr{0.0};
    double duration{0.0};
    std::optional<double> rmssd;
    std::optional<double> sdnn; ///< sample (divisor N-1)
    std::optional<double> pnn50;
};

double mean(std::span<const double> v);
double median(std::span<const double> v);

/**
 * @brief Percentile with linear interpolation between closest ranks.
 * @param q Percentile in [0, 100].
 */
double percentile(std::span<const double> v, double q);

double population_std(std::span<const double> v);
double sample_std(std::span<const double> v);

/**
 * @brief Successive differences v[i+1] - v[i]; empty for fewer than two values.
 */
std::vector<double> successive_differences(std::span<const double> v);

/**
 * @brief Quartile fences used by the outlier filter and the BPM estimator.
 * @param v Non-empty values.
 * @param k Fence multiplier (1.5 for the classic Tukey rule).
 */
IqrBounds iqr_bounds(std::span<const double> v, double k = 1.5);

/**
 * @brief Computes the full metric set over a sub-series.
 * @param values Channel values.
 * @param timestamps Timestamps parallel to values.
 * @param is_rr_channel Adds RMSSD and SDNN when true.
 * @return std::expected containing the report, or an error for empty or mismatched input.
 */
std::expected<StatisticsReport, std::string> summarize(std::span<const double> values,
                                                       std::span<const double> timestamps,
                                                       bool is_rr_channel);
