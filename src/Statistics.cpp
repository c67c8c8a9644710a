#include "Statistics.hpp"
#include "Hrv.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

double mean(std::span<const double> v) {
    if (v.empty()) return 0.0;
    return std::accumulate(v.begin(), v.end(), 0.0) / static_cast<double>(v.size());
}

double median(std::span<const double> v) {
    return percentile(v, 50.0);
}

double percentile(std::span<const double> v, double q) {
    if (v.empty()) return 0.0;
    std::vector<double> sorted(v.begin(), v.end());
    std::sort(sorted.begin(), sorted.end());
    const double rank = std::clamp(q, 0.0, 100.0) / 100.0 * static_cast<double>(sorted.size() - 1);
    const size_t lo = static_cast<size_t>(std::floor(rank));
    const size_t hi = std::min(lo + 1, sorted.size() - 1);
    const double frac = rank - static_cast<double>(lo);
    return sorted[lo] + (sorted[hi] - sorted[lo]) * frac;
}

namespace {
double sum_sq_dev(std::span<const double> v) {
    const double m = mean(v);
    double acc = 0.0;
    for (double x : v) {
        acc += (x - m) * (x - m);
    }
    return acc;
}
} // namespace

double population_std(std::span<const double> v) {
    if (v.empty()) return 0.0;
    return std::sqrt(sum_sq_dev(v) / static_cast<double>(v.size()));
}

double sample_std(std::span<const double> v) {
    if (v.size() < 2) return 0.0;
    return std::sqrt(sum_sq_dev(v) / static_cast<double>(v.size() - 1));
}

std::vector<double> successive_differences(std::span<const double> v) {
    std::vector<double> d;
    if (v.size() < 2) return d;
    d.reserve(v.size() - 1);
    for (size_t i = 1; i < v.size(); ++i) {
        d.push_back(v[i] - v[i - 1]);
    }
    return d;
}

IqrBounds iqr_bounds(std::span<const double> v, double k) {
    IqrBounds b{};
    b.q1 = percentile(v, 25.0);
    b.q3 = percentile(v, 75.0);
    const double iqr = b.q3 - b.q1;
    b.lower = b.q1 - k * iqr;
    b.upper = b.q3 + k * iqr;
    return b;
}

std::expected<StatisticsReport, std::string> summarize(std::span<const double> values,
                                                       std::span<const double> timestamps,
                                                       bool is_rr_channel) {
    if (values.empty()) {
        return std::unexpected("No data available");
    }
    if (values.size() != timestamps.size()) {
        return std::unexpected("Values and timestamps differ in length");
    }

    StatisticsReport r;
    r.count = values.size();
    r.mean = mean(values);
    r.median = median(values);
    const auto [lo, hi] = std::minmax_element(values.begin(), values.end());
    r.min = *lo;
    r.max = *hi;
    r.std_dev = population_std(values);
    r.iqr = percentile(values, 75.0) - percentile(values, 25.0);
    r.duration = timestamps.size() > 1 ? timestamps.back() - timestamps.front() : 0.0;

    if (is_rr_channel) {
        r.rmssd = rmssd(values);
        r.sdnn = sdnn(values);
    }
    return r;
}
