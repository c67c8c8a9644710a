#include "Hrv.hpp"
#include "Statistics.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

std::optional<double> rmssd(std::span<const double> rr_ms) {
    if (rr_ms.size() < 2) return std::nullopt;
    const auto d = successive_differences(rr_ms);
    double sq = 0.0;
    for (double x : d) {
        sq += x * x;
    }
    return std::sqrt(sq / static_cast<double>(d.size()));
}

std::optional<double> sdnn(std::span<const double> rr_ms) {
    if (rr_ms.size() < 2) return std::nullopt;
    return sample_std(rr_ms);
}

std::optional<double> pnn50(std::span<const double> rr_ms) {
    if (rr_ms.empty()) return std::nullopt;
    const auto d = successive_differences(rr_ms);
    const auto nn50 = std::count_if(d.begin(), d.end(), [](double x) { return std::fabs(x) > 50.0; });
    return 100.0 * static_cast<double>(nn50) / static_cast<double>(rr_ms.size());
}

HrvMetrics compute_hrv(std::span<const double> rr_ms) {
    return HrvMetrics{rmssd(rr_ms), sdnn(rr_ms), pnn50(rr_ms)};
}

std::vector<double> normalize_rr_units(std::span<const double> rr) {
    std::vector<double> out(rr.begin(), rr.end());
    if (out.empty()) return out;
    if (*std::max_element(out.begin(), out.end()) < kRrSecondsCutoff) {
        for (auto& v : out) {
            v *= 1000.0;
        }
    }
    return out;
}

std::vector<double> clean_rr_intervals(std::span<const double> rr, double z_threshold) {
    std::vector<double> out(rr.begin(), rr.end());
    const double m = mean(rr);
    const double sd = population_std(rr);
    if (sd <= 0.0) return out;

    // 1. Indices inside the z-score band
    std::vector<size_t> valid;
    for (size_t i = 0; i < out.size(); ++i) {
        if (std::fabs(out[i] - m) < z_threshold * sd) {
            valid.push_back(i);
        }
    }
    if (valid.size() < 2 || valid.size() == out.size()) return out;

    // 2. Linear interpolation over the index, extrapolating at both ends
    auto line = [&](size_t a, size_t b, size_t i) {
        const double xa = static_cast<double>(a), xb = static_cast<double>(b);
        const double slope = (rr[b] - rr[a]) / (xb - xa);
        return rr[a] + slope * (static_cast<double>(i) - xa);
    };
    size_t k = 0;
    for (size_t i = 0; i < out.size(); ++i) {
        while (k + 1 < valid.size() && valid[k + 1] <= i) {
            ++k;
        }
        if (std::binary_search(valid.begin(), valid.end(), i)) continue;
        if (i < valid.front()) {
            out[i] = line(valid[0], valid[1], i);
        } else if (k + 1 < valid.size()) {
            out[i] = line(valid[k], valid[k + 1], i);
        } else {
            out[i] = line(valid[valid.size() - 2], valid.back(), i);
        }
    }
    return out;
}

RrWindowTracker::RrWindowTracker(size_t window, double z_threshold)
    : m_window(window), m_z(z_threshold) {
    if (m_window < 2) {
        throw std::invalid_argument("HRV window must hold at least 2 intervals");
    }
    if (!(m_z > 0.0)) {
        throw std::invalid_argument("HRV z threshold must be positive");
    }
    m_buffer.reserve(m_window);
}

std::optional<HrvMetrics> RrWindowTracker::add(double rr_ms) {
    m_buffer.push_back(rr_ms);
    if (m_buffer.size() < m_window) return std::nullopt;

    const auto cleaned = clean_rr_intervals(m_buffer, m_z);
    HrvMetrics out{rmssd(cleaned), sdnn(cleaned), std::nullopt};
    m_buffer.clear();
    return out;
}
