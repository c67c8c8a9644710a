#include "Types.hpp"

std::vector<double> values_of(const std::vector<Sample>& samples) {
    std::vector<double> v;
    v.reserve(samples.size());
    for (const auto& s : samples) v.push_back(s.value);
    return v;
}

std::vector<double> timestamps_of(const std::vector<Sample>& samples) {
    std::vector<double> t;
    t.reserve(samples.size());
    for (const auto& s : samples) t.push_back(s.timestamp);
    return t;
}
