#include "BeatHistory.hpp"
#include <stdexcept>

BeatHistory::BeatHistory(size_t capacity) : m_capacity(capacity) {
    if (m_capacity < 2) {
        throw std::invalid_argument("Beat history needs room for at least 2 beats");
    }
}

void BeatHistory::push(double timestamp) {
    m_buffer.push_back(timestamp);
    while (m_buffer.size() > m_capacity) m_buffer.pop_front();
}

std::vector<double> BeatHistory::intervals() const {
    std::vector<double> d;
    if (m_buffer.size() < 2) return d;
    d.reserve(m_buffer.size() - 1);
    for (size_t i = 1; i < m_buffer.size(); ++i) {
        d.push_back(m_buffer[i] - m_buffer[i - 1]);
    }
    return d;
}
