#pragma once
#include <deque>
#include <vector>
#include <cstddef>

/**
 * @class BeatHistory
 * @brief Bounded FIFO of accepted beat timestamps (seconds), oldest evicted first.
 */
class BeatHistory {
public:
    /**
     * @param capacity Number of beats kept (e.g., 20).
     * @throws std::invalid_argument if capacity < 2.
     */
    explicit BeatHistory(size_t capacity = 20);

    /**
     * @brief Appends a timestamp and trims to capacity.
     */
    void push(double timestamp);

    void clear() { m_buffer.clear(); }

    size_t size() const { return m_buffer.size(); }
    size_t capacity() const { return m_capacity; }
    bool empty() const { return m_buffer.empty(); }
    bool full() const { return m_buffer.size() == m_capacity; }
    double back() const { return m_buffer.back(); }

    std::vector<double> timestamps() const { return {m_buffer.begin(), m_buffer.end()}; }

    /**
     * @brief Inter-beat intervals; size() - 1 entries.
     */
    std::vector<double> intervals() const;

private:
    std::deque<double> m_buffer;
    size_t m_capacity;
};
