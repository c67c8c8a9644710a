#pragma once
#include <string_view>
#include <vector>

/**
 * @struct Sample
 * @brief One reading on a channel: timestamp in seconds and its value.
 */
struct Sample {
    double timestamp;
    double value;
};

/**
 * @struct BeatEvent
 * @brief Instant (seconds) at which a heartbeat was declared.
 */
struct BeatEvent {
    double timestamp;
};

/**
 * @struct Interval
 * @brief Explicit (start, end, duration) range recorded by a collaborator.
 */
struct Interval {
    double start;
    double end;
    double duration;
};

/**
 * @brief Channels produced by the sensor.
 */
enum class Channel {
    HeartRate,
    RRinterval
};

inline constexpr Channel kAllChannels[] = { Channel::HeartRate, Channel::RRinterval };

constexpr std::string_view channel_name(Channel c) {
    switch (c) {
        case Channel::HeartRate: return "HeartRate";
        case Channel::RRinterval: return "RRinterval";
    }
    return "Unknown";
}

std::vector<double> values_of(const std::vector<Sample>& samples);
std::vector<double> timestamps_of(const std::vector<Sample>& samples);
