#pragma once
#include <expected>
#include <filesystem>
#include <string>
#include <vector>
#include "Types.hpp"

/**
 * @struct SessionRecording
 * @brief Everything the offline analysis reads for one participant.
 */
struct SessionRecording {
    std::vector<Sample> heart_rate;
    std::vector<Sample> rr_interval;
    std::vector<double> marks;
    std::vector<Interval> intervals;

    const std::vector<Sample>& series(Channel c) const;
    std::vector<Sample>& series(Channel c);
};

inline constexpr const char* kMarkedTimestampsFile = "marked_timestamps.csv";
inline constexpr const char* kMarkedIntervalsFile = "marked_intervals.csv";

/**
 * @brief "<channel>_recording.csv", the file a channel is recorded to inside a participant folder.
 */
std::string recording_file_name(Channel c);

/**
 * @brief Reads a "timestamp,value" CSV with a header row.
 */
std::expected<std::vector<Sample>, std::string> load_series(const std::filesystem::path& path);

/**
 * @brief Reads one mark timestamp per row (first column) after a header row.
 */
std::expected<std::vector<double>, std::string> load_marks(const std::filesystem::path& path);

/**
 * @brief Reads "start,end,duration" rows after a header row.
 */
std::expected<std::vector<Interval>, std::string> load_intervals(const std::filesystem::path& path);

/**
 * @brief Loads a participant folder. Missing files leave the matching buffer empty.
 * @return Error if the folder does not exist or a present file is malformed.
 */
std::expected<SessionRecording, std::string> load_recording(const std::filesystem::path& folder);
