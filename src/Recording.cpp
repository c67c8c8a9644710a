#include "Recording.hpp"
#include <fstream>
#include <sstream>

namespace {
std::expected<std::vector<std::vector<double>>, std::string> read_rows(const std::filesystem::path& path,
                                                                        size_t min_columns) {
    std::ifstream in(path);
    if (!in) {
        return std::unexpected("Cannot open " + path.string());
    }
    std::vector<std::vector<double>> rows;
    std::string line;
    std::getline(in, line); // header
    size_t line_no = 1;
    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        std::vector<double> row;
        std::stringstream ss(line);
        std::string cell;
        while (std::getline(ss, cell, ',')) {
            try {
                row.push_back(std::stod(cell));
            } catch (const std::exception&) {
                return std::unexpected(path.string() + ":" + std::to_string(line_no) + ": not a number: '" + cell + "'");
            }
        }
        if (row.size() < min_columns) {
            return std::unexpected(path.string() + ":" + std::to_string(line_no) + ": expected " +
                                   std::to_string(min_columns) + " columns");
        }
        rows.push_back(std::move(row));
    }
    return rows;
}
} // namespace

const std::vector<Sample>& SessionRecording::series(Channel c) const {
    return c == Channel::HeartRate ? heart_rate : rr_interval;
}

std::vector<Sample>& SessionRecording::series(Channel c) {
    return c == Channel::HeartRate ? heart_rate : rr_interval;
}

std::string recording_file_name(Channel c) {
    return std::string(channel_name(c)) + "_recording.csv";
}

std::expected<std::vector<Sample>, std::string> load_series(const std::filesystem::path& path) {
    auto rows = read_rows(path, 2);
    if (!rows) return std::unexpected(rows.error());
    std::vector<Sample> out;
    out.reserve(rows->size());
    for (const auto& r : *rows) {
        out.push_back({r[0], r[1]});
    }
    return out;
}

std::expected<std::vector<double>, std::string> load_marks(const std::filesystem::path& path) {
    auto rows = read_rows(path, 1);
    if (!rows) return std::unexpected(rows.error());
    std::vector<double> out;
    out.reserve(rows->size());
    for (const auto& r : *rows) {
        out.push_back(r[0]);
    }
    return out;
}

std::expected<std::vector<Interval>, std::string> load_intervals(const std::filesystem::path& path) {
    auto rows = read_rows(path, 3);
    if (!rows) return std::unexpected(rows.error());
    std::vector<Interval> out;
    out.reserve(rows->size());
    for (const auto& r : *rows) {
        out.push_back({r[0], r[1], r[2]});
    }
    return out;
}

std::expected<SessionRecording, std::string> load_recording(const std::filesystem::path& folder) {
    if (!std::filesystem::is_directory(folder)) {
        return std::unexpected("Folder not found: " + folder.string());
    }
    SessionRecording rec;
    for (Channel c : kAllChannels) {
        const auto file = folder / recording_file_name(c);
        if (!std::filesystem::exists(file)) continue;
        auto series = load_series(file);
        if (!series) return std::unexpected(series.error());
        rec.series(c) = std::move(*series);
    }
    if (const auto file = folder / kMarkedTimestampsFile; std::filesystem::exists(file)) {
        auto marks = load_marks(file);
        if (!marks) return std::unexpected(marks.error());
        rec.marks = std::move(*marks);
    }
    if (const auto file = folder / kMarkedIntervalsFile; std::filesystem::exists(file)) {
        auto intervals = load_intervals(file);
        if (!intervals) return std::unexpected(intervals.error());
        rec.intervals = std::move(*intervals);
    }
    return rec;
}
