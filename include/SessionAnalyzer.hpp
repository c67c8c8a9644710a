#pragma once
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include "Config.hpp"
#include "Hrv.hpp"
#include "Recording.hpp"
#include "Statistics.hpp"
#include "Types.hpp"

struct EpisodeReport {
    size_t index;
    double start;
    double end;
    StatisticsReport stats;
};

struct SegmentReport {
    size_t index;
    double start;
    double end;
    StatisticsReport stats;
    std::vector<EpisodeReport> episodes;
};

enum class EpisodeMode {
    None,      ///< no marks and no explicit intervals in the recording
    Marks,
    Intervals
};

/**
 * @struct ChannelReport
 * @brief Overall, per-segment and per-episode statistics of one channel.
 */
struct ChannelReport {
    Channel channel{Channel::HeartRate};
    std::optional<StatisticsReport> overall; ///< empty when the channel has no data
    std::vector<SegmentReport> segments;
    EpisodeMode episode_mode{EpisodeMode::None};

    bool has_data() const { return overall.has_value(); }
};

struct SessionReport {
    std::vector<ChannelReport> channels;

    const ChannelReport* find(Channel c) const;
};

/**
 * @struct HrvRow
 * @brief One line of the HRV batch report.
 */
struct HrvRow {
    std::string label; ///< "Segment_<n>" or "Overall"
    HrvMetrics metrics;
};

struct HrvBatchReport {
    std::vector<HrvRow> rows; ///< one row per consecutive mark pair, then "Overall"
    bool has_data() const { return !rows.empty(); }
};

struct ParticipantHrv {
    std::string participant; ///< "Participant_hrv_<folder>"
    HrvBatchReport report;
};

/**
 * @brief RMSSD, SDNN and pNN50 over the whole RR series and between consecutive marks.
 *
 * RR values below 10 are taken as seconds and scaled to ms. Mark ranges are
 * half-open [m_i, m_{i+1}) and need more than one RR value to report metrics.
 *
 * @param clean Apply clean_rr_intervals() before computing.
 */
HrvBatchReport analyze_hrv(const std::vector<Sample>& rr, std::span<const double> marks,
                           bool clean = true, double z_threshold = 3.0);

/**
 * @class SessionAnalyzer
 * @brief Offline segmentation, episode splitting and summaries over a recorded session.
 */
class SessionAnalyzer {
public:
    /**
     * @throws std::invalid_argument on an unusable gap threshold.
     */
    explicit SessionAnalyzer(const AppConfig& cfg,
                             std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

    /**
     * @brief Analyses every known channel; channels run on their own threads when configured.
     */
    SessionReport analyze(const SessionRecording& rec) const;

    ChannelReport analyze_channel(Channel channel, const std::vector<Sample>& series,
                                  std::span<const double> marks,
                                  std::span<const Interval> intervals) const;

    HrvBatchReport analyze_hrv(const SessionRecording& rec) const;

    /**
     * @brief HRV report for every participant folder under base_dir, in folder-name order.
     *
     * Folders without an RR recording or marked timestamps, or with a malformed
     * one, are skipped with a warning.
     * @return Error if base_dir is not a directory.
     */
    std::expected<std::vector<ParticipantHrv>, std::string>
    analyze_hrv_batch(const std::filesystem::path& base_dir) const;

private:
    double m_gap;
    bool m_parallel;
    bool m_clean_rr;
    double m_z;
    std::shared_ptr<spdlog::logger> m_log;
};
