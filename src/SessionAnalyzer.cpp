#include "SessionAnalyzer.hpp"
#include "EpisodeSplitter.hpp"
#include "Segmenter.hpp"
#include <algorithm>
#include <cmath>
#include <exception>
#include <iterator>
#include <stdexcept>
#include <thread>

namespace {
StatisticsReport summarize_samples(const std::vector<Sample>& samples, bool is_rr) {
    const auto values = values_of(samples);
    const auto ts = timestamps_of(samples);
    // callers only pass non-empty sample runs
    auto r = summarize(values, ts, is_rr);
    if (!r) {
        throw std::logic_error(r.error());
    }
    return *r;
}
} // namespace

const ChannelReport* SessionReport::find(Channel c) const {
    for (const auto& ch : channels) {
        if (ch.channel == c) return &ch;
    }
    return nullptr;
}

HrvBatchReport analyze_hrv(const std::vector<Sample>& rr, std::span<const double> marks,
                           bool clean, double z_threshold) {
    HrvBatchReport report;
    if (rr.empty()) return report;

    const auto ts = timestamps_of(rr);
    auto values = normalize_rr_units(values_of(rr));
    if (clean) {
        values = clean_rr_intervals(values, z_threshold);
    }

    for (size_t i = 0; i + 1 < marks.size(); ++i) {
        std::vector<double> inside;
        for (size_t k = 0; k < ts.size(); ++k) {
            if (ts[k] >= marks[i] && ts[k] < marks[i + 1]) {
                inside.push_back(values[k]);
            }
        }
        HrvRow row{"Segment_" + std::to_string(i + 1), {}};
        if (inside.size() > 1) {
            row.metrics = compute_hrv(inside);
        }
        report.rows.push_back(std::move(row));
    }
    report.rows.push_back(HrvRow{"Overall", compute_hrv(values)});
    return report;
}

SessionAnalyzer::SessionAnalyzer(const AppConfig& cfg, std::shared_ptr<spdlog::logger> logger)
    : m_gap(cfg.segmentation.gap_threshold),
      m_parallel(cfg.analysis.parallel_channels),
      m_clean_rr(cfg.hrv.clean_rr),
      m_z(cfg.hrv.z_threshold),
      m_log(std::move(logger)) {
    if (!std::isfinite(m_gap) || m_gap < 0.0) {
        throw std::invalid_argument("Gap threshold must be a non-negative number");
    }
    if (!m_log) {
        throw std::invalid_argument("SessionAnalyzer needs a logger");
    }
}

ChannelReport SessionAnalyzer::analyze_channel(Channel channel, const std::vector<Sample>& series,
                                               std::span<const double> marks,
                                               std::span<const Interval> intervals) const {
    ChannelReport report;
    report.channel = channel;
    if (series.empty()) {
        m_log->warn("{} Data: No Data Available", channel_name(channel));
        return report;
    }
    const bool is_rr = channel == Channel::RRinterval;

    report.overall = summarize_samples(series, is_rr);
    if (!marks.empty()) {
        report.episode_mode = EpisodeMode::Marks;
    } else if (!intervals.empty()) {
        report.episode_mode = EpisodeMode::Intervals;
    }

    const auto segments = segment_series(series, m_gap);
    m_log->debug("{}: {} samples in {} segment(s)", channel_name(channel), series.size(), segments.size());

    for (size_t i = 0; i < segments.size(); ++i) {
        const Segment& seg = segments[i];
        SegmentReport sr{i, seg.start_time(), seg.end_time(), summarize_samples(seg.samples, is_rr), {}};

        std::vector<Episode> episodes;
        if (report.episode_mode == EpisodeMode::Marks) {
            episodes = split_by_marks(seg, marks);
        } else if (report.episode_mode == EpisodeMode::Intervals) {
            episodes = split_by_intervals(seg, intervals);
        }
        for (size_t e = 0; e < episodes.size(); ++e) {
            sr.episodes.push_back(EpisodeReport{e, episodes[e].start, episodes[e].end,
                                                summarize_samples(episodes[e].samples, is_rr)});
        }
        report.segments.push_back(std::move(sr));
    }
    return report;
}

SessionReport SessionAnalyzer::analyze(const SessionRecording& rec) const {
    SessionReport report;
    report.channels.resize(std::size(kAllChannels));

    if (!m_parallel) {
        for (size_t i = 0; i < report.channels.size(); ++i) {
            const Channel c = kAllChannels[i];
            report.channels[i] = analyze_channel(c, rec.series(c), rec.marks, rec.intervals);
        }
    } else {
        std::vector<std::exception_ptr> errors(report.channels.size());
        {
            std::vector<std::jthread> workers;
            for (size_t i = 0; i < report.channels.size(); ++i) {
                workers.emplace_back([&, i]() {
                    const Channel c = kAllChannels[i];
                    try {
                        report.channels[i] = analyze_channel(c, rec.series(c), rec.marks, rec.intervals);
                    } catch (...) {
                        errors[i] = std::current_exception();
                    }
                });
            }
        }
        for (const auto& e : errors) {
            if (e) std::rethrow_exception(e);
        }
    }

    for (const auto& ch : report.channels) {
        if (ch.has_data()) {
            m_log->info("{}: {} segment(s), overall mean {:.2f}", channel_name(ch.channel),
                ch.segments.size(), ch.overall->mean);
        }
    }
    return report;
}

HrvBatchReport SessionAnalyzer::analyze_hrv(const SessionRecording& rec) const {
    if (rec.rr_interval.empty()) {
        m_log->warn("No RR intervals recorded; HRV report skipped");
        return {};
    }
    return ::analyze_hrv(rec.rr_interval, rec.marks, m_clean_rr, m_z);
}

std::expected<std::vector<ParticipantHrv>, std::string>
SessionAnalyzer::analyze_hrv_batch(const std::filesystem::path& base_dir) const {
    if (!std::filesystem::is_directory(base_dir)) {
        return std::unexpected("Folder not found: " + base_dir.string());
    }
    std::vector<std::filesystem::path> folders;
    for (const auto& entry : std::filesystem::directory_iterator(base_dir)) {
        if (entry.is_directory()) folders.push_back(entry.path());
    }
    std::sort(folders.begin(), folders.end());

    std::vector<ParticipantHrv> results;
    for (const auto& folder : folders) {
        const std::string name = folder.filename().string();
        const auto rr_file = folder / recording_file_name(Channel::RRinterval);
        const auto marks_file = folder / kMarkedTimestampsFile;
        if (!std::filesystem::exists(rr_file) || !std::filesystem::exists(marks_file)) {
            m_log->warn("Missing required files for {}. Skipping.", name);
            continue;
        }
        auto rr = load_series(rr_file);
        if (!rr) {
            m_log->warn("{}: {}. Skipping.", name, rr.error());
            continue;
        }
        auto marks = load_marks(marks_file);
        if (!marks) {
            m_log->warn("{}: {}. Skipping.", name, marks.error());
            continue;
        }
        auto report = ::analyze_hrv(*rr, *marks, m_clean_rr, m_z);
        if (!report.has_data()) {
            m_log->warn("{}: no RR intervals recorded. Skipping.", name);
            continue;
        }
        m_log->info("{}: {} HRV row(s)", name, report.rows.size());
        results.push_back(ParticipantHrv{"Participant_hrv_" + name, std::move(report)});
    }
    return results;
}
