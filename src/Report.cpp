#include "Report.hpp"
#include <iterator>
#include <spdlog/fmt/fmt.h>

namespace {
using Out = std::back_insert_iterator<std::string>;

constexpr const char* kHrvCsvHeader = "Participant,Segment,RMSSD,SDNN,pNN50\n";

void write_stats(Out out, const StatisticsReport& s, const char* indent) {
    fmt::format_to(out, "{}Mean: {:.2f}\n", indent, s.mean);
    fmt::format_to(out, "{}Median: {:.2f}\n", indent, s.median);
    fmt::format_to(out, "{}Min: {:.2f}\n", indent, s.min);
    fmt::format_to(out, "{}Max: {:.2f}\n", indent, s.max);
    fmt::format_to(out, "{}Variability (Standard Deviation): {:.2f}\n", indent, s.std_dev);
    fmt::format_to(out, "{}Interquartile Range (IQR): {:.2f}\n", indent, s.iqr);
    if (s.rmssd) fmt::format_to(out, "{}RMSSD: {:.2f}\n", indent, *s.rmssd);
    if (s.sdnn) fmt::format_to(out, "{}SDNN: {:.2f}\n", indent, *s.sdnn);
    if (s.pnn50) fmt::format_to(out, "{}pNN50: {:.2f}\n", indent, *s.pnn50);
}

std::string cell(const std::optional<double>& v) {
    return v ? fmt::format("{}", *v) : std::string();
}
} // namespace

std::string format_session_report(const SessionReport& report) {
    std::string text;
    auto out = std::back_inserter(text);
    for (const auto& ch : report.channels) {
        const auto name = channel_name(ch.channel);
        if (!ch.has_data()) {
            fmt::format_to(out, "{} Data: No Data Available\n\n", name);
            continue;
        }
        fmt::format_to(out, "{} Data (overall):\n", name);
        write_stats(out, *ch.overall, "  ");
        fmt::format_to(out, "  Duration: {:.2f} seconds\n\n", ch.overall->duration);

        for (const auto& seg : ch.segments) {
            fmt::format_to(out, "Segment {} ({} Data):\n", seg.index + 1, name);
            write_stats(out, seg.stats, "  ");
            fmt::format_to(out, "  Duration: {:.2f} seconds\n", seg.stats.duration);

            if (ch.episode_mode == EpisodeMode::None) {
                fmt::format_to(out, "  No Marked Timestamps Available for This Segment\n\n");
                continue;
            }
            fmt::format_to(out, "  Episodes between {}:\n",
                ch.episode_mode == EpisodeMode::Marks ? "Marked Timestamps" : "Marked Intervals");
            if (seg.episodes.empty()) {
                fmt::format_to(out, "    None in this segment\n");
            }
            for (const auto& ep : seg.episodes) {
                fmt::format_to(out, "    Episode {} [{:.2f}, {:.2f}]:\n", ep.index + 1, ep.start, ep.end);
                write_stats(out, ep.stats, "      ");
                fmt::format_to(out, "      Duration: {:.2f} seconds\n", ep.end - ep.start);
            }
            fmt::format_to(out, "\n");
        }
    }
    return text;
}

std::string format_hrv_csv(const std::string& participant, const HrvBatchReport& report, bool with_header) {
    std::string text;
    auto out = std::back_inserter(text);
    if (with_header) {
        text += kHrvCsvHeader;
    }
    for (const auto& row : report.rows) {
        fmt::format_to(out, "{},{},{},{},{}\n", participant, row.label,
            cell(row.metrics.rmssd), cell(row.metrics.sdnn), cell(row.metrics.pnn50));
    }
    return text;
}

std::string format_hrv_batch_csv(const std::vector<ParticipantHrv>& batch) {
    std::string text = kHrvCsvHeader;
    for (const auto& p : batch) {
        text += format_hrv_csv(p.participant, p.report, false);
    }
    return text;
}
