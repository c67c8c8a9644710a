#include <atomic>
#include <chrono>
#include <thread>
#include <vector>
#include <spdlog/spdlog.h>
#include "Config.hpp"
#include "LiveMonitor.hpp"
#include "Logging.hpp"
#include "Recording.hpp"
#include "Statistics.hpp"

namespace {
// Summary of the detector's raw beat-to-beat intervals, before outlier substitution
void log_beat_intervals(spdlog::logger& log, const std::vector<double>& beat_times) {
    if (beat_times.size() < 3) return;
    auto intervals = successive_differences(beat_times);
    for (auto& iv : intervals) iv *= 1000.0;
    const std::vector<double> at(beat_times.begin() + 1, beat_times.end());
    auto stats = summarize(intervals, at, true);
    if (!stats) {
        log.warn("Beat interval summary unavailable: {}", stats.error());
        return;
    }
    log.info("Detected beat interval: mean {:.1f} ms (median {:.1f}), min {:.1f}, max {:.1f}",
        stats->mean, stats->median, stats->min, stats->max);
    log.info("Detected beat HRV: SDNN {:.1f} ms, RMSSD {:.1f} ms",
        stats->sdnn.value_or(0.0), stats->rmssd.value_or(0.0));
}
} // namespace

int main(int argc, char** argv) {
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    if (argc < 3) {
        spdlog::error("Usage: {} <config.yaml> <raw_ecg.csv>", argv[0]);
        return 2;
    }

    auto app_start = std::chrono::steady_clock::now();
    auto config_res = AppConfig::load(argv[1]);
    if (!config_res) {
        spdlog::error("Config Error: {}", config_res.error());
        return -1;
    }
    const auto config = *config_res;
    auto log = make_logger("heartbeat_monitor", config.logging);
    log->info("Config loaded in {:.1f} ms", std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - app_start).count());
    log->info("Detector threshold={}, refractory_period={} s, history={} beats",
        config.detector.threshold, config.detector.refractory_period, config.filter.history_capacity);

    auto ecg = load_series(argv[2]);
    if (!ecg) {
        log->error("Signal Error: {}", ecg.error());
        return -1;
    }
    if (ecg->empty()) {
        log->warn("Signal file holds no samples");
        return 0;
    }
    log->info("Replaying {} samples ({:.1f} s)", ecg->size(),
        ecg->back().timestamp - ecg->front().timestamp);

    try {
        LiveMonitor monitor(config, log);
        std::atomic<bool> done{false};
        std::vector<double> beat_times;

        // Delivery context: the only writer of the monitor's state
        std::jthread producer([&](std::stop_token st) {
            const auto wall_start = std::chrono::steady_clock::now();
            const double t0 = ecg->front().timestamp;
            for (const auto& s : *ecg) {
                if (st.stop_requested()) break;
                if (config.replay.realtime) {
                    std::this_thread::sleep_until(wall_start + std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                        std::chrono::duration<double>(s.timestamp - t0)));
                }
                if (auto beat = monitor.on_sample(s)) {
                    beat_times.push_back(beat->timestamp);
                }
            }
            done = true;
        });

        // Reporting context: reads snapshots only
        auto last_report = std::chrono::steady_clock::now();
        while (!done) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            auto now = std::chrono::steady_clock::now();
            if (now - last_report > std::chrono::seconds(2)) {
                const auto snap = monitor.snapshot();
                log->info("Beats: {} ({} synthetic), window {}/{}, BPM {:.2f}",
                    snap.beats_detected, snap.beats_substituted, snap.history.size(),
                    config.filter.history_capacity, snap.bpm);
                last_report = now;
            }
        }
        producer.join();

        const auto snap = monitor.snapshot();
        log->info("Done: {} beats, {} synthetic, final BPM {:.2f}",
            snap.beats_detected, snap.beats_substituted, snap.bpm);
        log_beat_intervals(*log, beat_times);
    } catch (const std::exception& e) {
        log->error("Fatal: {}", e.what());
        return -1;
    }
    return 0;
}
