#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>
#include <spdlog/spdlog.h>
#include "BeatDetector.hpp"
#include "BeatFilter.hpp"
#include "BeatHistory.hpp"
#include "Config.hpp"
#include "Hrv.hpp"
#include "Types.hpp"

/**
 * @struct LiveSnapshot
 * @brief Copy of the live state, safe to hand to a reporting thread.
 */
struct LiveSnapshot {
    std::vector<double> history;
    double bpm{0.0};
    size_t beats_detected{0};
    size_t beats_substituted{0};
    std::optional<HrvMetrics> last_hrv;
};

/**
 * @class LiveMonitor
 * @brief Detector -> outlier filter -> BPM estimator on the sample delivery thread.
 *
 * Single writer: on_sample / on_beat / on_rr_interval / reset must be called
 * from one delivery context. snapshot() and latest_bpm() may be called from any
 * thread. A snapshot's bpm is always the estimate for its history.
 */
class LiveMonitor {
public:
    /**
     * @param cfg Detector, filter, bpm and hrv sections are used.
     * @param logger Sink for beat and BPM messages.
     * @throws std::invalid_argument if the configuration is unusable.
     */
    explicit LiveMonitor(const AppConfig& cfg,
                         std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

    /**
     * @brief Feeds one raw analog sample.
     * @return The beat event when the detector fired on this sample.
     */
    std::optional<BeatEvent> on_sample(const Sample& sample);

    /**
     * @brief Feeds a beat detected elsewhere.
     */
    FilterResult on_beat(double timestamp);

    /**
     * @brief Feeds one RR interval in ms. The beat time advances by the interval from the first RR sample's timestamp.
     *
     * Values below kRrSecondsCutoff are taken as seconds and scaled to ms.
     * @throws std::invalid_argument on a non-positive or non-finite value.
     */
    FilterResult on_rr_interval(const Sample& rr);

    /**
     * @brief Clears history and detector state (e.g., after a reconnect).
     */
    void reset();

    LiveSnapshot snapshot() const;
    double latest_bpm() const { return m_bpm; }

private:
    FilterResult ingest_beat(double timestamp);

    BeatDetector m_detector;
    BeatFilter m_filter;
    BpmPolicy m_policy;
    std::shared_ptr<spdlog::logger> m_log;

    double m_last_beat_time{BeatDetector::kNoPreviousBeat};
    std::optional<double> m_rr_clock;
    bool m_rr_in_seconds{false};

    mutable std::mutex m_mtx;
    BeatHistory m_history;
    RrWindowTracker m_hrv;
    size_t m_beats{0};
    size_t m_substituted{0};
    std::optional<HrvMetrics> m_last_hrv;

    std::atomic<double> m_bpm{0.0};
};
