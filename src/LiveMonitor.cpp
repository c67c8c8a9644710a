#include "LiveMonitor.hpp"
#include "BpmEstimator.hpp"
#include <cmath>
#include <stdexcept>

LiveMonitor::LiveMonitor(const AppConfig& cfg, std::shared_ptr<spdlog::logger> logger)
    : m_detector(cfg.detector.threshold, cfg.detector.refractory_period),
      m_filter(cfg.filter.min_history, cfg.filter.iqr_multiplier),
      m_policy(cfg.bpm.policy),
      m_log(std::move(logger)),
      m_history(cfg.filter.history_capacity),
      m_hrv(cfg.hrv.live_window, cfg.hrv.z_threshold) {
    if (!m_log) {
        throw std::invalid_argument("LiveMonitor needs a logger");
    }
    if (cfg.filter.min_history > cfg.filter.history_capacity) {
        throw std::invalid_argument("min_history exceeds history capacity; outliers would never be judged");
    }
}

std::optional<BeatEvent> LiveMonitor::on_sample(const Sample& sample) {
    const DetectResult r = m_detector.detect(sample, m_last_beat_time);
    m_last_beat_time = r.last_beat_time;
    if (!r.is_beat) {
        return std::nullopt;
    }
    m_log->debug("Timestamp: {:.3f}, BEAT", sample.timestamp);
    ingest_beat(r.last_beat_time);
    return BeatEvent{r.last_beat_time};
}

FilterResult LiveMonitor::on_beat(double timestamp) {
    return ingest_beat(timestamp);
}

FilterResult LiveMonitor::on_rr_interval(const Sample& rr) {
    if (!std::isfinite(rr.value) || rr.value <= 0.0) {
        throw std::invalid_argument("RR interval must be a positive number");
    }
    double rr_ms = rr.value;
    if (rr_ms < kRrSecondsCutoff) {
        if (!m_rr_in_seconds) {
            m_log->warn("RR value {:.3f} looks like seconds; scaling RR input to ms", rr.value);
            m_rr_in_seconds = true;
        }
        rr_ms *= 1000.0;
    }
    const double beat_time = m_rr_clock ? *m_rr_clock + rr_ms / 1000.0 : rr.timestamp;
    m_rr_clock = beat_time;

    std::optional<HrvMetrics> hrv = m_hrv.add(rr_ms);
    if (hrv) {
        m_log->info("Live HRV: SDNN {:.2f} ms, RMSSD {:.2f} ms",
            hrv->sdnn.value_or(0.0), hrv->rmssd.value_or(0.0));
        std::lock_guard<std::mutex> lock(m_mtx);
        m_last_hrv = hrv;
    }
    return ingest_beat(beat_time);
}

FilterResult LiveMonitor::ingest_beat(double timestamp) {
    FilterResult res{};
    double bpm = 0.0;
    bool report = false;
    {
        std::lock_guard<std::mutex> lock(m_mtx);
        res = m_filter.accept_or_substitute(timestamp, m_history);
        ++m_beats;
        if (res.verdict == BeatVerdict::Substituted) {
            ++m_substituted;
        }
        report = m_policy == BpmPolicy::EveryBeat || m_history.full();
        if (report) {
            bpm = calculate_bpm(m_history, m_filter.iqr_multiplier());
            m_bpm = bpm;
        }
    }
    if (res.verdict == BeatVerdict::Substituted) {
        m_log->info("Outlier beat at {:.3f}; synthetic beat added at {:.3f}", timestamp, res.inserted);
    }
    if (report) {
        m_log->info("Current BPM: {:.2f}", bpm);
    }
    return res;
}

void LiveMonitor::reset() {
    m_last_beat_time = BeatDetector::kNoPreviousBeat;
    m_rr_clock.reset();
    m_rr_in_seconds = false;
    {
        std::lock_guard<std::mutex> lock(m_mtx);
        m_history.clear();
        m_hrv.reset();
        m_beats = 0;
        m_substituted = 0;
        m_last_hrv.reset();
        m_bpm = 0.0;
    }
    m_log->info("Live state reset");
}

LiveSnapshot LiveMonitor::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mtx);
    LiveSnapshot s;
    s.history = m_history.timestamps();
    s.bpm = m_bpm;
    s.beats_detected = m_beats;
    s.beats_substituted = m_substituted;
    s.last_hrv = m_last_hrv;
    return s;
}
