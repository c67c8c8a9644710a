#include "Config.hpp"
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <algorithm>
#include <cmath>
#include <array>
#include <cctype>

namespace {
template <typename T>
T read(const YAML::Node& section, const char* key, T fallback) {
    if (!section || !section[key]) {
        return fallback;
    }
    return section[key].as<T>();
}

std::expected<size_t, std::string> read_count(const YAML::Node& section, const char* key, size_t fallback) {
    const long long v = read<long long>(section, key, static_cast<long long>(fallback));
    if (v < 0) {
        return std::unexpected(std::string(key) + " must not be negative");
    }
    return static_cast<size_t>(v);
}

std::expected<AppConfig, std::string> from_node(const YAML::Node& node) {
    AppConfig c;
    const YAML::Node detector = node["detector"];
    c.detector.threshold = read<double>(detector, "threshold", c.detector.threshold);
    c.detector.refractory_period = read<double>(detector, "refractory_period", c.detector.refractory_period);

    const YAML::Node filter = node["filter"];
    auto capacity = read_count(filter, "history_capacity", c.filter.history_capacity);
    if (!capacity) return std::unexpected(capacity.error());
    c.filter.history_capacity = *capacity;
    auto min_history = read_count(filter, "min_history", c.filter.min_history);
    if (!min_history) return std::unexpected(min_history.error());
    c.filter.min_history = *min_history;
    c.filter.iqr_multiplier = read<double>(filter, "iqr_multiplier", c.filter.iqr_multiplier);

    std::string policy = read<std::string>(node["bpm"], "policy", "full_window");
    std::transform(policy.begin(), policy.end(), policy.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (policy == "full_window") {
        c.bpm.policy = BpmPolicy::FullWindow;
    } else if (policy == "every_beat") {
        c.bpm.policy = BpmPolicy::EveryBeat;
    } else {
        return std::unexpected("Unknown bpm.policy: " + policy);
    }

    c.segmentation.gap_threshold = read<double>(node["segmentation"], "gap_threshold", c.segmentation.gap_threshold);

    const YAML::Node hrv = node["hrv"];
    c.hrv.clean_rr = read<bool>(hrv, "clean_rr", c.hrv.clean_rr);
    c.hrv.z_threshold = read<double>(hrv, "z_threshold", c.hrv.z_threshold);
    auto live_window = read_count(hrv, "live_window", c.hrv.live_window);
    if (!live_window) return std::unexpected(live_window.error());
    c.hrv.live_window = *live_window;

    c.analysis.parallel_channels = read<bool>(node["analysis"], "parallel_channels", c.analysis.parallel_channels);
    c.replay.realtime = read<bool>(node["replay"], "realtime", c.replay.realtime);

    const YAML::Node logging = node["logging"];
    c.logging.level = read<std::string>(logging, "level", c.logging.level);
    c.logging.pattern = read<std::string>(logging, "pattern", c.logging.pattern);

    if (auto ok = c.validate(); !ok) {
        return std::unexpected(ok.error());
    }
    return c;
}
} // namespace

std::expected<AppConfig, std::string> AppConfig::load(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        return std::unexpected("Config missing: " + path);
    }
    try {
        return from_node(YAML::LoadFile(path));
    } catch (const std::exception& e) {
        return std::unexpected(e.what());
    }
}

std::expected<AppConfig, std::string> AppConfig::parse(const std::string& yaml_text) {
    try {
        return from_node(YAML::Load(yaml_text));
    } catch (const std::exception& e) {
        return std::unexpected(e.what());
    }
}

std::expected<void, std::string> AppConfig::validate() const {
    if (!std::isfinite(detector.threshold) || detector.threshold < 0.0) {
        return std::unexpected("detector.threshold must be a non-negative number");
    }
    if (!std::isfinite(detector.refractory_period) || detector.refractory_period < 0.0) {
        return std::unexpected("detector.refractory_period must be a non-negative number");
    }
    if (filter.history_capacity < 2) {
        return std::unexpected("filter.history_capacity must be at least 2");
    }
    if (filter.min_history < 2 || filter.min_history > filter.history_capacity) {
        return std::unexpected("filter.min_history must lie in [2, history_capacity]");
    }
    if (!std::isfinite(filter.iqr_multiplier) || filter.iqr_multiplier < 0.0) {
        return std::unexpected("filter.iqr_multiplier must be a non-negative number");
    }
    if (!std::isfinite(segmentation.gap_threshold) || segmentation.gap_threshold < 0.0) {
        return std::unexpected("segmentation.gap_threshold must be a non-negative number");
    }
    if (!std::isfinite(hrv.z_threshold) || hrv.z_threshold <= 0.0) {
        return std::unexpected("hrv.z_threshold must be positive");
    }
    if (hrv.live_window < 2) {
        return std::unexpected("hrv.live_window must be at least 2");
    }
    static constexpr std::array levels{"trace", "debug", "info", "warning", "warn", "error", "critical", "off"};
    if (std::find(levels.begin(), levels.end(), logging.level) == levels.end()) {
        return std::unexpected("Unknown logging.level: " + logging.level);
    }
    return {};
}
