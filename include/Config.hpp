#pragma once
#include <string>
#include <expected>
#include <cstddef>

enum class BpmPolicy {
    FullWindow, ///< report once the history holds a full window
    EveryBeat   ///< report after every accepted or substituted beat
};

struct LoggingConfig {
    std::string level{"info"};
    std::string pattern{"[%H:%M:%S.%e] [%^%l%$] %v"};
};

/**
 * @struct AppConfig
 * @brief Configuration container loaded from YAML.
 */
struct AppConfig {
    struct {
        double threshold{210.0};
        double refractory_period{0.5};
    } detector;

    struct {
        size_t history_capacity{20};
        size_t min_history{20};
        double iqr_multiplier{1.5};
    } filter;

    struct {
        BpmPolicy policy{BpmPolicy::FullWindow};
    } bpm;

    struct {
        double gap_threshold{10.0};
    } segmentation;

    struct {
        bool clean_rr{true};
        double z_threshold{3.0};
        size_t live_window{50};
    } hrv;

    struct {
        bool parallel_channels{true};
    } analysis;

    struct {
        bool realtime{false};
    } replay;

    LoggingConfig logging;

    /**
     * @brief Parses a config file into the struct.
     * @return std::expected containing a validated config or an error string.
     */
    static std::expected<AppConfig, std::string> load(const std::string& path);

    /**
     * @brief Same as load() but from YAML text already in memory.
     */
    static std::expected<AppConfig, std::string> parse(const std::string& yaml_text);

    /**
     * @brief Rejects values no component can run with.
     */
    std::expected<void, std::string> validate() const;
};
