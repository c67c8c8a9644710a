#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <spdlog/spdlog.h>
#include "Config.hpp"
#include "Logging.hpp"
#include "Recording.hpp"
#include "Report.hpp"
#include "SessionAnalyzer.hpp"

namespace {
bool write_file(spdlog::logger& log, const std::filesystem::path& path, const std::string& text) {
    std::ofstream out(path);
    if (!out) {
        log.error("Cannot write {}", path.string());
        return false;
    }
    out << text;
    log.info("HRV values saved to {}", path.string());
    return true;
}

int run_session(const AppConfig& config, std::shared_ptr<spdlog::logger> log, const std::filesystem::path& folder,
                const char* hrv_out) {
    auto rec = load_recording(folder);
    if (!rec) {
        log->error("Recording Error: {}", rec.error());
        return -1;
    }
    log->info("Loaded {}: {} HR samples, {} RR samples, {} marks, {} intervals", folder.string(),
        rec->heart_rate.size(), rec->rr_interval.size(), rec->marks.size(), rec->intervals.size());

    auto start = std::chrono::steady_clock::now();
    SessionAnalyzer analyzer(config, log);
    const auto report = analyzer.analyze(*rec);
    const auto hrv = analyzer.analyze_hrv(*rec);
    log->info("Analysis finished in {:.1f} ms", std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count());

    const std::string text = format_session_report(report);
    std::fwrite(text.data(), 1, text.size(), stdout);

    if (hrv_out && hrv.has_data()) {
        auto participant = folder.filename().string();
        if (participant.empty()) participant = folder.parent_path().filename().string();
        if (!write_file(*log, hrv_out, format_hrv_csv(participant, hrv))) return -1;
    }
    return 0;
}

// HRV values of every participant folder under base_dir into one CSV
int run_batch(const AppConfig& config, std::shared_ptr<spdlog::logger> log, const std::filesystem::path& base_dir,
              const std::filesystem::path& hrv_out) {
    SessionAnalyzer analyzer(config, log);
    auto batch = analyzer.analyze_hrv_batch(base_dir);
    if (!batch) {
        log->error("Batch Error: {}", batch.error());
        return -1;
    }
    if (batch->empty()) {
        log->warn("No participant folder under {} holds RR intervals and marked timestamps", base_dir.string());
    }
    return write_file(*log, hrv_out, format_hrv_batch_csv(*batch)) ? 0 : -1;
}
} // namespace

int main(int argc, char** argv) {
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    const bool batch = argc > 2 && std::string(argv[2]) == "--batch";
    if (argc < 3 || (batch && argc < 4)) {
        spdlog::error("Usage: {} <config.yaml> <participant_folder> [hrv_out.csv]", argv[0]);
        spdlog::error("       {} <config.yaml> --batch <participants_dir> [hrv_values.csv]", argv[0]);
        return 2;
    }

    auto config_res = AppConfig::load(argv[1]);
    if (!config_res) {
        spdlog::error("Config Error: {}", config_res.error());
        return -1;
    }
    const auto config = *config_res;
    auto log = make_logger("session_analyzer", config.logging);

    try {
        if (batch) {
            return run_batch(config, log, argv[3], argc > 4 ? argv[4] : "hrv_values.csv");
        }
        return run_session(config, log, argv[2], argc > 3 ? argv[3] : nullptr);
    } catch (const std::exception& e) {
        log->error("Fatal: {}", e.what());
        return -1;
    }
}
