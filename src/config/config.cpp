#include "pileup/config.hpp"
#include "pileup/logging.hpp"
#include <algorithm>
#include <cstdlib>
#include <fstream>

#ifdef _WIN32
#include <direct.h>
#define MKDIR(path) _mkdir(path)
#else
#include <sys/stat.h>
#define MKDIR(path) mkdir(path, 0755)
#endif

namespace pileup {

std::string IntelConfig::getDefaultPath() {
#ifdef _WIN32
    const char* appdata = std::getenv("APPDATA");
    if (appdata) {
        return std::string(appdata) + "\\pileup\\intel.ini";
    }
    return "intel.ini";
#else
    const char* home = std::getenv("HOME");
    if (home) {
        return std::string(home) + "/.config/pileup/intel.ini";
    }
    return "intel.ini";
#endif
}

// Helper to create directory if it doesn't exist
static void ensureDirectory(const std::string& path) {
    size_t pos = path.find_last_of("/\\");
    if (pos != std::string::npos) {
        std::string dir = path.substr(0, pos);
        // Create parent directories recursively
        for (size_t i = 0; i < dir.size(); i++) {
            if (dir[i] == '/' || dir[i] == '\\') {
                std::string subdir = dir.substr(0, i);
                if (!subdir.empty()) {
                    MKDIR(subdir.c_str());
                }
            }
        }
        MKDIR(dir.c_str());
    }
}

static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

static bool parseBool(const std::string& value) {
    return value == "1" || value == "true";
}

bool IntelConfig::save(const std::string& path) const {
    std::string filepath = path.empty() ? getDefaultPath() : path;
    ensureDirectory(filepath);

    std::ofstream file(filepath);
    if (!file.is_open()) {
        LOG_ENGINE(WARN, "Cannot write config %s", filepath.c_str());
        return false;
    }

    file << "[Station]\n";
    file << "callsign=" << station.callsign << "\n";
    file << "grid=" << station.grid << "\n";

    file << "\n[Spectrum]\n";
    file << "bandwidth_hz=" << spectrum.bandwidth_hz << "\n";
    file << "local_half_width_hz=" << spectrum.local_half_width_hz << "\n";
    file << "remote_half_width_hz=" << spectrum.remote_half_width_hz << "\n";
    file << "window_hz=" << spectrum.window_hz << "\n";
    file << "remote_weight=" << spectrum.remote_weight << "\n";
    file << "center_bias_per_hz=" << spectrum.center_bias_per_hz << "\n";
    file << "guard_radius_hz=" << spectrum.guard_radius_hz << "\n";
    file << "guard_penalty=" << spectrum.guard_penalty << "\n";
    file << "edge_guard_hz=" << spectrum.edge_guard_hz << "\n";
    file << "hysteresis_hz=" << spectrum.hysteresis_hz << "\n";
    file << "decay_factor=" << spectrum.decay_factor << "\n";
    file << "decay_floor=" << spectrum.decay_floor << "\n";
    file << "decay_hold_seconds=" << spectrum.decay_hold_seconds << "\n";
    file << "remote_fresh_age_seconds=" << spectrum.remote_fresh_age_seconds << "\n";
    file << "remote_max_age_seconds=" << spectrum.remote_max_age_seconds << "\n";
    file << "waterfall_depth=" << spectrum.waterfall_depth << "\n";
    file << "waterfall_bin_hz=" << spectrum.waterfall_bin_hz << "\n";

    file << "\n[Tracker]\n";
    file << "cycle_seconds=" << tracker.cycle_seconds << "\n";
    file << "stale_seconds=" << tracker.stale_seconds << "\n";
    file << "loudest_tolerance_db=" << tracker.loudest_tolerance_db << "\n";
    file << "pattern_window=" << tracker.pattern_window << "\n";
    file << "pattern_min_answers=" << tracker.pattern_min_answers << "\n";

    file << "\n[Predictor]\n";
    file << "model_name=" << predictor.model_name << "\n";
    file << "default_prior=" << predictor.default_prior << "\n";
    file << "weight_pileup=" << predictor.weight_pileup << "\n";
    file << "weight_snr_rank=" << predictor.weight_snr_rank << "\n";
    file << "weight_behavior=" << predictor.weight_behavior << "\n";
    file << "weight_path=" << predictor.weight_path << "\n";
    file << "weight_persistence=" << predictor.weight_persistence << "\n";
    file << "cache_ttl_seconds=" << predictor.cache_ttl_seconds << "\n";
    file << "cache_max_entries=" << predictor.cache_max_entries << "\n";
    file << "max_reasons=" << predictor.max_reasons << "\n";
    file << "methodical_offset_hz=" << predictor.methodical_offset_hz << "\n";

    file << "\n[Engine]\n";
    file << "decay_period_ms=" << engine.decay_period_ms << "\n";
    file << "refresh_period_ms=" << engine.refresh_period_ms << "\n";
    file << "dial_frequency_hz=" << engine.dial_frequency_hz << "\n";
    file << "heuristic_only=" << (engine.heuristic_only ? "1" : "0") << "\n";

    return true;
}

bool IntelConfig::load(const std::string& path) {
    std::string filepath = path.empty() ? getDefaultPath() : path;

    std::ifstream file(filepath);
    if (!file.is_open()) {
        return false;
    }

    // Keys repeat across sections only by accident, so track the section
    std::string section;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }
        if (line[0] == '[') {
            size_t close = line.find(']');
            section = line.substr(1, close == std::string::npos ? std::string::npos : close - 1);
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        const char* v = value.c_str();

        if (section == "Station") {
            if (key == "callsign") station.callsign = value;
            else if (key == "grid") station.grid = value;
        } else if (section == "Spectrum") {
            if (key == "bandwidth_hz") spectrum.bandwidth_hz = std::atoi(v);
            else if (key == "local_half_width_hz") spectrum.local_half_width_hz = std::atoi(v);
            else if (key == "remote_half_width_hz") spectrum.remote_half_width_hz = std::atoi(v);
            else if (key == "window_hz") spectrum.window_hz = std::atoi(v);
            else if (key == "remote_weight") spectrum.remote_weight = std::strtof(v, nullptr);
            else if (key == "center_bias_per_hz") spectrum.center_bias_per_hz = std::strtof(v, nullptr);
            else if (key == "guard_radius_hz") spectrum.guard_radius_hz = std::atoi(v);
            else if (key == "guard_penalty") spectrum.guard_penalty = std::strtof(v, nullptr);
            else if (key == "edge_guard_hz") spectrum.edge_guard_hz = std::atoi(v);
            else if (key == "hysteresis_hz") spectrum.hysteresis_hz = std::atoi(v);
            else if (key == "decay_factor") spectrum.decay_factor = std::strtof(v, nullptr);
            else if (key == "decay_floor") spectrum.decay_floor = std::strtof(v, nullptr);
            else if (key == "decay_hold_seconds") spectrum.decay_hold_seconds = std::strtof(v, nullptr);
            else if (key == "remote_fresh_age_seconds") spectrum.remote_fresh_age_seconds = std::strtof(v, nullptr);
            else if (key == "remote_max_age_seconds") spectrum.remote_max_age_seconds = std::strtof(v, nullptr);
            else if (key == "waterfall_depth") spectrum.waterfall_depth = std::atoi(v);
            else if (key == "waterfall_bin_hz") spectrum.waterfall_bin_hz = std::atoi(v);
        } else if (section == "Tracker") {
            if (key == "cycle_seconds") tracker.cycle_seconds = std::strtof(v, nullptr);
            else if (key == "stale_seconds") tracker.stale_seconds = std::strtof(v, nullptr);
            else if (key == "loudest_tolerance_db") tracker.loudest_tolerance_db = std::strtof(v, nullptr);
            else if (key == "pattern_window") tracker.pattern_window = std::atoi(v);
            else if (key == "pattern_min_answers") tracker.pattern_min_answers = std::atoi(v);
        } else if (section == "Predictor") {
            if (key == "model_name") predictor.model_name = value;
            else if (key == "default_prior") predictor.default_prior = std::strtod(v, nullptr);
            else if (key == "weight_pileup") predictor.weight_pileup = std::strtod(v, nullptr);
            else if (key == "weight_snr_rank") predictor.weight_snr_rank = std::strtod(v, nullptr);
            else if (key == "weight_behavior") predictor.weight_behavior = std::strtod(v, nullptr);
            else if (key == "weight_path") predictor.weight_path = std::strtod(v, nullptr);
            else if (key == "weight_persistence") predictor.weight_persistence = std::strtod(v, nullptr);
            else if (key == "cache_ttl_seconds") predictor.cache_ttl_seconds = std::strtod(v, nullptr);
            else if (key == "cache_max_entries") predictor.cache_max_entries = static_cast<uint32_t>(std::strtoul(v, nullptr, 10));
            else if (key == "max_reasons") predictor.max_reasons = std::atoi(v);
            else if (key == "methodical_offset_hz") predictor.methodical_offset_hz = std::atoi(v);
        } else if (section == "Engine") {
            if (key == "decay_period_ms") engine.decay_period_ms = static_cast<uint32_t>(std::strtoul(v, nullptr, 10));
            else if (key == "refresh_period_ms") engine.refresh_period_ms = static_cast<uint32_t>(std::strtoul(v, nullptr, 10));
            else if (key == "dial_frequency_hz") engine.dial_frequency_hz = std::strtoll(v, nullptr, 10);
            else if (key == "heuristic_only") engine.heuristic_only = parseBool(value);
        }
    }

    if (validate()) {
        LOG_ENGINE(WARN, "Config %s had out-of-range values, clamped", filepath.c_str());
    }
    return true;
}

template <typename T>
static bool clampField(T& field, T lo, T hi) {
    T clamped = std::clamp(field, lo, hi);
    if (clamped == field) return false;
    field = clamped;
    return true;
}

bool IntelConfig::validate() {
    bool changed = false;

    changed |= clampField(spectrum.bandwidth_hz, 100, 6000);
    changed |= clampField(spectrum.local_half_width_hz, 0, 500);
    changed |= clampField(spectrum.remote_half_width_hz, 0, 500);
    changed |= clampField(spectrum.window_hz, 1, spectrum.bandwidth_hz);
    changed |= clampField(spectrum.remote_weight, 0.0f, 100.0f);
    changed |= clampField(spectrum.center_bias_per_hz, 0.0f, 10.0f);
    changed |= clampField(spectrum.guard_radius_hz, 0, spectrum.bandwidth_hz);
    changed |= clampField(spectrum.guard_penalty, 0.0f, 1.0e9f);
    changed |= clampField(spectrum.edge_guard_hz, 0, spectrum.bandwidth_hz);
    changed |= clampField(spectrum.hysteresis_hz, 0, spectrum.bandwidth_hz);
    changed |= clampField(spectrum.decay_factor, 0.01f, 0.999f);
    changed |= clampField(spectrum.decay_floor, 0.0f, 50.0f);
    changed |= clampField(spectrum.decay_hold_seconds, 0.0f, 600.0f);
    changed |= clampField(spectrum.remote_fresh_age_seconds, 0.0f, 86000.0f);
    changed |= clampField(spectrum.remote_max_age_seconds,
                          spectrum.remote_fresh_age_seconds + 1.0f, 86400.0f);
    changed |= clampField(spectrum.waterfall_depth, 1, 10000);
    changed |= clampField(spectrum.waterfall_bin_hz, 1, spectrum.bandwidth_hz);

    changed |= clampField(tracker.cycle_seconds, 1.0f, 600.0f);
    changed |= clampField(tracker.stale_seconds, 1.0f, 86400.0f);
    changed |= clampField(tracker.loudest_tolerance_db, 0.0f, 30.0f);
    changed |= clampField(tracker.pattern_min_answers, 2, 1000);
    changed |= clampField(tracker.pattern_window, tracker.pattern_min_answers, 1000);

    changed |= clampField(predictor.default_prior, 0.01, 0.99);
    changed |= clampField(predictor.weight_pileup, 0.0, 10.0);
    changed |= clampField(predictor.weight_snr_rank, 0.0, 10.0);
    changed |= clampField(predictor.weight_behavior, 0.0, 10.0);
    changed |= clampField(predictor.weight_path, 0.0, 10.0);
    changed |= clampField(predictor.weight_persistence, 0.0, 10.0);
    changed |= clampField(predictor.cache_ttl_seconds, 0.0, 3600.0);
    changed |= clampField(predictor.cache_max_entries, 1u, 100000u);
    changed |= clampField(predictor.max_reasons, 1, 20);
    changed |= clampField(predictor.methodical_offset_hz, 0, 1000);

    changed |= clampField(engine.decay_period_ms, 10u, 60000u);
    changed |= clampField(engine.refresh_period_ms, 100u, 600000u);

    return changed;
}

} // namespace pileup
