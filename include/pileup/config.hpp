#pragma once

#include <cstdint>
#include <string>

namespace pileup {

// Operator station
struct StationConfig {
    std::string callsign = "N0CALL";   // Standard placeholder callsign
    std::string grid;                  // Maidenhead locator
};

// Spectral occupancy map and gap finder
struct SpectrumConfig {
    int bandwidth_hz = 3000;           // Usable audio window, one bin per Hz
    int local_half_width_hz = 25;      // Raised around each local decode
    int remote_half_width_hz = 30;     // Raised around each remote report

    // Gap search
    int window_hz = 50;                // Sliding window width (our TX footprint)
    float remote_weight = 2.0f;        // Remote interference counts double
    float center_bias_per_hz = 0.01f;  // Pull toward the middle of the window
    int guard_radius_hz = 150;         // Keep clear of the protected (target) frequency
    float guard_penalty = 1.0e6f;
    int edge_guard_hz = 200;           // Excluded at both band edges
    int hysteresis_hz = 20;            // Smaller moves are not published

    // Decay of local signals
    float decay_factor = 0.95f;        // Per tick
    float decay_floor = 0.5f;          // Below this snaps to zero
    float decay_hold_seconds = 12.0f;  // No decay while decodes keep arriving

    // Remote report ageing: full weight until fresh_age, zero at max_age
    float remote_fresh_age_seconds = 60.0f;
    float remote_max_age_seconds = 600.0f;

    // Waterfall history
    int waterfall_depth = 100;         // Rows kept
    int waterfall_bin_hz = 10;         // Hz per waterfall cell
};

// Pileup session tracking
struct TrackerConfig {
    float cycle_seconds = 15.0f;       // FT8 T/R period
    float stale_seconds = 300.0f;      // Callers not heard for this long are dropped
    float loudest_tolerance_db = 1.0f; // "Loudest" if within this of the max SNR
    int pattern_window = 10;           // Answers considered for pattern analysis
    int pattern_min_answers = 5;       // Fewer gives no pattern
};

// Success prediction
struct PredictorConfig {
    std::string model_name = "success_model";
    double default_prior = 0.20;       // Used when no trained model answers

    // Log-odds weight of each live factor
    double weight_pileup = 1.0;
    double weight_snr_rank = 1.0;
    double weight_behavior = 1.0;
    double weight_path = 1.5;          // Path status is the strongest evidence
    double weight_persistence = 0.8;

    double cache_ttl_seconds = 30.0;
    uint32_t cache_max_entries = 500;
    int max_reasons = 3;               // Strategy reasons shown
    int methodical_offset_hz = 60;     // Suggested offset beyond the pileup edge
};

// Engine timers
struct EngineConfig {
    uint32_t decay_period_ms = 100;
    uint32_t refresh_period_ms = 2000;
    int64_t dial_frequency_hz = 14074000;  // For converting spots to audio offsets
    bool heuristic_only = false;           // Ignore any trained model
};

/**
 * Complete engine configuration
 *
 * Persisted as an INI file with one section per block.
 */
struct IntelConfig {
    StationConfig station;
    SpectrumConfig spectrum;
    TrackerConfig tracker;
    PredictorConfig predictor;
    EngineConfig engine;

    bool save(const std::string& path = "") const;
    bool load(const std::string& path = "");

    // Clamp out-of-range values. Returns true if anything changed.
    bool validate();

    static std::string getDefaultPath();
};

} // namespace pileup
