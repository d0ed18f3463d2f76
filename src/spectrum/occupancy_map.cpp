#include "occupancy_map.hpp"
#include "pileup/logging.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace pileup {

OccupancyMap::OccupancyMap(const SpectrumConfig& config)
    : config_(config)
    , local_(config.bandwidth_hz, 0.0f)
    , remote_(config.bandwidth_hz, 0.0f)
    , combined_(config.bandwidth_hz, 0.0f)
    , convolver_(static_cast<size_t>(config.bandwidth_hz), static_cast<size_t>(config.window_hz))
    , recommended_hz_(config.bandwidth_hz / 2)
{
    int cells = (config_.bandwidth_hz + config_.waterfall_bin_hz - 1) / config_.waterfall_bin_hz;
    waterfall_.assign(config_.waterfall_depth, Intensities(cells, 0.0f));
}

void OccupancyMap::reset() {
    std::fill(local_.begin(), local_.end(), 0.0f);
    std::fill(remote_.begin(), remote_.end(), 0.0f);
    cost_.clear();
    has_cost_ = false;
    has_local_ = false;
    recommended_hz_ = config_.bandwidth_hz / 2;
    for (auto& row : waterfall_) {
        std::fill(row.begin(), row.end(), 0.0f);
    }
    waterfall_line_ = 0;
    waterfall_rows_ = 0;
}

// ============================================================================
// Intensity mappings
// ============================================================================

Intensity OccupancyMap::localIntensityForSnr(int snr_db) {
    float level = 40.0f + (static_cast<float>(snr_db) + 24.0f) * (60.0f / 44.0f);
    return std::clamp(level, 40.0f, 100.0f);
}

Intensity OccupancyMap::remoteIntensityForSnr(int snr_db) {
    float level = 20.0f + (static_cast<float>(snr_db) + 30.0f) * 2.0f;
    return std::clamp(level, 20.0f, 100.0f);
}

float OccupancyMap::ageWeight(float age_seconds, const SpectrumConfig& config) {
    if (age_seconds <= config.remote_fresh_age_seconds) return 1.0f;
    if (age_seconds >= config.remote_max_age_seconds) return 0.0f;
    float span = config.remote_max_age_seconds - config.remote_fresh_age_seconds;
    return 1.0f - (age_seconds - config.remote_fresh_age_seconds) / span;
}

void OccupancyMap::raise(Intensities& bins, int center_hz, int half_width, Intensity level) {
    int lo = std::max(0, center_hz - half_width);
    int hi = std::min(config_.bandwidth_hz - 1, center_hz + half_width);
    for (int i = lo; i <= hi; ++i) {
        bins[i] = std::max(bins[i], level);
    }
}

// ============================================================================
// Ingest
// ============================================================================

void OccupancyMap::ingestLocalDecodes(const std::vector<Decode>& decodes, SteadyTime now) {
    int ingested = 0;
    for (const auto& d : decodes) {
        if (d.frequency < 0 || d.frequency >= config_.bandwidth_hz) continue;
        raise(local_, d.frequency, config_.local_half_width_hz, localIntensityForSnr(d.snr));
        ingested++;
    }

    if (ingested > 0) {
        last_local_ingest_ = now;
        has_local_ = true;
    }
    LOG_SPECTRUM(TRACE, "Local ingest: %d of %zu decodes", ingested, decodes.size());
}

void OccupancyMap::ingestRemoteInterference(const std::vector<RemoteReport>& reports) {
    std::fill(remote_.begin(), remote_.end(), 0.0f);

    int used = 0;
    for (const auto& r : reports) {
        if (r.offset < 0 || r.offset >= config_.bandwidth_hz) continue;
        float weight = ageWeight(r.age_seconds, config_);
        if (weight <= 0.0f) continue;
        // Max, not sum: overlapping reports of one signal don't stack
        raise(remote_, r.offset, config_.remote_half_width_hz, remoteIntensityForSnr(r.snr) * weight);
        used++;
    }
    LOG_SPECTRUM(DEBUG, "Remote interference: %d of %zu reports in window", used, reports.size());
}

bool OccupancyMap::decayTick(SteadyTime now) {
    bool decayed = false;

    float idle = has_local_
        ? std::chrono::duration<float>(now - last_local_ingest_).count()
        : std::numeric_limits<float>::infinity();

    if (idle >= config_.decay_hold_seconds) {
        for (auto& v : local_) {
            v *= config_.decay_factor;
            if (v < config_.decay_floor) v = 0.0f;
        }
        decayed = true;
    }

    pushWaterfallRow();
    return decayed;
}

void OccupancyMap::pushWaterfallRow() {
    if (waterfall_.empty()) return;

    Intensities& row = waterfall_[waterfall_line_];
    std::fill(row.begin(), row.end(), 0.0f);
    for (int hz = 0; hz < config_.bandwidth_hz; ++hz) {
        size_t cell = static_cast<size_t>(hz / config_.waterfall_bin_hz);
        row[cell] = std::max(row[cell], std::max(local_[hz], remote_[hz]));
    }

    waterfall_line_ = (waterfall_line_ + 1) % static_cast<int>(waterfall_.size());
    waterfall_rows_ = std::min(waterfall_rows_ + 1, static_cast<int>(waterfall_.size()));
}

std::vector<Intensities> OccupancyMap::getWaterfall() const {
    std::vector<Intensities> rows;
    rows.reserve(waterfall_rows_);

    int depth = static_cast<int>(waterfall_.size());
    int first = waterfall_rows_ < depth ? 0 : waterfall_line_;
    for (int i = 0; i < waterfall_rows_; ++i) {
        rows.push_back(waterfall_[(first + i) % depth]);
    }
    return rows;
}

// ============================================================================
// Gap finder
// ============================================================================

void OccupancyMap::setProtectedFrequency(int offset_hz) {
    protected_hz_ = offset_hz;
}

void OccupancyMap::clearProtectedFrequency() {
    protected_hz_.reset();
}

int OccupancyMap::safeLowHz() const {
    return std::max(config_.edge_guard_hz, config_.window_hz / 2);
}

int OccupancyMap::safeHighHz() const {
    int last_center = config_.bandwidth_hz - config_.window_hz + config_.window_hz / 2;
    return std::min(config_.bandwidth_hz - config_.edge_guard_hz, last_center);
}

bool OccupancyMap::isAcceptable(int offset_hz) const {
    if (offset_hz < safeLowHz() || offset_hz > safeHighHz()) return false;
    if (protected_hz_ && std::abs(offset_hz - *protected_hz_) <= config_.guard_radius_hz) return false;
    return true;
}

float OccupancyMap::costAt(int offset_hz) const {
    int i = offset_hz - config_.window_hz / 2;
    if (!has_cost_ || i < 0 || i >= static_cast<int>(cost_.size())) {
        return std::numeric_limits<float>::infinity();
    }
    return cost_[i];
}

std::optional<GapResult> OccupancyMap::findBestGap() {
    const int half = config_.window_hz / 2;
    const int lo_center = safeLowHz();
    const int hi_center = safeHighHz();

    if (lo_center > hi_center) {
        LOG_SPECTRUM(WARN, "Empty search range [%d, %d] Hz, keeping %d Hz",
                     lo_center, hi_center, recommended_hz_);
        return std::nullopt;
    }

    for (int hz = 0; hz < config_.bandwidth_hz; ++hz) {
        combined_[hz] = local_[hz] + config_.remote_weight * remote_[hz];
    }

    cost_ = convolver_.slidingSum(combined_);
    has_cost_ = true;

    const float band_center = config_.bandwidth_hz / 2.0f;
    for (size_t i = 0; i < cost_.size(); ++i) {
        int center = static_cast<int>(i) + half;
        cost_[i] += config_.center_bias_per_hz * std::fabs(center - band_center);
        if (protected_hz_ && std::abs(center - *protected_hz_) <= config_.guard_radius_hz) {
            cost_[i] += config_.guard_penalty;
        }
    }

    int best_i = lo_center - half;
    for (int i = lo_center - half; i <= hi_center - half; ++i) {
        if (cost_[i] < cost_[best_i]) best_i = i;
    }

    GapResult result;
    result.candidate_hz = best_i + half;
    result.candidate_cost = cost_[best_i];

    // Suppress flicker, unless the old recommendation became unusable
    bool moved_enough = std::abs(result.candidate_hz - recommended_hz_) > config_.hysteresis_hz;
    if (moved_enough || !isAcceptable(recommended_hz_)) {
        LOG_SPECTRUM(DEBUG, "Recommendation %d -> %d Hz (cost %.1f)",
                     recommended_hz_, result.candidate_hz, result.candidate_cost);
        recommended_hz_ = result.candidate_hz;
        result.updated = true;
        if (on_recommendation_) {
            on_recommendation_(recommended_hz_);
        }
    }

    result.recommended_hz = recommended_hz_;
    return result;
}

} // namespace pileup
