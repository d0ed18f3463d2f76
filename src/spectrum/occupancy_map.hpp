#pragma once

#include "pileup/config.hpp"
#include "pileup/dsp.hpp"
#include "pileup/types.hpp"
#include <functional>
#include <optional>
#include <vector>

namespace pileup {

// Result of one gap search
struct GapResult {
    int candidate_hz = 0;       // Lowest-cost window centre this pass
    float candidate_cost = 0.0f;
    int recommended_hz = 0;     // Published recommendation after hysteresis
    bool updated = false;       // Recommendation moved this pass
};

/**
 * Spectral Occupancy Map
 *
 * Two intensity arrays over the audio window, one bin per Hz:
 *   local  - what we decode ourselves (raised on ingest, decays when idle)
 *   remote - interference reported by the network (replaced per batch)
 *
 * The gap finder slides a TX-sized window over local + w*remote and picks
 * the cheapest centre inside the safe range, with a centre bias and a
 * large penalty around the protected (target) frequency.
 *
 * Not thread-safe; the engine serialises access.
 */
class OccupancyMap {
public:
    using RecommendationCallback = std::function<void(int offset_hz)>;

    explicit OccupancyMap(const SpectrumConfig& config = SpectrumConfig{});

    // --- Ingest ---

    // Raise local intensity around each decode (never lowers a bin)
    void ingestLocalDecodes(const std::vector<Decode>& decodes, SteadyTime now = SteadyClock::now());

    // Replace the remote array from a batch of reports
    void ingestRemoteInterference(const std::vector<RemoteReport>& reports);

    // Periodic decay. Only decays once no local decode arrived for the hold time.
    // Returns true if the local array was decayed.
    bool decayTick(SteadyTime now = SteadyClock::now());

    // --- Gap finder ---

    // Recompute the cost curve and the recommendation.
    // Returns std::nullopt if the safe range is empty (recommendation kept).
    std::optional<GapResult> findBestGap();

    // Avoid transmitting on top of this frequency (the current target)
    void setProtectedFrequency(int offset_hz);
    void clearProtectedFrequency();
    std::optional<int> getProtectedFrequency() const { return protected_hz_; }

    int getRecommendedOffset() const { return recommended_hz_; }
    void setRecommendationCallback(RecommendationCallback cb) { on_recommendation_ = std::move(cb); }

    // Cost of a window centred at offset_hz from the last search
    // (+inf outside the computed curve or before the first search)
    float costAt(int offset_hz) const;

    // Safe range of window centres [low, high]
    int safeLowHz() const;
    int safeHighHz() const;

    // --- Inspection ---

    const Intensities& localIntensity() const { return local_; }
    const Intensities& remoteIntensity() const { return remote_; }
    int bandwidth() const { return config_.bandwidth_hz; }

    // Waterfall rows, oldest first
    std::vector<Intensities> getWaterfall() const;

    void reset();

    // --- Intensity mappings ---

    // -24 dB .. +20 dB mapped onto [40, 100]
    static Intensity localIntensityForSnr(int snr_db);

    // -30 dB .. +10 dB mapped onto [20, 100]
    static Intensity remoteIntensityForSnr(int snr_db);

    // 1 while fresh, linear fade to 0 at max age
    static float ageWeight(float age_seconds, const SpectrumConfig& config);

private:
    SpectrumConfig config_;

    Intensities local_;
    Intensities remote_;
    Intensities combined_;
    std::vector<float> cost_;     // Indexed by window start

    BoxConvolver convolver_;

    std::optional<int> protected_hz_;
    int recommended_hz_;
    bool has_cost_ = false;

    SteadyTime last_local_ingest_{};
    bool has_local_ = false;

    // Waterfall ring buffer
    std::vector<Intensities> waterfall_;
    int waterfall_line_ = 0;
    int waterfall_rows_ = 0;

    RecommendationCallback on_recommendation_;

    void raise(Intensities& bins, int center_hz, int half_width, Intensity level);
    void pushWaterfallRow();
    bool isAcceptable(int offset_hz) const;
};

} // namespace pileup
