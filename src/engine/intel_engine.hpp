#pragma once

#include "periodic_task.hpp"
#include "pileup/config.hpp"
#include "pileup/types.hpp"
#include "spectrum/occupancy_map.hpp"
#include "session/session_tracker.hpp"
#include "predict/prediction_cache.hpp"
#include "predict/success_predictor.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace pileup {

// Output of one refresh pass for the current target
struct RefreshResult {
    std::string target;
    Prediction prediction;
    StrategyRecommendation strategy;
};

/**
 * Live Pileup Intelligence Engine
 *
 * Facade over the spectral occupancy map, the session tracker and the
 * success predictor. Each mutable entity has its own mutex, so the decode
 * path, the decay timer and the refresh timer may run on different threads.
 *
 * Lock order: predictor before session. Spectrum is never held with either.
 *
 * Typical use:
 *   1. setTarget("DX1X")
 *   2. ingestDecode() for every decode, ingestSpotBatch() per network batch,
 *      setDialFrequency() on every band change
 *   3. start() for the decay and refresh timers, or call decayTick()/refresh()
 *   4. findBestGap(), getPileupInfo(), predictSuccess(), getStrategy()
 */
class IntelEngine {
public:
    using RefreshCallback = std::function<void(const RefreshResult&)>;
    using RecommendationCallback = OccupancyMap::RecommendationCallback;

    // scorer may be nullptr; it must outlive the engine
    explicit IntelEngine(const IntelConfig& config = IntelConfig{},
                         const PriorScorer* scorer = nullptr);
    ~IntelEngine();

    IntelEngine(const IntelEngine&) = delete;
    IntelEngine& operator=(const IntelEngine&) = delete;

    // --- Ingest ---

    void ingestDecode(const Decode& decode);
    void ingestDecodes(const std::vector<Decode>& decodes);

    // Spots become remote interference; spots heard by the target set the competition label
    void ingestSpotBatch(const std::vector<Spot>& spots, Timestamp now = WallClock::now());

    bool decayTick(SteadyTime now = SteadyClock::now());

    // Recommended TX offset (previous one if the search range is empty)
    int findBestGap();

    // --- Band ---

    // Dial frequency that spot frequencies are converted against. A change
    // (QSY) clears remote interference, every session and cached predictions.
    // Returns true if the dial moved.
    bool setDialFrequency(int64_t dial_hz);
    int64_t getDialFrequency() const;

    // --- Target ---

    void setTarget(const std::string& callsign,
                   const std::optional<std::string>& grid = std::nullopt,
                   int frequency = 0);
    void clearTarget();
    std::optional<std::string> getTarget() const;

    // Drop the current target's session, or every session
    void clearSession();
    void clearAllSessions();
    std::vector<std::string> getSessionCallsigns() const;

    void setTxStatus(bool enabled, const std::string& calling = "");
    void setTxFrequency(int offset_hz);

    std::optional<PileupInfo> getPileupInfo() const;
    std::optional<TargetBehavior> getTargetBehavior() const;
    YourStatus getYourStatus() const;

    // --- Prediction ---

    Prediction predictSuccess(const std::string& target, const FeatureMap& features, PathStatus path);
    StrategyRecommendation getStrategy(const std::string& target, PathStatus path,
                                       const std::string& competition);

    // Used by refresh(); changing either invalidates cached predictions
    void setPathStatus(PathStatus status);
    PathStatus getPathStatus() const;
    void setFeatures(const FeatureMap& features);

    // Target-side competition label from the last spot batch, e.g. "Low (3)"
    std::string getTargetCompetition() const;
    static std::string competitionLabel(int count);

    const char* predictorName() const;

    // --- Timers and events ---

    // Prediction + strategy for the current target, nullopt without one
    std::optional<RefreshResult> refresh();

    void start();
    void stop();
    bool isRunning() const;

    void setRefreshCallback(RefreshCallback cb);

    // Recommendation and session events fire with the owning entity's lock
    // held; handlers must not call back into the engine.
    void setRecommendationCallback(RecommendationCallback cb);
    void setSessionObserver(SessionObserver* observer);

    // --- Spectrum inspection (copies) ---

    Intensities getLocalIntensity() const;
    Intensities getRemoteIntensity() const;
    std::vector<Intensities> getWaterfall() const;
    int getRecommendedOffset() const;
    float costAt(int offset_hz) const;

    const IntelConfig& config() const { return config_; }

private:
    IntelConfig config_;
    const PriorScorer* scorer_;

    mutable std::mutex spectrum_mutex_;
    OccupancyMap spectrum_;
    int64_t dial_frequency_hz_;

    mutable std::mutex session_mutex_;
    SessionTracker tracker_;

    mutable std::mutex predict_mutex_;
    PredictionCache cache_;
    std::unique_ptr<SuccessPredictor> predictor_;
    PathStatus path_status_ = PathStatus::UNKNOWN;
    FeatureMap features_;
    std::string competition_ = "No Spots (0)";

    std::mutex callback_mutex_;
    RefreshCallback on_refresh_;

    std::unique_ptr<PeriodicTask> decay_task_;
    std::unique_ptr<PeriodicTask> refresh_task_;

    void protectTargetFrequency(std::optional<int> offset_hz);
    void resetPredictionState();
};

} // namespace pileup
