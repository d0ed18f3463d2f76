#pragma once

#include "success_predictor.hpp"
#include "session/session_tracker.hpp"
#include "pileup/config.hpp"

namespace pileup {

/**
 * Heuristic Success Predictor ("purist mode")
 *
 * No trained prior: SNR-bucketed base probability multiplied by the
 * pileup and path factors. Confidence is always LOW.
 *
 * Reads the target SNR from the "target_snr" feature (-15 dB if absent).
 */
class HeuristicPredictor : public SuccessPredictor {
public:
    explicit HeuristicPredictor(const SessionTracker& tracker,
                                const PredictorConfig& config = PredictorConfig{});

    Prediction predictSuccess(const std::string& target, const FeatureMap& features,
                              PathStatus path) override;

    StrategyRecommendation getStrategy(const std::string& target, PathStatus path,
                                       const std::string& competition = "") override;

    const char* name() const override { return "heuristic"; }

    static double baseForSnr(int snr_db);

private:
    const SessionTracker& tracker_;
    PredictorConfig config_;

    std::optional<PileupInfo> pileupFor(const std::string& call) const;
};

} // namespace pileup
