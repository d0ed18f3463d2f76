#pragma once

#include "success_predictor.hpp"
#include "prediction_cache.hpp"
#include "session/session_tracker.hpp"
#include "pileup/config.hpp"
#include <optional>
#include <vector>

namespace pileup {

/**
 * Bayesian Success Predictor
 *
 * Prior from the scorer (or the default prior), updated in log-odds space:
 *
 *   logit(p) = logit(prior) + sum_i weight_i * ln(factor_i)
 *
 * then clamped to [0.01, 0.99]. Live factors come from the tracker's
 * session for the requested target; other targets get path and
 * persistence only.
 */
class BayesianPredictor : public SuccessPredictor {
public:
    // scorer may be nullptr (no trained model)
    BayesianPredictor(const SessionTracker& tracker, PredictionCache& cache,
                      const PriorScorer* scorer = nullptr,
                      const PredictorConfig& config = PredictorConfig{});

    Prediction predictSuccess(const std::string& target, const FeatureMap& features,
                              PathStatus path) override;

    StrategyRecommendation getStrategy(const std::string& target, PathStatus path,
                                       const std::string& competition = "") override;

    const char* name() const override { return "bayesian"; }

    bool hasModel() const;

    // Prior probability for these features (default prior without a model)
    double priorProbability(const FeatureMap& features) const;

    // Live evidence, in fixed order: pileup, snr_rank, behavior_match, path, persistence
    static std::vector<LiveFactor> liveFactors(const std::optional<PileupInfo>& pileup,
                                               const std::optional<TargetBehavior>& behavior,
                                               const YourStatus& you, PathStatus path,
                                               const PredictorConfig& config);

    // Log-odds fusion, clamped to [0.01, 0.99]
    static double combine(double prior, const std::vector<LiveFactor>& factors);

    static Confidence assessConfidence(bool model_available, bool live_data, int qso_count);

private:
    const SessionTracker& tracker_;
    PredictionCache& cache_;
    const PriorScorer* scorer_;
    PredictorConfig config_;

    bool tracksTarget(const std::string& target) const;
    std::string explain(double prior, const std::vector<LiveFactor>& factors,
                        double posterior, PathStatus path) const;
};

} // namespace pileup
