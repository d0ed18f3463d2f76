#pragma once

#include "prediction.hpp"
#include "prior_scorer.hpp"
#include "pileup/types.hpp"
#include <string>

namespace pileup {

/**
 * Contact success predictor interface
 *
 * Implemented by BayesianPredictor (trained prior + live evidence) and
 * HeuristicPredictor (live evidence only).
 */
class SuccessPredictor {
public:
    virtual ~SuccessPredictor() = default;

    virtual Prediction predictSuccess(const std::string& target, const FeatureMap& features,
                                      PathStatus path) = 0;

    // 'competition' is the target-side label, e.g. "High (5)"
    virtual StrategyRecommendation getStrategy(const std::string& target, PathStatus path,
                                               const std::string& competition = "") = 0;

    virtual const char* name() const = 0;
};

} // namespace pileup
