#include "bayesian_predictor.hpp"
#include "pileup/logging.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace pileup {

BayesianPredictor::BayesianPredictor(const SessionTracker& tracker, PredictionCache& cache,
                                     const PriorScorer* scorer, const PredictorConfig& config)
    : tracker_(tracker)
    , cache_(cache)
    , scorer_(scorer)
    , config_(config)
{}

bool BayesianPredictor::hasModel() const {
    return scorer_ && scorer_->hasModel(config_.model_name);
}

bool BayesianPredictor::tracksTarget(const std::string& target) const {
    auto current = tracker_.getTargetCallsign();
    return current && *current == normalizeCallsign(target);
}

double BayesianPredictor::priorProbability(const FeatureMap& features) const {
    if (!scorer_) return config_.default_prior;

    auto result = scorer_->predict(config_.model_name, features);
    if (!result) {
        LOG_PREDICT(DEBUG, "No model for %s, using default prior", config_.model_name.c_str());
        return config_.default_prior;
    }

    double confidence = std::clamp(result->confidence, 0.0, 1.0);
    return result->prediction == 1 ? confidence : 1.0 - confidence;
}

// ============================================================================
// Live factors
// ============================================================================

std::vector<LiveFactor> BayesianPredictor::liveFactors(const std::optional<PileupInfo>& pileup,
                                                       const std::optional<TargetBehavior>& behavior,
                                                       const YourStatus& you, PathStatus path,
                                                       const PredictorConfig& config) {
    std::vector<LiveFactor> factors;

    if (pileup) {
        int size = pileup->size;
        double f = size == 0 ? 1.5
                 : size <= 3 ? 1.2
                 : size <= 6 ? 1.0
                 : size <= 10 ? 0.7
                 : 0.4;
        factors.push_back({"pileup", f, config.weight_pileup});
    }

    // Unknown rank (we can't hear ourselves) gives no factor
    if (you.in_pileup && you.rank.isKnown()) {
        int rank = you.rank.rank;
        double f = rank == 1 ? 1.4
                 : rank <= 3 ? 1.2
                 : rank <= you.total / 2 ? 1.0
                 : 0.7;
        factors.push_back({"snr_rank", f, config.weight_snr_rank});
    }

    if (behavior && behavior->pattern) {
        std::optional<double> f;
        switch (behavior->pattern->style) {
            case PickingStyle::LOUDEST_FIRST:
                if (you.rank.isKnown()) {
                    f = you.rank.rank == 1 ? 1.5 : you.rank.rank <= 3 ? 1.1 : 0.6;
                }
                break;
            case PickingStyle::METHODICAL_LOW_HIGH:
                if (pileup && pileup->frequency_range && you.tx_frequency) {
                    auto [low, high] = *pileup->frequency_range;
                    f = *you.tx_frequency <= low + (high - low) * 0.3 ? 1.3 : 0.8;
                }
                break;
            case PickingStyle::METHODICAL_HIGH_LOW:
                if (pileup && pileup->frequency_range && you.tx_frequency) {
                    auto [low, high] = *pileup->frequency_range;
                    f = *you.tx_frequency >= low + (high - low) * 0.7 ? 1.3 : 0.8;
                }
                break;
            case PickingStyle::RANDOM:
                f = you.calls_made >= 3 ? 1.1 : 1.0;
                break;
            default:
                break;
        }
        if (f) factors.push_back({"behavior_match", *f, config.weight_behavior});
    }

    double path_factor = 1.0;
    switch (path) {
        case PathStatus::CONNECTED: path_factor = 2.0; break;
        case PathStatus::PATH_OPEN: path_factor = 1.3; break;
        case PathStatus::NO_PATH:   path_factor = 0.3; break;
        default: break;
    }
    factors.push_back({"path", path_factor, config.weight_path});

    int calls = you.calls_made;
    double persistence = calls == 0 ? 1.0
                       : calls <= 2 ? 1.05
                       : calls <= 5 ? 1.0
                       : 0.95;
    factors.push_back({"persistence", persistence, config.weight_persistence});

    return factors;
}

double BayesianPredictor::combine(double prior, const std::vector<LiveFactor>& factors) {
    double p = std::clamp(prior, 0.001, 0.999);
    double log_odds = std::log(p / (1.0 - p));

    for (const auto& f : factors) {
        if (f.value <= 0.0) continue;  // ln undefined
        log_odds += f.weight * std::log(f.value);
    }

    double posterior = 1.0 / (1.0 + std::exp(-log_odds));
    return std::clamp(posterior, 0.01, 0.99);
}

Confidence BayesianPredictor::assessConfidence(bool model_available, bool live_data, int qso_count) {
    if (model_available && live_data && qso_count >= 5) return Confidence::HIGH;
    if (model_available || (live_data && qso_count >= 3)) return Confidence::MEDIUM;
    return Confidence::LOW;
}

std::string BayesianPredictor::explain(double prior, const std::vector<LiveFactor>& factors,
                                       double posterior, PathStatus path) const {
    std::vector<std::string> parts;
    parts.push_back((hasModel() ? "Model: " : "Base: ") + formatPercent(prior));

    for (const auto& f : factors) {
        if (f.value < 0.7) {
            parts.push_back("↓" + f.name);
        } else if (f.value > 1.3) {
            parts.push_back("↑" + f.name);
        }
    }

    if (path == PathStatus::CONNECTED) {
        parts.push_back("★CONNECTED");
    } else if (path == PathStatus::NO_PATH) {
        parts.push_back("⚠no_path");
    }

    parts.push_back("→ " + formatPercent(posterior));

    std::string text;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) text += " | ";
        text += parts[i];
    }
    return text;
}

// ============================================================================
// Prediction
// ============================================================================

Prediction BayesianPredictor::predictSuccess(const std::string& target, const FeatureMap& features,
                                             PathStatus path) {
    std::string call = normalizeCallsign(target);
    std::string key = PredictionCache::makeKey(config_.model_name, call, path, features);
    if (auto cached = cache_.get(key)) {
        return *cached;
    }

    double prior = priorProbability(features);

    std::optional<PileupInfo> pileup;
    std::optional<TargetBehavior> behavior;
    YourStatus you;
    if (tracksTarget(call)) {
        pileup = tracker_.getPileupInfo();
        behavior = tracker_.getTargetBehavior();
        you = tracker_.getYourStatus();
    }

    Prediction result;
    result.model_contribution = prior;
    result.live_factors = liveFactors(pileup, behavior, you, path, config_);
    result.probability = combine(prior, result.live_factors);
    result.confidence = assessConfidence(hasModel(), pileup.has_value(),
                                         behavior ? behavior->qso_count : 0);
    result.explanation = explain(prior, result.live_factors, result.probability, path);

    LOG_PREDICT(DEBUG, "%s: %s (%s)", call.c_str(), result.explanation.c_str(),
                confidenceToString(result.confidence));

    cache_.put(key, result);
    return result;
}

// ============================================================================
// Strategy
// ============================================================================

StrategyRecommendation BayesianPredictor::getStrategy(const std::string& target, PathStatus path,
                                                      const std::string& competition) {
    std::string call = normalizeCallsign(target);

    std::optional<PileupInfo> pileup;
    std::optional<TargetBehavior> behavior;
    YourStatus you;
    if (tracksTarget(call)) {
        pileup = tracker_.getPileupInfo();
        behavior = tracker_.getTargetBehavior();
        you = tracker_.getYourStatus();
    }

    StrategyRecommendation rec;
    rec.target = call;
    std::vector<std::string>& reasons = rec.reasons;
    char buf[96];

    // Path status
    if (path == PathStatus::NO_PATH) {
        rec.action = Action::TRY_LATER;
        reasons.push_back("No path or no TX");
    } else if (path == PathStatus::CONNECTED) {
        reasons.push_back("Target hears you!");
    } else if (path == PathStatus::PATH_OPEN) {
        reasons.push_back("Path is open");
    }

    // Competition: local pileup vs. what the target side reports
    int local_size = pileup ? pileup->size : 0;
    int target_count = parseCompetitionCount(competition);
    int effective = std::max(local_size, target_count);
    bool hidden = target_count > local_size;

    if (rec.action != Action::TRY_LATER) {
        if (effective == 0) {
            reasons.push_back("No competition");
        } else if (effective > 10) {
            std::snprintf(buf, sizeof(buf), "Heavy pileup (%d stations)", effective);
            reasons.push_back(buf);
            if (path != PathStatus::CONNECTED) rec.action = Action::WAIT;
        } else if (effective >= 4) {
            if (hidden) {
                std::snprintf(buf, sizeof(buf), "Hidden pileup at target (%d stations)", target_count);
            } else {
                std::snprintf(buf, sizeof(buf), "Moderate competition (%d stations)", effective);
            }
            reasons.push_back(buf);
        } else {
            if (hidden) {
                std::snprintf(buf, sizeof(buf), "Competition at target (%d)", target_count);
            } else {
                std::snprintf(buf, sizeof(buf), "Light competition (%d)", effective);
            }
            reasons.push_back(buf);
        }

        // Your position
        if (pileup && you.rank.kind == YourRank::Kind::UNKNOWN) {
            reasons.push_back("You're calling");
        } else if (pileup && you.rank.isKnown()) {
            int rank = you.rank.rank;
            if (rank == 1) {
                reasons.push_back("You're the loudest signal");
            } else if (rank <= 3) {
                std::snprintf(buf, sizeof(buf), "You're #%d by signal strength", rank);
                reasons.push_back(buf);
            } else {
                std::snprintf(buf, sizeof(buf), "You're #%d/%d - consider waiting", rank, local_size);
                reasons.push_back(buf);
            }
        }
    }

    // Target's picking pattern
    if (behavior && behavior->pattern && rec.action != Action::TRY_LATER) {
        switch (behavior->pattern->style) {
            case PickingStyle::LOUDEST_FIRST:
                reasons.push_back("Target picks loudest first");
                if (you.rank.isKnown() && you.rank.rank > 3) {
                    reasons.push_back("Consider QSYing when conditions improve");
                }
                break;
            case PickingStyle::METHODICAL_LOW_HIGH:
                reasons.push_back("Target working methodical low high");
                if (pileup && pileup->frequency_range) {
                    rec.recommended_frequency = pileup->frequency_range->first - config_.methodical_offset_hz;
                    reasons.push_back("Position at lower frequency");
                }
                break;
            case PickingStyle::METHODICAL_HIGH_LOW:
                reasons.push_back("Target working methodical high low");
                if (pileup && pileup->frequency_range) {
                    rec.recommended_frequency = pileup->frequency_range->second + config_.methodical_offset_hz;
                    reasons.push_back("Position at higher frequency");
                }
                break;
            case PickingStyle::RANDOM:
                reasons.push_back("No clear pattern - persistence helps");
                break;
            default:
                break;
        }
    }

    // QSO rate
    if (behavior && rec.action != Action::TRY_LATER && behavior->qso_rate > 0.0) {
        const char* pace = behavior->qso_rate >= 2.0 ? "Fast"
                         : behavior->qso_rate >= 1.0 ? "Steady"
                         : "Slow";
        std::snprintf(buf, sizeof(buf), "%s QSO rate (%.1f/min)", pace, behavior->qso_rate);
        reasons.push_back(buf);
    }

    if (config_.max_reasons >= 0 && reasons.size() > static_cast<size_t>(config_.max_reasons)) {
        reasons.resize(config_.max_reasons);
    }

    LOG_PREDICT(DEBUG, "Strategy for %s: %s (%zu reasons)", call.c_str(),
                actionToString(rec.action), reasons.size());
    return rec;
}

} // namespace pileup
