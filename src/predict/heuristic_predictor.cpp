#include "heuristic_predictor.hpp"
#include "pileup/logging.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace pileup {

HeuristicPredictor::HeuristicPredictor(const SessionTracker& tracker, const PredictorConfig& config)
    : tracker_(tracker)
    , config_(config)
{}

double HeuristicPredictor::baseForSnr(int snr_db) {
    if (snr_db >= 0) return 0.40;
    if (snr_db >= -5) return 0.35;
    if (snr_db >= -10) return 0.25;
    if (snr_db >= -15) return 0.15;
    return 0.05;
}

std::optional<PileupInfo> HeuristicPredictor::pileupFor(const std::string& call) const {
    auto current = tracker_.getTargetCallsign();
    if (!current || *current != call) return std::nullopt;
    return tracker_.getPileupInfo();
}

Prediction HeuristicPredictor::predictSuccess(const std::string& target, const FeatureMap& features,
                                              PathStatus path) {
    std::string call = normalizeCallsign(target);

    int snr = -15;
    if (auto it = features.find("target_snr"); it != features.end() && std::isfinite(it->second)) {
        snr = static_cast<int>(std::lround(it->second));
    }

    double base = baseForSnr(snr);

    Prediction result;
    result.model_contribution = base;

    if (auto pileup = pileupFor(call)) {
        int size = pileup->size;
        double f = size == 0 ? 1.5 : size <= 5 ? 1.0 : size <= 10 ? 0.7 : 0.4;
        result.live_factors.push_back({"pileup", f, 1.0});
    }

    switch (path) {
        case PathStatus::CONNECTED: result.live_factors.push_back({"path", 2.0, 1.0}); break;
        case PathStatus::PATH_OPEN: result.live_factors.push_back({"path", 1.3, 1.0}); break;
        case PathStatus::NO_PATH:   result.live_factors.push_back({"path", 0.2, 1.0}); break;
        default: break;
    }

    double p = base;
    for (const auto& f : result.live_factors) {
        p *= f.value;
    }
    result.probability = std::clamp(p, 0.01, 0.99);
    result.confidence = Confidence::LOW;

    char buf[64];
    std::snprintf(buf, sizeof(buf), "Heuristic: SNR %d dB", snr);
    result.explanation = buf;
    if (path != PathStatus::UNKNOWN) {
        result.explanation += std::string(" | Path: ") + pathStatusToString(path);
    }
    result.explanation += " → " + formatPercent(result.probability);

    LOG_PREDICT(DEBUG, "%s: %s", call.c_str(), result.explanation.c_str());
    return result;
}

StrategyRecommendation HeuristicPredictor::getStrategy(const std::string& target, PathStatus path,
                                                       const std::string& competition) {
    std::string call = normalizeCallsign(target);
    auto pileup = pileupFor(call);
    YourStatus you;
    if (pileup) you = tracker_.getYourStatus();

    StrategyRecommendation rec;
    rec.target = call;
    char buf[96];

    if (path == PathStatus::NO_PATH) {
        rec.action = Action::TRY_LATER;
        rec.reasons.push_back("No path to target");
    } else if (path == PathStatus::CONNECTED) {
        rec.reasons.push_back("Target hears you!");
    } else if (path == PathStatus::PATH_OPEN) {
        rec.reasons.push_back("Path is open");
    }

    int local_size = pileup ? pileup->size : 0;
    int target_count = parseCompetitionCount(competition);
    int effective = std::max(local_size, target_count);
    bool hidden = target_count > local_size;

    if (rec.action != Action::TRY_LATER) {
        if (effective == 0) {
            rec.reasons.push_back("No competition");
        } else if (effective <= 3) {
            if (hidden) {
                std::snprintf(buf, sizeof(buf), "Competition at target (%d)", target_count);
            } else {
                std::snprintf(buf, sizeof(buf), "Light pileup (%d callers)", effective);
            }
            rec.reasons.push_back(buf);
        } else if (effective <= 8) {
            if (hidden) {
                std::snprintf(buf, sizeof(buf), "Hidden pileup at target (%d stations)", target_count);
            } else {
                std::snprintf(buf, sizeof(buf), "Moderate pileup (%d callers)", effective);
            }
            rec.reasons.push_back(buf);
        } else {
            // Heavy: only hold off while the path is unknown
            if (path == PathStatus::UNKNOWN) rec.action = Action::WAIT;
            if (hidden) {
                std::snprintf(buf, sizeof(buf), "Heavy hidden pileup (%d at target)", target_count);
            } else {
                std::snprintf(buf, sizeof(buf), "Heavy pileup (%d callers)", effective);
            }
            rec.reasons.push_back(buf);
        }
    }

    if (you.in_pileup) {
        if (you.rank.kind == YourRank::Kind::UNKNOWN) {
            rec.reasons.push_back("You're calling");
        } else if (you.rank.isKnown() && you.rank.rank == 1) {
            rec.reasons.push_back("You're loudest - good position");
        } else if (you.rank.isKnown() && you.rank.rank <= 3) {
            std::snprintf(buf, sizeof(buf), "Rank #%d - decent position", you.rank.rank);
            rec.reasons.push_back(buf);
        }
    }

    if (config_.max_reasons >= 0 && rec.reasons.size() > static_cast<size_t>(config_.max_reasons)) {
        rec.reasons.resize(config_.max_reasons);
    }
    return rec;
}

} // namespace pileup
