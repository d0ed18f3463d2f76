#include "multi_target_tracker.hpp"
#include "pileup/logging.hpp"
#include <algorithm>

namespace pileup {

MultiTargetTracker::MultiTargetTracker(const std::string& my_callsign, const TrackerConfig& config)
    : my_call_(normalizeCallsign(my_callsign))
    , config_(config)
{}

void MultiTargetTracker::addTarget(const std::string& callsign, const std::optional<std::string>& grid,
                                   Timestamp now) {
    std::string call = normalizeCallsign(callsign);
    if (call.empty() || trackers_.count(call)) return;

    auto tracker = std::make_unique<SessionTracker>(my_call_, config_);
    tracker->setTarget(call, grid, 0, now);
    trackers_.emplace(call, std::move(tracker));
    LOG_TRACKER(INFO, "Watching %s (%zu targets)", call.c_str(), trackers_.size());
}

void MultiTargetTracker::removeTarget(const std::string& callsign) {
    trackers_.erase(normalizeCallsign(callsign));
}

bool MultiTargetTracker::isTracking(const std::string& callsign) const {
    return trackers_.count(normalizeCallsign(callsign)) > 0;
}

std::vector<std::string> MultiTargetTracker::getTargets() const {
    std::vector<std::string> calls;
    calls.reserve(trackers_.size());
    for (const auto& [call, tracker] : trackers_) {
        calls.push_back(call);
    }
    return calls;
}

int MultiTargetTracker::processDecode(const Decode& decode) {
    int changed = 0;
    for (auto& [call, tracker] : trackers_) {
        if (tracker->processDecode(decode)) changed++;
    }
    return changed;
}

void MultiTargetTracker::setTxStatus(bool enabled, const std::string& calling) {
    for (auto& [call, tracker] : trackers_) {
        tracker->setTxStatus(enabled, calling);
    }
}

const SessionTracker* MultiTargetTracker::getTracker(const std::string& callsign) const {
    auto it = trackers_.find(normalizeCallsign(callsign));
    return it == trackers_.end() ? nullptr : it->second.get();
}

std::optional<double> MultiTargetTracker::scoreTarget(const std::string& callsign) const {
    const SessionTracker* tracker = getTracker(callsign);
    if (!tracker || !tracker->currentSession()) return std::nullopt;

    const TargetSession& session = *tracker->currentSession();
    if (session.callers.empty() && session.answers.empty()) {
        return std::nullopt;  // Nothing observed yet
    }

    auto pileup = tracker->getPileupInfo();
    if (!pileup) return std::nullopt;

    double score = 0.0;
    score += pileup->size == 0 ? 50.0 : std::max(0.0, 50.0 - 5.0 * pileup->size);

    if (pileup->your_rank.isKnown()) {
        score += std::max(0.0, 30.0 - 10.0 * (pileup->your_rank.rank - 1));
    }

    auto pattern = tracker->analyzePattern();
    if (pattern && pattern->style == PickingStyle::LOUDEST_FIRST && pileup->your_rank.isKnown()) {
        if (pileup->your_rank.rank == 1) {
            score += 20.0;
        } else if (pileup->your_rank.rank <= 3) {
            score += 10.0;
        }
    }

    return score;
}

std::optional<std::string> MultiTargetTracker::getBestTarget() const {
    std::optional<std::string> best;
    double best_score = 0.0;

    for (const auto& [call, tracker] : trackers_) {
        auto score = scoreTarget(call);
        if (!score) continue;
        if (!best || *score > best_score) {
            best = call;
            best_score = *score;
        }
    }

    if (best) {
        LOG_TRACKER(DEBUG, "Best target %s (score %.0f)", best->c_str(), best_score);
    }
    return best;
}

} // namespace pileup
