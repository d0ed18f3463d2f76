#pragma once

#include "session_tracker.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pileup {

/**
 * Multi-Target Tracker
 *
 * One independent SessionTracker per watched target. Every decode is fanned
 * out to all of them; getBestTarget() picks the most promising one.
 *
 * Score (higher is better):
 *   pileup size  0 -> 50, else max(0, 50 - 5*size)
 *   your rank    max(0, 30 - 10*(rank-1)) when known
 *   pattern      loudest-first: +20 if you're 1st, +10 if top 3
 */
class MultiTargetTracker {
public:
    explicit MultiTargetTracker(const std::string& my_callsign,
                                const TrackerConfig& config = TrackerConfig{});

    void addTarget(const std::string& callsign,
                   const std::optional<std::string>& grid = std::nullopt,
                   Timestamp now = WallClock::now());
    void removeTarget(const std::string& callsign);
    void clear() { trackers_.clear(); }

    bool isTracking(const std::string& callsign) const;
    std::vector<std::string> getTargets() const;
    size_t size() const { return trackers_.size(); }

    // Returns the number of trackers the decode changed
    int processDecode(const Decode& decode);

    void setTxStatus(bool enabled, const std::string& calling = "");

    // nullopt if the target isn't tracked or has no pileup data yet
    std::optional<double> scoreTarget(const std::string& callsign) const;

    // Highest-scoring target with pileup data, if any
    std::optional<std::string> getBestTarget() const;

    const SessionTracker* getTracker(const std::string& callsign) const;

private:
    std::string my_call_;
    TrackerConfig config_;
    std::map<std::string, std::unique_ptr<SessionTracker>> trackers_;
};

} // namespace pileup
