#pragma once

#include "prediction.hpp"
#include "prior_scorer.hpp"
#include "pileup/types.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace pileup {

/**
 * Prediction Cache
 *
 * Bounded map from key to Prediction with a time-to-live. At capacity the
 * oldest entry is evicted. Not thread-safe; owners serialise access.
 *
 * Keys look like "success|path=connected|target=DX1X|target_snr=-10|"
 * with fields sorted, so invalidate("|target=DX1X|") matches one target.
 */
class PredictionCache {
public:
    PredictionCache(size_t max_entries = 500, double ttl_seconds = 30.0);

    std::optional<Prediction> get(const std::string& key, SteadyTime now = SteadyClock::now());
    void put(const std::string& key, const Prediction& value, SteadyTime now = SteadyClock::now());

    // Drop every key containing pattern
    void invalidate(const std::string& pattern);
    void invalidateTarget(const std::string& target);
    void clear() { entries_.clear(); }

    size_t size() const { return entries_.size(); }

    static std::string makeKey(const std::string& model_name, const std::string& target,
                               PathStatus path, const FeatureMap& features);

private:
    struct Entry {
        Prediction value;
        SteadyTime stored{};
    };

    size_t max_entries_;
    double ttl_seconds_;
    std::map<std::string, Entry> entries_;
};

} // namespace pileup
