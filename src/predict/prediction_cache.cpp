#include "prediction_cache.hpp"
#include <algorithm>
#include <cstdio>
#include <utility>
#include <vector>

namespace pileup {

PredictionCache::PredictionCache(size_t max_entries, double ttl_seconds)
    : max_entries_(std::max<size_t>(1, max_entries))
    , ttl_seconds_(ttl_seconds)
{}

std::optional<Prediction> PredictionCache::get(const std::string& key, SteadyTime now) {
    auto it = entries_.find(key);
    if (it == entries_.end()) return std::nullopt;

    double age = std::chrono::duration<double>(now - it->second.stored).count();
    if (age > ttl_seconds_) {
        entries_.erase(it);
        return std::nullopt;
    }
    return it->second.value;
}

void PredictionCache::put(const std::string& key, const Prediction& value, SteadyTime now) {
    if (!entries_.count(key) && entries_.size() >= max_entries_) {
        auto oldest = std::min_element(entries_.begin(), entries_.end(),
            [](const auto& a, const auto& b) { return a.second.stored < b.second.stored; });
        entries_.erase(oldest);
    }
    entries_[key] = Entry{value, now};
}

void PredictionCache::invalidate(const std::string& pattern) {
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->first.find(pattern) != std::string::npos) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
}

void PredictionCache::invalidateTarget(const std::string& target) {
    invalidate("|target=" + target + "|");
}

std::string PredictionCache::makeKey(const std::string& model_name, const std::string& target,
                                     PathStatus path, const FeatureMap& features) {
    std::vector<std::pair<std::string, std::string>> fields;
    fields.emplace_back("target", target);
    fields.emplace_back("path", pathStatusToString(path));
    for (const auto& [name, value] : features) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%g", value);
        fields.emplace_back(name, buf);
    }
    std::sort(fields.begin(), fields.end());

    std::string key = model_name + "|";
    for (const auto& [name, value] : fields) {
        key += name + "=" + value + "|";
    }
    return key;
}

} // namespace pileup
