#pragma once

#include "target_session.hpp"
#include "pileup/config.hpp"
#include <optional>
#include <string>
#include <vector>

namespace pileup {

// How a target chooses whom to answer
enum class PickingStyle : uint8_t {
    UNKNOWN,
    LOUDEST_FIRST,
    METHODICAL_LOW_HIGH,
    METHODICAL_HIGH_LOW,
    RANDOM,
};

const char* pickingStyleToString(PickingStyle style);

struct PickingPattern {
    PickingStyle style = PickingStyle::UNKNOWN;
    double confidence = 0.0;            // 0-1
    int sample_size = 0;
    std::string advice;

    double loudest_pick_ratio = 0.0;
    double frequency_correlation = 0.0; // +1 low-to-high, -1 high-to-low
};

/**
 * Picking Pattern Analyzer
 *
 * Classifies the last answers of a session, in priority order:
 *   loudest ratio >= 0.6      -> LOUDEST_FIRST (confidence = ratio)
 *   freq correlation > 0.5    -> METHODICAL_LOW_HIGH (confidence = correlation)
 *   freq correlation < -0.5   -> METHODICAL_HIGH_LOW (confidence = |correlation|)
 *   otherwise                 -> RANDOM (confidence = 1 - ratio)
 */
class PatternAnalyzer {
public:
    explicit PatternAnalyzer(const TrackerConfig& config = TrackerConfig{});

    // Uses the most recent pattern_window answers. Returns nullopt below pattern_min_answers.
    std::optional<PickingPattern> analyze(const std::vector<AnsweredCall>& answers) const;

    // Spearman rank correlation of answer order against frequency.
    // 0 with fewer than 3 samples or when either series is constant.
    static double frequencyCorrelation(const std::vector<AnsweredCall>& answers);

    static const char* adviceFor(PickingStyle style);

private:
    TrackerConfig config_;
};

} // namespace pileup
