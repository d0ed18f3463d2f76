#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pileup {

enum class Confidence : uint8_t {
    LOW,
    MEDIUM,
    HIGH,
};

enum class Action : uint8_t {
    CALL_NOW,
    WAIT,
    TRY_LATER,
};

const char* confidenceToString(Confidence confidence);
const char* actionToString(Action action);

// One multiplicative piece of live evidence (1.0 = neutral)
struct LiveFactor {
    std::string name;
    double value = 1.0;
    double weight = 1.0;       // Scales ln(value) in log-odds space
};

struct Prediction {
    double probability = 0.0;            // Clamped to [0.01, 0.99]
    double model_contribution = 0.0;     // Prior before live evidence
    std::vector<LiveFactor> live_factors;
    std::string explanation;
    Confidence confidence = Confidence::LOW;

    std::optional<double> factor(const std::string& name) const;
};

struct StrategyRecommendation {
    std::string target;
    Action action = Action::CALL_NOW;
    std::optional<int> recommended_frequency;  // Audio offset (Hz)
    std::vector<std::string> reasons;           // Most salient first
};

// Count from a target-side competition label such as "High (5)". 0 if absent.
int parseCompetitionCount(const std::string& label);

// "37%" style percentage
std::string formatPercent(double p);

} // namespace pileup
