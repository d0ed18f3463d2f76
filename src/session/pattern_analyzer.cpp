#include "pattern_analyzer.hpp"
#include "pileup/logging.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace pileup {

const char* pickingStyleToString(PickingStyle style) {
    switch (style) {
        case PickingStyle::LOUDEST_FIRST:       return "loudest_first";
        case PickingStyle::METHODICAL_LOW_HIGH: return "methodical_low_high";
        case PickingStyle::METHODICAL_HIGH_LOW: return "methodical_high_low";
        case PickingStyle::RANDOM:              return "random";
        default: return "unknown";
    }
}

const char* PatternAnalyzer::adviceFor(PickingStyle style) {
    switch (style) {
        case PickingStyle::LOUDEST_FIRST:
            return "Target picks loudest signals. Strong signal advantage.";
        case PickingStyle::METHODICAL_LOW_HIGH:
            return "Target working low-to-high. Position at lower frequencies.";
        case PickingStyle::METHODICAL_HIGH_LOW:
            return "Target working high-to-low. Position at higher frequencies.";
        case PickingStyle::RANDOM:
            return "No clear pattern. Persistence matters.";
        default:
            return "Not enough answers yet.";
    }
}

PatternAnalyzer::PatternAnalyzer(const TrackerConfig& config)
    : config_(config)
{}

namespace {

// Fractional ranks (1-based), ties get the average of their positions
std::vector<double> averageRanks(const std::vector<double>& values) {
    size_t n = values.size();
    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&](size_t a, size_t b) { return values[a] < values[b]; });

    std::vector<double> ranks(n, 0.0);
    size_t i = 0;
    while (i < n) {
        size_t j = i;
        while (j + 1 < n && values[order[j + 1]] == values[order[i]]) ++j;
        double rank = (static_cast<double>(i) + static_cast<double>(j)) / 2.0 + 1.0;
        for (size_t k = i; k <= j; ++k) ranks[order[k]] = rank;
        i = j + 1;
    }
    return ranks;
}

double pearson(const std::vector<double>& x, const std::vector<double>& y) {
    double n = static_cast<double>(x.size());
    double mx = std::accumulate(x.begin(), x.end(), 0.0) / n;
    double my = std::accumulate(y.begin(), y.end(), 0.0) / n;

    double sxy = 0.0, sxx = 0.0, syy = 0.0;
    for (size_t i = 0; i < x.size(); ++i) {
        double dx = x[i] - mx;
        double dy = y[i] - my;
        sxy += dx * dy;
        sxx += dx * dx;
        syy += dy * dy;
    }
    if (sxx <= 0.0 || syy <= 0.0) return 0.0;  // Undefined for a constant series
    return sxy / std::sqrt(sxx * syy);
}

} // namespace

double PatternAnalyzer::frequencyCorrelation(const std::vector<AnsweredCall>& answers) {
    if (answers.size() < 3) return 0.0;

    std::vector<double> order(answers.size());
    std::vector<double> freqs(answers.size());
    for (size_t i = 0; i < answers.size(); ++i) {
        order[i] = static_cast<double>(i);
        freqs[i] = static_cast<double>(answers[i].frequency);
    }

    double rho = pearson(averageRanks(order), averageRanks(freqs));
    return std::isfinite(rho) ? std::clamp(rho, -1.0, 1.0) : 0.0;
}

std::optional<PickingPattern> PatternAnalyzer::analyze(const std::vector<AnsweredCall>& answers) const {
    size_t window = static_cast<size_t>(std::max(1, config_.pattern_window));
    size_t first = answers.size() > window ? answers.size() - window : 0;
    std::vector<AnsweredCall> recent(answers.begin() + first, answers.end());

    if (static_cast<int>(recent.size()) < config_.pattern_min_answers || recent.empty()) {
        return std::nullopt;
    }

    int loudest = 0;
    for (const auto& a : recent) {
        if (a.was_loudest) loudest++;
    }

    PickingPattern pattern;
    pattern.sample_size = static_cast<int>(recent.size());
    pattern.loudest_pick_ratio = static_cast<double>(loudest) / recent.size();
    pattern.frequency_correlation = frequencyCorrelation(recent);

    if (pattern.loudest_pick_ratio >= 0.6) {
        pattern.style = PickingStyle::LOUDEST_FIRST;
        pattern.confidence = pattern.loudest_pick_ratio;
    } else if (pattern.frequency_correlation > 0.5) {
        pattern.style = PickingStyle::METHODICAL_LOW_HIGH;
        pattern.confidence = pattern.frequency_correlation;
    } else if (pattern.frequency_correlation < -0.5) {
        pattern.style = PickingStyle::METHODICAL_HIGH_LOW;
        pattern.confidence = std::fabs(pattern.frequency_correlation);
    } else {
        pattern.style = PickingStyle::RANDOM;
        pattern.confidence = 1.0 - pattern.loudest_pick_ratio;
    }
    pattern.advice = adviceFor(pattern.style);

    LOG_TRACKER(DEBUG, "Pattern %s (%.2f) from %d answers: loudest %.2f, corr %.2f",
                pickingStyleToString(pattern.style), pattern.confidence, pattern.sample_size,
                pattern.loudest_pick_ratio, pattern.frequency_correlation);
    return pattern;
}

} // namespace pileup
