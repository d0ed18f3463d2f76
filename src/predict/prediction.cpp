#include "prediction.hpp"
#include <cctype>
#include <cmath>
#include <cstdio>

namespace pileup {

const char* confidenceToString(Confidence confidence) {
    switch (confidence) {
        case Confidence::HIGH:   return "high";
        case Confidence::MEDIUM: return "medium";
        default: return "low";
    }
}

const char* actionToString(Action action) {
    switch (action) {
        case Action::WAIT:      return "wait";
        case Action::TRY_LATER: return "try_later";
        default: return "call_now";
    }
}

std::optional<double> Prediction::factor(const std::string& name) const {
    for (const auto& f : live_factors) {
        if (f.name == name) return f.value;
    }
    return std::nullopt;
}

int parseCompetitionCount(const std::string& label) {
    size_t open = label.find('(');
    if (open == std::string::npos) return 0;
    size_t close = label.find(')', open);
    if (close == std::string::npos) return 0;

    // Surrounding blanks are allowed: "High ( 5 )"
    size_t first = open + 1;
    size_t last = close;
    while (first < last && std::isspace(static_cast<unsigned char>(label[first]))) ++first;
    while (last > first && std::isspace(static_cast<unsigned char>(label[last - 1]))) --last;
    if (first == last) return 0;

    int count = 0;
    for (size_t i = first; i < last; ++i) {
        unsigned char c = static_cast<unsigned char>(label[i]);
        if (!std::isdigit(c)) return 0;
        count = count * 10 + (c - '0');
        if (count > 100000) return 0;
    }
    return count;
}

std::string formatPercent(double p) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%.0f%%", std::round(p * 100.0));
    return buf;
}

} // namespace pileup
