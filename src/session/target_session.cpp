#include "target_session.hpp"
#include <algorithm>

namespace pileup {

void TargetSession::upsertCaller(const std::string& call, int freq, int snr_db,
                                 const std::optional<std::string>& caller_grid, Timestamp seen) {
    auto it = callers.find(call);
    if (it == callers.end()) {
        PileupMember member;
        member.callsign = call;
        member.frequency = freq;
        member.snr = snr_db;
        member.grid = caller_grid;
        member.first_seen = seen;
        member.last_seen = seen;
        callers.emplace(call, std::move(member));
        return;
    }

    PileupMember& member = it->second;
    member.frequency = freq;
    member.snr = snr_db;
    if (caller_grid) member.grid = caller_grid;
    member.last_seen = std::max(member.last_seen, seen);
    member.call_count++;
}

std::vector<PileupMember> TargetSession::callersBySnr() const {
    std::vector<PileupMember> sorted;
    sorted.reserve(callers.size());
    for (const auto& [call, member] : callers) {
        sorted.push_back(member);
    }
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const PileupMember& a, const PileupMember& b) { return a.snr > b.snr; });
    return sorted;
}

int TargetSession::snrRank(const std::string& call) const {
    auto sorted = callersBySnr();
    for (size_t i = 0; i < sorted.size(); ++i) {
        if (sorted[i].callsign == call) return static_cast<int>(i) + 1;
    }
    return 0;
}

std::optional<int> TargetSession::loudestSnr() const {
    if (callers.empty()) return std::nullopt;
    int best = callers.begin()->second.snr;
    for (const auto& [call, member] : callers) {
        best = std::max(best, member.snr);
    }
    return best;
}

std::optional<std::pair<int, int>> TargetSession::frequencyRange() const {
    if (callers.empty()) return std::nullopt;
    int lo = callers.begin()->second.frequency;
    int hi = lo;
    for (const auto& [call, member] : callers) {
        lo = std::min(lo, member.frequency);
        hi = std::max(hi, member.frequency);
    }
    return std::make_pair(lo, hi);
}

int TargetSession::pruneStale(Timestamp now, double max_age_seconds) {
    int removed = 0;
    for (auto it = callers.begin(); it != callers.end();) {
        if (secondsBetween(it->second.last_seen, now) > max_age_seconds) {
            it = callers.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    return removed;
}

std::vector<AnsweredCall> TargetSession::recentAnswers(size_t n) const {
    size_t first = answers.size() > n ? answers.size() - n : 0;
    return std::vector<AnsweredCall>(answers.begin() + first, answers.end());
}

double TargetSession::qsoRatePerMinute(Timestamp now) const {
    if (qso_count == 0) return 0.0;
    double minutes = secondsBetween(started, now) / 60.0;
    return qso_count / std::max(0.1, minutes);
}

} // namespace pileup
