#pragma once

#include "pileup/types.hpp"
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace pileup {

// A station currently calling the target
struct PileupMember {
    std::string callsign;
    int frequency = 0;                 // Last-seen audio offset (Hz)
    int snr = 0;                       // Last SNR as we hear them
    std::optional<std::string> grid;
    Timestamp first_seen{};
    Timestamp last_seen{};
    int call_count = 1;                // Sightings this pileup
};

// Target answered a caller (append-only history)
struct AnsweredCall {
    std::string callsign;
    int frequency = 0;
    int snr = 0;
    Timestamp answered_at{};
    int cycle_number = 0;
    int calls_before_answer = 0;
    int snr_rank = 0;                  // 1 = loudest caller at answer time
    int pileup_size = 0;
    bool was_loudest = false;          // Within tolerance of the loudest caller
};

/**
 * One tracked DX target
 *
 * Plain state owned and mutated by SessionTracker.
 */
struct TargetSession {
    std::string callsign;
    std::optional<std::string> grid;
    int frequency = 0;                 // Target's own TX offset

    Timestamp started{};
    Timestamp last_activity{};

    int cq_count = 0;
    int qso_count = 0;

    std::map<std::string, PileupMember> callers;
    std::vector<AnsweredCall> answers;  // Time-ordered

    int pileupSize() const { return static_cast<int>(callers.size()); }

    // Insert or refresh a caller
    void upsertCaller(const std::string& call, int frequency, int snr,
                      const std::optional<std::string>& grid, Timestamp seen);

    // Callers by SNR, loudest first (ties by callsign)
    std::vector<PileupMember> callersBySnr() const;

    // 1-based SNR rank, 0 if not in the pileup
    int snrRank(const std::string& call) const;

    std::optional<int> loudestSnr() const;
    std::optional<std::pair<int, int>> frequencyRange() const;

    // Drop callers not heard for more than max_age_seconds. Returns count removed.
    int pruneStale(Timestamp now, double max_age_seconds);

    // Last n answers, oldest first
    std::vector<AnsweredCall> recentAnswers(size_t n) const;

    // QSOs per minute since the session started (at least 0.1 min elapsed)
    double qsoRatePerMinute(Timestamp now) const;
};

} // namespace pileup
