#pragma once

#include "target_session.hpp"
#include "pattern_analyzer.hpp"
#include "message/message_parser.hpp"
#include "pileup/config.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pileup {

// Operator's position in a pileup
struct YourRank {
    enum class Kind : uint8_t {
        KNOWN,          // We hear our own call in the pileup
        UNKNOWN,        // Transmitting, but we can't hear ourselves
        NOT_IN_PILEUP,
    };

    Kind kind = Kind::NOT_IN_PILEUP;
    int rank = 0;       // Valid only for KNOWN

    static YourRank known(int r) { return {Kind::KNOWN, r}; }
    static YourRank unknown() { return {Kind::UNKNOWN, 0}; }
    static YourRank notInPileup() { return {Kind::NOT_IN_PILEUP, 0}; }

    bool isKnown() const { return kind == Kind::KNOWN; }
};

struct PileupInfo {
    int size = 0;
    std::vector<PileupMember> callers;              // Loudest first
    YourRank your_rank;
    std::optional<PileupMember> loudest;
    std::optional<std::pair<int, int>> frequency_range;
};

struct TargetBehavior {
    std::string callsign;
    int qso_count = 0;
    double qso_rate = 0.0;                          // Per minute
    int cq_count = 0;
    std::vector<AnsweredCall> answers;              // Recent window
    std::optional<PickingPattern> pattern;
};

struct YourStatus {
    bool in_pileup = false;
    YourRank rank;
    int total = 0;                                  // Current pileup size
    int calls_made = 0;
    std::optional<int> tx_frequency;
};

/**
 * Session event sink
 *
 * Called synchronously from processDecode(). Default implementations do nothing.
 */
class SessionObserver {
public:
    virtual ~SessionObserver() = default;

    virtual void onPileupUpdate(const std::string& /*target*/, const PileupInfo& /*info*/) {}
    virtual void onAnswerDetected(const std::string& /*target*/, const AnsweredCall& /*answer*/) {}
    virtual void onPatternDetected(const std::string& /*target*/, const PickingPattern& /*pattern*/) {}
    virtual void onTargetCallingYou(const std::string& /*target*/, const Decode& /*decode*/) {}
};

/**
 * Pileup Session Tracker
 *
 * Follows one current target through the decode stream:
 *   target CQ              -> CQ count, grid and frequency
 *   someone calls target   -> pileup member upsert
 *   target answers other   -> answer history, pileup cleared, pattern re-analysis
 *   target answers us      -> onTargetCallingYou
 *
 * Sessions for earlier targets stay alive and resume on re-selection.
 * Decodes arriving with no target set are dropped.
 */
class SessionTracker {
public:
    explicit SessionTracker(const std::string& my_callsign,
                            const TrackerConfig& config = TrackerConfig{});

    void setObserver(SessionObserver* observer) { observer_ = observer; }

    // --- Target selection ---

    void setTarget(const std::string& callsign,
                   const std::optional<std::string>& grid = std::nullopt,
                   int frequency = 0,
                   Timestamp now = WallClock::now());

    // Forget the current target (its session stays alive)
    void clearTarget();

    // Drop the current target's session
    void clearSession();

    // Drop every session (band change)
    void clearAll();

    bool hasTarget() const { return current_ != nullptr; }
    std::optional<std::string> getTargetCallsign() const;
    std::vector<std::string> getSessionCallsigns() const;

    // --- Operator status ---

    void setMyCallsign(const std::string& callsign);
    const std::string& getMyCallsign() const { return my_call_; }

    // TX state as reported by the station software. 'calling' is the
    // station being called (empty if unknown).
    void setTxStatus(bool enabled, const std::string& calling = "");
    void setTxFrequency(int offset_hz) { tx_frequency_ = offset_hz; }
    bool isTxEnabled() const { return tx_enabled_; }

    // --- Decode stream ---

    // Returns true if the decode changed the current session
    bool processDecode(const Decode& decode);

    // --- Queries ---

    std::optional<PileupInfo> getPileupInfo() const;
    std::optional<TargetBehavior> getTargetBehavior() const;
    YourStatus getYourStatus() const;
    std::optional<PickingPattern> analyzePattern() const;

    // Read-only access to the current session (nullptr without a target)
    const TargetSession* currentSession() const { return current_; }

    int getCycle() const { return cycle_; }

private:
    TrackerConfig config_;
    PatternAnalyzer analyzer_;
    std::string my_call_;

    std::map<std::string, std::unique_ptr<TargetSession>> sessions_;
    TargetSession* current_ = nullptr;

    // Cycle bookkeeping
    int cycle_ = 0;
    std::optional<Timestamp> last_cycle_time_;
    Timestamp latest_{};                 // Newest decode time seen

    // Operator TX
    bool tx_enabled_ = false;
    std::string tx_calling_;
    std::optional<int> tx_frequency_;
    int calls_made_ = 0;

    SessionObserver* observer_ = nullptr;

    void updateCycle(Timestamp ts);
    bool callingCurrentTarget() const;
    YourRank rankOf(const TargetSession& session) const;
    PileupInfo buildPileupInfo(const TargetSession& session) const;

    void handleTargetCq(const Decode& decode, const ParsedMessage& msg);
    void handlePileupCall(const Decode& decode, const ParsedMessage& msg);
    void handleTargetAnswer(const Decode& decode, const std::string& answered);
    void handleTargetCallingMe(const Decode& decode);
};

} // namespace pileup
