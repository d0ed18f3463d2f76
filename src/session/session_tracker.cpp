#include "session_tracker.hpp"
#include "pileup/logging.hpp"
#include <algorithm>
#include <cmath>

namespace pileup {

SessionTracker::SessionTracker(const std::string& my_callsign, const TrackerConfig& config)
    : config_(config)
    , analyzer_(config)
    , my_call_(normalizeCallsign(my_callsign))
{}

void SessionTracker::setMyCallsign(const std::string& callsign) {
    my_call_ = normalizeCallsign(callsign);
}

// ============================================================================
// Target selection
// ============================================================================

void SessionTracker::setTarget(const std::string& callsign, const std::optional<std::string>& grid,
                               int frequency, Timestamp now) {
    std::string call = normalizeCallsign(callsign);
    if (call.empty()) {
        LOG_TRACKER(WARN, "Ignoring empty target callsign");
        return;
    }

    auto it = sessions_.find(call);
    if (it == sessions_.end()) {
        auto session = std::make_unique<TargetSession>();
        session->callsign = call;
        session->grid = grid;
        session->frequency = frequency;
        session->started = now;
        session->last_activity = now;
        it = sessions_.emplace(call, std::move(session)).first;
        LOG_TRACKER(INFO, "Target set: %s (new session)", call.c_str());
    } else {
        if (grid && !it->second->grid) it->second->grid = grid;
        if (frequency > 0) it->second->frequency = frequency;
        LOG_TRACKER(INFO, "Target set: %s (resumed, %d QSOs)", call.c_str(), it->second->qso_count);
    }

    if (current_ != it->second.get()) {
        calls_made_ = 0;
    }
    current_ = it->second.get();
}

void SessionTracker::clearTarget() {
    current_ = nullptr;
    calls_made_ = 0;
}

void SessionTracker::clearSession() {
    if (!current_) return;
    LOG_TRACKER(INFO, "Session cleared: %s", current_->callsign.c_str());
    sessions_.erase(current_->callsign);
    current_ = nullptr;
    calls_made_ = 0;
}

void SessionTracker::clearAll() {
    sessions_.clear();
    current_ = nullptr;
    calls_made_ = 0;
    cycle_ = 0;
    last_cycle_time_.reset();
}

std::optional<std::string> SessionTracker::getTargetCallsign() const {
    if (!current_) return std::nullopt;
    return current_->callsign;
}

std::vector<std::string> SessionTracker::getSessionCallsigns() const {
    std::vector<std::string> calls;
    for (const auto& [call, session] : sessions_) {
        calls.push_back(call);
    }
    return calls;
}

void SessionTracker::setTxStatus(bool enabled, const std::string& calling) {
    std::string call = normalizeCallsign(calling);
    bool was_calling = callingCurrentTarget();

    tx_enabled_ = enabled;
    tx_calling_ = call;

    if (!callingCurrentTarget()) {
        calls_made_ = 0;
    } else if (!was_calling) {
        calls_made_ = 1;
    }
}

bool SessionTracker::callingCurrentTarget() const {
    if (!tx_enabled_ || !current_) return false;
    return tx_calling_.empty() || tx_calling_ == current_->callsign;
}

// ============================================================================
// Decode stream
// ============================================================================

void SessionTracker::updateCycle(Timestamp ts) {
    latest_ = std::max(latest_, ts);

    if (!last_cycle_time_) {
        last_cycle_time_ = ts;
        return;
    }

    double elapsed = secondsBetween(*last_cycle_time_, ts);
    if (elapsed < config_.cycle_seconds) return;

    int cycles = static_cast<int>(std::floor(elapsed / config_.cycle_seconds));
    cycle_ += cycles;
    last_cycle_time_ = ts;

    if (callingCurrentTarget()) {
        calls_made_ += cycles;
    }

    // Prune on cycle boundaries only
    if (current_) {
        int removed = current_->pruneStale(ts, config_.stale_seconds);
        if (removed > 0) {
            LOG_TRACKER(DEBUG, "Pruned %d stale callers of %s", removed, current_->callsign.c_str());
        }
    }
}

bool SessionTracker::processDecode(const Decode& decode) {
    if (!current_) return false;

    updateCycle(decode.timestamp);

    ParsedMessage msg = MessageParser::parse(decode.message);
    if (msg.empty()) return false;

    const std::string& target = current_->callsign;
    const std::string& caller = *msg.caller;

    if (msg.is_cq && caller == target) {
        handleTargetCq(decode, msg);
        return true;
    }

    if (msg.callee && *msg.callee == target) {
        handlePileupCall(decode, msg);
        return true;
    }

    if (caller == target && msg.is_reply && msg.callee) {
        if (*msg.callee == my_call_) {
            handleTargetCallingMe(decode);
        } else {
            handleTargetAnswer(decode, *msg.callee);
        }
        return true;
    }

    return false;
}

void SessionTracker::handleTargetCq(const Decode& decode, const ParsedMessage& msg) {
    TargetSession& s = *current_;
    s.cq_count++;
    s.last_activity = std::max(s.last_activity, decode.timestamp);
    if (msg.grid && !s.grid) s.grid = msg.grid;
    if (decode.frequency > 0) s.frequency = decode.frequency;

    LOG_TRACKER(DEBUG, "Target CQ #%d from %s @ %d Hz", s.cq_count, s.callsign.c_str(), s.frequency);
}

void SessionTracker::handlePileupCall(const Decode& decode, const ParsedMessage& msg) {
    TargetSession& s = *current_;
    s.upsertCaller(*msg.caller, decode.frequency, decode.snr, msg.grid, decode.timestamp);

    LOG_TRACKER(DEBUG, "Pileup: %s @ %d Hz (%d dB) - total %d",
                msg.caller->c_str(), decode.frequency, decode.snr, s.pileupSize());

    if (observer_) {
        observer_->onPileupUpdate(s.callsign, buildPileupInfo(s));
    }
}

void SessionTracker::handleTargetAnswer(const Decode& decode, const std::string& answered) {
    TargetSession& s = *current_;
    s.last_activity = std::max(s.last_activity, decode.timestamp);
    s.qso_count++;

    std::optional<AnsweredCall> record;
    auto it = s.callers.find(answered);
    if (it != s.callers.end()) {
        const PileupMember& member = it->second;
        int loudest = s.loudestSnr().value_or(member.snr);

        AnsweredCall a;
        a.callsign = answered;
        a.frequency = member.frequency;
        a.snr = member.snr;
        // History stays time-ordered even if decodes arrive out of order
        a.answered_at = s.answers.empty()
            ? decode.timestamp
            : std::max(decode.timestamp, s.answers.back().answered_at);
        a.cycle_number = cycle_;
        a.calls_before_answer = member.call_count;
        a.snr_rank = s.snrRank(answered);
        a.pileup_size = s.pileupSize();
        a.was_loudest = member.snr >= loudest - config_.loudest_tolerance_db;

        s.answers.push_back(a);
        record = a;
    }

    // A fresh pileup forms for the next cycle
    s.callers.clear();

    if (!record) {
        LOG_TRACKER(INFO, "Target %s answered %s (not seen in pileup)", s.callsign.c_str(), answered.c_str());
        return;
    }

    LOG_TRACKER(INFO, "Target %s answered %s (rank %d/%d%s)", s.callsign.c_str(), answered.c_str(),
                record->snr_rank, record->pileup_size, record->was_loudest ? ", loudest" : "");

    if (observer_) {
        observer_->onAnswerDetected(s.callsign, *record);
    }

    if (static_cast<int>(s.answers.size()) >= config_.pattern_min_answers) {
        if (auto pattern = analyzer_.analyze(s.answers)) {
            LOG_TRACKER(INFO, "Pattern for %s: %s (%.0f%%)", s.callsign.c_str(),
                        pickingStyleToString(pattern->style), pattern->confidence * 100.0);
            if (observer_) {
                observer_->onPatternDetected(s.callsign, *pattern);
            }
        }
    }
}

void SessionTracker::handleTargetCallingMe(const Decode& decode) {
    current_->last_activity = std::max(current_->last_activity, decode.timestamp);
    LOG_TRACKER(INFO, "TARGET IS CALLING YOU: %s", decode.message.c_str());

    if (observer_) {
        observer_->onTargetCallingYou(current_->callsign, decode);
    }
}

// ============================================================================
// Queries
// ============================================================================

YourRank SessionTracker::rankOf(const TargetSession& session) const {
    if (int rank = session.snrRank(my_call_); rank > 0) {
        return YourRank::known(rank);
    }
    if (callingCurrentTarget()) {
        return YourRank::unknown();
    }
    return YourRank::notInPileup();
}

PileupInfo SessionTracker::buildPileupInfo(const TargetSession& session) const {
    PileupInfo info;
    info.callers = session.callersBySnr();
    info.size = static_cast<int>(info.callers.size());
    info.your_rank = rankOf(session);
    if (!info.callers.empty()) {
        info.loudest = info.callers.front();
    }
    info.frequency_range = session.frequencyRange();
    return info;
}

std::optional<PileupInfo> SessionTracker::getPileupInfo() const {
    if (!current_) return std::nullopt;
    return buildPileupInfo(*current_);
}

std::optional<PickingPattern> SessionTracker::analyzePattern() const {
    if (!current_) return std::nullopt;
    return analyzer_.analyze(current_->answers);
}

std::optional<TargetBehavior> SessionTracker::getTargetBehavior() const {
    if (!current_) return std::nullopt;

    const TargetSession& s = *current_;
    TargetBehavior behavior;
    behavior.callsign = s.callsign;
    behavior.qso_count = s.qso_count;
    behavior.qso_rate = s.qsoRatePerMinute(std::max(latest_, s.last_activity));
    behavior.cq_count = s.cq_count;
    behavior.answers = s.recentAnswers(static_cast<size_t>(std::max(1, config_.pattern_window)));
    behavior.pattern = analyzer_.analyze(s.answers);
    return behavior;
}

YourStatus SessionTracker::getYourStatus() const {
    YourStatus status;
    status.tx_frequency = tx_frequency_;
    if (!current_) return status;

    status.total = current_->pileupSize();
    status.rank = rankOf(*current_);
    status.in_pileup = status.rank.kind != YourRank::Kind::NOT_IN_PILEUP;
    if (callingCurrentTarget()) {
        status.calls_made = std::max(1, calls_made_);
    }
    return status;
}

} // namespace pileup
