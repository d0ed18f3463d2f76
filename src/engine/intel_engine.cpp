#include "intel_engine.hpp"
#include "message/message_parser.hpp"
#include "predict/bayesian_predictor.hpp"
#include "predict/heuristic_predictor.hpp"
#include "pileup/logging.hpp"
#include <algorithm>
#include <set>

namespace pileup {

namespace {

IntelConfig validated(IntelConfig config) {
    if (config.validate()) {
        LOG_ENGINE(WARN, "Configuration values out of range were clamped");
    }
    return config;
}

// Portable calls match their base call: DX1X == DX1X/P
bool sameStation(const std::string& a, const std::string& b) {
    if (a.empty() || b.empty()) return false;
    if (a == b) return true;
    if (a.find('/') != std::string::npos && a.find(b) != std::string::npos) return true;
    if (b.find('/') != std::string::npos && b.find(a) != std::string::npos) return true;
    return false;
}

} // namespace

IntelEngine::IntelEngine(const IntelConfig& config, const PriorScorer* scorer)
    : config_(validated(config))
    , scorer_(scorer)
    , spectrum_(config_.spectrum)
    , dial_frequency_hz_(config_.engine.dial_frequency_hz)
    , tracker_(config_.station.callsign, config_.tracker)
    , cache_(config_.predictor.cache_max_entries, config_.predictor.cache_ttl_seconds)
{
    if (config_.engine.heuristic_only) {
        predictor_ = std::make_unique<HeuristicPredictor>(tracker_, config_.predictor);
    } else {
        predictor_ = std::make_unique<BayesianPredictor>(tracker_, cache_, scorer_, config_.predictor);
    }

    LOG_ENGINE(INFO, "Engine for %s: %s predictor, %d Hz window",
               config_.station.callsign.c_str(), predictor_->name(), config_.spectrum.bandwidth_hz);
}

IntelEngine::~IntelEngine() {
    stop();
}

// ============================================================================
// Ingest
// ============================================================================

void IntelEngine::ingestDecode(const Decode& decode) {
    Decode d = decode;
    MessageParser::annotate(d);

    {
        std::lock_guard<std::mutex> lock(spectrum_mutex_);
        spectrum_.ingestLocalDecodes({d});
    }

    std::optional<int> moved_to;
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        const TargetSession* session = tracker_.currentSession();
        int before = session ? session->frequency : 0;

        tracker_.processDecode(d);

        session = tracker_.currentSession();
        if (session && session->frequency > 0 && session->frequency != before) {
            moved_to = session->frequency;
        }
    }

    if (moved_to) {
        protectTargetFrequency(moved_to);
    }
}

void IntelEngine::ingestDecodes(const std::vector<Decode>& decodes) {
    for (const auto& d : decodes) {
        ingestDecode(d);
    }
}

std::string IntelEngine::competitionLabel(int count) {
    const char* level = count > 40 ? "Pileup"
                      : count > 20 ? "High"
                      : count > 10 ? "Med"
                      : count > 0 ? "Low"
                      : "No Spots";
    return std::string(level) + " (" + std::to_string(std::max(0, count)) + ")";
}

void IntelEngine::ingestSpotBatch(const std::vector<Spot>& spots, Timestamp now) {
    std::optional<std::string> target = getTarget();
    int64_t dial_hz = getDialFrequency();
    int64_t now_s = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();

    std::vector<RemoteReport> reports;
    std::set<std::string> competitors;

    for (const auto& spot : spots) {
        bool heard_by_target = target && sameStation(normalizeCallsign(spot.receiver), *target);
        if (heard_by_target) {
            competitors.insert(normalizeCallsign(spot.sender));
        }

        // With a target, remote interference is what the target hears
        if (target && !heard_by_target) continue;

        int64_t offset = spot.frequency - dial_hz;
        if (offset <= 0 || offset >= config_.spectrum.bandwidth_hz) continue;

        RemoteReport r;
        r.offset = static_cast<int>(offset);
        r.snr = spot.snr;
        r.age_seconds = static_cast<float>(std::max<int64_t>(0, now_s - spot.time));
        reports.push_back(r);
    }

    {
        std::lock_guard<std::mutex> lock(spectrum_mutex_);
        spectrum_.ingestRemoteInterference(reports);
    }

    std::string label = competitionLabel(static_cast<int>(competitors.size()));
    {
        std::lock_guard<std::mutex> lock(predict_mutex_);
        competition_ = label;
    }

    LOG_ENGINE(DEBUG, "Spot batch: %zu spots, %zu in window, competition %s",
               spots.size(), reports.size(), label.c_str());
}

bool IntelEngine::decayTick(SteadyTime now) {
    std::lock_guard<std::mutex> lock(spectrum_mutex_);
    return spectrum_.decayTick(now);
}

int IntelEngine::findBestGap() {
    std::lock_guard<std::mutex> lock(spectrum_mutex_);
    if (auto gap = spectrum_.findBestGap()) {
        return gap->recommended_hz;
    }
    return spectrum_.getRecommendedOffset();
}

// ============================================================================
// Band
// ============================================================================

bool IntelEngine::setDialFrequency(int64_t dial_hz) {
    if (dial_hz <= 0) {
        LOG_ENGINE(WARN, "Ignoring dial frequency %lld Hz", static_cast<long long>(dial_hz));
        return false;
    }

    int64_t previous;
    {
        std::lock_guard<std::mutex> lock(spectrum_mutex_);
        previous = dial_frequency_hz_;
        if (dial_hz == previous) return false;

        dial_frequency_hz_ = dial_hz;
        // Spots from the old band no longer map onto this window
        spectrum_.ingestRemoteInterference({});
    }

    LOG_ENGINE(INFO, "QSY %lld -> %lld Hz, sessions cleared",
               static_cast<long long>(previous), static_cast<long long>(dial_hz));
    clearAllSessions();
    return true;
}

int64_t IntelEngine::getDialFrequency() const {
    std::lock_guard<std::mutex> lock(spectrum_mutex_);
    return dial_frequency_hz_;
}

void IntelEngine::protectTargetFrequency(std::optional<int> offset_hz) {
    std::lock_guard<std::mutex> lock(spectrum_mutex_);
    if (offset_hz && *offset_hz > 0) {
        spectrum_.setProtectedFrequency(*offset_hz);
    } else {
        spectrum_.clearProtectedFrequency();
    }
}

// ============================================================================
// Target
// ============================================================================

void IntelEngine::setTarget(const std::string& callsign, const std::optional<std::string>& grid,
                            int frequency) {
    std::optional<int> target_freq;
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        tracker_.setTarget(callsign, grid, frequency);
        if (const TargetSession* session = tracker_.currentSession()) {
            target_freq = session->frequency;
        }
    }

    protectTargetFrequency(target_freq);
    resetPredictionState();
}

void IntelEngine::clearTarget() {
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        tracker_.clearTarget();
    }

    protectTargetFrequency(std::nullopt);
    resetPredictionState();
}

void IntelEngine::clearSession() {
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        tracker_.clearSession();
    }

    protectTargetFrequency(std::nullopt);
    resetPredictionState();
}

void IntelEngine::clearAllSessions() {
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        tracker_.clearAll();
    }

    protectTargetFrequency(std::nullopt);
    resetPredictionState();
}

std::vector<std::string> IntelEngine::getSessionCallsigns() const {
    std::lock_guard<std::mutex> lock(session_mutex_);
    return tracker_.getSessionCallsigns();
}

void IntelEngine::resetPredictionState() {
    std::lock_guard<std::mutex> lock(predict_mutex_);
    cache_.clear();
    competition_ = competitionLabel(0);
}

std::optional<std::string> IntelEngine::getTarget() const {
    std::lock_guard<std::mutex> lock(session_mutex_);
    return tracker_.getTargetCallsign();
}

void IntelEngine::setTxStatus(bool enabled, const std::string& calling) {
    std::lock_guard<std::mutex> lock(session_mutex_);
    tracker_.setTxStatus(enabled, calling);
}

void IntelEngine::setTxFrequency(int offset_hz) {
    std::lock_guard<std::mutex> lock(session_mutex_);
    tracker_.setTxFrequency(offset_hz);
}

std::optional<PileupInfo> IntelEngine::getPileupInfo() const {
    std::lock_guard<std::mutex> lock(session_mutex_);
    return tracker_.getPileupInfo();
}

std::optional<TargetBehavior> IntelEngine::getTargetBehavior() const {
    std::lock_guard<std::mutex> lock(session_mutex_);
    return tracker_.getTargetBehavior();
}

YourStatus IntelEngine::getYourStatus() const {
    std::lock_guard<std::mutex> lock(session_mutex_);
    return tracker_.getYourStatus();
}

// ============================================================================
// Prediction
// ============================================================================

Prediction IntelEngine::predictSuccess(const std::string& target, const FeatureMap& features,
                                       PathStatus path) {
    std::lock_guard<std::mutex> predict_lock(predict_mutex_);
    std::lock_guard<std::mutex> session_lock(session_mutex_);
    return predictor_->predictSuccess(target, features, path);
}

StrategyRecommendation IntelEngine::getStrategy(const std::string& target, PathStatus path,
                                                const std::string& competition) {
    std::lock_guard<std::mutex> predict_lock(predict_mutex_);
    std::lock_guard<std::mutex> session_lock(session_mutex_);
    return predictor_->getStrategy(target, path, competition);
}

void IntelEngine::setPathStatus(PathStatus status) {
    std::lock_guard<std::mutex> lock(predict_mutex_);
    if (status == path_status_) return;

    LOG_ENGINE(INFO, "Path status %s -> %s", pathStatusToString(path_status_), pathStatusToString(status));
    path_status_ = status;
    cache_.clear();
}

PathStatus IntelEngine::getPathStatus() const {
    std::lock_guard<std::mutex> lock(predict_mutex_);
    return path_status_;
}

void IntelEngine::setFeatures(const FeatureMap& features) {
    std::lock_guard<std::mutex> lock(predict_mutex_);
    features_ = features;
}

std::string IntelEngine::getTargetCompetition() const {
    std::lock_guard<std::mutex> lock(predict_mutex_);
    return competition_;
}

const char* IntelEngine::predictorName() const {
    return predictor_->name();
}

// ============================================================================
// Timers and events
// ============================================================================

std::optional<RefreshResult> IntelEngine::refresh() {
    RefreshResult result;
    {
        std::lock_guard<std::mutex> predict_lock(predict_mutex_);
        std::lock_guard<std::mutex> session_lock(session_mutex_);

        auto target = tracker_.getTargetCallsign();
        if (!target) return std::nullopt;

        result.target = *target;
        result.prediction = predictor_->predictSuccess(*target, features_, path_status_);
        result.strategy = predictor_->getStrategy(*target, path_status_, competition_);
    }

    RefreshCallback cb;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        cb = on_refresh_;
    }
    if (cb) cb(result);

    return result;
}

void IntelEngine::start() {
    if (!decay_task_) {
        decay_task_ = std::make_unique<PeriodicTask>(
            "decay", std::chrono::milliseconds(config_.engine.decay_period_ms),
            [this] { decayTick(); });
    }
    if (!refresh_task_) {
        refresh_task_ = std::make_unique<PeriodicTask>(
            "refresh", std::chrono::milliseconds(config_.engine.refresh_period_ms),
            [this] { refresh(); });
    }

    decay_task_->start();
    refresh_task_->start();
    LOG_ENGINE(INFO, "Timers started (decay %u ms, refresh %u ms)",
               config_.engine.decay_period_ms, config_.engine.refresh_period_ms);
}

void IntelEngine::stop() {
    if (decay_task_) decay_task_->stop();
    if (refresh_task_) refresh_task_->stop();
}

bool IntelEngine::isRunning() const {
    return (decay_task_ && decay_task_->isRunning()) ||
           (refresh_task_ && refresh_task_->isRunning());
}

void IntelEngine::setRefreshCallback(RefreshCallback cb) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    on_refresh_ = std::move(cb);
}

void IntelEngine::setRecommendationCallback(RecommendationCallback cb) {
    std::lock_guard<std::mutex> lock(spectrum_mutex_);
    spectrum_.setRecommendationCallback(std::move(cb));
}

void IntelEngine::setSessionObserver(SessionObserver* observer) {
    std::lock_guard<std::mutex> lock(session_mutex_);
    tracker_.setObserver(observer);
}

// ============================================================================
// Spectrum inspection
// ============================================================================

Intensities IntelEngine::getLocalIntensity() const {
    std::lock_guard<std::mutex> lock(spectrum_mutex_);
    return spectrum_.localIntensity();
}

Intensities IntelEngine::getRemoteIntensity() const {
    std::lock_guard<std::mutex> lock(spectrum_mutex_);
    return spectrum_.remoteIntensity();
}

std::vector<Intensities> IntelEngine::getWaterfall() const {
    std::lock_guard<std::mutex> lock(spectrum_mutex_);
    return spectrum_.getWaterfall();
}

int IntelEngine::getRecommendedOffset() const {
    std::lock_guard<std::mutex> lock(spectrum_mutex_);
    return spectrum_.getRecommendedOffset();
}

float IntelEngine::costAt(int offset_hz) const {
    std::lock_guard<std::mutex> lock(spectrum_mutex_);
    return spectrum_.costAt(offset_hz);
}

} // namespace pileup
