/**
 * Engine Scenario Test Suite
 *
 * End-to-end runs through IntelEngine: a loudest-first DXpedition, gap
 * finding around remote and local interference, spot batches, band
 * changes, refresh and the background timers.
 */

#include "engine/intel_engine.hpp"
#include "pileup/logging.hpp"
#include <atomic>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace pileup;

static int tests_run = 0;
static int tests_passed = 0;

#define TEST(name) \
    do { std::cout << "  Testing " << name << "... " << std::flush; tests_run++; } while(0)

#define PASS() \
    do { std::cout << "PASS\n"; tests_passed++; } while(0)

#define FAIL(msg) \
    do { std::cout << "FAIL: " << msg << "\n"; return false; } while(0)

static const int64_t DIAL = 14074000;

static IntelConfig stationConfig() {
    IntelConfig cfg;
    cfg.station.callsign = "W1ME";
    cfg.engine.dial_frequency_hz = DIAL;
    return cfg;
}

static Decode decodeAt(Timestamp base, double seconds, int snr, int freq, const std::string& message) {
    Decode d;
    d.timestamp = base + std::chrono::duration_cast<WallClock::duration>(std::chrono::duration<double>(seconds));
    d.snr = snr;
    d.frequency = freq;
    d.message = message;
    return d;
}

static Spot spotAt(const std::string& sender, const std::string& receiver, int offset_hz, int snr,
                   int64_t time) {
    Spot s;
    s.sender = sender;
    s.receiver = receiver;
    s.frequency = DIAL + offset_hz;
    s.snr = snr;
    s.time = time;
    return s;
}

static int64_t epochSeconds(Timestamp t) {
    return std::chrono::duration_cast<std::chrono::seconds>(t.time_since_epoch()).count();
}

class CountingObserver : public SessionObserver {
public:
    int pileup_updates = 0;
    int answers = 0;
    int patterns = 0;

    void onPileupUpdate(const std::string&, const PileupInfo&) override { pileup_updates++; }
    void onAnswerDetected(const std::string&, const AnsweredCall&) override { answers++; }
    void onPatternDetected(const std::string&, const PickingPattern&) override { patterns++; }
};

// ============================================================================
// End-to-end
// ============================================================================

bool test_loudest_first_dxpedition() {
    TEST("Loudest-first DXpedition");

    IntelEngine engine(stationConfig());
    CountingObserver obs;
    engine.setSessionObserver(&obs);
    engine.setTarget("DX1X");

    Timestamp base = WallClock::now();
    engine.ingestDecode(decodeAt(base, 0, -8, 1800, "CQ DX1X JJ00aa"));

    const char* loud[] = {"K1AAA", "K2AAA", "K3AAA", "K4AAA", "K5AAA"};
    double t = 15;
    for (int round = 0; round < 5; ++round) {
        engine.ingestDecode(decodeAt(base, t, -3, 900 + 40 * round, std::string("DX1X ") + loud[round] + " FN42"));
        engine.ingestDecode(decodeAt(base, t, -12, 1200, "DX1X N2BBB EM10"));
        engine.ingestDecode(decodeAt(base, t, -17, 2100, "DX1X N3CCC"));
        t += 15;
        engine.ingestDecode(decodeAt(base, t, -8, 1800, std::string(loud[round]) + " DX1X -03"));
        t += 15;
    }

    auto pileup = engine.getPileupInfo();
    if (!pileup || pileup->size != 0) FAIL("Pileup not cleared after answer");

    auto behavior = engine.getTargetBehavior();
    if (!behavior || !behavior->pattern) FAIL("No pattern");
    if (behavior->pattern->style != PickingStyle::LOUDEST_FIRST) {
        FAIL("Style " << pickingStyleToString(behavior->pattern->style));
    }
    if (behavior->pattern->confidence != 1.0) FAIL("Confidence " << behavior->pattern->confidence);
    if (behavior->qso_count != 5 || behavior->cq_count != 1) FAIL("Counters");

    if (obs.answers != 5 || obs.patterns != 1 || obs.pileup_updates != 15) {
        FAIL("Observer " << obs.pileup_updates << "/" << obs.answers << "/" << obs.patterns);
    }

    PASS();
    return true;
}

bool test_gap_between_clusters() {
    TEST("Gap avoids remote and local clusters");

    IntelEngine engine(stationConfig());
    Timestamp now = WallClock::now();
    int64_t ten_s_ago = epochSeconds(now) - 10;

    engine.ingestSpotBatch({
        spotAt("K1AAA", "EA8ZZZ", 500, 10, ten_s_ago),
        spotAt("K2BBB", "EA8ZZZ", 1500, 10, ten_s_ago),
    }, now);

    for (int i = 0; i < 3; ++i) {
        engine.ingestDecode(decodeAt(now, 0, -20, 995 + 5 * i, "CQ K9ZZZ EN50"));
    }

    int best = engine.findBestGap();
    if (best < 200 || best > 2800) FAIL("Outside safe range: " << best);

    int clusters[] = {500, 1000, 1500};
    float best_cost = engine.costAt(best);
    for (int c : clusters) {
        if (std::abs(best - c) <= 50) FAIL(best << " Hz too close to cluster at " << c);
        if (!(best_cost < engine.costAt(c))) FAIL("Cost at " << best << " not below cost at " << c);
    }
    if (std::abs(best - 1500) >= std::abs(1000 - 1500)) FAIL("Not close to band centre: " << best);

    Intensities remote = engine.getRemoteIntensity();
    if (remote[500] <= 0.0f || remote[1500] <= 0.0f || remote[1000] != 0.0f) FAIL("Remote map");
    Intensities local = engine.getLocalIntensity();
    if (local[1000] <= 0.0f || local[500] != 0.0f) FAIL("Local map");

    PASS();
    return true;
}

bool test_gap_follows_target() {
    TEST("Gap keeps clear of the target frequency");

    IntelEngine engine(stationConfig());
    std::vector<int> published;
    engine.setRecommendationCallback([&](int hz) { published.push_back(hz); });

    engine.setTarget("DX1X", std::nullopt, 1500);
    int gap = engine.findBestGap();
    if (std::abs(gap - 1500) <= 150) FAIL("Gap " << gap << " inside guard");
    if (published.empty() || published.back() != gap) FAIL("Recommendation not published");

    // Target QSYs: protection follows its CQ
    engine.ingestDecode(decodeAt(WallClock::now(), 0, -10, 2200, "CQ DX1X JJ00"));
    gap = engine.findBestGap();
    if (std::abs(gap - 2200) <= 150) FAIL("Gap " << gap << " inside moved guard");
    if (std::abs(gap - 1500) > 2) FAIL("Expected centre once free, got " << gap);

    engine.clearTarget();
    if (engine.getTarget()) FAIL("Target not cleared");

    PASS();
    return true;
}

// ============================================================================
// Spots and competition
// ============================================================================

bool test_spot_competition() {
    TEST("Spots heard by the target set competition");

    IntelEngine engine(stationConfig());
    if (IntelEngine::competitionLabel(0) != "No Spots (0)") FAIL("Label 0");
    if (IntelEngine::competitionLabel(3) != "Low (3)") FAIL("Label 3");
    if (IntelEngine::competitionLabel(11) != "Med (11)") FAIL("Label 11");
    if (IntelEngine::competitionLabel(21) != "High (21)") FAIL("Label 21");
    if (IntelEngine::competitionLabel(41) != "Pileup (41)") FAIL("Label 41");

    engine.setTarget("DX1X");
    if (engine.getTargetCompetition() != "No Spots (0)") FAIL("Initial label");

    Timestamp now = WallClock::now();
    int64_t ts = epochSeconds(now);
    engine.ingestSpotBatch({
        spotAt("K1AAA", "DX1X", 700, -5, ts),
        spotAt("K1AAA", "DX1X", 700, -4, ts),
        spotAt("K2BBB", "DX1X/P", 1100, -9, ts),
        spotAt("K3CCC", "dx1x", 2400, -12, ts),
        spotAt("K4DDD", "EA8ZZZ", 1900, 5, ts),
    }, now);

    if (engine.getTargetCompetition() != "Low (3)") FAIL("Label " << engine.getTargetCompetition());

    Intensities remote = engine.getRemoteIntensity();
    if (remote[700] <= 0.0f || remote[1100] <= 0.0f || remote[2400] <= 0.0f) FAIL("Target-side spots missing");
    if (remote[1900] != 0.0f) FAIL("Spot not heard by target raised the map");

    // Hidden pileup reaches the strategy through refresh()
    auto result = engine.refresh();
    if (!result) FAIL("No refresh result");
    if (result->strategy.reasons.empty() ||
        result->strategy.reasons[0] != "Competition at target (3)") {
        FAIL("Strategy ignores target-side competition");
    }

    // Out-of-window and stale spots
    engine.ingestSpotBatch({
        spotAt("K5EEE", "DX1X", -100, 0, ts),
        spotAt("K6FFF", "DX1X", 3500, 0, ts),
        spotAt("K7GGG", "DX1X", 1300, 0, ts - 3600),
    }, now);
    remote = engine.getRemoteIntensity();
    for (float v : remote) {
        if (v != 0.0f) FAIL("Out-of-window or stale spot raised the map");
    }
    if (engine.getTargetCompetition() != "Low (3)") FAIL("Competition counts senders heard by target");

    PASS();
    return true;
}

// ============================================================================
// Prediction through the engine
// ============================================================================

bool test_refresh_and_path() {
    TEST("Refresh follows path status");

    IntelEngine engine(stationConfig());
    int calls = 0;
    engine.setRefreshCallback([&](const RefreshResult&) { calls++; });

    if (engine.refresh()) FAIL("Refresh without target");
    if (calls != 0) FAIL("Callback without target");

    engine.setTarget("DX1X");
    engine.setFeatures({{"target_snr", -12}});
    engine.setPathStatus(PathStatus::CONNECTED);

    auto result = engine.refresh();
    if (!result || result->target != "DX1X") FAIL("Refresh target");
    if (calls != 1) FAIL("Callback count " << calls);
    if (result->strategy.action != Action::CALL_NOW) FAIL("Connected action");
    double connected_p = result->prediction.probability;

    engine.setPathStatus(PathStatus::NO_PATH);
    result = engine.refresh();
    if (result->strategy.action != Action::TRY_LATER) FAIL("No path action");
    if (!(result->prediction.probability < connected_p)) FAIL("Stale cached prediction after path change");

    Prediction direct = engine.predictSuccess("DX1X", {{"target_snr", -12}}, PathStatus::NO_PATH);
    if (direct.probability != result->prediction.probability) FAIL("Direct and refresh predictions differ");

    PASS();
    return true;
}

bool test_tx_status_through_engine() {
    TEST("TX status through the engine");

    IntelEngine engine(stationConfig());
    engine.setTarget("DX1X");
    engine.ingestDecode(decodeAt(WallClock::now(), 0, -6, 1200, "DX1X K1AAA"));

    engine.setTxStatus(true, "DX1X");
    engine.setTxFrequency(1650);

    YourStatus you = engine.getYourStatus();
    if (!you.in_pileup || you.rank.kind != YourRank::Kind::UNKNOWN) FAIL("Calling status");
    if (!you.tx_frequency || *you.tx_frequency != 1650) FAIL("TX frequency");

    auto strategy = engine.getStrategy("DX1X", PathStatus::PATH_OPEN, "");
    bool found = false;
    for (const auto& r : strategy.reasons) found |= r == "You're calling";
    if (!found) FAIL("Strategy missing calling reason");

    PASS();
    return true;
}

bool test_heuristic_mode_and_validation() {
    TEST("Heuristic mode and config validation");

    IntelConfig cfg = stationConfig();
    cfg.engine.heuristic_only = true;
    cfg.spectrum.window_hz = 0;
    IntelEngine engine(cfg);

    if (std::string(engine.predictorName()) != "heuristic") FAIL("Predictor " << engine.predictorName());
    if (engine.config().spectrum.window_hz != 1) FAIL("Config not validated");

    IntelEngine bayes(stationConfig());
    if (std::string(bayes.predictorName()) != "bayesian") FAIL("Default predictor");

    PASS();
    return true;
}

// ============================================================================
// Timers
// ============================================================================

bool test_timers() {
    TEST("Decay and refresh timers");

    IntelConfig cfg = stationConfig();
    cfg.engine.decay_period_ms = 10;
    cfg.engine.refresh_period_ms = 100;
    cfg.spectrum.decay_hold_seconds = 0.0f;

    IntelEngine engine(cfg);
    std::atomic<int> refreshes{0};
    engine.setRefreshCallback([&](const RefreshResult&) { refreshes++; });
    engine.setTarget("DX1X");
    engine.ingestDecode(decodeAt(WallClock::now(), 0, 10, 1000, "CQ K9ZZZ EN50"));
    float before = engine.getLocalIntensity()[1000];

    engine.start();
    if (!engine.isRunning()) FAIL("Not running");
    std::this_thread::sleep_for(std::chrono::milliseconds(400));
    engine.stop();

    if (engine.isRunning()) FAIL("Still running");
    if (refreshes.load() < 1) FAIL("No refresh fired");
    if (!(engine.getLocalIntensity()[1000] < before)) FAIL("Local map did not decay");
    if (engine.getWaterfall().empty()) FAIL("No waterfall rows");

    // Restart after stop
    engine.start();
    if (!engine.isRunning()) FAIL("Restart failed");
    engine.stop();

    PASS();
    return true;
}

bool test_band_change() {
    TEST("QSY re-bases spots and clears sessions");

    const int64_t DIAL_40M = 7074000;

    IntelEngine engine(stationConfig());
    Timestamp now = WallClock::now();
    int64_t spot_time = epochSeconds(now) - 10;

    engine.ingestSpotBatch({spotAt("K1AAA", "G4XYZ", 800, 5, spot_time)}, now);
    if (!(engine.getRemoteIntensity()[800] > 0.0f)) FAIL("20m spot not mapped");

    engine.setTarget("DX2Y");
    engine.setTarget("DX1X");
    engine.ingestDecode(decodeAt(now, 0, -8, 1200, "DX1X W2ABC FN20"));
    if (engine.getSessionCallsigns().size() != 2) FAIL("Sessions " << engine.getSessionCallsigns().size());

    // 40m spots against the 20m dial fall outside the window
    Spot low = spotAt("K2BBB", "F5ABC", 0, 5, spot_time);
    Spot high = spotAt("K3CCC", "F5ABC", 0, 5, spot_time);
    low.frequency = DIAL_40M + 500;
    high.frequency = DIAL_40M + 1500;
    engine.clearTarget();
    engine.ingestSpotBatch({low, high}, now);
    if (engine.getRemoteIntensity()[500] != 0.0f) FAIL("40m spot mapped on 20m");

    engine.setTarget("DX1X");
    if (!engine.setDialFrequency(DIAL_40M)) FAIL("Dial change not reported");
    if (engine.getDialFrequency() != DIAL_40M) FAIL("Dial " << engine.getDialFrequency());
    if (engine.getTarget()) FAIL("Target survived QSY");
    if (!engine.getSessionCallsigns().empty()) FAIL("Sessions survived QSY");
    if (engine.getPileupInfo()) FAIL("Pileup info without target");
    if (engine.getTargetCompetition() != "No Spots (0)") FAIL("Competition " << engine.getTargetCompetition());

    Intensities remote = engine.getRemoteIntensity();
    for (size_t i = 0; i < remote.size(); ++i) {
        if (remote[i] != 0.0f) FAIL("Remote bin " << i << " not cleared");
    }

    if (engine.setDialFrequency(DIAL_40M)) FAIL("Same dial reported as change");
    if (engine.setDialFrequency(0)) FAIL("Zero dial accepted");
    if (engine.getDialFrequency() != DIAL_40M) FAIL("Dial moved by bad value");

    engine.ingestSpotBatch({low, high}, now);
    remote = engine.getRemoteIntensity();
    if (!(remote[500] > 0.0f) || !(remote[1500] > 0.0f)) {
        FAIL("40m spots: remote@500=" << remote[500] << " remote@1500=" << remote[1500]);
    }
    if (remote[800] != 0.0f) FAIL("Stale 20m bin");

    PASS();
    return true;
}

bool test_clear_sessions() {
    TEST("Session clearing through the engine");

    IntelEngine engine(stationConfig());
    engine.setTarget("DX1X", std::nullopt, 1500);
    engine.setTarget("DX2Y", std::nullopt, 900);

    engine.clearSession();
    auto calls = engine.getSessionCallsigns();
    if (calls.size() != 1 || calls[0] != "DX1X") FAIL("Remaining sessions");
    if (engine.getTarget()) FAIL("Target kept after clearSession");

    engine.clearSession();
    if (engine.getSessionCallsigns().size() != 1) FAIL("clearSession without target removed a session");

    engine.setTarget("DX3Z");
    engine.clearAllSessions();
    if (!engine.getSessionCallsigns().empty()) FAIL("clearAllSessions left sessions");
    if (engine.getTarget()) FAIL("Target kept after clearAllSessions");
    if (engine.getDialFrequency() != DIAL) FAIL("Dial changed");

    PASS();
    return true;
}

int main() {
    std::cout << "=== Engine Scenario Test Suite ===\n\n";

    setLogLevel(LogLevel::WARN);

    std::cout << "End-to-end:\n";
    test_loudest_first_dxpedition();
    test_gap_between_clusters();
    test_gap_follows_target();

    std::cout << "\nSpots:\n";
    test_spot_competition();

    std::cout << "\nBand:\n";
    test_band_change();
    test_clear_sessions();

    std::cout << "\nPrediction:\n";
    test_refresh_and_path();
    test_tx_status_through_engine();
    test_heuristic_mode_and_validation();

    std::cout << "\nTimers:\n";
    test_timers();

    std::cout << "\n=== Results: " << tests_passed << "/" << tests_run << " passed ===\n";

    return (tests_passed == tests_run) ? 0 : 1;
}
