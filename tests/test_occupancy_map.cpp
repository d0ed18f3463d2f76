/**
 * Spectral Occupancy Map Test Suite
 *
 * Intensity mappings, ingest and decay behaviour, and the gap finder's
 * guard bands, protected frequency and hysteresis.
 */

#include "spectrum/occupancy_map.hpp"
#include <cmath>
#include <cstdlib>
#include <iostream>
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

static Decode makeDecode(int freq, int snr) {
    Decode d;
    d.frequency = freq;
    d.snr = snr;
    d.message = "CQ K1ABC FN42";
    return d;
}

static RemoteReport makeReport(int offset, int snr, float age) {
    RemoteReport r;
    r.offset = offset;
    r.snr = snr;
    r.age_seconds = age;
    return r;
}

// ============================================================================
// Mappings
// ============================================================================

bool test_local_mapping_monotonic() {
    TEST("Local intensity mapping is monotonic and bounded");

    Intensity prev = OccupancyMap::localIntensityForSnr(-60);
    for (int snr = -60; snr <= 60; ++snr) {
        Intensity v = OccupancyMap::localIntensityForSnr(snr);
        if (v < 0.0f || v > 100.0f) FAIL("Out of range at " << snr << " dB: " << v);
        if (v < 40.0f) FAIL("Below 40 at " << snr << " dB");
        if (v < prev) FAIL("Decreasing at " << snr << " dB");
        prev = v;
    }
    if (OccupancyMap::localIntensityForSnr(-24) != 40.0f) FAIL("-24 dB should map to 40");
    if (OccupancyMap::localIntensityForSnr(20) != 100.0f) FAIL("+20 dB should map to 100");

    PASS();
    return true;
}

bool test_remote_mapping_and_age() {
    TEST("Remote intensity mapping and age weight");

    Intensity prev = OccupancyMap::remoteIntensityForSnr(-60);
    for (int snr = -60; snr <= 40; ++snr) {
        Intensity v = OccupancyMap::remoteIntensityForSnr(snr);
        if (v < 20.0f || v > 100.0f) FAIL("Out of range at " << snr << " dB");
        if (v < prev) FAIL("Decreasing at " << snr << " dB");
        prev = v;
    }

    SpectrumConfig cfg;
    if (OccupancyMap::ageWeight(10.0f, cfg) != 1.0f) FAIL("Fresh report not full weight");
    if (OccupancyMap::ageWeight(60.0f, cfg) != 1.0f) FAIL("60 s report not full weight");
    if (OccupancyMap::ageWeight(600.0f, cfg) != 0.0f) FAIL("600 s report not zero");
    if (OccupancyMap::ageWeight(900.0f, cfg) != 0.0f) FAIL("900 s report not zero");
    float mid = OccupancyMap::ageWeight(330.0f, cfg);
    if (std::fabs(mid - 0.5f) > 1e-4f) FAIL("Midpoint weight " << mid);

    PASS();
    return true;
}

// ============================================================================
// Ingest and decay
// ============================================================================

bool test_local_raise_monotonic() {
    TEST("Repeated local ingest never lowers intensity");

    OccupancyMap map;
    auto now = SteadyClock::now();

    map.ingestLocalDecodes({makeDecode(1000, 5)}, now);
    Intensity first = map.localIntensity()[1000];
    if (first <= 0.0f) FAIL("Nothing raised");

    for (int i = 0; i < 5; ++i) {
        map.ingestLocalDecodes({makeDecode(1000, 5)}, now);
        if (map.localIntensity()[1000] < first) FAIL("Intensity decreased on repeat");
    }

    // A weaker decode on the same frequency must not lower it either
    map.ingestLocalDecodes({makeDecode(1000, -20)}, now);
    if (map.localIntensity()[1000] < first) FAIL("Weaker decode lowered intensity");

    // Raised across +-25 Hz only
    if (map.localIntensity()[975] <= 0.0f || map.localIntensity()[1025] <= 0.0f) FAIL("Window too narrow");
    if (map.localIntensity()[974] != 0.0f || map.localIntensity()[1026] != 0.0f) FAIL("Window too wide");

    PASS();
    return true;
}

bool test_out_of_band_decode_ignored() {
    TEST("Out-of-band decodes ignored, edges clipped");

    OccupancyMap map;
    map.ingestLocalDecodes({makeDecode(-50, 0), makeDecode(3500, 0), makeDecode(5, 0)});
    if (map.localIntensity()[0] <= 0.0f) FAIL("Edge decode not raised");
    if (map.localIntensity()[31] != 0.0f) FAIL("Edge window too wide");

    PASS();
    return true;
}

bool test_decay_hold() {
    TEST("No decay during hold period");

    OccupancyMap map;
    auto t0 = SteadyClock::now();
    map.ingestLocalDecodes({makeDecode(1200, 0)}, t0);
    Intensity before = map.localIntensity()[1200];

    if (map.decayTick(t0 + std::chrono::seconds(1))) FAIL("Decayed inside hold");
    if (map.decayTick(t0 + std::chrono::seconds(11))) FAIL("Decayed inside hold");
    if (map.localIntensity()[1200] != before) FAIL("Intensity changed during hold");

    if (!map.decayTick(t0 + std::chrono::seconds(13))) FAIL("No decay after hold");
    if (map.localIntensity()[1200] >= before) FAIL("Intensity not reduced");

    PASS();
    return true;
}

bool test_decay_converges_to_zero() {
    TEST("Decay converges to exactly zero");

    OccupancyMap map;
    auto t0 = SteadyClock::now();
    map.ingestLocalDecodes({makeDecode(800, 20), makeDecode(1500, 0), makeDecode(2200, -20)}, t0);

    auto later = t0 + std::chrono::seconds(20);
    for (int i = 0; i < 200; ++i) {
        map.decayTick(later);
    }

    for (size_t i = 0; i < map.localIntensity().size(); ++i) {
        if (map.localIntensity()[i] != 0.0f) FAIL("Bin " << i << " = " << map.localIntensity()[i]);
    }

    PASS();
    return true;
}

bool test_remote_replaced() {
    TEST("Remote batch replaces previous batch");

    OccupancyMap map;
    map.ingestRemoteInterference({makeReport(500, 0, 10.0f)});
    if (map.remoteIntensity()[500] <= 0.0f) FAIL("Remote not raised");
    if (map.remoteIntensity()[530] <= 0.0f || map.remoteIntensity()[531] != 0.0f) FAIL("Remote width");

    map.ingestRemoteInterference({makeReport(1000, 0, 10.0f)});
    if (map.remoteIntensity()[500] != 0.0f) FAIL("Old batch survived");
    if (map.remoteIntensity()[1000] <= 0.0f) FAIL("New batch missing");

    PASS();
    return true;
}

bool test_remote_overlap_uses_max() {
    TEST("Overlapping remote reports take the maximum");

    OccupancyMap map;
    map.ingestRemoteInterference({makeReport(700, 0, 10.0f), makeReport(710, 0, 10.0f)});
    Intensity single = OccupancyMap::remoteIntensityForSnr(0);
    if (std::fabs(map.remoteIntensity()[705] - single) > 1e-4f) FAIL("Overlap summed");

    // Aged reports fade, expired ones vanish
    map.ingestRemoteInterference({makeReport(700, 0, 330.0f), makeReport(2000, 0, 700.0f)});
    if (std::fabs(map.remoteIntensity()[700] - single * 0.5f) > 1e-3f) FAIL("Age weight not applied");
    if (map.remoteIntensity()[2000] != 0.0f) FAIL("Expired report raised");

    PASS();
    return true;
}

// ============================================================================
// Gap finder
// ============================================================================

bool test_empty_band_prefers_center() {
    TEST("Empty band recommends band centre");

    OccupancyMap map;
    auto gap = map.findBestGap();
    if (!gap) FAIL("No result");
    if (gap->candidate_hz != 1500) FAIL("Candidate " << gap->candidate_hz);
    if (map.getRecommendedOffset() != 1500) FAIL("Recommended " << map.getRecommendedOffset());

    PASS();
    return true;
}

bool test_guard_bands_and_protection() {
    TEST("Never inside edge guards or protected radius");

    const std::vector<int> busy = {250, 400, 650, 900, 1100, 1350, 1500, 1700, 1950, 2300, 2600, 2750};
    const std::vector<int> protect = {200, 350, 800, 1500, 2100, 2650, 2800};

    for (int p : protect) {
        OccupancyMap map;
        std::vector<Decode> decodes;
        for (int f : busy) decodes.push_back(makeDecode(f, -5));
        map.ingestLocalDecodes(decodes);
        map.ingestRemoteInterference({makeReport(1200, 5, 5.0f), makeReport(2000, 5, 5.0f)});
        map.setProtectedFrequency(p);

        auto gap = map.findBestGap();
        if (!gap) FAIL("No result for protect " << p);

        int rec = map.getRecommendedOffset();
        if (rec < 200 || rec > 2800) FAIL("Inside edge guard: " << rec);
        if (std::abs(rec - p) <= 150) FAIL("Within guard of " << p << ": " << rec);
        if (gap->candidate_hz < 200 || gap->candidate_hz > 2800) FAIL("Candidate in edge guard");
    }

    PASS();
    return true;
}

bool test_hysteresis() {
    TEST("Hysteresis suppresses small moves");

    OccupancyMap map;
    int notifications = 0;
    map.setRecommendationCallback([&](int) { notifications++; });

    map.findBestGap();  // Centre, already the initial recommendation
    if (map.getRecommendedOffset() != 1500) FAIL("Initial recommendation");

    // Signal just below centre pushes the best window ~11 Hz up
    map.ingestLocalDecodes({makeDecode(1460, -10)});
    auto small = map.findBestGap();
    if (!small) FAIL("No result");
    if (std::abs(small->candidate_hz - 1500) > 20 || small->candidate_hz == 1500) {
        FAIL("Unexpected candidate " << small->candidate_hz);
    }
    if (small->updated) FAIL("Small move published");
    if (map.getRecommendedOffset() != 1500) FAIL("Recommendation moved");

    // Second signal closes the gap; the move is now large
    map.ingestLocalDecodes({makeDecode(1530, -10)});
    auto big = map.findBestGap();
    if (!big || !big->updated) FAIL("Large move suppressed");
    if (std::abs(map.getRecommendedOffset() - 1500) <= 20) FAIL("Recommendation didn't move");
    if (notifications < 1) FAIL("Callback not fired");

    PASS();
    return true;
}

bool test_protect_forces_update() {
    TEST("Protecting the current recommendation forces a move");

    OccupancyMap map;
    map.findBestGap();
    map.setProtectedFrequency(1510);
    auto gap = map.findBestGap();
    if (!gap || !gap->updated) FAIL("No move");
    if (std::abs(map.getRecommendedOffset() - 1510) <= 150) FAIL("Still within guard");

    map.clearProtectedFrequency();
    if (map.getProtectedFrequency()) FAIL("Protection not cleared");

    PASS();
    return true;
}

bool test_empty_search_range() {
    TEST("Empty search range keeps previous recommendation");

    SpectrumConfig cfg;
    cfg.edge_guard_hz = 1600;  // Guards overlap
    OccupancyMap map(cfg);

    int before = map.getRecommendedOffset();
    bool fired = false;
    map.setRecommendationCallback([&](int) { fired = true; });

    if (map.findBestGap()) FAIL("Result returned for empty range");
    if (map.getRecommendedOffset() != before) FAIL("Recommendation changed");
    if (fired) FAIL("Callback fired");

    PASS();
    return true;
}

bool test_interference_scenario() {
    TEST("Gap away from remote and local clusters");

    OccupancyMap map;

    map.ingestRemoteInterference({makeReport(500, 5, 10.0f), makeReport(1500, 5, 10.0f)});
    map.ingestLocalDecodes({makeDecode(990, -18), makeDecode(1000, -20), makeDecode(1010, -19)});

    auto gap = map.findBestGap();
    if (!gap) FAIL("No result");
    int best = map.getRecommendedOffset();

    // Clear of every cluster by at least half a window plus its raise width
    if (std::abs(best - 500) < 50) FAIL("On the 500 Hz cluster: " << best);
    if (std::abs(best - 1500) < 50) FAIL("On the 1500 Hz cluster: " << best);
    if (std::abs(best - 1000) < 50) FAIL("On the 1000 Hz cluster: " << best);

    // Nearer the centre than the farthest cluster
    if (std::abs(best - 1500) >= 500) FAIL("Not pulled toward centre: " << best);

    float cost = map.costAt(best);
    for (int cluster : {500, 1000, 1500}) {
        if (!(cost < map.costAt(cluster))) FAIL("Cost not lower than at " << cluster);
    }

    PASS();
    return true;
}

bool test_cost_outside_curve() {
    TEST("Cost outside the curve is infinite");

    OccupancyMap map;
    if (!std::isinf(map.costAt(1500))) FAIL("Cost before first search");
    map.findBestGap();
    if (std::isinf(map.costAt(1500))) FAIL("No cost at centre");
    if (!std::isinf(map.costAt(10))) FAIL("Cost before first window centre");
    if (!std::isinf(map.costAt(2990))) FAIL("Cost past last window centre");

    PASS();
    return true;
}

// ============================================================================
// Waterfall
// ============================================================================

bool test_waterfall_ring() {
    TEST("Waterfall ring buffer");

    SpectrumConfig cfg;
    cfg.waterfall_depth = 8;
    OccupancyMap map(cfg);

    auto t0 = SteadyClock::now();
    for (int i = 0; i < 3; ++i) map.decayTick(t0);
    if (map.getWaterfall().size() != 3) FAIL("Expected 3 rows");

    map.ingestLocalDecodes({makeDecode(1000, 0)}, t0);
    map.decayTick(t0);

    auto rows = map.getWaterfall();
    if (rows.size() != 4) FAIL("Expected 4 rows");
    if (rows.front().size() != 300) FAIL("Row size " << rows.front().size());
    if (rows.back()[100] <= 0.0f) FAIL("Newest row missing signal");
    if (rows.front()[100] != 0.0f) FAIL("Oldest row has signal");

    for (int i = 0; i < 20; ++i) map.decayTick(t0);
    if (map.getWaterfall().size() != 8) FAIL("Ring not bounded");

    map.reset();
    if (!map.getWaterfall().empty()) FAIL("Reset kept rows");
    if (map.localIntensity()[1000] != 0.0f) FAIL("Reset kept intensity");

    PASS();
    return true;
}

int main() {
    std::cout << "=== Spectral Occupancy Map Test Suite ===\n\n";

    std::cout << "Mappings:\n";
    test_local_mapping_monotonic();
    test_remote_mapping_and_age();

    std::cout << "\nIngest and decay:\n";
    test_local_raise_monotonic();
    test_out_of_band_decode_ignored();
    test_decay_hold();
    test_decay_converges_to_zero();
    test_remote_replaced();
    test_remote_overlap_uses_max();

    std::cout << "\nGap finder:\n";
    test_empty_band_prefers_center();
    test_guard_bands_and_protection();
    test_hysteresis();
    test_protect_forces_update();
    test_empty_search_range();
    test_interference_scenario();
    test_cost_outside_curve();

    std::cout << "\nWaterfall:\n";
    test_waterfall_ring();

    std::cout << "\n=== Results: " << tests_passed << "/" << tests_run << " passed ===\n";

    return (tests_passed == tests_run) ? 0 : 1;
}
