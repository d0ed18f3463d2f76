/**
 * Pattern Analyzer Test Suite
 */

#include "session/pattern_analyzer.hpp"
#include <cmath>
#include <iostream>
#include <string>
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

// Answers with the given frequencies; the first `loudest` are flagged loudest
static std::vector<AnsweredCall> makeAnswers(const std::vector<int>& freqs, int loudest) {
    std::vector<AnsweredCall> answers;
    for (size_t i = 0; i < freqs.size(); ++i) {
        AnsweredCall a;
        a.callsign = "K" + std::to_string(i % 10) + "ABC";
        a.frequency = freqs[i];
        a.cycle_number = static_cast<int>(i) * 2;
        a.was_loudest = static_cast<int>(i) < loudest;
        answers.push_back(a);
    }
    return answers;
}

bool test_too_few_answers() {
    TEST("Fewer than 5 answers gives no pattern");

    PatternAnalyzer analyzer;
    if (analyzer.analyze({})) FAIL("Pattern from nothing");
    if (analyzer.analyze(makeAnswers({100, 200, 300, 400}, 4))) FAIL("Pattern from 4 answers");
    if (!analyzer.analyze(makeAnswers({100, 200, 300, 400, 500}, 5))) FAIL("No pattern from 5");

    PASS();
    return true;
}

bool test_loudest_first() {
    TEST("8 of 10 loudest -> loudest-first 0.8");

    PatternAnalyzer analyzer;
    auto answers = makeAnswers({1200, 800, 1500, 900, 1100, 700, 1400, 1000, 1300, 600}, 8);
    auto p = analyzer.analyze(answers);
    if (!p) FAIL("No pattern");
    if (p->style != PickingStyle::LOUDEST_FIRST) FAIL("Style " << pickingStyleToString(p->style));
    if (std::fabs(p->confidence - 0.8) > 1e-9) FAIL("Confidence " << p->confidence);
    if (std::fabs(p->loudest_pick_ratio - 0.8) > 1e-9) FAIL("Ratio " << p->loudest_pick_ratio);
    if (p->sample_size != 10) FAIL("Sample size " << p->sample_size);
    if (p->advice != "Target picks loudest signals. Strong signal advantage.") FAIL("Advice");

    PASS();
    return true;
}

bool test_loudest_beats_frequency() {
    TEST("Loudest ratio takes priority over frequency order");

    PatternAnalyzer analyzer;
    auto p = analyzer.analyze(makeAnswers({500, 600, 700, 800, 900, 1000}, 4));
    if (!p || p->style != PickingStyle::LOUDEST_FIRST) FAIL("Expected loudest-first");
    if (p->frequency_correlation < 0.99) FAIL("Correlation still computed");

    PASS();
    return true;
}

bool test_methodical_low_high() {
    TEST("Increasing frequencies -> methodical low-to-high");

    PatternAnalyzer analyzer;
    auto p = analyzer.analyze(makeAnswers({400, 650, 900, 1210, 1500, 1720, 2000}, 1));
    if (!p) FAIL("No pattern");
    if (p->style != PickingStyle::METHODICAL_LOW_HIGH) FAIL("Style " << pickingStyleToString(p->style));
    if (!(p->confidence > 0.5)) FAIL("Confidence " << p->confidence);
    if (std::fabs(p->frequency_correlation - 1.0) > 1e-9) FAIL("Correlation " << p->frequency_correlation);
    if (p->advice != "Target working low-to-high. Position at lower frequencies.") FAIL("Advice");

    PASS();
    return true;
}

bool test_methodical_high_low() {
    TEST("Decreasing frequencies -> methodical high-to-low");

    PatternAnalyzer analyzer;
    auto p = analyzer.analyze(makeAnswers({2400, 2100, 1800, 1500, 1000, 600}, 0));
    if (!p) FAIL("No pattern");
    if (p->style != PickingStyle::METHODICAL_HIGH_LOW) FAIL("Style " << pickingStyleToString(p->style));
    if (std::fabs(p->confidence - 1.0) > 1e-9) FAIL("Confidence " << p->confidence);
    if (p->frequency_correlation > -0.99) FAIL("Correlation sign");

    PASS();
    return true;
}

bool test_random() {
    TEST("No trend, few loudest -> random");

    PatternAnalyzer analyzer;
    auto p = analyzer.analyze(makeAnswers({1000, 500, 1500, 700, 1200, 800, 1400, 600, 1100, 900}, 2));
    if (!p) FAIL("No pattern");
    if (p->style != PickingStyle::RANDOM) FAIL("Style " << pickingStyleToString(p->style));
    if (std::fabs(p->confidence - 0.8) > 1e-9) FAIL("Confidence " << p->confidence);
    if (std::fabs(p->frequency_correlation) > 0.5) FAIL("Correlation " << p->frequency_correlation);
    if (p->advice != "No clear pattern. Persistence matters.") FAIL("Advice");

    PASS();
    return true;
}

bool test_window_uses_recent() {
    TEST("Only the most recent 10 answers count");

    PatternAnalyzer analyzer;
    std::vector<int> freqs = {2000, 1900, 1800, 1700, 1600};           // Old, loudest
    for (int f = 500; f < 1500; f += 100) freqs.push_back(f);          // Recent, rising
    auto answers = makeAnswers(freqs, 5);

    auto p = analyzer.analyze(answers);
    if (!p) FAIL("No pattern");
    if (p->sample_size != 10) FAIL("Sample size " << p->sample_size);
    if (p->loudest_pick_ratio != 0.0) FAIL("Old answers counted");
    if (p->style != PickingStyle::METHODICAL_LOW_HIGH) FAIL("Style " << pickingStyleToString(p->style));

    PASS();
    return true;
}

bool test_spearman_values() {
    TEST("Spearman correlation values");

    double rho = PatternAnalyzer::frequencyCorrelation(makeAnswers({100, 300, 200, 500, 400}, 0));
    if (std::fabs(rho - 0.8) > 1e-9) FAIL("Expected 0.8, got " << rho);

    // Monotonic but non-linear still gives 1
    rho = PatternAnalyzer::frequencyCorrelation(makeAnswers({100, 101, 500, 2900, 2950}, 0));
    if (std::fabs(rho - 1.0) > 1e-9) FAIL("Expected 1.0, got " << rho);

    // Ties share ranks
    rho = PatternAnalyzer::frequencyCorrelation(makeAnswers({100, 100, 200, 200, 300}, 0));
    if (!(rho > 0.9 && rho < 1.0)) FAIL("Tied ranks gave " << rho);

    PASS();
    return true;
}

bool test_degenerate_correlation() {
    TEST("Degenerate inputs give zero correlation");

    if (PatternAnalyzer::frequencyCorrelation(makeAnswers({100, 200}, 0)) != 0.0) FAIL("Two samples");
    double flat = PatternAnalyzer::frequencyCorrelation(makeAnswers({1000, 1000, 1000, 1000, 1000}, 0));
    if (flat != 0.0 || std::isnan(flat)) FAIL("Constant frequencies gave " << flat);

    PatternAnalyzer analyzer;
    auto p = analyzer.analyze(makeAnswers({1000, 1000, 1000, 1000, 1000}, 0));
    if (!p || p->style != PickingStyle::RANDOM) FAIL("Constant frequencies not random");
    if (p->confidence != 1.0) FAIL("Confidence " << p->confidence);

    PASS();
    return true;
}

bool test_custom_window() {
    TEST("Configured window and minimum");

    TrackerConfig cfg;
    cfg.pattern_min_answers = 3;
    cfg.pattern_window = 4;
    PatternAnalyzer analyzer(cfg);

    auto p = analyzer.analyze(makeAnswers({900, 800, 700}, 0));
    if (!p || p->style != PickingStyle::METHODICAL_HIGH_LOW) FAIL("3 answers with min 3");

    p = analyzer.analyze(makeAnswers({100, 200, 300, 400, 500, 600}, 2));
    if (!p || p->sample_size != 4) FAIL("Window of 4 not applied");
    if (p->loudest_pick_ratio != 0.0) FAIL("Answers outside window counted");

    PASS();
    return true;
}

int main() {
    std::cout << "=== Pattern Analyzer Test Suite ===\n\n";

    test_too_few_answers();
    test_loudest_first();
    test_loudest_beats_frequency();
    test_methodical_low_high();
    test_methodical_high_low();
    test_random();
    test_window_uses_recent();
    test_spearman_values();
    test_degenerate_correlation();
    test_custom_window();

    std::cout << "\n=== Results: " << tests_passed << "/" << tests_run << " passed ===\n";

    return (tests_passed == tests_run) ? 0 : 1;
}
