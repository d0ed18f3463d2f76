/**
 * Pileup Simulator
 *
 * Synthesises a DX station working a pileup over several FT8 cycles and
 * feeds the decodes (plus a batch of network spots per cycle) through the
 * intelligence engine. Prints what the engine makes of it.
 *
 * Usage:
 *   ./pileup_simulator [options]
 *
 * Options:
 *   --cycles <n>     Answer cycles to simulate (default: 8)
 *   --callers <n>    Callers per cycle (default: 6)
 *   --style <s>      loudest | low-high | high-low | random (default: loudest)
 *   --seed <n>       RNG seed (default: 1)
 *   --config <path>  Load engine configuration from an INI file
 *   --heuristic      Use the heuristic predictor
 *   --verbose        Enable debug logging
 *   --log <cat=lvl>  Per-category log level, e.g. parser=trace
 */

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <iostream>
#include <iterator>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "engine/intel_engine.hpp"
#include "pileup/logging.hpp"

using namespace pileup;

namespace {

struct Caller {
    std::string call;
    std::string grid;
    int frequency = 0;
    int snr = 0;
};

const char* const kCallPool[] = {
    "K1ABC", "W2XYZ", "N3QQ", "JA1RRR", "DL2ABC", "G4KLM", "VK3DEF", "PY2GHI",
    "EA5JKL", "I2MNO", "OH6PQR", "SP9STU", "F5VWX", "ON4YZA", "OK1BCD", "LU3EFG",
    "ZL1HIJ", "VE7KLM", "HA5NOP", "YO3QRS",
};

const char* const kGridPool[] = {
    "FN42", "FN20", "EM10", "PM95", "JO62", "IO91", "QF22", "GG66",
    "IM98", "JN45", "KP20", "KO02", "JN18", "JO20", "JO70", "GF05",
};

enum class SimStyle { LOUDEST, LOW_HIGH, HIGH_LOW, RANDOM };

class PileupSimulator {
public:
    PileupSimulator(const IntelConfig& config, unsigned seed)
        : config_(config), engine_(config), rng_(seed) {}

    void setCycles(int n) { cycles_ = std::max(1, n); }
    void setCallers(int n) { callers_ = std::clamp(n, 1, 20); }
    void setStyle(SimStyle s) { style_ = s; }

    bool run() {
        printHeader();

        engine_.setRecommendationCallback([this](int hz) { last_published_ = hz; });
        engine_.setTarget(target_);
        engine_.setTxStatus(true, target_);
        engine_.setTxFrequency(tx_hz_);
        engine_.setPathStatus(PathStatus::PATH_OPEN);
        engine_.setFeatures({{"target_snr", -9}});

        Timestamp base = WallClock::now();
        double t = 0.0;
        int low_high_cursor = 0;

        feed(base, t, -9, target_freq_, "CQ " + target_ + " " + target_grid_);
        t += config_.tracker.cycle_seconds;

        for (int cycle = 0; cycle < cycles_; ++cycle) {
            std::vector<Caller> pileup = makePileup();

            // Odd cycles we hear ourselves calling too
            if (cycle % 2 == 1) {
                Caller me{config_.station.callsign, config_.station.grid, tx_hz_, snrDist_(rng_)};
                pileup.push_back(me);
            }

            for (const auto& c : pileup) {
                std::string msg = target_ + " " + c.call;
                if (!c.grid.empty()) msg += " " + c.grid;
                feed(base, t, c.snr, c.frequency, msg);
            }

            sendSpots(base, t, pileup);
            engine_.decayTick();
            int gap = engine_.findBestGap();

            t += config_.tracker.cycle_seconds;

            const Caller& picked = pick(pileup, low_high_cursor++);
            char report[8];
            std::snprintf(report, sizeof(report), "%+03d", std::clamp(picked.snr, -24, 20));
            feed(base, t, -9, target_freq_, picked.call + " " + target_ + " " + report);
            t += config_.tracker.cycle_seconds;

            std::cout << "  Cycle " << (cycle + 1) << ": " << pileup.size() << " callers, "
                      << target_ << " answered " << picked.call << " (" << picked.snr << " dB @ "
                      << picked.frequency << " Hz), gap " << gap << " Hz\n";
        }

        // One more pileup so the report has something to rank
        std::vector<Caller> pileup = makePileup();
        for (const auto& c : pileup) {
            feed(base, t, c.snr, c.frequency, target_ + " " + c.call);
        }

        printReport();
        return true;
    }

private:
    IntelConfig config_;
    IntelEngine engine_;
    std::mt19937 rng_;
    std::uniform_int_distribution<int> freqDist_{250, 2750};
    std::uniform_int_distribution<int> snrDist_{-22, 8};

    std::string target_ = "DX1X";
    std::string target_grid_ = "JJ00";
    int target_freq_ = 1800;
    int tx_hz_ = 1150;
    int cycles_ = 8;
    int callers_ = 6;
    SimStyle style_ = SimStyle::LOUDEST;
    int last_published_ = 0;

    void feed(Timestamp base, double t, int snr, int freq, const std::string& message) {
        Decode d;
        d.timestamp = base + std::chrono::duration_cast<WallClock::duration>(std::chrono::duration<double>(t));
        d.snr = snr;
        d.frequency = freq;
        d.message = message;
        engine_.ingestDecode(d);
    }

    std::vector<Caller> makePileup() {
        std::vector<const char*> pool(std::begin(kCallPool), std::end(kCallPool));
        std::shuffle(pool.begin(), pool.end(), rng_);

        std::uniform_int_distribution<size_t> gridDist(0, std::size(kGridPool) - 1);
        std::vector<Caller> pileup;
        for (int i = 0; i < callers_; ++i) {
            Caller c;
            c.call = pool[i];
            c.grid = kGridPool[gridDist(rng_)];
            c.frequency = freqDist_(rng_);
            c.snr = snrDist_(rng_);
            pileup.push_back(c);
        }
        return pileup;
    }

    const Caller& pick(const std::vector<Caller>& pileup, int turn) {
        auto by_freq = [](const Caller& a, const Caller& b) { return a.frequency < b.frequency; };
        switch (style_) {
            case SimStyle::LOUDEST:
                return *std::max_element(pileup.begin(), pileup.end(),
                    [](const Caller& a, const Caller& b) { return a.snr < b.snr; });
            case SimStyle::LOW_HIGH: {
                // Sweep upward through the band, wrapping every few answers
                int floor_hz = 300 + (turn % 5) * 450;
                const Caller* best = nullptr;
                for (const auto& c : pileup) {
                    if (c.frequency >= floor_hz && (!best || c.frequency < best->frequency)) best = &c;
                }
                return best ? *best : *std::min_element(pileup.begin(), pileup.end(), by_freq);
            }
            case SimStyle::HIGH_LOW: {
                int ceiling_hz = 2700 - (turn % 5) * 450;
                const Caller* best = nullptr;
                for (const auto& c : pileup) {
                    if (c.frequency <= ceiling_hz && (!best || c.frequency > best->frequency)) best = &c;
                }
                return best ? *best : *std::max_element(pileup.begin(), pileup.end(), by_freq);
            }
            default: {
                std::uniform_int_distribution<size_t> any(0, pileup.size() - 1);
                return pileup[any(rng_)];
            }
        }
    }

    // The target hears about half the pileup; a few unrelated spots land elsewhere
    void sendSpots(Timestamp base, double t, const std::vector<Caller>& pileup) {
        Timestamp now = base + std::chrono::duration_cast<WallClock::duration>(std::chrono::duration<double>(t));
        int64_t epoch = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();

        std::vector<Spot> spots;
        for (size_t i = 0; i < pileup.size(); i += 2) {
            Spot s;
            s.sender = pileup[i].call;
            s.receiver = target_;
            s.frequency = config_.engine.dial_frequency_hz + pileup[i].frequency;
            s.snr = pileup[i].snr - 3;
            s.time = epoch;
            spots.push_back(s);
        }
        Spot other;
        other.sender = "K9ZZZ";
        other.receiver = "EA8XYZ";
        other.frequency = config_.engine.dial_frequency_hz + 600;
        other.time = epoch;
        spots.push_back(other);

        engine_.ingestSpotBatch(spots, now);
    }

    void printHeader() {
        std::cout << "\n";
        std::cout << "╔══════════════════════════════════════════════════════════════╗\n";
        std::cout << "║                  Pileup Intelligence Simulator               ║\n";
        std::cout << "╚══════════════════════════════════════════════════════════════╝\n";
        std::cout << "\n";
        std::cout << "Configuration:\n";
        std::cout << "  Station:   " << config_.station.callsign << "\n";
        std::cout << "  Target:    " << target_ << " @ " << target_freq_ << " Hz\n";
        std::cout << "  Cycles:    " << cycles_ << " x " << callers_ << " callers\n";
        std::cout << "  Predictor: " << engine_.predictorName() << "\n";
        std::cout << "\n";
    }

    void printReport() {
        std::cout << "\n=== PILEUP ===\n";
        if (auto info = engine_.getPileupInfo()) {
            std::cout << "  Size: " << info->size << "\n";
            for (const auto& m : info->callers) {
                std::cout << "    " << m.callsign << "  " << m.snr << " dB @ " << m.frequency << " Hz\n";
            }
            if (info->frequency_range) {
                std::cout << "  Range: " << info->frequency_range->first << "-"
                          << info->frequency_range->second << " Hz\n";
            }
        }

        YourStatus you = engine_.getYourStatus();
        std::cout << "  You: ";
        if (you.rank.isKnown()) {
            std::cout << "#" << you.rank.rank << " of " << you.total;
        } else if (you.rank.kind == YourRank::Kind::UNKNOWN) {
            std::cout << "calling (rank unknown)";
        } else {
            std::cout << "not in pileup";
        }
        std::cout << ", " << you.calls_made << " calls\n";

        std::cout << "\n=== TARGET ===\n";
        if (auto behavior = engine_.getTargetBehavior()) {
            std::printf("  QSOs: %d (%.1f/min), CQs: %d\n", behavior->qso_count, behavior->qso_rate,
                        behavior->cq_count);
            if (behavior->pattern) {
                std::printf("  Pattern: %s (%.0f%%, %d answers)\n",
                            pickingStyleToString(behavior->pattern->style),
                            behavior->pattern->confidence * 100.0, behavior->pattern->sample_size);
                std::cout << "  Advice: " << behavior->pattern->advice << "\n";
            } else {
                std::cout << "  Pattern: not enough answers\n";
            }
        }
        std::cout << "  Competition at target: " << engine_.getTargetCompetition() << "\n";

        std::cout << "\n=== PREDICTION ===\n";
        if (auto result = engine_.refresh()) {
            std::cout << "  " << formatPercent(result->prediction.probability) << " ("
                      << confidenceToString(result->prediction.confidence) << " confidence)\n";
            std::cout << "  " << result->prediction.explanation << "\n";
            std::cout << "  Action: " << actionToString(result->strategy.action) << "\n";
            if (result->strategy.recommended_frequency) {
                std::cout << "  Suggested TX: " << *result->strategy.recommended_frequency << " Hz\n";
            }
            for (const auto& r : result->strategy.reasons) {
                std::cout << "    - " << r << "\n";
            }
        }

        std::cout << "\n=== GAP ===\n";
        std::cout << "  Recommended TX offset: " << engine_.findBestGap() << " Hz";
        if (last_published_ > 0) std::cout << " (last published " << last_published_ << " Hz)";
        std::cout << "\n\n";
    }
};

} // namespace

int main(int argc, char* argv[]) {
    IntelConfig config;
    config.station.callsign = "W1ME";
    config.station.grid = "FN42";

    int cycles = 8;
    int callers = 6;
    unsigned seed = 1;
    SimStyle style = SimStyle::LOUDEST;
    bool verbose = false;
    std::vector<std::pair<LogCategory, LogLevel>> log_overrides;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--cycles" && i + 1 < argc) {
            cycles = std::stoi(argv[++i]);
        } else if (arg == "--callers" && i + 1 < argc) {
            callers = std::stoi(argv[++i]);
        } else if (arg == "--seed" && i + 1 < argc) {
            seed = static_cast<unsigned>(std::stoul(argv[++i]));
        } else if (arg == "--style" && i + 1 < argc) {
            std::string s = argv[++i];
            if (s == "loudest") style = SimStyle::LOUDEST;
            else if (s == "low-high") style = SimStyle::LOW_HIGH;
            else if (s == "high-low") style = SimStyle::HIGH_LOW;
            else if (s == "random") style = SimStyle::RANDOM;
            else {
                std::cerr << "Unknown style: " << s << "\n";
                return 1;
            }
        } else if (arg == "--config" && i + 1 < argc) {
            std::string path = argv[++i];
            if (!config.load(path)) {
                std::cerr << "Cannot read config: " << path << "\n";
                return 1;
            }
        } else if (arg == "--heuristic") {
            config.engine.heuristic_only = true;
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--log" && i + 1 < argc) {
            std::string value = argv[++i];
            size_t eq = value.find('=');
            auto category = parseLogCategory(value.substr(0, eq).c_str());
            std::optional<LogLevel> level;
            if (eq != std::string::npos) level = parseLogLevel(value.substr(eq + 1).c_str());
            if (!category || !level) {
                std::cerr << "Bad --log value (want category=level): " << value << "\n";
                return 1;
            }
            log_overrides.emplace_back(*category, *level);
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Pileup Simulator\n\n";
            std::cout << "Usage: " << argv[0] << " [options]\n\n";
            std::cout << "Options:\n";
            std::cout << "  --cycles <n>     Answer cycles (default: 8)\n";
            std::cout << "  --callers <n>    Callers per cycle (default: 6)\n";
            std::cout << "  --style <s>      loudest | low-high | high-low | random\n";
            std::cout << "  --seed <n>       RNG seed (default: 1)\n";
            std::cout << "  --config <path>  Engine configuration (INI)\n";
            std::cout << "  --heuristic      Heuristic predictor\n";
            std::cout << "  --verbose        Enable debug logging\n";
            std::cout << "  --log <cat=lvl>  Per-category level, e.g. parser=trace\n";
            return 0;
        }
    }

    LogLevel base = verbose ? LogLevel::DEBUG : LogLevel::WARN;
    if (log_overrides.empty()) {
        setLogLevel(base);
    } else {
        // Named categories get their own level, the rest stay at the base
        setLogLevel(LogLevel::TRACE);
        for (size_t c = 0; c < LOG_CATEGORY_COUNT; ++c) {
            auto category = static_cast<LogCategory>(c);
            setCategoryLevel(category, std::min(g_category_levels[c], base));
        }
        for (const auto& [category, level] : log_overrides) {
            setCategoryLevel(category, level);
        }
    }

    PileupSimulator sim(config, seed);
    sim.setCycles(cycles);
    sim.setCallers(callers);
    sim.setStyle(style);

    return sim.run() ? 0 : 1;
}
