#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace pileup {

// Core types
using Intensity = float;                          // Occupancy intensity (0-100)
using Intensities = std::vector<Intensity>;       // One value per 1 Hz bin
using IntensitySpan = std::span<const Intensity>;

// Decode and spot times are wall-clock; timers and TTLs use the steady clock
using WallClock = std::chrono::system_clock;
using Timestamp = WallClock::time_point;
using SteadyClock = std::chrono::steady_clock;
using SteadyTime = SteadyClock::time_point;

// Seconds between two wall-clock timestamps (negative if b is before a)
inline double secondsBetween(Timestamp a, Timestamp b) {
    return std::chrono::duration<double>(b - a).count();
}

// One received transmission as produced by the protocol decoder
struct Decode {
    Timestamp timestamp{};
    int snr = 0;                  // dB
    float dt = 0.0f;              // Time offset in seconds
    int frequency = 0;            // Audio offset in Hz
    std::string mode = "FT8";
    std::string message;          // Raw message text

    // Filled from the message text
    std::optional<std::string> callsign;     // Transmitting station
    std::optional<std::string> grid;
    bool is_cq = false;
    bool is_reply = false;
    std::optional<std::string> replying_to;  // Addressee
};

// One reception report from the reporting network
struct Spot {
    std::string sender;           // Station that was heard
    std::string receiver;         // Station that heard it
    int64_t frequency = 0;        // RF frequency in Hz
    int snr = 0;
    std::string grid;
    int64_t time = 0;             // Unix epoch seconds
};

// Remote interference entry derived from spots
struct RemoteReport {
    int offset = 0;               // Audio offset in Hz
    int snr = 0;
    float age_seconds = 0.0f;
};

// Whether the target can currently hear us
enum class PathStatus : uint8_t {
    CONNECTED,   // Target has reported us
    PATH_OPEN,   // Stations near us are heard by the target
    NO_PATH,     // Nothing of ours reaches the target
    UNKNOWN,
};

inline const char* pathStatusToString(PathStatus status) {
    switch (status) {
        case PathStatus::CONNECTED: return "connected";
        case PathStatus::PATH_OPEN: return "path_open";
        case PathStatus::NO_PATH:   return "no_path";
        default: return "unknown";
    }
}

// Upper-case, strip hashed-call brackets and anything outside A-Z 0-9 /
std::string normalizeCallsign(const std::string& call);

// Amateur callsign shape: letters, digits and '/', at least one of each
bool isPlausibleCallsign(const std::string& call);

// Maidenhead square: two letters A-R then two digits (RR73 excluded)
bool isLocator(const std::string& token);

} // namespace pileup
