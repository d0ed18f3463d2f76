#pragma once

#include <cstdarg>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cctype>
#include <optional>

namespace pileup {

enum class LogLevel {
    NONE = 0,
    ERROR = 1,
    WARN = 2,
    INFO = 3,
    DEBUG = 4,
    TRACE = 5
};

// One per engine stage. The parser logs every decode, so it is silent
// until raised explicitly.
enum class LogCategory : uint8_t {
    PARSER,
    SPECTRUM,
    TRACKER,
    PREDICT,
    ENGINE,
    COUNT
};

constexpr size_t LOG_CATEGORY_COUNT = static_cast<size_t>(LogCategory::COUNT);

inline const char* logCategoryName(LogCategory category) {
    switch (category) {
        case LogCategory::PARSER:   return "PARSER";
        case LogCategory::SPECTRUM: return "SPECTRUM";
        case LogCategory::TRACKER:  return "TRACKER";
        case LogCategory::PREDICT:  return "PREDICT";
        case LogCategory::ENGINE:   return "ENGINE";
        default: return "?";
    }
}

// Global ceiling - can be changed at runtime
#ifdef NDEBUG
inline LogLevel g_log_level = LogLevel::INFO;
#else
inline LogLevel g_log_level = LogLevel::DEBUG;
#endif

// Per-category ceiling, applied on top of g_log_level
inline LogLevel g_category_levels[LOG_CATEGORY_COUNT] = {
    LogLevel::NONE,     // PARSER
    LogLevel::TRACE,    // SPECTRUM
    LogLevel::TRACE,    // TRACKER
    LogLevel::TRACE,    // PREDICT
    LogLevel::TRACE,    // ENGINE
};

inline void setLogLevel(LogLevel level) {
    g_log_level = level;
}

inline void setCategoryLevel(LogCategory category, LogLevel level) {
    if (category < LogCategory::COUNT) {
        g_category_levels[static_cast<size_t>(category)] = level;
    }
}

inline bool logEnabled(LogCategory category, LogLevel level) {
    if (category >= LogCategory::COUNT) return false;
    return level <= g_log_level && level <= g_category_levels[static_cast<size_t>(category)];
}

inline bool logNameEquals(const char* a, const char* b) {
    for (; *a && *b; ++a, ++b) {
        if (std::tolower(static_cast<unsigned char>(*a)) != std::tolower(static_cast<unsigned char>(*b))) {
            return false;
        }
    }
    return *a == *b;
}

// Case-insensitive "trace", "debug", ... "none"
inline std::optional<LogLevel> parseLogLevel(const char* name) {
    static const struct { const char* name; LogLevel level; } levels[] = {
        {"none", LogLevel::NONE}, {"error", LogLevel::ERROR}, {"warn", LogLevel::WARN},
        {"info", LogLevel::INFO}, {"debug", LogLevel::DEBUG}, {"trace", LogLevel::TRACE},
    };
    if (!name) return std::nullopt;
    for (const auto& l : levels) {
        if (logNameEquals(name, l.name)) return l.level;
    }
    return std::nullopt;
}

inline std::optional<LogCategory> parseLogCategory(const char* name) {
    if (!name) return std::nullopt;
    for (size_t i = 0; i < LOG_CATEGORY_COUNT; ++i) {
        auto category = static_cast<LogCategory>(i);
        if (logNameEquals(name, logCategoryName(category))) return category;
    }
    return std::nullopt;
}

inline void log(LogLevel level, LogCategory category, const char* format, ...) {
    if (!logEnabled(category, level)) return;

    const char* level_str = "";
    switch (level) {
        case LogLevel::ERROR: level_str = "ERROR"; break;
        case LogLevel::WARN:  level_str = "WARN "; break;
        case LogLevel::INFO:  level_str = "INFO "; break;
        case LogLevel::DEBUG: level_str = "DEBUG"; break;
        case LogLevel::TRACE: level_str = "TRACE"; break;
        default: break;
    }

    fprintf(stderr, "[%s][%-8s] ", level_str, logCategoryName(category));

    va_list args;
    va_start(args, format);
    vfprintf(stderr, format, args);
    va_end(args);

    fprintf(stderr, "\n");
}

// Category macros: LOG_TRACKER(INFO, "fmt", ...). The enabled check runs
// before the arguments are evaluated. Nothing is compiled with PILEUP_LOG_DISABLE.
#ifdef PILEUP_LOG_DISABLE

#define PILEUP_LOG(category, level, fmt, ...) do { } while(0)

#else

#define PILEUP_LOG(category, level, fmt, ...) \
    do { if (pileup::logEnabled(pileup::LogCategory::category, pileup::LogLevel::level)) \
        pileup::log(pileup::LogLevel::level, pileup::LogCategory::category, fmt, ##__VA_ARGS__); } while(0)

#endif

#define LOG_PARSER(level, fmt, ...)   PILEUP_LOG(PARSER, level, fmt, ##__VA_ARGS__)
#define LOG_SPECTRUM(level, fmt, ...) PILEUP_LOG(SPECTRUM, level, fmt, ##__VA_ARGS__)
#define LOG_TRACKER(level, fmt, ...)  PILEUP_LOG(TRACKER, level, fmt, ##__VA_ARGS__)
#define LOG_PREDICT(level, fmt, ...)  PILEUP_LOG(PREDICT, level, fmt, ##__VA_ARGS__)
#define LOG_ENGINE(level, fmt, ...)   PILEUP_LOG(ENGINE, level, fmt, ##__VA_ARGS__)

} // namespace pileup
