#include <tid/log.hpp>
#include <atomic>
#include <cctype>
#include <cstdarg>
#include <cstdio>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace tid::log {

// Codec diagnostics may log from any thread, so all settings are atomic.
static std::atomic<Level> s_level{Info};

// -1 = not yet detected, 0 = off, 1 = on
static std::atomic<int> s_color{-1};

static bool color_on() {
    int state = s_color.load(std::memory_order_relaxed);
    if (state < 0) {
        int detected = isatty(fileno(stderr)) ? 1 : 0;
        // Keep a value set concurrently by set_color_enabled()
        if (!s_color.compare_exchange_strong(state, detected, std::memory_order_relaxed)) {
            return state == 1;
        }
        return detected == 1;
    }
    return state == 1;
}

void set_level(Level lvl) {
    s_level.store(lvl, std::memory_order_relaxed);
}

Level get_level() {
    return s_level.load(std::memory_order_relaxed);
}

bool enabled(Level lvl) {
    return lvl >= get_level();
}

void set_color_enabled(bool enabled) {
    s_color.store(enabled ? 1 : 0, std::memory_order_relaxed);
}

bool is_color_enabled() {
    return color_on();
}

const char* level_name(Level lvl) {
    switch (lvl) {
        case Trace: return "trace";
        case Debug: return "debug";
        case Info:  return "info";
        case Warn:  return "warn";
        case Error: return "error";
    }
    return "unknown";
}

Result<Level> parse_level(const std::string& name) {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (lower == "trace") return Result<Level>::ok(Trace);
    if (lower == "debug") return Result<Level>::ok(Debug);
    if (lower == "info") return Result<Level>::ok(Info);
    if (lower == "warn" || lower == "warning") return Result<Level>::ok(Warn);
    if (lower == "error") return Result<Level>::ok(Error);

    return TidError{TidError::Config,
        "unknown log level '" + name + "'",
        "expected one of: trace, debug, info, warn, error"};
}

static const char* level_color(Level lvl) {
    switch (lvl) {
        case Trace: return "\033[90m";   // gray
        case Debug: return "\033[36m";   // cyan
        case Info:  return "\033[32m";   // green
        case Warn:  return "\033[33m";   // yellow
        case Error: return "\033[31m";   // red
    }
    return "";
}

static void log_message(Level lvl, const char* fmt, va_list args) {
    if (!enabled(lvl)) return;

    if (color_on()) {
        std::fprintf(stderr, "%s%s\033[0m: ", level_color(lvl), level_name(lvl));
    } else {
        std::fprintf(stderr, "%s: ", level_name(lvl));
    }

    std::vfprintf(stderr, fmt, args);
    std::fprintf(stderr, "\n");
}

void trace(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Trace, fmt, args);
    va_end(args);
}

void debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Debug, fmt, args);
    va_end(args);
}

void info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Info, fmt, args);
    va_end(args);
}

void warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Warn, fmt, args);
    va_end(args);
}

void error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Error, fmt, args);
    va_end(args);
}

} // namespace tid::log
