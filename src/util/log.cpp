#include <projmetrics/log.hpp>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <mutex>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace projmetrics::log {

static std::atomic<Level> s_level{Info};
static std::atomic<int> s_color{-1};     // -1 until decided, then 0 or 1
static std::mutex s_write_mutex;

static const char* const NAMES[] = {"trace", "debug", "info", "warn", "error", "off"};

// gray, cyan, green, yellow, red
static const char* const COLORS[] = {"\033[90m", "\033[36m", "\033[32m", "\033[33m", "\033[31m", ""};

static const char RESET[] = "\033[0m";

void set_level(Level lvl) {
    s_level = lvl;
}

Level get_level() {
    return s_level;
}

bool enabled(Level lvl) {
    Level threshold = s_level.load();
    return threshold != Off && lvl != Off && lvl >= threshold;
}

void set_color_enabled(bool on) {
    s_color = on ? 1 : 0;
}

bool is_color_enabled() {
    int c = s_color.load();
    if (c < 0) {
        // First use decides from the terminal; a racing set_color_enabled wins
        int detected = isatty(fileno(stderr)) ? 1 : 0;
        s_color.compare_exchange_strong(c, detected);
        c = s_color.load();
    }
    return c == 1;
}

const char* level_name(Level lvl) {
    auto i = static_cast<size_t>(lvl);
    return i < sizeof(NAMES) / sizeof(NAMES[0]) ? NAMES[i] : "unknown";
}

Result<Level> parse_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (Level lvl : {Trace, Debug, Info, Warn, Error, Off}) {
        if (lower == NAMES[lvl]) {
            return Result<Level>::ok(lvl);
        }
    }
    return MetricsError{MetricsError::InvalidArg,
        "unknown log level '" + name + "'",
        "expected one of: trace, debug, info, warn, error, off"};
}

// Formats the whole line first so one fputs call writes it; worker threads
// then never interleave within a line.
static void write_line(Level lvl, const char* fmt, va_list args) {
    std::string line;
    if (is_color_enabled()) {
        line += COLORS[lvl];
        line += NAMES[lvl];
        line += RESET;
    } else {
        line += NAMES[lvl];
    }
    line += ": ";

    va_list sized;
    va_copy(sized, args);
    int needed = std::vsnprintf(nullptr, 0, fmt, sized);
    va_end(sized);
    if (needed > 0) {
        size_t prefix = line.size();
        line.resize(prefix + static_cast<size_t>(needed) + 1);
        std::vsnprintf(&line[prefix], static_cast<size_t>(needed) + 1, fmt, args);
        line.resize(prefix + static_cast<size_t>(needed));
    }
    line += '\n';

    std::lock_guard<std::mutex> lock(s_write_mutex);
    std::fputs(line.c_str(), stderr);
}

void trace(const char* fmt, ...) {
    if (!enabled(Trace)) return;
    va_list args;
    va_start(args, fmt);
    write_line(Trace, fmt, args);
    va_end(args);
}

void debug(const char* fmt, ...) {
    if (!enabled(Debug)) return;
    va_list args;
    va_start(args, fmt);
    write_line(Debug, fmt, args);
    va_end(args);
}

void info(const char* fmt, ...) {
    if (!enabled(Info)) return;
    va_list args;
    va_start(args, fmt);
    write_line(Info, fmt, args);
    va_end(args);
}

void warn(const char* fmt, ...) {
    if (!enabled(Warn)) return;
    va_list args;
    va_start(args, fmt);
    write_line(Warn, fmt, args);
    va_end(args);
}

void error(const char* fmt, ...) {
    if (!enabled(Error)) return;
    va_list args;
    va_start(args, fmt);
    write_line(Error, fmt, args);
    va_end(args);
}

} // namespace projmetrics::log
