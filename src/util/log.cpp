#include <ope/log.hpp>
#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace ope::log {

// Atomics: the matcher logs from every thread that shares it.
static std::atomic<Level> s_level{Info};
static std::atomic<bool> s_color_initialized{false};
static std::atomic<bool> s_color_enabled{false};

static void init_color() {
    if (!s_color_initialized.load()) {
        s_color_enabled = isatty(fileno(stderr)) != 0;
        s_color_initialized = true;
    }
}

void set_level(Level lvl) {
    s_level = lvl;
}

Level get_level() {
    return s_level;
}

void set_color_enabled(bool enabled) {
    s_color_enabled = enabled;
    s_color_initialized = true;
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

bool parse_level(const std::string& name, Level& out) {
    for (Level lvl : {Trace, Debug, Info, Warn, Error}) {
        if (name == level_name(lvl)) {
            out = lvl;
            return true;
        }
    }
    return false;
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
    if (lvl < s_level) return;
    init_color();

    // Format the whole line first so one call is one fprintf, which keeps
    // lines from concurrent callers intact.
    va_list sizing;
    va_copy(sizing, args);
    int n = std::vsnprintf(nullptr, 0, fmt, sizing);
    va_end(sizing);
    if (n < 0) return;

    std::vector<char> line(static_cast<size_t>(n) + 1);
    std::vsnprintf(line.data(), line.size(), fmt, args);

    if (s_color_enabled) {
        std::fprintf(stderr, "%s%s\033[0m: %s\n", level_color(lvl), level_name(lvl),
                     line.data());
    } else {
        std::fprintf(stderr, "%s: %s\n", level_name(lvl), line.data());
    }
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

void error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Error, fmt, args);
    va_end(args);
}

} // namespace ope::log
