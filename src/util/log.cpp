#include <shortguid/log.hpp>
#include <cstdarg>
#include <cctype>
#include <cstdio>
#include <string>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace shortguid::log {

static Level s_level = Warn;
static bool s_color_initialized = false;
static bool s_color_enabled = false;
static std::string s_program;

static void init_color() {
    if (!s_color_initialized) {
        s_color_enabled = isatty(fileno(stderr));
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

bool is_color_enabled() {
    init_color();
    return s_color_enabled;
}

void set_program_name(const std::string& name) {
    s_program = name;
}

const std::string& program_name() {
    return s_program;
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
    for (char c : name) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (lower == "warning") return Result<Level>::ok(Warn);
    for (Level lvl : {Trace, Debug, Info, Warn, Error}) {
        if (lower == level_name(lvl)) return Result<Level>::ok(lvl);
    }
    return GuidError{GuidError::Config,
        "unknown log level '" + name + "'",
        "expected one of: trace, debug, info, warn, error"};
}

static const char* level_color(Level lvl) {
    switch (lvl) {
        case Trace: return "\033[90m";
        case Debug: return "\033[36m";
        case Info:  return "\033[32m";
        case Warn:  return "\033[33m";
        case Error: return "\033[1;31m";
    }
    return "";
}

// Formats the whole line first so it reaches stderr in a single write
static void emit(Level lvl, const char* fmt, va_list args) {
    if (lvl < s_level) return;
    init_color();

    char body[1024];
    std::vsnprintf(body, sizeof(body), fmt, args);

    std::string line;
    if (!s_program.empty()) {
        line += s_program;
        line += ": ";
    }
    if (s_color_enabled) {
        line += level_color(lvl);
        line += level_name(lvl);
        line += "\033[0m";
    } else {
        line += level_name(lvl);
    }
    line += ": ";
    line += body;
    line += '\n';

    std::fputs(line.c_str(), stderr);
}

#define SHORTGUID_LOG_FN(name, lvl)        \
    void name(const char* fmt, ...) {      \
        va_list args;                      \
        va_start(args, fmt);               \
        emit(lvl, fmt, args);              \
        va_end(args);                      \
    }

SHORTGUID_LOG_FN(trace, Trace)
SHORTGUID_LOG_FN(debug, Debug)
SHORTGUID_LOG_FN(info, Info)
SHORTGUID_LOG_FN(warn, Warn)
SHORTGUID_LOG_FN(error, Error)

#undef SHORTGUID_LOG_FN

} // namespace shortguid::log
