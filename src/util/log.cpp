#include <chartsmith/log.hpp>
#include <cstdarg>
#include <cstdio>
#include <string>
#include <unistd.h>

namespace chartsmith::log {

static Level s_level = Info;
static bool s_color_initialized = false;
static bool s_color_enabled = false;
static Sink s_sink;

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

bool parse_level(const std::string& name, Level& out) {
    if (name == "trace")                      { out = Trace; return true; }
    if (name == "debug")                      { out = Debug; return true; }
    if (name == "info")                       { out = Info;  return true; }
    if (name == "warn" || name == "warning")  { out = Warn;  return true; }
    if (name == "error")                      { out = Error; return true; }
    return false;
}

void set_color_enabled(bool enabled) {
    s_color_enabled = enabled;
    s_color_initialized = true;
}

bool is_color_enabled() {
    init_color();
    return s_color_enabled;
}

void set_sink(Sink sink) {
    s_sink = std::move(sink);
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

// vsnprintf into a std::string; `args` is consumed
static std::string vformat(const char* fmt, va_list args) {
    va_list sizing;
    va_copy(sizing, args);
    int len = std::vsnprintf(nullptr, 0, fmt, sizing);
    va_end(sizing);
    if (len <= 0) return std::string();

    std::string out(static_cast<size_t>(len), '\0');
    std::vsnprintf(&out[0], out.size() + 1, fmt, args);
    return out;
}

static void emit(Level lvl, const char* fmt, va_list args) {
    if (lvl < s_level) return;
    std::string msg = vformat(fmt, args);

    if (s_sink) {
        s_sink(lvl, msg);
        return;
    }

    init_color();
    if (s_color_enabled) {
        std::fprintf(stderr, "%s%s\033[0m: %s\n", level_color(lvl), level_name(lvl),
                     msg.c_str());
    } else {
        std::fprintf(stderr, "%s: %s\n", level_name(lvl), msg.c_str());
    }
}

void trace(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(Trace, fmt, args);
    va_end(args);
}

void debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(Debug, fmt, args);
    va_end(args);
}

void info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(Info, fmt, args);
    va_end(args);
}

void warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(Warn, fmt, args);
    va_end(args);
}

void error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(Error, fmt, args);
    va_end(args);
}

} // namespace chartsmith::log
