#pragma once

#include <string>
#include <functional>

namespace chartsmith::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

// Parse "trace", "debug", "info", "warn"/"warning" or "error".
// Returns false and leaves `out` untouched on an unknown name.
bool parse_level(const std::string& name, Level& out);

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Replace the stderr writer. The sink receives already-formatted messages
// that passed the level threshold. Pass an empty function to restore stderr.
using Sink = std::function<void(Level, const std::string&)>;
void set_sink(Sink sink);

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

const char* level_name(Level lvl);

} // namespace chartsmith::log
