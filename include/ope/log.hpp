#pragma once

#include <string>

namespace ope::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

// Colour defaults to on when stderr is a terminal.
void set_color_enabled(bool enabled);

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void error(const char* fmt, ...);

const char* level_name(Level lvl);

// Parse a level name ("trace", "debug", ...). Returns false if unknown.
bool parse_level(const std::string& name, Level& out);

} // namespace ope::log
