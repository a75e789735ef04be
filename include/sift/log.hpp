#pragma once

#include <string>
#include <cstdio>

namespace sift::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

void set_color_enabled(bool enabled);
bool is_color_enabled();

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

const char* level_name(Level lvl);

// Log a SiftError at the given level, one line per formatted line.
void report(Level lvl, const std::string& formatted);

} // namespace sift::log
