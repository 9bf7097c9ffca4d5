#pragma once

#include <projmetrics/result.hpp>
#include <string>

namespace projmetrics::log {

enum Level { Trace, Debug, Info, Warn, Error, Off };

void set_level(Level lvl);
Level get_level();

// True when a message at lvl would be written
bool enabled(Level lvl);

void set_color_enabled(bool on);
bool is_color_enabled();

// Safe to call from worker threads; each message is emitted as one line.
void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Returns the name string for a level
const char* level_name(Level lvl);

// Accepts the names returned by level_name(), case-insensitive
Result<Level> parse_level(const std::string& name);

} // namespace projmetrics::log
