#pragma once

#include <pkgid/result.hpp>
#include <string>
#include <cstdio>

namespace pkgid::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Redirect output (nullptr restores stderr)
void set_stream(std::FILE* stream);

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Returns the name string for a level
const char* level_name(Level lvl);

// "trace" | "debug" | "info" | "warn" | "error", case-insensitive
Result<Level> parse_level(const std::string& name);

} // namespace pkgid::log
