#pragma once

#include <shortguid/result.hpp>
#include <string>
#include <cstdio>

namespace shortguid::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Prefix every line with "<name>: "; empty disables the prefix
void set_program_name(const std::string& name);
const std::string& program_name();

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Returns the name string for a level
const char* level_name(Level lvl);

// Inverse of level_name(); case-insensitive, also accepts "warning"
Result<Level> parse_level(const std::string& name);

} // namespace shortguid::log
