#pragma once

#include <optional>
#include <string>

namespace uuidkit::log {

enum Level { Trace, Debug, Info, Warn, Error };

// Messages below the threshold are dropped. Defaults to Warn: a library
// should stay quiet unless the host asks for more.
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

// Inverse of level_name(), case-insensitive. "warning" is accepted for Warn.
std::optional<Level> level_from_name(const std::string& name);

} // namespace uuidkit::log
