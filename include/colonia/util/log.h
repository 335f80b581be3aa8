#pragma once

#include <functional>
#include <string>

namespace colonia::log {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

void set_level(Level lvl);
Level level();

// Replace the output sink. Passing an empty function restores stderr output.
//
// Tests use this to capture warnings emitted by code that never throws
// (integrity checks, dropped deliveries).
using Sink = std::function<void(Level, const std::string&)>;
void set_sink(Sink sink);

const char* level_label(Level l);

// Parses "debug", "info", "warn", "error", "off". Returns false on anything else.
bool parse_level(const std::string& text, Level& out);

void debug(const std::string& msg);
void info(const std::string& msg);
void warn(const std::string& msg);
void error(const std::string& msg);

} // namespace colonia::log
